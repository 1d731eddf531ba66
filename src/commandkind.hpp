#pragma once

#include <optional>
#include <string_view>

enum class CommandKind {
    Schedule,
    Live,
    Scores,
    Teams,
    Standings,
};

std::optional<CommandKind> parseCommandKind(std::string_view str);

std::string_view toString(CommandKind kind);
