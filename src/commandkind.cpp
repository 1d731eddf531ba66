#include "commandkind.hpp"

#include <array>
#include <utility>

namespace {
constexpr std::array<std::pair<std::string_view, CommandKind>, 5> commandNames { {
    { "schedule", CommandKind::Schedule },
    { "live", CommandKind::Live },
    { "scores", CommandKind::Scores },
    { "teams", CommandKind::Teams },
    { "standings", CommandKind::Standings },
} };
}

std::optional<CommandKind> parseCommandKind(std::string_view str)
{
    for (const auto& [name, kind] : commandNames) {
        if (name == str)
            return kind;
    }
    return std::nullopt;
}

std::string_view toString(CommandKind kind)
{
    for (const auto& [name, k] : commandNames) {
        if (k == kind)
            return name;
    }
    return "unknown";
}
