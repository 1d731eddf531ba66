#pragma once

#include <string>
#include <string_view>

using namespace std::literals;

#include "colors.hpp"

namespace control {
// SGR
namespace sgr {
    std::string fgColor(ColorIndex color);
    std::string fgColor(const RgbColor& color);
    std::string fgColor(const Color& color);
    inline constexpr auto resetFgColor = "\x1b[39m"sv;

    // Wraps str in a foreground color and a reset, so the color does not leak into the rest of
    // the line
    std::string colored(std::string_view str, const Color& color);
}
}
