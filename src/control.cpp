#include "control.hpp"

#include <fmt/format.h>

#include "util.hpp"

namespace control {
namespace sgr {
    std::string fgColor(ColorIndex idx)
    {
        return fmt::format("\x1b[38;5;{}m", idx);
    }

    std::string fgColor(const RgbColor& rgb)
    {
        return fmt::format("\x1b[38;2;{};{};{}m", rgb.r, rgb.g, rgb.b);
    }

    std::string fgColor(const Color& color)
    {
        if (const auto idx = std::get_if<ColorIndex>(&color))
            return fgColor(*idx);
        else if (const auto rgb = std::get_if<RgbColor>(&color))
            return fgColor(*rgb);
        die("Invalid variant state");
    }

    std::string colored(std::string_view str, const Color& color)
    {
        std::string out = fgColor(color);
        out.append(str);
        out.append(resetFgColor);
        return out;
    }
}
}
