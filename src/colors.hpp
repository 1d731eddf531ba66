#pragma once

#include <cstdint>
#include <variant>

struct RgbColor {
    uint8_t r, g, b;

    bool operator==(const RgbColor& other) const
    {
        return r == other.r && g == other.g && b == other.b;
    }

    bool operator!=(const RgbColor& other) const
    {
        return !(*this == other);
    }
};
using ColorIndex = uint8_t;
using Color = std::variant<ColorIndex, RgbColor>;

inline constexpr RgbColor white { 255, 255, 255 };

// Fixed colors for everything that is not a team name
namespace palette {
inline constexpr Color header = ColorIndex { 244 };
}
