#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>

#include "colors.hpp"
#include "result.hpp"
#include "util.hpp"

// Parses "(r, g, b)". Anything not wrapped in parentheses is used in the color file to mark teams
// without a distinct color and gives white. Error::ColorFormat if a component is not a number in
// [0, 255] or there are not exactly three.
Result<RgbColor> parseRgb(std::string_view str);

class ColorTable {
public:
    ColorTable() = default;
    ColorTable(std::unordered_map<int64_t, RgbColor> colors);

    // Rows are `id,"(r, g, b)"`. Error::File if the file can't be read, Error::ColorFormat if a
    // row is malformed.
    static Result<ColorTable> load(const fs::path& path);

    // Like load, but a missing file gives an empty table, so everything is rendered white
    static Result<ColorTable> loadOrEmpty(const fs::path& path);

    // White for unknown teams
    RgbColor get(int64_t teamId) const;

    size_t size() const;

private:
    std::unordered_map<int64_t, RgbColor> colors_;
};
