#include "colortable.hpp"

#include "csv.hpp"
#include "debug.hpp"

Result<RgbColor> parseRgb(std::string_view str)
{
    str = trim(str);
    if (str.size() < 2 || str.front() != '(' || str.back() != ')')
        return white;
    str = str.substr(1, str.size() - 2);

    uint8_t components[3] = { 0, 0, 0 };
    size_t count = 0;
    while (true) {
        const auto comma = str.find(',');
        const auto part = trim(str.substr(0, comma));
        const auto value = toInt(part);
        if (count >= 3 || !value || *value < 0 || *value > 255)
            return error(Error::ColorFormat);
        components[count++] = static_cast<uint8_t>(*value);
        if (comma == std::string_view::npos)
            break;
        str.remove_prefix(comma + 1);
    }
    if (count != 3)
        return error(Error::ColorFormat);
    return RgbColor { components[0], components[1], components[2] };
}

ColorTable::ColorTable(std::unordered_map<int64_t, RgbColor> colors)
    : colors_(std::move(colors))
{
}

Result<ColorTable> ColorTable::load(const fs::path& path)
{
    const auto text = readFile(path);
    if (!text) {
        debug("Could not read color file '{}'", path.u8string());
        return error(Error::File);
    }

    std::unordered_map<int64_t, RgbColor> colors;
    for (const auto& row : csv::parse(*text)) {
        const auto id = row.size() >= 2 ? toInt(trim(row[0])) : std::nullopt;
        if (!id) {
            debug("Invalid row in color file '{}'", csv::formatLine(row));
            return error(Error::ColorFormat);
        }
        const auto color = parseRgb(row[1]);
        if (!color) {
            debug("Invalid color '{}' for team {}", row[1], *id);
            return error(color.error());
        }
        colors[*id] = color.value();
    }
    return ColorTable(std::move(colors));
}

Result<ColorTable> ColorTable::loadOrEmpty(const fs::path& path)
{
    if (!fs::exists(path)) {
        debug("No color file at '{}', using white for everything", path.u8string());
        return ColorTable();
    }
    return load(path);
}

RgbColor ColorTable::get(int64_t teamId) const
{
    const auto it = colors_.find(teamId);
    if (it == colors_.end())
        return white;
    return it->second;
}

size_t ColorTable::size() const
{
    return colors_.size();
}
