#include "csv.hpp"

#include "util.hpp"

namespace csv {
std::vector<std::string> parseLine(std::string_view line)
{
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const auto ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    i++;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(ch);
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field.push_back(ch);
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

std::string formatField(std::string_view field)
{
    if (field.find_first_of(",\"") == std::string_view::npos)
        return std::string(field);

    std::string out = "\"";
    for (const auto ch : field) {
        if (ch == '"')
            out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

std::string formatLine(const std::vector<std::string>& fields)
{
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0)
            line.push_back(',');
        line.append(formatField(fields[i]));
    }
    return line;
}

std::vector<std::vector<std::string>> parse(std::string_view text)
{
    std::vector<std::vector<std::string>> rows;
    size_t offset = 0;
    while (offset < text.size()) {
        auto end = text.find('\n', offset);
        if (end == std::string_view::npos)
            end = text.size();
        auto line = text.substr(offset, end - offset);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (!trim(line).empty())
            rows.push_back(parseLine(line));
        offset = end + 1;
    }
    return rows;
}
}
