#include "roster.hpp"

#include <optional>

#include "csv.hpp"
#include "debug.hpp"

RosterStore::RosterStore(fs::path path)
    : path_(std::move(path))
{
}

const fs::path& RosterStore::getPath() const
{
    return path_;
}

namespace {
std::optional<RosterEntry> parseEntry(const std::vector<std::string>& row)
{
    const auto id = row.size() >= 2 ? toInt(trim(row[1])) : std::nullopt;
    if (!id)
        return std::nullopt;
    return RosterEntry { std::string(trim(row[0])), *id };
}
}

Result<std::vector<RosterEntry>> RosterStore::readRows() const
{
    const auto text = readFile(path_);
    if (!text) {
        debug("Could not read roster '{}'", path_.u8string());
        return error(Error::File);
    }

    std::vector<RosterEntry> entries;
    for (const auto& row : csv::parse(*text)) {
        auto entry = parseEntry(row);
        if (!entry) {
            // Hand-edited files may contain junk, we just skip it
            debug("Skipping invalid roster row '{}'", csv::formatLine(row));
            continue;
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}

Result<std::map<std::string, int64_t>> RosterStore::readAll() const
{
    const auto rows = readRows();
    if (!rows)
        return error(rows.error());

    std::map<std::string, int64_t> teams;
    for (const auto& entry : rows.value())
        teams[entry.name] = entry.id;
    return teams;
}

Result<std::monostate> RosterStore::append(const RosterEntry& entry) const
{
    std::string text;
    // A last row without a newline would otherwise swallow the new one
    const auto existing = readFile(path_);
    if (existing && !existing->empty() && existing->back() != '\n')
        text.push_back('\n');
    text.append(csv::formatLine({ entry.name, std::to_string(entry.id) }) + "\n");
    return write(text, "a");
}

Result<std::monostate> RosterStore::removeByName(std::string_view name) const
{
    const auto text = readFile(path_);
    if (!text) {
        debug("Could not read roster '{}'", path_.u8string());
        return error(Error::File);
    }

    // Line by line, so comments and rows we can't parse survive untouched
    std::string kept;
    size_t offset = 0;
    while (offset < text->size()) {
        auto end = text->find('\n', offset);
        const auto hasNewline = end != std::string::npos;
        if (!hasNewline)
            end = text->size();
        const auto line = std::string_view(*text).substr(offset, end - offset);
        offset = end + 1;

        auto content = line;
        if (!content.empty() && content.back() == '\r')
            content.remove_suffix(1);
        if (!trim(content).empty()) {
            const auto entry = parseEntry(csv::parseLine(content));
            if (entry && equalsIgnoreCase(entry->name, name))
                continue;
        }
        kept.append(line);
        if (hasNewline)
            kept.push_back('\n');
    }

    if (kept == *text)
        return success();
    return write(kept, "w");
}

Result<std::monostate> RosterStore::write(std::string_view text, const char* mode) const
{
    auto f = uniqueFopen(path_.c_str(), mode);
    if (!f) {
        debug("Could not open roster '{}' for writing", path_.u8string());
        return error(Error::File);
    }
    if (fwrite(text.data(), 1, text.size(), f.get()) != text.size() || fflush(f.get()) != 0) {
        debug("Could not write roster '{}'", path_.u8string());
        return error(Error::File);
    }
    return success();
}

fs::path rosterPath(const Settings& settings)
{
    if (const auto path = getEnv(rosterPathEnvVar))
        return fs::path(*path);
    return fs::path(settings.rosterPath);
}
