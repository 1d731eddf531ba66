#pragma once

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "config.hpp"
#include "models.hpp"
#include "result.hpp"

// The favorite teams, one `name,id` row per team
class RosterStore {
public:
    RosterStore(fs::path path);

    const fs::path& getPath() const;

    // Rows in file order. Error::File if the file can't be read.
    Result<std::vector<RosterEntry>> readRows() const;

    // Duplicate names are not reconciled, the last row wins.
    Result<std::map<std::string, int64_t>> readAll() const;

    // Creates the file if necessary. Existing rows are never touched, a missing newline after the
    // last one is added.
    Result<std::monostate> append(const RosterEntry& entry) const;

    // Removes every row whose name matches case-insensitively. All other lines, including ones
    // that are not valid rows, are written back as they were. Removing a name that isn't there is
    // not an error.
    Result<std::monostate> removeByName(std::string_view name) const;

private:
    Result<std::monostate> write(std::string_view text, const char* mode) const;

    fs::path path_;
};

inline constexpr auto rosterPathEnvVar = "FOOTY_TEAMS_FILE";

// FOOTY_TEAMS_FILE if it is set (read every time), settings.rosterPath otherwise
fs::path rosterPath(const Settings& settings);
