#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "commandkind.hpp"
#include "util.hpp"

struct Settings {
    // Leagues shown by "schedule" and "standings"
    std::vector<int64_t> preferredLeagues = { 39, 140, 135, 78, 61 };
    // Superset of preferredLeagues, only used for the aggregate "live" query
    std::vector<int64_t> allLeagues = { 39, 140, 135, 78, 61, 2, 3, 848, 253 };
    CommandKind defaultCommand = CommandKind::Schedule;

    // "schedule" uses the year of today's date instead
    int64_t season = 2023;
    int64_t lastFixtures = 2;

    std::string apiHost = "api-football-v1.p.rapidapi.com";

    std::string rosterPath = "data/teams.csv";
    std::string colorsPath = "data/colors.csv";

    // e.g. "fixtures" -> "https://<apiHost>/v3/fixtures?"
    std::string endpoint(std::string_view name) const;
};

fs::path getConfigDirectory();

// Defaults, overridden by config.lua in the config directory and footy.lua in the working
// directory. Throws sol::error if one of the scripts is broken.
Settings loadSettings();
