#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct Team {
    int64_t id = 0;
    std::string name;
    std::string logo;
    // true: this team won, false: it lost, nullopt: draw or not decided yet
    std::optional<bool> winner;
};

struct Venue {
    std::optional<int64_t> id;
    std::optional<std::string> name;
    std::optional<std::string> city;
};

struct Status {
    std::string longLabel;
    std::string shortCode; // "NS", "TBD", "FT", "1H", "HT", "2H", ...
    std::optional<int64_t> elapsed;
};

struct Periods {
    std::optional<int64_t> first;
    std::optional<int64_t> second;
};

struct LeagueSummary {
    int64_t id = 0;
    std::string name;
    std::string country;
    std::string logo;
    std::optional<std::string> flag;
    int64_t season = 0;
    std::optional<std::string> round;
};

struct Goals {
    std::optional<int64_t> home;
    std::optional<int64_t> away;
};

struct Score {
    Goals halftime;
    Goals fulltime;
    Goals extratime;
    Goals penalty;
};

struct Fixture {
    int64_t id = 0;
    std::optional<std::string> referee;
    std::string timezone;
    std::string date; // ISO 8601, e.g. "2023-11-15T19:00:00-06:00"
    int64_t timestamp = 0;
    Periods periods;
    std::optional<Venue> venue;
    Status status;
    LeagueSummary league;
    Team home;
    Team away;
    Goals goals;
    std::optional<Score> score;
};

struct Stats {
    int64_t played = 0;
    int64_t win = 0;
    int64_t draw = 0;
    int64_t lose = 0;
    int64_t goalsFor = 0;
    int64_t goalsAgainst = 0;
};

struct TeamStanding {
    int64_t rank = 0;
    Team team;
    int64_t points = 0;
    int64_t goalsDiff = 0;
    std::optional<std::string> group;
    std::optional<std::string> form;
    std::optional<std::string> status;
    std::optional<std::string> description;
    Stats all;
    Stats home;
    Stats away;
};

struct RosterEntry {
    std::string name;
    int64_t id = 0;

    bool operator==(const RosterEntry& other) const
    {
        return name == other.name && id == other.id;
    }
};

// These throw nlohmann::json::exception for missing required fields or wrong types.
// Optional fields may be missing or null.
void from_json(const json& j, Team& team);
void from_json(const json& j, Venue& venue);
void from_json(const json& j, Status& status);
void from_json(const json& j, Periods& periods);
void from_json(const json& j, LeagueSummary& league);
void from_json(const json& j, Goals& goals);
void from_json(const json& j, Score& score);
void from_json(const json& j, Fixture& fixture);
void from_json(const json& j, Stats& stats);
void from_json(const json& j, TeamStanding& standing);
