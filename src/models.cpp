#include "models.hpp"

namespace {
template <typename T>
std::optional<T> getOptional(const json& j, const char* key)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

template <typename T>
void getOptionalTo(const json& j, const char* key, T& value)
{
    const auto it = j.find(key);
    if (it != j.end() && !it->is_null())
        it->get_to(value);
}
}

void from_json(const json& j, Team& team)
{
    j.at("id").get_to(team.id);
    j.at("name").get_to(team.name);
    team.logo = getOptional<std::string>(j, "logo").value_or("");
    team.winner = getOptional<bool>(j, "winner");
}

void from_json(const json& j, Venue& venue)
{
    venue.id = getOptional<int64_t>(j, "id");
    venue.name = getOptional<std::string>(j, "name");
    venue.city = getOptional<std::string>(j, "city");
}

void from_json(const json& j, Status& status)
{
    j.at("long").get_to(status.longLabel);
    j.at("short").get_to(status.shortCode);
    status.elapsed = getOptional<int64_t>(j, "elapsed");
}

void from_json(const json& j, Periods& periods)
{
    periods.first = getOptional<int64_t>(j, "first");
    periods.second = getOptional<int64_t>(j, "second");
}

void from_json(const json& j, LeagueSummary& league)
{
    j.at("id").get_to(league.id);
    j.at("name").get_to(league.name);
    j.at("country").get_to(league.country);
    j.at("logo").get_to(league.logo);
    league.flag = getOptional<std::string>(j, "flag");
    j.at("season").get_to(league.season);
    league.round = getOptional<std::string>(j, "round");
}

void from_json(const json& j, Goals& goals)
{
    goals.home = getOptional<int64_t>(j, "home");
    goals.away = getOptional<int64_t>(j, "away");
}

void from_json(const json& j, Score& score)
{
    getOptionalTo(j, "halftime", score.halftime);
    getOptionalTo(j, "fulltime", score.fulltime);
    getOptionalTo(j, "extratime", score.extratime);
    getOptionalTo(j, "penalty", score.penalty);
}

void from_json(const json& j, Fixture& fixture)
{
    const auto& f = j.at("fixture");
    f.at("id").get_to(fixture.id);
    fixture.referee = getOptional<std::string>(f, "referee");
    f.at("timezone").get_to(fixture.timezone);
    f.at("date").get_to(fixture.date);
    f.at("timestamp").get_to(fixture.timestamp);
    getOptionalTo(f, "periods", fixture.periods);
    fixture.venue = getOptional<Venue>(f, "venue");
    f.at("status").get_to(fixture.status);

    j.at("league").get_to(fixture.league);
    j.at("teams").at("home").get_to(fixture.home);
    j.at("teams").at("away").get_to(fixture.away);
    getOptionalTo(j, "goals", fixture.goals);
    fixture.score = getOptional<Score>(j, "score");
}

void from_json(const json& j, Stats& stats)
{
    j.at("played").get_to(stats.played);
    j.at("win").get_to(stats.win);
    j.at("draw").get_to(stats.draw);
    j.at("lose").get_to(stats.lose);
    // These are null for teams that have not played yet
    const auto& goals = j.at("goals");
    stats.goalsFor = getOptional<int64_t>(goals, "for").value_or(0);
    stats.goalsAgainst = getOptional<int64_t>(goals, "against").value_or(0);
}

void from_json(const json& j, TeamStanding& standing)
{
    j.at("rank").get_to(standing.rank);
    j.at("team").get_to(standing.team);
    j.at("points").get_to(standing.points);
    j.at("goalsDiff").get_to(standing.goalsDiff);
    standing.group = getOptional<std::string>(j, "group");
    standing.form = getOptional<std::string>(j, "form");
    standing.status = getOptional<std::string>(j, "status");
    standing.description = getOptional<std::string>(j, "description");
    j.at("all").get_to(standing.all);
    j.at("home").get_to(standing.home);
    j.at("away").get_to(standing.away);
}
