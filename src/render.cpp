#include "render.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "control.hpp"
#include "utf8.hpp"
#include "util.hpp"

namespace render {
namespace {
    bool isEmpty(const FixtureGroups& groups)
    {
        return std::all_of(groups.begin(), groups.end(),
            [](const std::vector<Fixture>& group) { return group.empty(); });
    }

    std::string goalsString(const std::optional<int64_t>& goals)
    {
        return goals ? std::to_string(*goals) : "-";
    }

    void printLine(FILE* out, std::string_view line)
    {
        fmt::print(out, "{}\n", line);
    }
}

std::string formatTime(int64_t timestamp)
{
    const auto tm = toLocalTime(static_cast<std::time_t>(timestamp));
    return fmt::format("{:02}:{:02}", tm.tm_hour, tm.tm_min);
}

std::string formatDay(int64_t timestamp)
{
    const auto tm = toLocalTime(static_cast<std::time_t>(timestamp));
    return fmt::format("{:02}-{:02}", tm.tm_mon + 1, tm.tm_mday);
}

std::string_view monthDay(std::string_view isoDate)
{
    if (isoDate.size() < 10)
        return isoDate;
    return isoDate.substr(5, 5);
}

std::string_view inProgressSuffix(std::string_view statusShort)
{
    if (statusShort == "FT" || statusShort == "TBD" || statusShort == "NS")
        return "";
    return "| In Progress";
}

std::string teamField(const Team& team, const ColorTable& colors)
{
    const auto width = utf8::countCodePoints(team.name);
    auto field = control::sgr::colored(team.name, colors.get(team.id));
    field.append(subClamp(teamFieldWidth, width), ' ');
    return field;
}

std::string leagueHeader(const LeagueSummary& league)
{
    return control::sgr::colored(fmt::format("{} ({})", league.name, league.country), palette::header);
}

std::string scheduleRow(const Fixture& fixture, const ColorTable& colors)
{
    auto row = fmt::format("{} at {} at {}", teamField(fixture.away, colors),
        teamField(fixture.home, colors), formatTime(fixture.timestamp));
    const auto suffix = inProgressSuffix(fixture.status.shortCode);
    if (!suffix.empty()) {
        row.push_back(' ');
        row.append(suffix);
    }
    return row;
}

std::string liveRow(const Fixture& fixture, const ColorTable& colors)
{
    return fmt::format("{} {}: {} - {} in {}'", teamField(fixture.away, colors),
        teamField(fixture.home, colors), fixture.goals.away.value(), fixture.goals.home.value(),
        fixture.status.elapsed.value());
}

std::string scoresRow(const Fixture& fixture, const ColorTable& colors)
{
    return fmt::format("{} {}: {} - {} on {}", teamField(fixture.away, colors),
        teamField(fixture.home, colors), goalsString(fixture.goals.away),
        goalsString(fixture.goals.home), monthDay(fixture.date));
}

std::vector<std::string> standingsRows(const TeamStanding& standing, const ColorTable& colors)
{
    std::vector<std::string> rows;
    if (standing.rank == 1 && standing.group)
        rows.push_back(control::sgr::colored(*standing.group, palette::header));
    rows.push_back(fmt::format("{} {} {} {}", standing.rank, teamField(standing.team, colors),
        standing.points, standing.form.value_or("na")));
    return rows;
}

bool isCompleteLiveFixture(const Fixture& fixture)
{
    return fixture.goals.home && fixture.goals.away && fixture.status.elapsed;
}

void schedule(const FixtureGroups& groups, const ColorTable& colors, FILE* out)
{
    if (isEmpty(groups)) {
        printLine(out, "No fixtures today");
        return;
    }
    for (const auto& group : groups) {
        if (group.empty())
            continue;
        printLine(out, leagueHeader(group.front().league));
        for (const auto& fixture : group)
            printLine(out, scheduleRow(fixture, colors));
        printLine(out, "");
    }
}

void live(const FixtureGroups& groups, const ColorTable& colors, FILE* out)
{
    if (isEmpty(groups)) {
        printLine(out, "No live fixtures");
        return;
    }
    for (const auto& group : groups) {
        for (const auto& fixture : group)
            printLine(out, liveRow(fixture, colors));
    }
}

void scores(const FixtureGroups& groups, const ColorTable& colors, FILE* out)
{
    if (isEmpty(groups)) {
        printLine(out, "No fixtures to show");
        return;
    }
    for (const auto& group : groups) {
        for (const auto& fixture : group)
            printLine(out, scoresRow(fixture, colors));
    }
}

void standings(const StandingTables& tables, const ColorTable& colors, FILE* out)
{
    for (const auto& league : tables) {
        for (const auto& group : league) {
            for (const auto& standing : group) {
                for (const auto& row : standingsRows(standing, colors))
                    printLine(out, row);
            }
        }
        printLine(out, "");
    }
}

void roster(const std::vector<RosterEntry>& entries, const ColorTable& colors, FILE* out)
{
    for (const auto& entry : entries)
        printLine(out, control::sgr::colored(entry.name, colors.get(entry.id)));
}
}
