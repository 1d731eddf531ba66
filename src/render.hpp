#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "colortable.hpp"
#include "models.hpp"
#include "normalize.hpp"

namespace render {
// Team names are padded to this many characters, so the rows line up
inline constexpr size_t teamFieldWidth = 27;

// Local time
std::string formatTime(int64_t timestamp); // HH:MM
std::string formatDay(int64_t timestamp); // MM-DD

// "2023-11-15T19:00:00-06:00" -> "11-15"
std::string_view monthDay(std::string_view isoDate);

// Empty for "FT", "TBD" and "NS", "| In Progress" for everything else
std::string_view inProgressSuffix(std::string_view statusShort);

// The colored name followed by enough spaces to fill teamFieldWidth. The padding is computed from
// the name alone, so the escape sequences don't count.
std::string teamField(const Team& team, const ColorTable& colors);

std::string leagueHeader(const LeagueSummary& league);

// <away> at <home> at <HH:MM> [| In Progress]
std::string scheduleRow(const Fixture& fixture, const ColorTable& colors);

// <away> <home>: <awayGoals> - <homeGoals> in <elapsed>'
// Only valid for fixtures that report goals and elapsed time (see isCompleteLiveFixture).
std::string liveRow(const Fixture& fixture, const ColorTable& colors);

// <away> <home>: <awayGoals> - <homeGoals> on <MM-DD>
std::string scoresRow(const Fixture& fixture, const ColorTable& colors);

// <rank> <team> <points> <form or "na">, preceded by the group label for the first row of a group
std::vector<std::string> standingsRows(const TeamStanding& standing, const ColorTable& colors);

bool isCompleteLiveFixture(const Fixture& fixture);

void schedule(const FixtureGroups& groups, const ColorTable& colors, FILE* out);
void live(const FixtureGroups& groups, const ColorTable& colors, FILE* out);
void scores(const FixtureGroups& groups, const ColorTable& colors, FILE* out);
void standings(const StandingTables& tables, const ColorTable& colors, FILE* out);
void roster(const std::vector<RosterEntry>& entries, const ColorTable& colors, FILE* out);
}
