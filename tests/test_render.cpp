#include <cstdlib>
#include <ctime>

#include "expect.hpp"
#include "normalize.hpp"
#include "render.hpp"

namespace {

const std::string liverpool = "\x1b[38;2;200;16;46mLiverpool\x1b[39m" + std::string(18, ' ');
const std::string manCity = "\x1b[38;2;108;171;221mManchester City\x1b[39m" + std::string(12, ' ');
const std::string arsenal = "\x1b[38;2;239;1;7mArsenal\x1b[39m" + std::string(20, ' ');
const std::string burnley = "\x1b[38;2;255;255;255mBurnley\x1b[39m" + std::string(20, ' ');

Team makeTeam(int64_t id, std::string name)
{
    Team team;
    team.id = id;
    team.name = std::move(name);
    return team;
}

}

int main()
{
    // Fixed zone, so the local time checks don't depend on the machine
    setenv("TZ", "CST6CDT,M3.2.0,M11.1.0", 1);
    tzset();

    bool ok = true;

    ok &= expectEq(render::formatTime(1700096621), "19:03", "formatTime");
    ok &= expectEq(render::formatDay(1700096621), "11-15", "formatDay");
    ok &= expectEq(render::formatTime(0), "18:00", "formatTime of the epoch");
    ok &= expectEq(render::monthDay("2023-11-15T19:03:41-06:00"), "11-15", "monthDay");
    ok &= expectEq(render::monthDay("soon"), "soon", "monthDay of a short string");

    ok &= expectEq(render::inProgressSuffix("FT"), "", "FT is not in progress");
    ok &= expectEq(render::inProgressSuffix("TBD"), "", "TBD is not in progress");
    ok &= expectEq(render::inProgressSuffix("NS"), "", "NS is not in progress");
    for (const auto code : { "1H", "HT", "2H", "ET", "P", "SUSP", "INT", "LIVE" })
        ok &= expectEq(render::inProgressSuffix(code), "| In Progress", std::string("suffix for ") + code);

    const auto colors = ColorTable::load(dataPath("colors.csv"));
    if (!expect(colors.hasValue(), "load colors.csv"))
        return 1;

    ok &= expectEq(render::teamField(makeTeam(40, "Liverpool"), colors.value()), liverpool,
        "team field is padded to 27 characters");
    ok &= expectEq(render::teamField(makeTeam(44, "Burnley"), colors.value()), burnley,
        "sentinel color renders white");
    ok &= expectEq(render::teamField(makeTeam(1, "Atlético Madrid"), ColorTable()),
        "\x1b[38;2;255;255;255mAtlético Madrid\x1b[39m" + std::string(12, ' '),
        "padding counts characters, not bytes");
    const auto longName = std::string(30, 'x');
    ok &= expectEq(render::teamField(makeTeam(1, longName), ColorTable()),
        "\x1b[38;2;255;255;255m" + longName + "\x1b[39m", "long names get no padding");

    const auto groups = normalize::fixtures({ readData("fixtures.json") });
    if (!expect(groups.hasValue() && groups.value().size() == 1
                && groups.value()[0].size() == 2,
            "normalize fixtures.json"))
        return 1;
    const auto& notStarted = groups.value()[0][0];
    const auto& secondHalf = groups.value()[0][1];

    ok &= expectEq(render::scheduleRow(notStarted, colors.value()),
        manCity + " at " + liverpool + " at 19:03", "schedule row");
    ok &= expectEq(render::scheduleRow(secondHalf, colors.value()),
        burnley + " at " + arsenal + " at 17:00 | In Progress", "schedule row in progress");

    ok &= expect(render::isCompleteLiveFixture(secondHalf), "2H fixture is complete");
    ok &= expect(!render::isCompleteLiveFixture(notStarted), "NS fixture is not complete");
    ok &= expectEq(render::liveRow(secondHalf, colors.value()),
        burnley + " " + arsenal + ": 1 - 2 in 67'", "live row");

    ok &= expectEq(render::scoresRow(secondHalf, colors.value()),
        burnley + " " + arsenal + ": 1 - 2 on 11-15", "scores row");
    ok &= expectEq(render::scoresRow(notStarted, colors.value()),
        manCity + " " + liverpool + ": - - - on 11-15", "scores row without goals");

    const auto tables = normalize::standings({ readData("standings.json") });
    if (!expect(tables.hasValue(), "normalize standings.json"))
        return 1;
    const auto& table = tables.value()[0][0];
    const auto first = render::standingsRows(table[0], colors.value());
    ok &= expectEq(first.size(), 2u, "first row has a group header");
    ok &= expectEq(first.back(), "1 " + liverpool + " 28 WWDWW", "standings row");
    ok &= expect(first.front().find("Premier League") != std::string::npos, "group header");
    const auto second = render::standingsRows(table[1], colors.value());
    ok &= expectEq(second.size(), 1u, "no header after the first row");
    ok &= expectEq(second.front(), "2 " + arsenal + " 27 na", "standings row without form");

    {
        CapturedOutput out;
        render::schedule(FixtureGroups { {} }, colors.value(), out.get());
        ok &= expectEq(out.str(), "No fixtures today\n", "empty schedule");
    }

    {
        CapturedOutput out;
        render::schedule(groups.value(), colors.value(), out.get());
        const auto text = out.str();
        ok &= expect(text.find("Premier League (England)") != std::string::npos, "league header");
        ok &= expect(text.find(manCity + " at " + liverpool + " at 19:03\n") != std::string::npos,
            "schedule output contains the row");
    }

    {
        CapturedOutput out;
        render::scores(FixtureGroups { {} }, colors.value(), out.get());
        ok &= expectEq(out.str(), "No fixtures to show\n", "empty scores");
    }

    {
        CapturedOutput out;
        render::roster({ RosterEntry { "Liverpool", 40 } }, colors.value(), out.get());
        ok &= expectEq(out.str(), "\x1b[38;2;200;16;46mLiverpool\x1b[39m\n", "roster listing");
    }

    return ok ? 0 : 1;
}
