#include <cstdlib>

#include <nlohmann/json.hpp>

#include "commands.hpp"
#include "expect.hpp"
#include "fake_http.hpp"
#include "roster.hpp"

namespace {

class InputFile {
public:
    InputFile(std::string text)
        : text_(std::move(text))
        , file_(fmemopen(text_.data(), text_.size(), "r"))
    {
    }

    ~InputFile()
    {
        if (file_)
            fclose(file_);
    }

    InputFile(const InputFile&) = delete;
    InputFile& operator=(const InputFile&) = delete;

    FILE* get() const
    {
        return file_;
    }

private:
    std::string text_;
    FILE* file_;
};

struct RunResult {
    bool success;
    std::string out;
    std::string err;
};

RunResult run(CommandKind kind, const Settings& settings, FakeHttpClient& http,
    const std::string& input = "")
{
    const api::Client client(http, "secret", settings);
    InputFile in(input);
    CapturedOutput out;
    CapturedOutput err;
    Context ctx { settings, client, in.get(), out.get(), err.get() };
    const auto success = runCommand(kind, ctx);
    return RunResult { success, out.str(), err.str() };
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

std::string liveOnly()
{
    auto doc = nlohmann::json::parse(readData("fixtures.json"));
    auto& response = doc["response"];
    response.erase(response.begin());
    return doc.dump();
}

}

int main()
{
    setenv("TZ", "CST6CDT,M3.2.0,M11.1.0", 1);
    tzset();
    unsetenv(rosterPathEnvVar);

    bool ok = true;

    ok &= expect(parseCommandKind("schedule") == CommandKind::Schedule, "parse schedule");
    ok &= expect(parseCommandKind("live") == CommandKind::Live, "parse live");
    ok &= expect(parseCommandKind("scores") == CommandKind::Scores, "parse scores");
    ok &= expect(parseCommandKind("teams") == CommandKind::Teams, "parse teams");
    ok &= expect(parseCommandKind("standings") == CommandKind::Standings, "parse standings");
    ok &= expect(!parseCommandKind("Schedule"), "command names are case-sensitive");
    ok &= expect(!parseCommandKind("table"), "unknown command");
    ok &= expectEq(toString(CommandKind::Standings), "standings", "toString");

    Settings settings;
    settings.preferredLeagues = { 39, 140 };
    settings.allLeagues = { 39, 140, 2 };
    settings.colorsPath = dataPath("colors.csv").u8string();
    settings.rosterPath = scratchCopy("teams.csv", "commands_roster.csv").u8string();

    {
        FakeHttpClient http;
        http.bodies["league=39&"] = readData("fixtures.json");
        const auto res = run(CommandKind::Schedule, settings, http);
        ok &= expect(res.success, "schedule succeeds");
        ok &= expectEq(http.requested.size(), 2u, "one request per preferred league");
        if (http.requested.size() == 2) {
            const auto date = http.requested[0].substr(http.requested[0].find("&date="));
            ok &= expect(contains(http.requested[1], date), "same date for every league");
        }
        ok &= expect(contains(res.out, "Premier League (England)"), "schedule league header");
        ok &= expect(contains(res.out, "at 17:00 | In Progress"), "schedule in-progress row");
        ok &= expect(contains(res.out, "at 19:03\n"), "schedule not started row");
    }

    {
        FakeHttpClient http;
        http.failOn = "league=140";
        const auto res = run(CommandKind::Schedule, settings, http);
        ok &= expect(!res.success, "schedule fails on a transport error");
        ok &= expect(contains(res.err, "Error from the API"), "transport error message");
        ok &= expect(res.out.empty(), "nothing rendered after a transport error");
    }

    {
        FakeHttpClient http;
        http.bodies["league=39&"] = R"({"errors": {"token": "bad"}})";
        const auto res = run(CommandKind::Schedule, settings, http);
        ok &= expect(!res.success && contains(res.err, "Error parsing fixtures"),
            "schedule parse error message");
    }

    {
        auto noLeagues = settings;
        noLeagues.preferredLeagues.clear();
        FakeHttpClient http;
        const auto res = run(CommandKind::Schedule, noLeagues, http);
        ok &= expect(res.success && res.out == "No fixtures today\n", "empty schedule");
        ok &= expect(http.requested.empty(), "no leagues, no requests");
    }

    {
        FakeHttpClient http;
        http.bodies["live="] = liveOnly();
        const auto res = run(CommandKind::Live, settings, http);
        ok &= expect(res.success, "live succeeds");
        ok &= expect(http.requested.size() == 1 && contains(http.requested[0], "live=39-140-2"),
            "one aggregate live request");
        ok &= expect(contains(res.out, ": 1 - 2 in 67'"), "live row");
    }

    {
        FakeHttpClient http;
        http.bodies["live="] = readData("fixtures.json");
        const auto res = run(CommandKind::Live, settings, http);
        ok &= expect(!res.success && contains(res.err, "Error parsing fixtures"),
            "live fixture without goals is rejected");
    }

    {
        FakeHttpClient http;
        const auto res = run(CommandKind::Live, settings, http);
        ok &= expect(res.success && res.out == "No live fixtures\n", "no live fixtures");
    }

    {
        FakeHttpClient http;
        http.bodies["team=40&"] = readData("fixtures.json");
        const auto res = run(CommandKind::Scores, settings, http);
        ok &= expect(res.success, "scores succeeds");
        ok &= expect(http.requested.size() == 2 && contains(http.requested[0], "team=42&last=2")
                && contains(http.requested[1], "team=40&last=2"),
            "one request per favorite team");
        ok &= expect(contains(res.out, ": 1 - 2 on 11-15"), "scores row");
        ok &= expect(contains(res.out, ": - - - on 11-15"), "scores row for a future fixture");
    }

    {
        auto noRoster = settings;
        noRoster.rosterPath = "does_not_exist.csv";
        FakeHttpClient http;
        const auto res = run(CommandKind::Scores, noRoster, http);
        ok &= expect(!res.success && contains(res.err, "Error reading does_not_exist.csv"),
            "scores without a roster fails");
        ok &= expect(http.requested.empty(), "no requests without a roster");
    }

    {
        auto oneLeague = settings;
        oneLeague.preferredLeagues = { 39 };
        FakeHttpClient http;
        http.bodies["standings?league=39&"] = readData("standings.json");
        const auto res = run(CommandKind::Standings, oneLeague, http);
        ok &= expect(res.success, "standings succeeds");
        ok &= expect(contains(res.out, " 28 WWDWW\n"), "standings row");
        ok &= expect(contains(res.out, " 27 na\n"), "standings row without form");
    }

    {
        FakeHttpClient http;
        const auto res = run(CommandKind::Standings, settings, http);
        ok &= expect(!res.success && contains(res.err, "Error parsing standings"),
            "empty standings response is an error");
    }

    {
        auto badColors = settings;
        badColors.colorsPath = dataPath("colors_malformed.csv").u8string();
        FakeHttpClient http;
        const auto res = run(CommandKind::Live, badColors, http);
        ok &= expect(!res.success && contains(res.err, "Error reading"),
            "malformed color file is reported");
    }

    {
        const auto before = readFile(settings.rosterPath).value_or("");

        FakeHttpClient http;
        http.bodies["teams?name=Chelsea"] = readData("teams_search.json");
        auto res = run(CommandKind::Teams, settings, http, "a\nChelsea\n");
        ok &= expect(res.success && contains(res.out, "Added Chelsea"), "add a team");
        ok &= expectEq(readFile(settings.rosterPath).value_or(""), before + "Chelsea,49\n",
            "team appended to the roster");

        res = run(CommandKind::Teams, settings, http, "  A\nChelsea\n");
        ok &= expect(res.success && contains(res.out, "already a favorite"), "no duplicates");

        res = run(CommandKind::Teams, settings, http, "a\nNobody FC\n");
        ok &= expect(contains(res.err, "Nobody FC is not a valid team"), "unknown team");

        res = run(CommandKind::Teams, settings, http, "r\nchelsea\n");
        ok &= expect(res.success && contains(res.out, "Removed chelsea"), "remove a team");
        ok &= expect(contains(res.out, "Liverpool"), "roster is listed before removing");
        ok &= expectEq(readFile(settings.rosterPath).value_or(""), before, "team removed");

        res = run(CommandKind::Teams, settings, http, "r\nEverton\n");
        ok &= expect(res.success && contains(res.out, "Removed Everton"),
            "removing an unknown team still confirms");

        res = run(CommandKind::Teams, settings, http, "x\n");
        ok &= expect(!res.success && contains(res.err, "Invalid input"), "invalid choice");

        res = run(CommandKind::Teams, settings, http, "\n");
        ok &= expect(!res.success && contains(res.err, "Invalid input"), "no input");
    }

    return ok ? 0 : 1;
}
