#include "commands.hpp"

#include <cctype>
#include <ctime>

#include <fmt/format.h>

#include "debug.hpp"
#include "render.hpp"
#include "roster.hpp"
#include "util.hpp"

void reportError(FILE* err, const std::error_code& ec, std::string_view subject)
{
    if (ec == Error::Transport) {
        fmt::print(err, "Error from the API: {}\n", ec.message());
    } else if (ec == Error::MissingField || ec == Error::Deserialization) {
        fmt::print(err, "Error parsing {}: {}\n", subject, ec.message());
    } else if (ec == Error::File || ec == Error::ColorFormat) {
        fmt::print(err, "Error reading {}: {}\n", subject, ec.message());
    } else if (ec == Error::NotFound) {
        fmt::print(err, "{} is not a valid team\n", subject);
    } else {
        fmt::print(err, "Error: {}\n", ec.message());
    }
}

Result<FixtureGroups> ScheduleOperation::fetch(Context& ctx)
{
    // Once for all leagues, so the calls can't straddle midnight
    const auto today = toLocalTime(std::time(nullptr));
    std::vector<std::string> urls;
    for (const auto league : ctx.settings.preferredLeagues)
        urls.push_back(api::scheduleUrl(ctx.settings, league, today));

    const auto bodies = ctx.client.fetchAll(urls);
    if (!bodies)
        return error(bodies.error());
    return normalize::fixtures(bodies.value());
}

void ScheduleOperation::render(Context& ctx, const FixtureGroups& groups, const ColorTable& colors)
{
    render::schedule(groups, colors, ctx.out);
}

Result<FixtureGroups> LiveOperation::fetch(Context& ctx)
{
    const auto body = ctx.client.fetch(api::liveUrl(ctx.settings));
    if (!body)
        return error(body.error());
    auto groups = normalize::fixtures({ body.value() });
    if (!groups)
        return groups;

    for (const auto& group : groups.value()) {
        for (const auto& fixture : group) {
            if (!render::isCompleteLiveFixture(fixture)) {
                debug("Live fixture {} has no goals or elapsed time", fixture.id);
                return error(Error::MissingField);
            }
        }
    }
    return groups;
}

void LiveOperation::render(Context& ctx, const FixtureGroups& groups, const ColorTable& colors)
{
    render::live(groups, colors, ctx.out);
}

Result<FixtureGroups> ScoresOperation::fetch(Context& ctx)
{
    const auto teams = RosterStore(rosterPath(ctx.settings)).readAll();
    if (!teams)
        return error(teams.error());

    std::vector<std::string> urls;
    for (const auto& [name, id] : teams.value()) {
        debug("Fetching fixtures for {} ({})", name, id);
        urls.push_back(api::teamFixturesUrl(ctx.settings, id));
    }

    const auto bodies = ctx.client.fetchAll(urls);
    if (!bodies)
        return error(bodies.error());
    return normalize::fixtures(bodies.value());
}

void ScoresOperation::render(Context& ctx, const FixtureGroups& groups, const ColorTable& colors)
{
    render::scores(groups, colors, ctx.out);
}

void ScoresOperation::report(Context& ctx, const std::error_code& ec)
{
    if (ec == Error::File)
        reportError(ctx.err, ec, rosterPath(ctx.settings).u8string());
    else
        FetchRenderOperation::report(ctx, ec);
}

Result<StandingTables> StandingsOperation::fetch(Context& ctx)
{
    std::vector<std::string> urls;
    for (const auto league : ctx.settings.preferredLeagues)
        urls.push_back(api::standingsUrl(ctx.settings, league));

    const auto bodies = ctx.client.fetchAll(urls);
    if (!bodies)
        return error(bodies.error());
    return normalize::standings(bodies.value());
}

void StandingsOperation::render(
    Context& ctx, const StandingTables& tables, const ColorTable& colors)
{
    render::standings(tables, colors, ctx.out);
}

std::string_view StandingsOperation::recordName() const
{
    return "standings";
}

namespace {
std::string prompt(Context& ctx, std::string_view text)
{
    fmt::print(ctx.out, "{}", text);
    fflush(ctx.out);
    return std::string(trim(readLine(ctx.in).value_or("")));
}
}

bool RosterEditOperation::run(Context& ctx)
{
    const auto input = prompt(ctx, "Add or remove a team? [a/r]> ");
    const auto choice = input.empty() ? '\0' : std::tolower(static_cast<unsigned char>(input[0]));
    if (choice == 'a')
        return add(ctx);
    if (choice == 'r')
        return remove(ctx);
    fmt::print(ctx.err, "Invalid input\n");
    return false;
}

bool RosterEditOperation::add(Context& ctx)
{
    const auto query = prompt(ctx, "Team name> ");
    if (query.empty()) {
        fmt::print(ctx.err, "Invalid input\n");
        return false;
    }

    const auto team = ctx.client.searchTeam(query);
    if (!team) {
        reportError(ctx.err, team.error(), team.error() == Error::NotFound ? query : "teams");
        return team.error() == Error::NotFound;
    }

    const auto store = RosterStore(rosterPath(ctx.settings));
    // A missing file just means nobody has been added yet
    if (const auto rows = store.readRows()) {
        for (const auto& entry : rows.value()) {
            if (equalsIgnoreCase(entry.name, team->name)) {
                fmt::print(ctx.out, "{} is already a favorite team\n", entry.name);
                return true;
            }
        }
    }

    const auto res = store.append(team.value());
    if (!res) {
        fmt::print(ctx.err, "Error writing {}: {}\n", store.getPath().u8string(),
            res.error().message());
        return false;
    }
    fmt::print(ctx.out, "Added {}\n", team->name);
    return true;
}

bool RosterEditOperation::remove(Context& ctx)
{
    const auto store = RosterStore(rosterPath(ctx.settings));
    const auto rows = store.readRows();
    if (!rows) {
        reportError(ctx.err, rows.error(), store.getPath().u8string());
        return false;
    }
    const auto colors = ColorTable::loadOrEmpty(ctx.settings.colorsPath);
    if (!colors) {
        reportError(ctx.err, colors.error(), ctx.settings.colorsPath);
        return false;
    }
    render::roster(rows.value(), colors.value(), ctx.out);

    const auto name = prompt(ctx, "Team to remove> ");
    const auto res = store.removeByName(name);
    if (!res) {
        fmt::print(ctx.err, "Error writing {}: {}\n", store.getPath().u8string(),
            res.error().message());
        return false;
    }
    fmt::print(ctx.out, "Removed {}\n", name);
    return true;
}

std::unique_ptr<Operation> makeOperation(CommandKind kind)
{
    switch (kind) {
    case CommandKind::Schedule:
        return std::make_unique<ScheduleOperation>();
    case CommandKind::Live:
        return std::make_unique<LiveOperation>();
    case CommandKind::Scores:
        return std::make_unique<ScoresOperation>();
    case CommandKind::Teams:
        return std::make_unique<RosterEditOperation>();
    case CommandKind::Standings:
        return std::make_unique<StandingsOperation>();
    default:
        die("Invalid command kind");
    }
}

bool runCommand(CommandKind kind, Context& ctx)
{
    debug("Running '{}'", toString(kind));
    return makeOperation(kind)->run(ctx);
}
