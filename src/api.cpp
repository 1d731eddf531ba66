#include "api.hpp"

#include <fmt/format.h>

#include "debug.hpp"
#include "normalize.hpp"

namespace api {
std::string formatDate(const std::tm& date)
{
    return fmt::format("{:04}-{:02}-{:02}", date.tm_year + 1900, date.tm_mon + 1, date.tm_mday);
}

std::string scheduleUrl(const Settings& settings, int64_t league, const std::tm& date)
{
    return fmt::format("{}league={}&season={}&date={}", settings.endpoint("fixtures"), league,
        date.tm_year + 1900, formatDate(date));
}

std::string liveUrl(const Settings& settings)
{
    return fmt::format("{}live={}", settings.endpoint("fixtures"), join(settings.allLeagues, "-"));
}

std::string teamFixturesUrl(const Settings& settings, int64_t team)
{
    return fmt::format("{}season={}&team={}&last={}", settings.endpoint("fixtures"),
        settings.season, team, settings.lastFixtures);
}

std::string standingsUrl(const Settings& settings, int64_t league)
{
    return fmt::format(
        "{}league={}&season={}", settings.endpoint("standings"), league, settings.season);
}

std::string teamSearchUrl(const Settings& settings, std::string_view name)
{
    return fmt::format("{}name={}", settings.endpoint("teams"), percentEncode(name));
}

Client::Client(HttpClient& http, std::string apiKey, const Settings& settings)
    : http_(http)
    , apiKey_(std::move(apiKey))
    , settings_(settings)
{
}

Result<std::string> Client::fetch(const std::string& url) const
{
    return http_.get(url,
        {
            "X-RapidAPI-KEY: " + apiKey_,
            "X-RapidAPI-Host: " + settings_.apiHost,
        });
}

Result<std::vector<std::string>> Client::fetchAll(const std::vector<std::string>& urls) const
{
    std::vector<std::string> bodies;
    bodies.reserve(urls.size());
    for (const auto& url : urls) {
        auto body = fetch(url);
        if (!body) {
            debug("Aborting batch at {}", url);
            return error(body.error());
        }
        bodies.push_back(std::move(body).value());
    }
    return bodies;
}

Result<RosterEntry> Client::searchTeam(std::string_view name) const
{
    const auto body = fetch(teamSearchUrl(settings_, name));
    if (!body)
        return error(body.error());
    const auto teams = normalize::teamSearch(body.value());
    if (!teams)
        return error(teams.error());
    if (teams.value().empty())
        return error(Error::NotFound);
    return teams.value().front();
}
}
