#include "normalize.hpp"

#include "debug.hpp"

namespace normalize {
namespace {
    // Returns the `response` member of the envelope
    Result<json> unwrap(const std::string& body)
    {
        auto doc = json::parse(body, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            debug("Response is not a JSON object: {}", body.substr(0, 200));
            return error(Error::Deserialization);
        }

        const auto errors = doc.find("errors");
        if (errors != doc.end() && !errors->empty())
            debug("API reported errors: {}", errors->dump());

        const auto response = doc.find("response");
        if (response == doc.end()) {
            debug("Envelope has no 'response'");
            return error(Error::MissingField);
        }
        return success(std::move(*response));
    }
}

Result<FixtureGroups> fixtures(const std::vector<std::string>& bodies)
{
    if (bodies.empty())
        return FixtureGroups { std::vector<Fixture> {} };

    FixtureGroups groups;
    groups.reserve(bodies.size());
    for (const auto& body : bodies) {
        const auto response = unwrap(body);
        if (!response)
            return error(response.error());
        try {
            groups.push_back(response.value().get<std::vector<Fixture>>());
        } catch (const json::exception& exc) {
            debug("Could not deserialize fixtures: {}", exc.what());
            return error(Error::Deserialization);
        }
    }
    return groups;
}

Result<StandingTables> standings(const std::vector<std::string>& bodies)
{
    StandingTables tables;
    tables.reserve(bodies.size());
    for (const auto& body : bodies) {
        const auto response = unwrap(body);
        if (!response)
            return error(response.error());
        const auto& leagues = response.value();
        if (!leagues.is_array() || leagues.empty()) {
            debug("Standings response is empty");
            return error(Error::MissingField);
        }
        try {
            tables.push_back(leagues.at(0)
                                 .at("league")
                                 .at("standings")
                                 .get<std::vector<std::vector<TeamStanding>>>());
        } catch (const json::exception& exc) {
            debug("Could not deserialize standings: {}", exc.what());
            return error(Error::Deserialization);
        }
    }
    return tables;
}

Result<std::vector<RosterEntry>> teamSearch(const std::string& body)
{
    const auto response = unwrap(body);
    if (!response)
        return error(response.error());

    std::vector<RosterEntry> teams;
    try {
        for (const auto& item : response.value()) {
            const auto& team = item.at("team");
            teams.push_back(
                RosterEntry { team.at("name").get<std::string>(), team.at("id").get<int64_t>() });
        }
    } catch (const json::exception& exc) {
        debug("Could not deserialize teams: {}", exc.what());
        return error(Error::Deserialization);
    }
    return teams;
}
}
