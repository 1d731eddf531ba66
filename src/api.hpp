#pragma once

#include <ctime>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "http.hpp"
#include "models.hpp"
#include "result.hpp"

namespace api {
inline constexpr auto apiKeyEnvVar = "FOOTY_API_KEY";

// "YYYY-MM-DD" in local time
std::string formatDate(const std::tm& date);

// URL templates for the API-Football v3 endpoints
std::string scheduleUrl(const Settings& settings, int64_t league, const std::tm& date);
std::string liveUrl(const Settings& settings);
std::string teamFixturesUrl(const Settings& settings, int64_t team);
std::string standingsUrl(const Settings& settings, int64_t league);
std::string teamSearchUrl(const Settings& settings, std::string_view name);

class Client {
public:
    Client(HttpClient& http, std::string apiKey, const Settings& settings);

    // A single GET with the RapidAPI headers
    Result<std::string> fetch(const std::string& url) const;

    // The requests are done one after the other. The first failure aborts the batch and is the
    // only thing returned.
    Result<std::vector<std::string>> fetchAll(const std::vector<std::string>& urls) const;

    // First match of the teams search. Error::NotFound if there is none.
    Result<RosterEntry> searchTeam(std::string_view name) const;

private:
    HttpClient& http_;
    std::string apiKey_;
    const Settings& settings_;
};
}
