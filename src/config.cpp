#include "config.hpp"

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>
#include <sol/sol.hpp>

#include "debug.hpp"

std::string Settings::endpoint(std::string_view name) const
{
    return fmt::format("https://{}/v3/{}?", apiHost, name);
}

namespace {
fs::path getHomeDirectory()
{
    const auto home = ::getenv("HOME");
    if (home) {
        return fs::path(home);
    }
    const auto uid = ::geteuid();
    const auto pw = getpwuid(uid);
    if (!pw) {
        die("Could not get user directory");
    }
    return fs::path(pw->pw_dir);
}

fs::path getConfigHomeDirectory()
{
    const auto configHome = ::getenv("XDG_CONFIG_HOME");
    if (configHome) {
        return fs::path(configHome);
    }
    return getHomeDirectory() / ".config";
}
}

fs::path getConfigDirectory()
{
    return getConfigHomeDirectory() / "footy";
}

Settings loadSettings()
{
    Settings settings;

    const auto configFilePath = getConfigDirectory() / "config.lua";
    const fs::path localConfigPath = "footy.lua";
    if (!fs::exists(configFilePath) && !fs::exists(localConfigPath)) {
        return settings;
    }

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::math, sol::lib::table,
        sol::lib::os);

    auto footy = lua.create_named_table("footy");
    auto lconfig = footy.create_named("config");

    lconfig["preferredLeagues"] = sol::as_table(settings.preferredLeagues);
    lconfig["allLeagues"] = sol::as_table(settings.allLeagues);
    lconfig["defaultCommand"] = std::string(toString(settings.defaultCommand));
    lconfig["season"] = settings.season;
    lconfig["lastFixtures"] = settings.lastFixtures;
    lconfig["apiHost"] = settings.apiHost;
    lconfig["rosterPath"] = settings.rosterPath;
    lconfig["colorsPath"] = settings.colorsPath;

    if (fs::exists(configFilePath)) {
        debug("Loading {}", configFilePath.u8string());
        lua.script_file(configFilePath.u8string());
    }

    if (fs::exists(localConfigPath)) {
        debug("Loading {}", localConfigPath.u8string());
        lua.script_file(localConfigPath.u8string());
    }

    settings.preferredLeagues = lconfig["preferredLeagues"].get<std::vector<int64_t>>();
    settings.allLeagues = lconfig["allLeagues"].get<std::vector<int64_t>>();
    settings.season = lconfig["season"];
    settings.lastFixtures = lconfig["lastFixtures"];
    settings.apiHost = lconfig["apiHost"].get<std::string>();
    settings.rosterPath = lconfig["rosterPath"].get<std::string>();
    settings.colorsPath = lconfig["colorsPath"].get<std::string>();

    const auto defaultCommand = lconfig["defaultCommand"].get<std::string>();
    if (const auto kind = parseCommandKind(defaultCommand)) {
        settings.defaultCommand = *kind;
    } else {
        fmt::print(stderr, "Ignoring invalid default command '{}' in config\n", defaultCommand);
    }

    return settings;
}
