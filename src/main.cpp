#include <cstdio>
#include <cstdlib>

#include <clipp.hpp>
#include <fmt/format.h>
#include <sol/sol.hpp>

#include "api.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "debug.hpp"
#include "http.hpp"
#include "util.hpp"

struct Args : clipp::ArgsBase {
    bool debug = false;
    std::string command;

    void args()
    {
        flag(debug, "debug", 'D').help("Append log output to footy-debug.log");
        positional(command, "command")
            .optional()
            .help("One of: schedule, live, scores, teams, standings. Defaults to the "
                  "defaultCommand from the config.");
    }

    std::string description() const override
    {
        return "Football fixtures, live scores and standings in your terminal. "
               "Requires FOOTY_API_KEY to be set.";
    }
};

int main(int argc, char** argv)
{
    auto parser = clipp::Parser(argv[0]);
    const auto args = parser.parse<Args>(argc, argv).value();

    if (args.debug)
        logDebugToFile = true;

    debug(">>>>>>>>>>>>>>>>>>>>>> INIT <<<<<<<<<<<<<<<<<<<<<<");

    Settings settings;
    try {
        settings = loadSettings();
    } catch (const sol::error& exc) {
        fmt::print(stderr, "Error in config: {}\n", exc.what());
        return 1;
    }

    auto kind = settings.defaultCommand;
    if (!args.command.empty()) {
        const auto parsed = parseCommandKind(args.command);
        if (!parsed) {
            fmt::print(stderr, "Invalid command type '{}'\n", args.command);
            return 1;
        }
        kind = *parsed;
    }

    const auto apiKey = getEnv(api::apiKeyEnvVar);
    if (!apiKey || apiKey->empty()) {
        fmt::print(stderr, "{} is not set\n", api::apiKeyEnvVar);
        return 1;
    }

    fmt::print("\nGlobal Football CLI\n============================\n");

    CurlHttpClient http;
    const api::Client client(http, *apiKey, settings);
    Context ctx { settings, client, stdin, stdout, stderr };
    return runCommand(kind, ctx) ? EXIT_SUCCESS : EXIT_FAILURE;
}
