#pragma once

#include <string>
#include <vector>

#include "models.hpp"
#include "result.hpp"

using FixtureGroups = std::vector<std::vector<Fixture>>;
// league -> group (e.g. conference or split table) -> rows
using StandingTables = std::vector<std::vector<std::vector<TeamStanding>>>;

namespace normalize {
// One inner vector per body, in order. No bodies at all gives a single empty inner vector, which
// means "nothing to show" rather than an error.
// Error::MissingField if an envelope has no `response`, Error::Deserialization if a body is not
// JSON or any record has the wrong shape. One bad record fails the whole batch.
Result<FixtureGroups> fixtures(const std::vector<std::string>& bodies);

// Each body is expected to wrap a single league in `response`. No bodies gives no tables.
// Error::MissingField if `response` is missing or empty.
Result<StandingTables> standings(const std::vector<std::string>& bodies);

Result<std::vector<RosterEntry>> teamSearch(const std::string& body);
}
