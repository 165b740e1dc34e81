#pragma once

#include <string>
#include <vector>

#include "league_core/config.hpp"
#include "league_core/league_state.hpp"

namespace league_core {

// Structural checks on a league at rest. Each violation is one message;
// an empty result means the state is consistent.
std::vector<std::string> check_league_invariants(const LeagueState &state,
                                                 const LeagueConfig &cfg);

} // namespace league_core
