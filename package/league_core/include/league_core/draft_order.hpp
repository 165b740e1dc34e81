#pragma once

#include <optional>
#include <string>
#include <vector>

#include "league_core/playoffs.hpp"
#include "league_core/standings.hpp"
#include "league_core/types.hpp"

namespace league_core {

struct DraftPick {
  std::string id;
  int year{0};
  int round{1};
  int overall{1};
  TeamId original_team{-1};
  TeamId current_team{-1};
  std::optional<PlayerId> selected_player;
  std::vector<TeamId> trade_history; // previous owners, oldest first
};

// Order derived from standings and the bracket alone. May be incomplete
// when the bracket has not been played out.
struct PartialDraftOrder {
  std::vector<TeamId> order;
  bool complete{false};
};

PartialDraftOrder compute_primary_draft_order(const Standings &standings,
                                              const PlayoffBracket &bracket,
                                              int expected_teams = kNumTeams);

// Drops unknown and duplicate ids, then appends every missing team by
// ascending win% (0.5 when no row exists). Always returns each id in
// `all_teams` exactly once.
std::vector<TeamId> reconcile_draft_order(const PartialDraftOrder &partial,
                                          const std::vector<TeamId> &all_teams,
                                          const Standings &standings);

std::vector<TeamId> calculate_draft_order(const Standings &standings,
                                          const PlayoffBracket &bracket,
                                          const std::vector<TeamId> &all_teams);

std::vector<DraftPick> create_draft_picks(const std::vector<TeamId> &order,
                                          int year, int rounds = kDraftRounds);

// Moves a pick to a new owner and records the previous one.
DraftPick transfer_pick(const DraftPick &pick, TeamId new_owner);

// Empty when `order` holds every id in `all_teams` exactly once.
std::vector<std::string> validate_draft_order(const std::vector<TeamId> &order,
                                              const std::vector<TeamId> &all_teams);

} // namespace league_core
