#pragma once

#include <array>
#include <optional>
#include <vector>

#include "league_core/schedule.hpp"
#include "league_core/team.hpp"
#include "league_core/types.hpp"

namespace league_core {

struct TeamStanding {
  TeamId team_id{-1};
  Conference conference{Conference::AFC};
  Division division{Division::East};
  int wins{0};
  int losses{0};
  int ties{0};
  double win_pct{0.0};
  int division_wins{0};
  int division_losses{0};
  int division_ties{0};
  double division_win_pct{0.0};
  int conference_wins{0};
  int conference_losses{0};
  int conference_ties{0};
  double conference_win_pct{0.0};
  int points_for{0};
  int points_against{0};
  int point_differential{0};
  int streak{0};
  // Informational only; not part of the tiebreak chain.
  double strength_of_victory{0.0};
  double strength_of_schedule{0.0};
  int division_rank{0};   // 1-based
  int conference_rank{0}; // 1-based
};

struct Standings {
  std::vector<TeamStanding> rows; // one per team, in team order
  DivisionStandings division_order;
  std::array<std::vector<TeamId>, kNumConferences> conference_order;

  const TeamStanding *find(TeamId team) const;
};

// Seeds per conference; index 0 holds the 1 seed.
struct PlayoffField {
  std::array<std::vector<TeamId>, kNumConferences> seeds;

  std::vector<TeamId> all_teams() const;
  bool contains(TeamId team) const;
};

// Negative when a ranks ahead of b, positive when behind, 0 when every
// tiebreak is level: win%, division win%, conference win%, point
// differential.
int compare_standings(const TeamStanding &a, const TeamStanding &b);

// Strict order: compare_standings, then team id.
bool ranks_ahead(const TeamStanding &a, const TeamStanding &b);

TeamStanding standing_from_record(const Team &team, const TeamRecord &record);

// Standings from completed games only; unplayed games are ignored.
Standings calculate_standings(const std::vector<ScheduledGame> &games,
                              const std::vector<Team> &teams);

// Standings from the teams' current records (no schedule strength data).
Standings standings_from_records(const std::vector<Team> &teams);

// Four division winners (seeds 1-4, ordered among themselves) followed by
// the three best remaining records (seeds 5-7).
PlayoffField determine_playoff_teams(const Standings &standings);

} // namespace league_core
