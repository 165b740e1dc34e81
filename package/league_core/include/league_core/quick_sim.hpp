#pragma once

#include <optional>
#include <vector>

#include <Eigen/Dense>

#include "league_core/coach.hpp"
#include "league_core/config.hpp"
#include "league_core/player.hpp"
#include "league_core/random.hpp"
#include "league_core/schedule.hpp"
#include "league_core/team.hpp"

namespace league_core {

struct TeamStrength {
  double offense{40.0};
  double defense{40.0};
};

// Offense/defense strength per team id, one row per team.
struct StrengthTable {
  Eigen::MatrixXd values; // n_teams x 2: (offense, defense)

  TeamStrength get(TeamId team) const;
};

struct QuickGameResult {
  int home_score{0};
  int away_score{0};
  std::optional<TeamId> winner; // empty for a tie
  bool overtime{false};
  BoxScore box_score;
};

TeamStrength compute_team_strength(const Team &team, const PlayerTable &players,
                                   const CoachTable &coaches,
                                   const QuickSimConfig &cfg);

StrengthTable compute_strength_table(const std::vector<Team> &teams,
                                     const PlayerTable &players,
                                     const CoachTable &coaches,
                                     const QuickSimConfig &cfg);

// Raw regulation score for one side before tie handling.
int sample_score(double offense, double opposing_defense, bool home,
                 RandomSource &rng, const QuickSimConfig &cfg);

// Applies the tie rules to a regulation score. Regular season ties may
// stand; playoff ties never do.
QuickGameResult resolve_game(TeamId home, TeamId away, int home_score,
                             int away_score, bool playoff, RandomSource &rng,
                             const QuickSimConfig &cfg);

QuickGameResult simulate_game(TeamId home, TeamId away,
                              const StrengthTable &strengths, bool playoff,
                              RandomSource &rng, const QuickSimConfig &cfg);

// Plays every unplayed game of the schedule and folds each result into the
// teams' current records.
void simulate_regular_season(SeasonSchedule &schedule, std::vector<Team> &teams,
                             const StrengthTable &strengths, RandomSource &rng,
                             const QuickSimConfig &cfg);

} // namespace league_core
