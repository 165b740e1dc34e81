#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "league_core/config.hpp"
#include "league_core/random.hpp"
#include "league_core/team.hpp"
#include "league_core/types.hpp"

namespace league_core {

// Which part of the league formula produced a game.
enum class GameComponent {
  Divisional,
  IntraConference,
  InterConference,
  StandingsBased,
  SeventeenthGame,
  Fallback
};

struct BoxScore {
  int home_yards{0};
  int away_yards{0};
  int home_turnovers{0};
  int away_turnovers{0};
  int margin{0};
  bool blowout{false}; // decided by 21 or more
};

struct ScheduledGame {
  std::string id;
  int week{0};
  TeamId home{-1};
  TeamId away{-1};
  bool is_divisional{false};
  bool is_conference{false};
  GameComponent component{GameComponent::Fallback};
  bool is_complete{false};
  int home_score{0};
  int away_score{0};
  std::optional<TeamId> winner; // empty for ties and unplayed games
  BoxScore box_score;
};

struct SeasonSchedule {
  int year{0};
  std::vector<ScheduledGame> games;
  std::vector<int> bye_weeks; // indexed by team id
  bool used_fallback{false};

  std::vector<ScheduledGame> games_in_week(int week) const;
  std::vector<ScheduledGame> games_for_team(TeamId team) const;
};

// Finish order inside each division, [conference][division] -> team ids,
// first place first.
using DivisionStandings = std::array<
    std::array<std::vector<TeamId>, kDivisionsPerConference>, kNumConferences>;

// Division order by team id; used when no prior season exists.
DivisionStandings default_division_standings(const std::vector<Team> &teams);

// Bye week per team id. Byes are handed out in pairs inside the configured
// window so every week has an even number of active teams.
std::vector<int> assign_bye_weeks(const std::vector<Team> &teams,
                                  RandomSource &rng,
                                  const ScheduleConfig &cfg);

// The 272 matchups of the league formula, weeks unassigned. Empty when the
// league does not have the standard 2x4x4 alignment.
std::vector<ScheduledGame>
build_formula_matchups(const std::vector<Team> &teams,
                       const DivisionStandings &previous, int year);

// Formula matchups laid out as one league-wide round per week, with the
// byes carved out of the divisional rounds. Empty when the alignment, the
// week count or the bye window rules out that layout.
std::optional<SeasonSchedule>
build_formula_schedule(const std::vector<Team> &teams,
                       const DivisionStandings &previous, int year,
                       RandomSource &rng, const ScheduleConfig &cfg);

// Random weekly pairing of every non-bye team. Always valid.
SeasonSchedule build_fallback_schedule(const std::vector<Team> &teams,
                                       int year,
                                       const std::vector<int> &bye_weeks,
                                       RandomSource &rng,
                                       const ScheduleConfig &cfg);

// Formula schedule, or the fallback pairing when the formula fails.
SeasonSchedule generate_season_schedule(const std::vector<Team> &teams,
                                        const DivisionStandings &previous,
                                        int year, RandomSource &rng,
                                        const ScheduleConfig &cfg);

// Empty when the schedule satisfies every structural rule.
std::vector<std::string> validate_schedule(const SeasonSchedule &schedule,
                                           const std::vector<Team> &teams,
                                           const ScheduleConfig &cfg);

} // namespace league_core
