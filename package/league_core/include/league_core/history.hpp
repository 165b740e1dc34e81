#pragma once

#include <functional>
#include <vector>

#include "league_core/config.hpp"
#include "league_core/draft_order.hpp"
#include "league_core/generators.hpp"
#include "league_core/league_state.hpp"
#include "league_core/offseason.hpp"
#include "league_core/playoffs.hpp"
#include "league_core/random.hpp"
#include "league_core/schedule.hpp"
#include "league_core/standings.hpp"

namespace league_core {

enum class HistoryPhase { Season, Offseason };

const char *to_string(HistoryPhase phase);

// (year_index, total_years, phase); year_index counts from 1.
using ProgressCallback = std::function<void(int, int, HistoryPhase)>;
using CancelCheck = std::function<bool()>;

struct HistoryConfig {
  int years{20};
  ProgressCallback on_progress;
  CancelCheck should_cancel;
};

struct SeasonResult {
  LeagueState state; // records folded into history, offseason not yet run
  Standings standings;
  PlayoffBracket bracket;
  std::vector<TeamId> draft_order;
  HistoricalSeasonSummary summary;
};

struct CycleResult {
  LeagueState state;
  HistoricalSeasonSummary summary;
  OffseasonReport offseason;
};

struct HistoryResult {
  LeagueState state;
  std::vector<HistoricalSeasonSummary> season_summaries;
  int years_simulated{0};
  int total_retirements{0};
  int total_draft_picks{0};
  int total_free_agency_signings{0};
  int total_coaching_changes{0};
  bool cancelled{false};
};

class LeagueHistorySimulator {
public:
  LeagueHistorySimulator(PlayerGenerator &players, ContractGenerator &contracts,
                         CoachGenerator &coaches)
      : player_gen_(&players), contract_gen_(&contracts), coach_gen_(&coaches) {}

  void set_league_config(const LeagueConfig &cfg) { cfg_ = cfg; }
  const LeagueConfig &league_config() const { return cfg_; }

  // Regular season and playoffs for state.calendar.year. Games already
  // completed in a matching schedule are kept; the rest are simulated.
  SeasonResult play_season(const LeagueState &state, RandomSource &rng) const;

  // One full season and offseason; the calendar moves to the next year.
  CycleResult run_cycle(const LeagueState &state, RandomSource &rng) const;

  // Pre-history: replays `years` seasons ending just before
  // initial.calendar.year, then hands back a clean state for that year.
  HistoryResult run(const LeagueState &initial, const HistoryConfig &cfg,
                    RandomSource &rng) const;

private:
  OffseasonOutcome run_offseason_for(const SeasonResult &season,
                                     RandomSource &rng) const;
  LeagueState close_year(LeagueState state, int year) const;
  LeagueState finalize(LeagueState state, int start_year,
                       RandomSource &rng) const;

  PlayerGenerator *player_gen_{nullptr};
  ContractGenerator *contract_gen_{nullptr};
  CoachGenerator *coach_gen_{nullptr};
  LeagueConfig cfg_{};
};

} // namespace league_core
