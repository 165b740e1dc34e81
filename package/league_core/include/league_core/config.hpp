#pragma once

#include "league_core/types.hpp"

namespace league_core {

struct ScheduleConfig {
  int weeks{kRegularSeasonWeeks};
  int games_per_team{kGamesPerTeam};
  int first_bye_week{5};
  int last_bye_week{14};
  int max_teams_per_bye{6};
};

struct QuickSimConfig {
  double base_score{22.0};
  double strength_scale{14.0};
  double home_field_advantage{3.0};
  double score_stddev{10.0};
  double default_strength{40.0};
  double coach_iq_weight{0.05};
  double min_strength{20.0};
  double max_strength{95.0};
  double overtime_resolution_chance{0.9};
  double overtime_home_edge{0.55};
  int overtime_points{3};
};

struct OffseasonConfig {
  int roster_limit{kActiveRosterLimit};
  int draft_rounds{kDraftRounds};
  int draft_scan_depth{50};
  int rookie_contract_years{4};
  Money salary_cap{kDefaultSalaryCap};
  Money min_cap_space_to_bid{1000};
  int free_agency_roster_target{50};
  double coordinator_fire_chance{0.4};
  double pool_hire_chance{0.5};
  int coach_pool_patience_years{3};
};

struct LeagueConfig {
  ScheduleConfig schedule;
  QuickSimConfig quick_sim;
  OffseasonConfig offseason;
};

} // namespace league_core
