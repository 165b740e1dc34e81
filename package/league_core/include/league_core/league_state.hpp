#pragma once

#include <optional>
#include <string>
#include <vector>

#include "league_core/coach.hpp"
#include "league_core/config.hpp"
#include "league_core/contract.hpp"
#include "league_core/draft_order.hpp"
#include "league_core/generators.hpp"
#include "league_core/player.hpp"
#include "league_core/random.hpp"
#include "league_core/schedule.hpp"
#include "league_core/team.hpp"

namespace league_core {

enum class SeasonPhase { Preseason, RegularSeason, Playoffs, Offseason };

struct Calendar {
  int year{2025};
  int week{0};
  SeasonPhase phase{SeasonPhase::Preseason};
};

struct HistoricalSeasonSummary {
  int year{0};
  std::optional<TeamId> champion;
  std::string champion_record;
  std::optional<TeamId> runner_up;
  std::vector<TeamId> playoff_teams;
  std::vector<TeamId> draft_order;
  bool schedule_fallback{false};
};

struct LeagueState {
  Calendar calendar;
  std::vector<Team> teams; // index == team id
  PlayerTable players;
  ContractTable contracts;
  CoachTable coaches;
  std::vector<Prospect> draft_class;
  std::vector<DraftPick> draft_picks;
  SeasonSchedule schedule;
  DivisionStandings previous_standings; // finish order of the last season
  std::vector<HistoricalSeasonSummary> season_history;
};

// The 32 franchises with their conference and division, no rosters.
std::vector<Team> default_teams(Money salary_cap = kDefaultSalaryCap);

// A fresh league for `year`: rosters, contracts, a three-man staff per
// team, finances, a draft class, picks and a schedule.
LeagueState create_league(int year, PlayerGenerator &players,
                          ContractGenerator &contracts, CoachGenerator &coaches,
                          RandomSource &rng, const LeagueConfig &cfg = {});

} // namespace league_core
