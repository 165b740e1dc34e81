#pragma once

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "league_core/coach.hpp"
#include "league_core/config.hpp"
#include "league_core/contract.hpp"
#include "league_core/draft_order.hpp"
#include "league_core/generators.hpp"
#include "league_core/league_state.hpp"
#include "league_core/player.hpp"
#include "league_core/random.hpp"
#include "league_core/team.hpp"

namespace league_core {

// Every stage takes its inputs by const reference and returns new tables;
// nothing passed in is modified. `season` is the league year the roster is
// being built for (the year after the season just played).

// 1. Progression

// Growth multiplier applied to the gap between rating and potential.
double age_growth_modifier(int age);

// Change in overall rating for one offseason.
double progression_delta(int age, double overall, int potential,
                         int coach_development, RandomSource &rng);

PlayerTable process_progression(const PlayerTable &players,
                                const std::vector<Team> &teams,
                                const CoachTable &coaches, RandomSource &rng);

// 2. Retirement

struct RetirementResult {
  PlayerTable players;
  ContractTable contracts;
  std::vector<Team> teams;
  std::vector<PlayerId> retired;
};

// has_role is false for unsigned players.
double retirement_probability(const Player &p, bool has_role);

RetirementResult process_retirements(const PlayerTable &players,
                                     const ContractTable &contracts,
                                     const std::vector<Team> &teams,
                                     RandomSource &rng);

// 3. Contract expiration

struct ExpirationResult {
  PlayerTable players;
  ContractTable contracts;
  std::vector<Team> teams;
  std::vector<PlayerId> new_free_agents;
};

ExpirationResult process_contract_expirations(const PlayerTable &players,
                                              const ContractTable &contracts,
                                              const std::vector<Team> &teams);

// 4. Coaching changes

enum class CoachChangeReason {
  Fired,
  FollowedHeadCoach,
  ContractExpired,
  Vacancy
};

struct CoachChange {
  TeamId team{-1};
  CoachRole role{CoachRole::HeadCoach};
  std::optional<CoachId> before;
  CoachId after{0};
  CoachChangeReason reason{CoachChangeReason::Fired};
};

struct CoachingResult {
  CoachTable coaches;
  std::vector<CoachChange> changes;
};

double head_coach_fire_probability(double win_pct);

CoachingResult process_coaching_changes(const std::vector<Team> &teams,
                                        const CoachTable &coaches, int season,
                                        RandomSource &rng,
                                        CoachGenerator &generator,
                                        const OffseasonConfig &cfg);

// 5. AI draft

struct DraftResult {
  PlayerTable players;
  ContractTable contracts;
  std::vector<Team> teams;
  std::vector<DraftPick> picks; // with selections filled in
  std::vector<PlayerId> drafted;
  std::vector<PlayerId> undrafted; // added to players as unsigned
};

// Talent component of a pick score, driven by the prospect's ceiling.
double prospect_talent_score(const Prospect &p);

DraftResult process_ai_draft(const std::vector<DraftPick> &picks,
                             const std::vector<Prospect> &draft_class,
                             const PlayerTable &players,
                             const ContractTable &contracts,
                             const std::vector<Team> &teams, int season,
                             RandomSource &rng, ContractGenerator &generator,
                             const OffseasonConfig &cfg);

// 6. AI free agency

struct AuctionOutcome {
  std::optional<TeamId> winner;
  double price{0.0};
};

// Highest valuation wins and pays the runner-up's valuation (never less
// than the reserve and never more than its own valuation). No winner when
// every valuation is below the reserve.
AuctionOutcome clear_free_agent_auction(const std::vector<TeamId> &bidders,
                                        const Eigen::VectorXd &valuations,
                                        double reserve);

struct Signing {
  PlayerId player{0};
  TeamId team{-1};
  ContractId contract{0};
  Money average_value{0};
  bool minimum_deal{false};
};

struct FreeAgencyResult {
  PlayerTable players;
  ContractTable contracts;
  std::vector<Team> teams;
  std::vector<Signing> signings;
};

FreeAgencyResult process_ai_free_agency(const std::vector<PlayerId> &candidates,
                                        const PlayerTable &players,
                                        const ContractTable &contracts,
                                        const std::vector<Team> &teams,
                                        int season, RandomSource &rng,
                                        ContractGenerator &generator,
                                        const OffseasonConfig &cfg);

// 7. Roster maintenance

struct RosterMaintenanceResult {
  PlayerTable players;
  ContractTable contracts;
  std::vector<Team> teams;
  std::vector<PlayerId> released;
  std::vector<PlayerId> added;
};

RosterMaintenanceResult process_roster_maintenance(
    const PlayerTable &players, const ContractTable &contracts,
    const std::vector<Team> &teams, int season, RandomSource &rng,
    PlayerGenerator &player_gen, ContractGenerator &contract_gen,
    const OffseasonConfig &cfg);

// 8. Finances

std::vector<Team> update_team_finances(const std::vector<Team> &teams,
                                       const ContractTable &contracts,
                                       int season, Money salary_cap);

// All stages

struct OffseasonReport {
  std::vector<PlayerId> retired;
  std::vector<PlayerId> new_free_agents;
  std::vector<CoachChange> coaching_changes;
  std::vector<DraftPick> draft_picks;
  std::vector<Signing> signings;
  std::vector<PlayerId> released;
  std::vector<PlayerId> added;
};

struct OffseasonOutcome {
  LeagueState state;
  OffseasonReport report;
};

// Runs the eight stages in order for the offseason that follows `year`.
OffseasonOutcome run_offseason(const LeagueState &state,
                               const std::vector<TeamId> &draft_order, int year,
                               RandomSource &rng, PlayerGenerator &player_gen,
                               ContractGenerator &contract_gen,
                               CoachGenerator &coach_gen,
                               const LeagueConfig &cfg);

} // namespace league_core
