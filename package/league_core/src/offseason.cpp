#include "league_core/offseason.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "league_core/log.hpp"

namespace league_core {

// Picks in the final order, keeping any ownership changes already recorded
// against the provisional picks for the same draft.
static std::vector<DraftPick>
ordered_picks(const std::vector<TeamId> &order, int season, int rounds,
              const std::vector<DraftPick> &existing) {
  std::vector<DraftPick> picks = create_draft_picks(order, season, rounds);
  for (auto &pick : picks) {
    for (const auto &old : existing) {
      if (old.year == pick.year && old.round == pick.round &&
          old.original_team == pick.original_team) {
        pick.current_team = old.current_team;
        pick.trade_history = old.trade_history;
        break;
      }
    }
  }
  return picks;
}

OffseasonOutcome run_offseason(const LeagueState &state,
                               const std::vector<TeamId> &draft_order, int year,
                               RandomSource &rng, PlayerGenerator &player_gen,
                               ContractGenerator &contract_gen,
                               CoachGenerator &coach_gen,
                               const LeagueConfig &cfg) {
  const int season = year + 1;
  const OffseasonConfig &oc = cfg.offseason;

  OffseasonOutcome out;
  out.state = state;
  LeagueState &s = out.state;
  OffseasonReport &report = out.report;
  s.calendar.phase = SeasonPhase::Offseason;

  s.players = process_progression(s.players, s.teams, s.coaches, rng);

  RetirementResult retired =
      process_retirements(s.players, s.contracts, s.teams, rng);
  s.players = std::move(retired.players);
  s.contracts = std::move(retired.contracts);
  s.teams = std::move(retired.teams);
  report.retired = std::move(retired.retired);

  ExpirationResult expired =
      process_contract_expirations(s.players, s.contracts, s.teams);
  s.players = std::move(expired.players);
  s.contracts = std::move(expired.contracts);
  s.teams = std::move(expired.teams);
  report.new_free_agents = std::move(expired.new_free_agents);

  CoachingResult coaching =
      process_coaching_changes(s.teams, s.coaches, season, rng, coach_gen, oc);
  s.coaches = std::move(coaching.coaches);
  report.coaching_changes = std::move(coaching.changes);

  std::vector<Prospect> draft_class;
  for (const auto &p : s.draft_class) {
    if (p.player.draft_year == season && !s.players.has(p.player.id))
      draft_class.push_back(p);
  }
  if (draft_class.empty())
    draft_class = player_gen.generate_draft_class(season, rng);
  const std::vector<DraftPick> picks =
      ordered_picks(draft_order, season, oc.draft_rounds, s.draft_picks);
  DraftResult draft = process_ai_draft(picks, draft_class, s.players, s.contracts,
                                       s.teams, season, rng, contract_gen, oc);
  s.players = std::move(draft.players);
  s.contracts = std::move(draft.contracts);
  s.teams = std::move(draft.teams);
  s.draft_picks = draft.picks;
  s.draft_class.clear();
  report.draft_picks = std::move(draft.picks);

  // New free agents and undrafted rookies first, then anyone else unsigned.
  std::vector<PlayerId> candidates = report.new_free_agents;
  candidates.insert(candidates.end(), draft.undrafted.begin(),
                    draft.undrafted.end());
  std::set<PlayerId> listed(candidates.begin(), candidates.end());
  for (const auto &kv : s.players) {
    if (!kv.second.contract_id && !listed.count(kv.first))
      candidates.push_back(kv.first);
  }
  FreeAgencyResult fa =
      process_ai_free_agency(candidates, s.players, s.contracts, s.teams, season,
                             rng, contract_gen, oc);
  s.players = std::move(fa.players);
  s.contracts = std::move(fa.contracts);
  s.teams = std::move(fa.teams);
  report.signings = std::move(fa.signings);

  RosterMaintenanceResult roster =
      process_roster_maintenance(s.players, s.contracts, s.teams, season, rng,
                                 player_gen, contract_gen, oc);
  s.players = std::move(roster.players);
  s.contracts = std::move(roster.contracts);
  s.teams = std::move(roster.teams);
  report.released = std::move(roster.released);
  report.added = std::move(roster.added);

  s.teams = update_team_finances(s.teams, s.contracts, season, oc.salary_cap);

  log::info("offseason {}: {} retired, {} free agents, {} coaching changes, "
            "{} signings",
            year, report.retired.size(), report.new_free_agents.size(),
            report.coaching_changes.size(), report.signings.size());
  return out;
}

} // namespace league_core
