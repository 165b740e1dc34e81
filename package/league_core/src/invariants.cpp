#include "league_core/invariants.hpp"

#include <fmt/format.h>

#include <map>

namespace league_core {

static void check_rosters(const LeagueState &s, const LeagueConfig &cfg,
                          std::vector<std::string> &errors) {
  std::map<PlayerId, TeamId> owner;
  for (const auto &team : s.teams) {
    if (static_cast<int>(team.roster.size()) > cfg.offseason.roster_limit)
      errors.push_back(fmt::format("{} carries {} players, limit {}",
                                   team.abbreviation, team.roster.size(),
                                   cfg.offseason.roster_limit));
    for (const PlayerId pid : team.roster) {
      auto [it, inserted] = owner.emplace(pid, team.id);
      if (!inserted) {
        errors.push_back(fmt::format("player {} is on rosters of teams {} and {}",
                                     pid, it->second, team.id));
        continue;
      }
      const Player *p = s.players.find(pid);
      if (!p) {
        errors.push_back(
            fmt::format("{} lists unknown player {}", team.abbreviation, pid));
        continue;
      }
      const Contract *c = p->contract_id ? s.contracts.find(*p->contract_id)
                                         : nullptr;
      if (!c || c->status != ContractStatus::Active || c->team_id != team.id)
        errors.push_back(fmt::format("player {} on {} has no active contract "
                                     "with the team",
                                     pid, team.abbreviation));
    }
  }

  for (const auto &kv : s.contracts) {
    const Contract &c = kv.second;
    if (c.status != ContractStatus::Active)
      continue;
    auto it = owner.find(c.player_id);
    if (it == owner.end() || it->second != c.team_id)
      errors.push_back(fmt::format(
          "active contract {} for player {} is not backed by team {}'s roster",
          c.id, c.player_id, c.team_id));
  }
}

static void check_finances(const LeagueState &s,
                           std::vector<std::string> &errors) {
  const int year = s.calendar.year;
  for (const auto &team : s.teams) {
    const Money usage = team_cap_usage(s.contracts, team.id, year);
    if (team.finances.cap_usage != usage)
      errors.push_back(fmt::format("{} cap usage {} does not match contracts "
                                   "({})",
                                   team.abbreviation, team.finances.cap_usage,
                                   usage));
  }
}

std::vector<std::string> check_league_invariants(const LeagueState &state,
                                                 const LeagueConfig &cfg) {
  std::vector<std::string> errors;
  if (state.teams.size() != static_cast<std::size_t>(kNumTeams))
    errors.push_back(fmt::format("league has {} teams, expected {}",
                                 state.teams.size(), kNumTeams));
  else if (!has_standard_alignment(state.teams))
    errors.push_back("teams do not form 2 conferences of 4 divisions of 4");

  check_rosters(state, cfg, errors);
  check_finances(state, errors);

  if (!state.schedule.games.empty()) {
    for (const auto &err :
         validate_schedule(state.schedule, state.teams, cfg.schedule))
      errors.push_back(fmt::format("schedule {}: {}", state.schedule.year, err));
  }
  return errors;
}

} // namespace league_core
