#include "league_core/offseason.hpp"

#include <algorithm>
#include <unordered_set>

#include "league_core/log.hpp"

namespace league_core {

static double base_retirement_chance(int age) {
  if (age >= 40)
    return 0.85;
  if (age >= 38)
    return 0.60;
  if (age >= 36)
    return 0.35;
  if (age >= 34)
    return 0.20;
  if (age >= 32)
    return 0.10;
  if (age >= 30)
    return 0.04;
  if (age >= 28)
    return 0.01;
  return 0.0;
}

double retirement_probability(const Player &p, bool has_role) {
  double chance = base_retirement_chance(p.age);

  switch (p.position) {
  case Position::QB: chance *= 0.6; break;
  case Position::K:
  case Position::P: chance *= 0.5; break;
  case Position::RB: chance *= 1.4; break;
  default: break;
  }

  switch (skill_tier(p)) {
  case SkillTier::Elite: chance *= 0.5; break;
  case SkillTier::Starter: chance *= 0.7; break;
  case SkillTier::Fringe: chance *= 1.3; break;
  default: break;
  }

  // Unsigned players have no role keeping them in the league.
  if (!has_role)
    chance = std::max(chance * 2.0, p.age >= 25 ? 0.25 : 0.0);
  return std::clamp(chance, 0.0, 0.98);
}

RetirementResult process_retirements(const PlayerTable &players,
                                     const ContractTable &contracts,
                                     const std::vector<Team> &teams,
                                     RandomSource &rng) {
  RetirementResult out;
  out.contracts = contracts;
  std::unordered_set<PlayerId> retired;

  for (const auto &kv : players) {
    const Player &p = kv.second;
    const bool has_role = p.contract_id.has_value();
    if (rng.chance(retirement_probability(p, has_role))) {
      retired.insert(p.id);
      out.retired.push_back(p.id);
      if (p.contract_id) {
        Contract *c = out.contracts.find_mutable(*p.contract_id);
        if (c && c->status == ContractStatus::Active) {
          c->status = ContractStatus::Expired;
          c->years_remaining = 0;
        }
      }
      continue;
    }
    out.players.upsert(p);
  }

  out.teams = teams;
  for (auto &team : out.teams) {
    team.roster.erase(std::remove_if(team.roster.begin(), team.roster.end(),
                                     [&retired](PlayerId pid) {
                                       return retired.count(pid) > 0;
                                     }),
                      team.roster.end());
  }
  log::debug("retirement: {} players retired", out.retired.size());
  return out;
}

} // namespace league_core
