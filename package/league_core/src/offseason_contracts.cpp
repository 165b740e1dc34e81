#include "league_core/offseason.hpp"

#include <algorithm>
#include <unordered_set>

#include "league_core/log.hpp"

namespace league_core {

ExpirationResult process_contract_expirations(const PlayerTable &players,
                                              const ContractTable &contracts,
                                              const std::vector<Team> &teams) {
  ExpirationResult out;
  out.players = players;
  std::unordered_set<PlayerId> released_to_market;

  for (const auto &kv : contracts) {
    const Contract next = advance_contract_year(kv.second);
    out.contracts.upsert(next);
    const bool just_expired = kv.second.status == ContractStatus::Active &&
                              next.status == ContractStatus::Expired;
    if (!just_expired)
      continue;

    Player *p = out.players.find_mutable(next.player_id);
    if (!p)
      continue; // player already gone; nothing to free
    if (p->contract_id && *p->contract_id == next.id) {
      p->contract_id.reset();
      released_to_market.insert(p->id);
      out.new_free_agents.push_back(p->id);
    }
  }

  out.teams = teams;
  for (auto &team : out.teams) {
    team.roster.erase(std::remove_if(team.roster.begin(), team.roster.end(),
                                     [&released_to_market](PlayerId pid) {
                                       return released_to_market.count(pid) > 0;
                                     }),
                      team.roster.end());
  }
  log::debug("contracts: {} expired into free agency",
             out.new_free_agents.size());
  return out;
}

} // namespace league_core
