#include "league_core/offseason.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <unordered_set>

#include "league_core/log.hpp"

namespace league_core {

static bool better_player(const Player &a, const Player &b) {
  const double ra = overall_rating(a), rb = overall_rating(b);
  if (ra != rb)
    return ra > rb;
  return a.id < b.id;
}

static Contract filler_contract(ContractGenerator &gen, const Player &p,
                                TeamId team, int season) {
  ContractOffer offer;
  offer.years = 1;
  offer.salary_per_year = minimum_salary(p.experience);
  return gen.create_contract(p.id, team, offer, season, ContractType::Minimum);
}

RosterMaintenanceResult process_roster_maintenance(
    const PlayerTable &players, const ContractTable &contracts,
    const std::vector<Team> &teams, int season, RandomSource &rng,
    PlayerGenerator &player_gen, ContractGenerator &contract_gen,
    const OffseasonConfig &cfg) {
  RosterMaintenanceResult out;
  out.players = players;
  out.contracts = contracts;
  out.teams = teams;
  const int limit = std::max(0, cfg.roster_limit);

  // Drop stale ids and any player already claimed by an earlier roster.
  std::unordered_set<PlayerId> rostered;
  for (auto &team : out.teams) {
    std::vector<PlayerId> clean;
    for (const PlayerId pid : team.roster) {
      if (out.players.has(pid) && rostered.insert(pid).second)
        clean.push_back(pid);
    }
    team.roster = std::move(clean);
  }

  // Cut down to the limit, keeping the best.
  for (auto &team : out.teams) {
    if (static_cast<int>(team.roster.size()) <= limit)
      continue;
    std::sort(team.roster.begin(), team.roster.end(),
              [&out](PlayerId a, PlayerId b) {
                return better_player(out.players.get(a), out.players.get(b));
              });
    for (std::size_t i = static_cast<std::size_t>(limit); i < team.roster.size(); ++i) {
      Player *p = out.players.find_mutable(team.roster[i]);
      if (p->contract_id) {
        const Contract *c = out.contracts.find(*p->contract_id);
        if (c && c->status == ContractStatus::Active)
          out.contracts.upsert(release_contract(*c, season));
        p->contract_id.reset();
      }
      rostered.erase(p->id);
      out.released.push_back(p->id);
    }
    team.roster.resize(static_cast<std::size_t>(limit));
  }

  // Unsigned players still young enough to help, best first per position.
  std::array<std::deque<PlayerId>, kNumPositions> pool;
  {
    std::vector<const Player *> unsigned_players;
    for (const auto &kv : out.players) {
      const Player &p = kv.second;
      if (!p.contract_id && !rostered.count(p.id) && p.age <= 33)
        unsigned_players.push_back(&p);
    }
    std::sort(unsigned_players.begin(), unsigned_players.end(),
              [](const Player *a, const Player *b) { return better_player(*a, *b); });
    for (const Player *p : unsigned_players)
      pool[position_index(p->position)].push_back(p->id);
  }

  // Fill up to the limit at the thinnest positions.
  for (auto &team : out.teams) {
    Eigen::ArrayXi counts = position_counts(team.roster, out.players);
    while (static_cast<int>(team.roster.size()) < limit) {
      const Position pos = most_needed_position(counts);
      auto &candidates = pool[position_index(pos)];
      Player p;
      if (!candidates.empty()) {
        p = out.players.get(candidates.front());
        candidates.pop_front();
      } else {
        PlayerConstraints cons;
        cons.position = pos;
        cons.tier = rng.chance(0.2) ? SkillTier::Backup : SkillTier::Fringe;
        cons.min_age = 22;
        cons.max_age = 28;
        p = player_gen.generate_player(cons, rng);
      }
      const Contract c = filler_contract(contract_gen, p, team.id, season);
      p.contract_id = c.id;
      out.players.upsert(p);
      out.contracts.upsert(c);
      team.roster.push_back(p.id);
      counts(position_index(pos)) += 1;
      out.added.push_back(p.id);
    }
  }

  log::debug("roster maintenance {}: {} released, {} added", season,
             out.released.size(), out.added.size());
  return out;
}

} // namespace league_core
