#include "league_core/offseason.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "league_core/log.hpp"

namespace league_core {

AuctionOutcome clear_free_agent_auction(const std::vector<TeamId> &bidders,
                                        const Eigen::VectorXd &valuations,
                                        double reserve) {
  AuctionOutcome res;
  if (bidders.empty() ||
      valuations.size() != static_cast<Eigen::Index>(bidders.size()))
    return res;

  Eigen::Index top = 0;
  const double best = valuations.maxCoeff(&top);
  if (best < reserve)
    return res;

  // The runner-up drops out at its own valuation; the winner pays that.
  double second = reserve;
  for (Eigen::Index i = 0; i < valuations.size(); ++i) {
    if (i != top && valuations(i) > second)
      second = valuations(i);
  }
  res.winner = bidders[top];
  res.price = std::min(best, std::max(reserve, second));
  return res;
}

// Older marginal players draw no interest.
static bool worth_pursuing(const Player &p) {
  const SkillTier tier = skill_tier(p);
  if (p.age > 38 && tier != SkillTier::Elite)
    return false;
  if (p.age > 36 && tier == SkillTier::Fringe)
    return false;
  return true;
}

FreeAgencyResult process_ai_free_agency(const std::vector<PlayerId> &candidates,
                                        const PlayerTable &players,
                                        const ContractTable &contracts,
                                        const std::vector<Team> &teams,
                                        int season, RandomSource &rng,
                                        ContractGenerator &generator,
                                        const OffseasonConfig &cfg) {
  FreeAgencyResult out;
  out.players = players;
  out.contracts = contracts;
  out.teams = teams;

  TeamId max_id = 0;
  for (const auto &t : out.teams)
    max_id = std::max(max_id, t.id);
  Eigen::ArrayXXi depth = Eigen::ArrayXXi::Zero(max_id + 1, kNumPositions);
  std::vector<Money> committed(static_cast<std::size_t>(max_id + 1), 0);
  for (const auto &t : out.teams) {
    depth.row(t.id) = position_counts(t.roster, out.players).transpose();
    committed[t.id] = team_cap_usage(out.contracts, t.id, season) +
                      team_dead_money(out.contracts, t.id, season);
  }

  // Unsigned, existing players only, best first.
  std::set<PlayerId> seen;
  std::vector<const Player *> pool;
  for (const PlayerId pid : candidates) {
    const Player *p = out.players.find(pid);
    if (p && !p->contract_id && seen.insert(pid).second)
      pool.push_back(p);
  }
  std::sort(pool.begin(), pool.end(), [](const Player *a, const Player *b) {
    const double ra = overall_rating(*a), rb = overall_rating(*b);
    if (ra != rb)
      return ra > rb;
    return a->id < b->id;
  });
  std::vector<PlayerId> order;
  for (const Player *p : pool)
    order.push_back(p->id);

  const auto &ideal = ideal_position_counts();
  for (const PlayerId pid : order) {
    Player player = out.players.get(pid);
    if (!worth_pursuing(player))
      continue;

    const ContractOffer ask = generator.value_player(player, rng);
    const Money asking_aav = ask.salary_per_year + ask.bonus_per_year;
    const int pos = position_index(player.position);

    std::vector<TeamId> bidders;
    std::vector<double> values;
    for (const auto &team : out.teams) {
      const int roster_n = static_cast<int>(team.roster.size());
      if (roster_n >= cfg.roster_limit)
        continue;
      if (cfg.salary_cap - committed[team.id] <= cfg.min_cap_space_to_bid)
        continue;
      const int deficit = ideal[pos] - depth(team.id, pos);
      if (deficit <= 0 && roster_n >= cfg.free_agency_roster_target)
        continue;
      const double need = std::max(0, deficit) * 10.0 +
                          (cfg.roster_limit - roster_n) * 2.0 +
                          rng.uniform_int(0, 10);
      bidders.push_back(team.id);
      values.push_back(static_cast<double>(asking_aav) * (0.85 + need / 100.0));
    }
    if (bidders.empty())
      continue;

    const Eigen::VectorXd valuations =
        Eigen::Map<const Eigen::VectorXd>(values.data(),
                                          static_cast<Eigen::Index>(values.size()));
    const Money min_salary = minimum_salary(player.experience);
    const AuctionOutcome outcome = clear_free_agent_auction(
        bidders, valuations, static_cast<double>(min_salary));
    if (!outcome.winner)
      continue;

    Team *team = find_team(out.teams, *outcome.winner);
    const Money space = cfg.salary_cap - committed[team->id];
    const Money aav = std::max(min_salary, static_cast<Money>(std::lround(outcome.price)));

    ContractOffer offer = ask;
    ContractType type = ContractType::Veteran;
    bool minimum_deal = false;
    if (aav <= space) {
      const double bonus_share =
          asking_aav > 0 ? static_cast<double>(ask.bonus_per_year) / asking_aav : 0.0;
      offer.bonus_per_year = static_cast<Money>(std::lround(aav * bonus_share));
      offer.salary_per_year = aav - offer.bonus_per_year;
    } else if (min_salary <= space) {
      offer = ContractOffer{};
      offer.years = 1;
      offer.salary_per_year = min_salary;
      type = ContractType::Minimum;
      minimum_deal = true;
    } else {
      continue;
    }

    const Contract c =
        generator.create_contract(player.id, team->id, offer, season, type);
    player.contract_id = c.id;
    out.players.upsert(player);
    out.contracts.upsert(c);
    team->roster.push_back(player.id);
    depth(team->id, pos) += 1;
    committed[team->id] += cap_hit_for_year(c, season);
    out.signings.push_back(Signing{player.id, team->id, c.id,
                                   offer.salary_per_year + offer.bonus_per_year,
                                   minimum_deal});
  }

  log::debug("free agency {}: {} signings from {} candidates", season,
             out.signings.size(), order.size());
  return out;
}

} // namespace league_core
