#include "league_core/offseason.hpp"

#include <algorithm>
#include <numeric>

#include "league_core/log.hpp"

namespace league_core {

double prospect_talent_score(const Prospect &p) {
  const int ceiling = p.player.potential;
  double tier = 10.0;
  if (ceiling >= 82)
    tier = 100.0;
  else if (ceiling >= 76)
    tier = 80.0;
  else if (ceiling >= 70)
    tier = 60.0;
  else if (ceiling >= 65)
    tier = 40.0;
  else if (ceiling >= 60)
    tier = 35.0;
  else if (ceiling >= 55)
    tier = 25.0;
  // Separate prospects inside a band by current ability.
  return tier + overall_rating(p.player) * 0.1;
}

static ContractOffer rookie_offer(int round, int overall, int years) {
  const Money aav = rookie_slot_value(round, overall);
  ContractOffer offer;
  offer.years = years;
  offer.bonus_per_year = aav / 2;
  offer.salary_per_year = aav - offer.bonus_per_year;
  offer.guaranteed_years = round == 1 ? years : 1;
  return offer;
}

DraftResult process_ai_draft(const std::vector<DraftPick> &picks,
                             const std::vector<Prospect> &draft_class,
                             const PlayerTable &players,
                             const ContractTable &contracts,
                             const std::vector<Team> &teams, int season,
                             RandomSource &rng, ContractGenerator &generator,
                             const OffseasonConfig &cfg) {
  DraftResult out;
  out.players = players;
  out.contracts = contracts;
  out.teams = teams;
  out.picks = picks;
  std::sort(out.picks.begin(), out.picks.end(),
            [](const DraftPick &a, const DraftPick &b) {
              return a.overall < b.overall;
            });

  TeamId max_id = 0;
  for (const auto &t : out.teams)
    max_id = std::max(max_id, t.id);
  // Depth chart per team: rows are team ids, columns positions.
  Eigen::ArrayXXi depth = Eigen::ArrayXXi::Zero(max_id + 1, kNumPositions);
  for (const auto &t : out.teams)
    depth.row(t.id) = position_counts(t.roster, out.players).transpose();

  // Big board: the class in talent order, whatever order it arrived in.
  std::vector<std::size_t> board(draft_class.size());
  std::iota(board.begin(), board.end(), 0);
  std::vector<double> talent(draft_class.size());
  for (std::size_t i = 0; i < draft_class.size(); ++i)
    talent[i] = prospect_talent_score(draft_class[i]);
  std::stable_sort(board.begin(), board.end(),
                   [&](std::size_t a, std::size_t b) {
                     if (talent[a] != talent[b])
                       return talent[a] > talent[b];
                     return draft_class[a].draft_value >
                            draft_class[b].draft_value;
                   });

  std::vector<bool> taken(draft_class.size(), false);
  const auto &ideal = ideal_position_counts();

  for (auto &pick : out.picks) {
    if (pick.round > cfg.draft_rounds || pick.selected_player)
      continue;
    Team *team = find_team(out.teams, pick.current_team);
    if (!team)
      continue;

    int best = -1;
    double best_score = 0.0;
    int scanned = 0;
    for (std::size_t k = 0; k < board.size() && scanned < cfg.draft_scan_depth;
         ++k) {
      const std::size_t i = board[k];
      if (taken[i])
        continue;
      ++scanned;
      const int pos = position_index(draft_class[i].player.position);
      const int deficit = ideal[pos] - depth(team->id, pos);
      const double need = deficit > 0 ? deficit * 15.0 : -10.0;
      const double score = talent[i] + need + rng.uniform_int(-5, 5);
      if (best < 0 || score > best_score) {
        best = static_cast<int>(i);
        best_score = score;
      }
    }
    if (best < 0)
      break; // class exhausted

    taken[best] = true;
    Player p = draft_class[best].player;
    p.experience = 0;
    p.draft_year = season;
    p.draft_round = pick.round;
    p.draft_pick = pick.overall;
    const Contract c = generator.create_contract(
        p.id, team->id,
        rookie_offer(pick.round, pick.overall, cfg.rookie_contract_years),
        season, ContractType::Rookie);
    p.contract_id = c.id;
    out.players.upsert(p);
    out.contracts.upsert(c);
    team->roster.push_back(p.id);
    depth(team->id, position_index(p.position)) += 1;
    pick.selected_player = p.id;
    out.drafted.push_back(p.id);
  }

  for (std::size_t i = 0; i < draft_class.size(); ++i) {
    if (taken[i])
      continue;
    Player p = draft_class[i].player;
    p.contract_id.reset();
    p.draft_year = season;
    p.draft_round = 0;
    p.draft_pick = 0;
    out.players.upsert(p);
    out.undrafted.push_back(p.id);
  }

  log::debug("draft {}: {} selected, {} undrafted", season, out.drafted.size(),
             out.undrafted.size());
  return out;
}

} // namespace league_core
