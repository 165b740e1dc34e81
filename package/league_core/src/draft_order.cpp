#include "league_core/draft_order.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include "league_core/log.hpp"

namespace league_core {

// Worst record first: win%, then point differential, then id.
static void sort_worst_first(std::vector<const TeamStanding *> &rows) {
  std::sort(rows.begin(), rows.end(),
            [](const TeamStanding *a, const TeamStanding *b) {
              if (a->win_pct != b->win_pct)
                return a->win_pct < b->win_pct;
              if (a->point_differential != b->point_differential)
                return a->point_differential < b->point_differential;
              return a->team_id < b->team_id;
            });
}

static void append_group(std::vector<TeamId> &order,
                         std::vector<const TeamStanding *> group) {
  sort_worst_first(group);
  for (const TeamStanding *row : group)
    order.push_back(row->team_id);
}

PartialDraftOrder compute_primary_draft_order(const Standings &standings,
                                              const PlayoffBracket &bracket,
                                              int expected_teams) {
  PartialDraftOrder out;
  std::vector<const TeamStanding *> non_playoff;
  std::vector<const TeamStanding *> lost_in[4];
  const TeamStanding *runner_up = nullptr;
  const TeamStanding *champion = nullptr;

  for (const auto &row : standings.rows) {
    if (!bracket.field.contains(row.team_id)) {
      non_playoff.push_back(&row);
      continue;
    }
    if (bracket.champion && *bracket.champion == row.team_id) {
      champion = &row;
      continue;
    }
    const auto round = elimination_round(bracket, row.team_id);
    if (!round)
      continue; // still alive in an unfinished bracket
    if (*round == PlayoffRound::SuperBowl)
      runner_up = &row;
    else
      lost_in[static_cast<int>(*round)].push_back(&row);
  }

  append_group(out.order, non_playoff);
  for (int r = 0; r < 3; ++r)
    append_group(out.order, lost_in[r]);
  if (runner_up)
    out.order.push_back(runner_up->team_id);
  if (champion)
    out.order.push_back(champion->team_id);

  out.complete = static_cast<int>(out.order.size()) == expected_teams;
  return out;
}

std::vector<TeamId> reconcile_draft_order(const PartialDraftOrder &partial,
                                          const std::vector<TeamId> &all_teams,
                                          const Standings &standings) {
  const std::set<TeamId> known(all_teams.begin(), all_teams.end());
  std::set<TeamId> placed;
  std::vector<TeamId> order;
  for (TeamId id : partial.order) {
    if (known.count(id) && placed.insert(id).second)
      order.push_back(id);
  }

  std::vector<std::pair<double, TeamId>> missing;
  for (TeamId id : all_teams) {
    if (placed.count(id))
      continue;
    const TeamStanding *row = standings.find(id);
    const double pct = (row && row->wins + row->losses + row->ties > 0)
                           ? row->win_pct
                           : 0.5;
    missing.emplace_back(pct, id);
  }
  std::sort(missing.begin(), missing.end());
  for (const auto &m : missing) {
    if (placed.insert(m.second).second)
      order.push_back(m.second);
  }
  return order;
}

std::vector<TeamId> calculate_draft_order(const Standings &standings,
                                          const PlayoffBracket &bracket,
                                          const std::vector<TeamId> &all_teams) {
  const PartialDraftOrder partial = compute_primary_draft_order(
      standings, bracket, static_cast<int>(all_teams.size()));
  if (!partial.complete) {
    log::warn("draft order for {}: {} of {} teams placed from results; "
              "topping up by record",
              bracket.year, partial.order.size(), all_teams.size());
  }
  return reconcile_draft_order(partial, all_teams, standings);
}

std::vector<DraftPick> create_draft_picks(const std::vector<TeamId> &order,
                                          int year, int rounds) {
  std::vector<DraftPick> picks;
  const int n = static_cast<int>(order.size());
  picks.reserve(static_cast<std::size_t>(n * std::max(0, rounds)));
  for (int round = 1; round <= rounds; ++round) {
    for (int i = 0; i < n; ++i) {
      DraftPick p;
      p.year = year;
      p.round = round;
      p.overall = (round - 1) * n + i + 1;
      p.original_team = order[i];
      p.current_team = order[i];
      p.id = fmt::format("pick-{}-{}-{}", year, round, p.overall);
      picks.push_back(p);
    }
  }
  return picks;
}

DraftPick transfer_pick(const DraftPick &pick, TeamId new_owner) {
  DraftPick out = pick;
  if (new_owner == pick.current_team)
    return out;
  out.trade_history.push_back(pick.current_team);
  out.current_team = new_owner;
  return out;
}

std::vector<std::string> validate_draft_order(const std::vector<TeamId> &order,
                                              const std::vector<TeamId> &all_teams) {
  std::vector<std::string> errors;
  if (order.size() != all_teams.size()) {
    errors.push_back(fmt::format("draft order has {} entries for {} teams",
                                 order.size(), all_teams.size()));
  }
  const std::set<TeamId> known(all_teams.begin(), all_teams.end());
  std::set<TeamId> seen;
  for (TeamId id : order) {
    if (!known.count(id))
      errors.push_back(fmt::format("draft order names unknown team {}", id));
    else if (!seen.insert(id).second)
      errors.push_back(fmt::format("team {} appears twice in the draft order", id));
  }
  return errors;
}

} // namespace league_core
