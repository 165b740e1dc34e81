#include "league_core/standings.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace league_core {

static constexpr double kPctEpsilon = 1e-9;

static int compare_pct(double a, double b) {
  if (std::abs(a - b) <= kPctEpsilon)
    return 0;
  return a > b ? -1 : 1;
}

const TeamStanding *Standings::find(TeamId team) const {
  for (const auto &row : rows) {
    if (row.team_id == team)
      return &row;
  }
  return nullptr;
}

std::vector<TeamId> PlayoffField::all_teams() const {
  std::vector<TeamId> out;
  for (const auto &conf : seeds)
    out.insert(out.end(), conf.begin(), conf.end());
  return out;
}

bool PlayoffField::contains(TeamId team) const {
  for (const auto &conf : seeds) {
    if (std::find(conf.begin(), conf.end(), team) != conf.end())
      return true;
  }
  return false;
}

int compare_standings(const TeamStanding &a, const TeamStanding &b) {
  if (int c = compare_pct(a.win_pct, b.win_pct))
    return c;
  if (int c = compare_pct(a.division_win_pct, b.division_win_pct))
    return c;
  if (int c = compare_pct(a.conference_win_pct, b.conference_win_pct))
    return c;
  if (a.point_differential != b.point_differential)
    return a.point_differential > b.point_differential ? -1 : 1;
  return 0;
}

bool ranks_ahead(const TeamStanding &a, const TeamStanding &b) {
  const int c = compare_standings(a, b);
  if (c != 0)
    return c < 0;
  return a.team_id < b.team_id;
}

TeamStanding standing_from_record(const Team &team, const TeamRecord &r) {
  TeamStanding s;
  s.team_id = team.id;
  s.conference = team.conference;
  s.division = team.division;
  s.wins = r.wins;
  s.losses = r.losses;
  s.ties = r.ties;
  s.win_pct = win_pct(r.wins, r.losses, r.ties);
  s.division_wins = r.division_wins;
  s.division_losses = r.division_losses;
  s.division_ties = r.division_ties;
  s.division_win_pct = win_pct(r.division_wins, r.division_losses, r.division_ties);
  s.conference_wins = r.conference_wins;
  s.conference_losses = r.conference_losses;
  s.conference_ties = r.conference_ties;
  s.conference_win_pct =
      win_pct(r.conference_wins, r.conference_losses, r.conference_ties);
  s.points_for = r.points_for;
  s.points_against = r.points_against;
  s.point_differential = r.points_for - r.points_against;
  s.streak = r.streak;
  return s;
}

// Fills division/conference orders and ranks from finished rows.
static void rank_rows(Standings &st) {
  std::vector<const TeamStanding *> sorted;
  for (const auto &row : st.rows)
    sorted.push_back(&row);
  std::sort(sorted.begin(), sorted.end(),
            [](const TeamStanding *a, const TeamStanding *b) {
              return ranks_ahead(*a, *b);
            });

  std::map<TeamId, std::pair<int, int>> ranks; // division, conference
  for (const TeamStanding *row : sorted) {
    const int c = conference_index(row->conference);
    const int d = division_index(row->division);
    st.division_order[c][d].push_back(row->team_id);
    st.conference_order[c].push_back(row->team_id);
    ranks[row->team_id] = {static_cast<int>(st.division_order[c][d].size()),
                           static_cast<int>(st.conference_order[c].size())};
  }
  for (auto &row : st.rows) {
    row.division_rank = ranks[row.team_id].first;
    row.conference_rank = ranks[row.team_id].second;
  }
}

Standings calculate_standings(const std::vector<ScheduledGame> &games,
                              const std::vector<Team> &teams) {
  std::vector<Team> scratch = reset_season_records(teams);
  std::map<TeamId, std::vector<TeamId>> opponents;
  std::map<TeamId, std::vector<TeamId>> beaten;
  for (const auto &g : games) {
    if (!g.is_complete)
      continue;
    apply_game_result(scratch, g.home, g.away, g.home_score, g.away_score);
    opponents[g.home].push_back(g.away);
    opponents[g.away].push_back(g.home);
    if (g.winner)
      beaten[*g.winner].push_back(*g.winner == g.home ? g.away : g.home);
  }

  Standings st;
  for (const auto &t : scratch)
    st.rows.push_back(standing_from_record(t, t.current_record));

  auto mean_pct = [&scratch](const std::vector<TeamId> &ids) {
    if (ids.empty())
      return 0.0;
    double sum = 0.0;
    for (TeamId id : ids) {
      const Team *t = find_team(scratch, id);
      if (t)
        sum += t->current_record.win_pct();
    }
    return sum / static_cast<double>(ids.size());
  };
  for (auto &row : st.rows) {
    row.strength_of_schedule = mean_pct(opponents[row.team_id]);
    row.strength_of_victory = mean_pct(beaten[row.team_id]);
  }

  rank_rows(st);
  return st;
}

Standings standings_from_records(const std::vector<Team> &teams) {
  Standings st;
  for (const auto &t : teams)
    st.rows.push_back(standing_from_record(t, t.current_record));
  rank_rows(st);
  return st;
}

PlayoffField determine_playoff_teams(const Standings &standings) {
  PlayoffField field;
  for (int c = 0; c < kNumConferences; ++c) {
    std::vector<const TeamStanding *> winners;
    for (const auto &div : standings.division_order[c]) {
      if (!div.empty()) {
        const TeamStanding *row = standings.find(div.front());
        if (row)
          winners.push_back(row);
      }
    }
    std::sort(winners.begin(), winners.end(),
              [](const TeamStanding *a, const TeamStanding *b) {
                return ranks_ahead(*a, *b);
              });
    for (const TeamStanding *w : winners)
      field.seeds[c].push_back(w->team_id);

    // conference_order is already sorted by the tiebreak chain.
    for (TeamId id : standings.conference_order[c]) {
      if (static_cast<int>(field.seeds[c].size()) >= kPlayoffSeedsPerConference)
        break;
      if (std::find(field.seeds[c].begin(), field.seeds[c].end(), id) ==
          field.seeds[c].end())
        field.seeds[c].push_back(id);
    }
  }
  return field;
}

} // namespace league_core
