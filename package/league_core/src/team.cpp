#include "league_core/team.hpp"

#include <array>

#include <fmt/format.h>

namespace league_core {

double win_pct(int wins, int losses, int ties) {
  const int games = wins + losses + ties;
  if (games <= 0)
    return 0.0;
  return (static_cast<double>(wins) + 0.5 * static_cast<double>(ties)) /
         static_cast<double>(games);
}

double TeamRecord::win_pct() const {
  return league_core::win_pct(wins, losses, ties);
}

std::string record_string(int wins, int losses, int ties) {
  if (ties > 0)
    return fmt::format("{}-{}-{}", wins, losses, ties);
  return fmt::format("{}-{}", wins, losses);
}

std::string record_string(const TeamRecord &r) {
  return record_string(r.wins, r.losses, r.ties);
}

bool same_division(const Team &a, const Team &b) {
  return a.conference == b.conference && a.division == b.division;
}

bool same_conference(const Team &a, const Team &b) {
  return a.conference == b.conference;
}

const Team *find_team(const std::vector<Team> &teams, TeamId id) {
  if (id >= 0 && id < static_cast<TeamId>(teams.size()) && teams[id].id == id)
    return &teams[id];
  for (const auto &t : teams) {
    if (t.id == id)
      return &t;
  }
  return nullptr;
}

Team *find_team(std::vector<Team> &teams, TeamId id) {
  if (id >= 0 && id < static_cast<TeamId>(teams.size()) && teams[id].id == id)
    return &teams[id];
  for (auto &t : teams) {
    if (t.id == id)
      return &t;
  }
  return nullptr;
}

std::vector<TeamId> team_ids(const std::vector<Team> &teams) {
  std::vector<TeamId> ids;
  ids.reserve(teams.size());
  for (const auto &t : teams)
    ids.push_back(t.id);
  return ids;
}

bool has_standard_alignment(const std::vector<Team> &teams) {
  if (static_cast<int>(teams.size()) != kNumTeams)
    return false;
  std::array<std::array<int, kDivisionsPerConference>, kNumConferences> n{};
  for (const auto &t : teams)
    n[conference_index(t.conference)][division_index(t.division)] += 1;
  for (const auto &conf : n) {
    for (int count : conf) {
      if (count != kTeamsPerDivision)
        return false;
    }
  }
  return true;
}

static void record_outcome(TeamRecord &r, int result, bool division,
                           bool conference) {
  // result: 1 win, 0 tie, -1 loss
  if (result > 0) {
    r.wins += 1;
    r.streak = r.streak > 0 ? r.streak + 1 : 1;
  } else if (result < 0) {
    r.losses += 1;
    r.streak = r.streak < 0 ? r.streak - 1 : -1;
  } else {
    r.ties += 1;
    r.streak = 0;
  }
  if (division) {
    r.division_wins += result > 0;
    r.division_losses += result < 0;
    r.division_ties += result == 0;
  }
  if (conference) {
    r.conference_wins += result > 0;
    r.conference_losses += result < 0;
    r.conference_ties += result == 0;
  }
}

void apply_game_result(std::vector<Team> &teams, TeamId home, TeamId away,
                       int home_score, int away_score) {
  Team *h = find_team(teams, home);
  Team *a = find_team(teams, away);
  if (!h || !a)
    return;
  const bool division = same_division(*h, *a);
  const bool conference = same_conference(*h, *a);
  const int result =
      home_score > away_score ? 1 : (home_score < away_score ? -1 : 0);

  record_outcome(h->current_record, result, division, conference);
  record_outcome(a->current_record, -result, division, conference);
  h->current_record.points_for += home_score;
  h->current_record.points_against += away_score;
  a->current_record.points_for += away_score;
  a->current_record.points_against += home_score;
}

std::vector<Team> reset_season_records(const std::vector<Team> &teams) {
  std::vector<Team> out = teams;
  for (auto &t : out) {
    t.current_record = TeamRecord{};
    t.playoff_seed.reset();
  }
  return out;
}

std::vector<Team> fold_season_records(const std::vector<Team> &teams,
                                      std::optional<TeamId> champion,
                                      int year) {
  std::vector<Team> out = teams;
  for (auto &t : out) {
    t.all_time_record.wins += t.current_record.wins;
    t.all_time_record.losses += t.current_record.losses;
    t.all_time_record.ties += t.current_record.ties;
    if (t.playoff_seed)
      t.playoff_appearances += 1;
    if (champion && *champion == t.id) {
      t.championships += 1;
      t.last_championship_year = year;
    }
  }
  return out;
}

} // namespace league_core
