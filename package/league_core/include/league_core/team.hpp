#pragma once

#include <optional>
#include <string>
#include <vector>

#include "league_core/types.hpp"

namespace league_core {

struct TeamRecord {
  int wins{0};
  int losses{0};
  int ties{0};
  int division_wins{0};
  int division_losses{0};
  int division_ties{0};
  int conference_wins{0};
  int conference_losses{0};
  int conference_ties{0};
  int points_for{0};
  int points_against{0};
  int streak{0}; // positive for a win streak, negative for a losing streak

  int games() const { return wins + losses + ties; }
  double win_pct() const;
};

struct AllTimeRecord {
  int wins{0};
  int losses{0};
  int ties{0};

  int games() const { return wins + losses + ties; }
};

struct TeamFinances {
  Money salary_cap{kDefaultSalaryCap};
  Money cap_usage{0};
  Money dead_money{0};
  Money cap_space{kDefaultSalaryCap};
  Money next_year_committed{0};
  Money two_years_out_committed{0};
  Money three_years_out_committed{0};
};

struct Team {
  TeamId id{0};
  std::string city;
  std::string name;
  std::string abbreviation;
  Conference conference{Conference::AFC};
  Division division{Division::East};
  std::vector<PlayerId> roster;
  TeamRecord current_record;
  AllTimeRecord all_time_record;
  int championships{0};
  std::optional<int> last_championship_year;
  int playoff_appearances{0};
  std::optional<int> playoff_seed;
  TeamFinances finances;
};

// (wins + 0.5 * ties) / games, 0 when nothing has been played.
double win_pct(int wins, int losses, int ties);

// "W-L" or "W-L-T" when ties exist.
std::string record_string(int wins, int losses, int ties);
std::string record_string(const TeamRecord &r);

bool same_division(const Team &a, const Team &b);
bool same_conference(const Team &a, const Team &b);

// Lookup by id; nullptr when absent.
const Team *find_team(const std::vector<Team> &teams, TeamId id);
Team *find_team(std::vector<Team> &teams, TeamId id);

// Ids of every team, in id order.
std::vector<TeamId> team_ids(const std::vector<Team> &teams);

// True when every conference has four divisions of four teams.
bool has_standard_alignment(const std::vector<Team> &teams);

// Adds a finished game to both sides' current records.
void apply_game_result(std::vector<Team> &teams, TeamId home, TeamId away,
                       int home_score, int away_score);

// Clears every team's current record and playoff seed.
std::vector<Team> reset_season_records(const std::vector<Team> &teams);

// Folds the season into all-time records and credits the champion.
std::vector<Team> fold_season_records(const std::vector<Team> &teams,
                                      std::optional<TeamId> champion,
                                      int year);

} // namespace league_core
