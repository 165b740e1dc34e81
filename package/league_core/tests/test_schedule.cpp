#include "league_core/schedule.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <set>

#include "test_helpers.hpp"

using namespace league_core;

namespace {

std::vector<int> games_per_team(const std::vector<ScheduledGame> &games) {
  std::vector<int> n(kNumTeams, 0);
  for (const auto &g : games) {
    n[g.home] += 1;
    n[g.away] += 1;
  }
  return n;
}

void require_playable(const SeasonSchedule &s, const std::vector<Team> &teams,
                      const ScheduleConfig &cfg) {
  REQUIRE(validate_schedule(s, teams, cfg).empty());
  for (int n : games_per_team(s.games))
    REQUIRE(n == cfg.games_per_team);
  for (int w = 1; w <= cfg.weeks; ++w) {
    std::set<TeamId> busy;
    for (const auto &g : s.games_in_week(w)) {
      REQUIRE(g.home != g.away);
      REQUIRE(busy.insert(g.home).second);
      REQUIRE(busy.insert(g.away).second);
    }
  }
  for (TeamId t = 0; t < kNumTeams; ++t) {
    const int bye = s.bye_weeks[t];
    REQUIRE(bye >= 1);
    REQUIRE(bye <= cfg.weeks);
    for (const auto &g : s.games_for_team(t))
      REQUIRE(g.week != bye);
  }
}

} // namespace

TEST_CASE("formula matchups give every team seventeen games",
          "[schedule]") {
  const std::vector<Team> teams = default_teams();
  for (int year : {2023, 2024, 2025, 2026}) {
    const std::vector<ScheduledGame> games = build_formula_matchups(
        teams, default_division_standings(teams), year);
    REQUIRE(games.size() == 272);
    for (int n : games_per_team(games))
      REQUIRE(n == kGamesPerTeam);

    std::vector<int> home(kNumTeams, 0);
    std::map<std::pair<TeamId, TeamId>, int> meetings;
    for (const auto &g : games) {
      home[g.home] += 1;
      meetings[{std::min(g.home, g.away), std::max(g.home, g.away)}] += 1;
    }
    for (int h : home) {
      REQUIRE(h >= 8);
      REQUIRE(h <= 9);
    }
    for (const auto &m : meetings) {
      const bool rivals =
          same_division(teams[m.first.first], teams[m.first.second]);
      REQUIRE(m.second == (rivals ? 2 : 1));
    }
  }
}

TEST_CASE("formula matchups need the standard alignment", "[schedule]") {
  std::vector<Team> teams = default_teams();
  teams[0].division = Division::West;
  REQUIRE(build_formula_matchups(teams, default_division_standings(teams), 2025)
              .empty());
}

TEST_CASE("bye weeks stay in the window and come in pairs", "[schedule]") {
  const std::vector<Team> teams = default_teams();
  const ScheduleConfig cfg;
  SeededRandom rng(11);
  const std::vector<int> byes = assign_bye_weeks(teams, rng, cfg);
  REQUIRE(byes.size() == static_cast<std::size_t>(kNumTeams));
  std::map<int, int> per_week;
  for (int b : byes) {
    REQUIRE(b >= cfg.first_bye_week);
    REQUIRE(b <= cfg.last_bye_week);
    per_week[b] += 1;
  }
  for (const auto &w : per_week) {
    REQUIRE(w.second % 2 == 0);
    REQUIRE(w.second <= cfg.max_teams_per_bye);
  }
}

TEST_CASE("generated schedules are playable", "[schedule]") {
  const std::vector<Team> teams = default_teams();
  const ScheduleConfig cfg;
  for (std::uint64_t seed = 1; seed <= 4; ++seed) {
    SeededRandom rng(seed);
    const SeasonSchedule s = generate_season_schedule(
        teams, default_division_standings(teams), 2025, rng, cfg);
    REQUIRE(s.year == 2025);
    REQUIRE(s.games.size() == 272);
    require_playable(s, teams, cfg);
  }
}

TEST_CASE("the formula schedule lays out every season without the fallback",
          "[schedule]") {
  const std::vector<Team> teams = default_teams();
  const ScheduleConfig cfg;
  for (int i = 0; i < 40; ++i) {
    SeededRandom rng(100 + i);
    DivisionStandings previous = default_division_standings(teams);
    for (auto &conf : previous)
      for (auto &div : conf)
        rng.shuffle(div);

    const int year = 2025 + i;
    const std::optional<SeasonSchedule> formula =
        build_formula_schedule(teams, previous, year, rng, cfg);
    REQUIRE(formula.has_value());
    REQUIRE_FALSE(formula->used_fallback);
    REQUIRE(formula->games.size() == 272);
    require_playable(*formula, teams, cfg);

    std::map<int, int> per_week;
    for (int b : formula->bye_weeks) {
      REQUIRE(b >= cfg.first_bye_week);
      REQUIRE(b <= cfg.last_bye_week);
      per_week[b] += 1;
    }
    for (const auto &w : per_week)
      REQUIRE(w.second <= cfg.max_teams_per_bye);

    std::set<std::pair<TeamId, TeamId>> hosted;
    for (const auto &g : formula->games) {
      if (g.is_divisional)
        hosted.insert({g.home, g.away});
    }
    for (const auto &a : teams) {
      for (const auto &b : teams) {
        if (a.id != b.id && same_division(a, b))
          REQUIRE(hosted.count({a.id, b.id}) == 1);
      }
    }

    SeededRandom again(100 + i);
    const SeasonSchedule s =
        generate_season_schedule(teams, previous, year, again, cfg);
    REQUIRE_FALSE(s.used_fallback);
  }
}

TEST_CASE("a bye window too tight for the formula falls back", "[schedule]") {
  const std::vector<Team> teams = default_teams();
  ScheduleConfig cfg;
  cfg.max_teams_per_bye = 4;
  SeededRandom rng(9);
  REQUIRE_FALSE(build_formula_schedule(teams, default_division_standings(teams),
                                       2025, rng, cfg)
                    .has_value());
  const SeasonSchedule s = generate_season_schedule(
      teams, default_division_standings(teams), 2025, rng, cfg);
  REQUIRE(s.used_fallback);
  require_playable(s, teams, cfg);
}

TEST_CASE("fallback pairing is always playable", "[schedule]") {
  const std::vector<Team> teams = default_teams();
  const ScheduleConfig cfg;
  for (std::uint64_t seed = 1; seed <= 10; ++seed) {
    SeededRandom rng(seed);
    const std::vector<int> byes = assign_bye_weeks(teams, rng, cfg);
    const SeasonSchedule s = build_fallback_schedule(teams, 2030, byes, rng, cfg);
    REQUIRE(s.used_fallback);
    require_playable(s, teams, cfg);
  }
}

TEST_CASE("schedule generation rejects sparse team ids", "[schedule]") {
  std::vector<Team> teams = default_teams();
  teams[5].id = 99;
  SeededRandom rng(1);
  REQUIRE_THROWS_AS(generate_season_schedule(teams, DivisionStandings{}, 2025,
                                             rng, ScheduleConfig{}),
                    std::invalid_argument);
}

TEST_CASE("schedule validation reports broken schedules", "[schedule]") {
  const std::vector<Team> teams = default_teams();
  const ScheduleConfig cfg;
  SeededRandom rng(3);
  SeasonSchedule s = generate_season_schedule(
      teams, default_division_standings(teams), 2025, rng, cfg);

  SECTION("a team playing itself") {
    s.games.front().away = s.games.front().home;
    REQUIRE_FALSE(validate_schedule(s, teams, cfg).empty());
  }
  SECTION("a missing game") {
    s.games.pop_back();
    REQUIRE_FALSE(validate_schedule(s, teams, cfg).empty());
  }
  SECTION("a game in a bye week") {
    ScheduledGame &g = s.games.front();
    g.week = s.bye_weeks[g.home];
    REQUIRE_FALSE(validate_schedule(s, teams, cfg).empty());
  }
}

TEST_CASE("same seed, same schedule", "[schedule][determinism]") {
  const std::vector<Team> teams = default_teams();
  SeededRandom a(77), b(77);
  const SeasonSchedule sa = generate_season_schedule(
      teams, default_division_standings(teams), 2025, a, ScheduleConfig{});
  const SeasonSchedule sb = generate_season_schedule(
      teams, default_division_standings(teams), 2025, b, ScheduleConfig{});
  REQUIRE(sa.games.size() == sb.games.size());
  for (std::size_t i = 0; i < sa.games.size(); ++i) {
    REQUIRE(sa.games[i].id == sb.games[i].id);
    REQUIRE(sa.games[i].week == sb.games[i].week);
  }
  REQUIRE(sa.bye_weeks == sb.bye_weeks);
}
