#include "league_core/history.hpp"

#include <catch2/catch.hpp>

#include <set>
#include <utility>

#include "league_core/invariants.hpp"
#include "test_helpers.hpp"

using namespace league_core;
using league_core_test::make_league;

namespace {

struct Run {
  HistoryResult result;
  std::vector<std::pair<int, HistoryPhase>> progress;
};

Run run_history(int years, std::uint64_t seed, int cancel_after = -1) {
  BasicLeagueGenerator gen;
  const LeagueState initial = make_league(gen, seed);
  LeagueHistorySimulator sim(gen, gen, gen);

  Run run;
  bool cancel = false;
  HistoryConfig cfg;
  cfg.years = years;
  cfg.on_progress = [&](int index, int total, HistoryPhase phase) {
    REQUIRE(total == years);
    run.progress.emplace_back(index, phase);
    if (index == cancel_after && phase == HistoryPhase::Offseason)
      cancel = true;
  };
  cfg.should_cancel = [&cancel]() { return cancel; };

  SeededRandom rng(mix_seed(seed, 1));
  run.result = sim.run(initial, cfg, rng);
  return run;
}

} // namespace

TEST_CASE("five seasons of history crown five champions", "[history]") {
  const Run run = run_history(5, 101);
  const HistoryResult &r = run.result;

  REQUIRE_FALSE(r.cancelled);
  REQUIRE(r.years_simulated == 5);
  REQUIRE(r.season_summaries.size() == 5);
  for (std::size_t i = 0; i < r.season_summaries.size(); ++i) {
    const HistoricalSeasonSummary &s = r.season_summaries[i];
    REQUIRE(s.year == 2020 + static_cast<int>(i));
    REQUIRE(s.champion.has_value());
    REQUIRE(s.runner_up.has_value());
    REQUIRE_FALSE(s.champion_record.empty());
    REQUIRE_FALSE(s.schedule_fallback);
    REQUIRE(s.playoff_teams.size() == 14);
    REQUIRE(s.draft_order.size() == static_cast<std::size_t>(kNumTeams));
    REQUIRE(std::set<TeamId>(s.draft_order.begin(), s.draft_order.end()).size() ==
            static_cast<std::size_t>(kNumTeams));
  }

  int titles = 0, appearances = 0;
  for (const auto &t : r.state.teams) {
    titles += t.championships;
    appearances += t.playoff_appearances;
    REQUIRE(t.all_time_record.games() == 5 * kGamesPerTeam);
    REQUIRE(t.current_record.games() == 0);
  }
  REQUIRE(titles == 5);
  REQUIRE(appearances == 5 * 14);

  REQUIRE(r.total_draft_picks == 5 * kNumTeams * kDraftRounds);
  REQUIRE(r.total_free_agency_signings > 0);
  REQUIRE(r.total_retirements > 0);
  REQUIRE(r.state.season_history.size() == 5);
}

TEST_CASE("history hands back a clean league for the start year",
          "[history]") {
  const Run run = run_history(3, 202);
  const LeagueState &s = run.result.state;

  REQUIRE(s.calendar.year == 2025);
  REQUIRE(s.calendar.phase == SeasonPhase::Preseason);
  REQUIRE(s.schedule.year == 2025);
  REQUIRE(s.schedule.games.size() == 272);
  for (const auto &g : s.schedule.games)
    REQUIRE_FALSE(g.is_complete);
  REQUIRE(s.draft_picks.size() == static_cast<std::size_t>(kNumTeams * kDraftRounds));
  REQUIRE(s.draft_picks.front().year == 2026);
  REQUIRE_FALSE(s.draft_class.empty());
  REQUIRE(s.draft_class.front().player.draft_year == 2026);

  for (const auto &t : s.teams) {
    REQUIRE(t.roster.size() == static_cast<std::size_t>(kActiveRosterLimit));
    REQUIRE(t.all_time_record.games() > 0);
    REQUIRE(t.finances.cap_usage == team_cap_usage(s.contracts, t.id, 2025));
  }
  REQUIRE(check_league_invariants(s, LeagueConfig{}).empty());
}

TEST_CASE("progress is reported for every season and offseason",
          "[history]") {
  const Run run = run_history(3, 303);
  const std::vector<std::pair<int, HistoryPhase>> expected{
      {1, HistoryPhase::Season}, {1, HistoryPhase::Offseason},
      {2, HistoryPhase::Season}, {2, HistoryPhase::Offseason},
      {3, HistoryPhase::Season}, {3, HistoryPhase::Offseason}};
  REQUIRE(run.progress == expected);
}

TEST_CASE("cancelled history still returns a valid league", "[history]") {
  const Run run = run_history(4, 404, 1);
  const HistoryResult &r = run.result;
  REQUIRE(r.cancelled);
  REQUIRE(r.years_simulated == 1);
  REQUIRE(r.season_summaries.size() == 1);
  REQUIRE(run.progress.size() == 2);
  REQUIRE(r.state.calendar.year == 2025);
  REQUIRE(check_league_invariants(r.state, LeagueConfig{}).empty());
}

TEST_CASE("history length is validated", "[history]") {
  BasicLeagueGenerator gen;
  const LeagueState initial = make_league(gen, 5);
  LeagueHistorySimulator sim(gen, gen, gen);
  SeededRandom rng(6);

  HistoryConfig cfg;
  cfg.years = -1;
  REQUIRE_THROWS_AS(sim.run(initial, cfg, rng), std::invalid_argument);

  cfg.years = 0;
  const HistoryResult r = sim.run(initial, cfg, rng);
  REQUIRE(r.season_summaries.empty());
  REQUIRE(r.state.calendar.year == 2025);
  REQUIRE(check_league_invariants(r.state, LeagueConfig{}).empty());
}

TEST_CASE("same seed, same history", "[history][determinism]") {
  const Run a = run_history(2, 505);
  const Run b = run_history(2, 505);
  REQUIRE(a.result.season_summaries.size() == b.result.season_summaries.size());
  for (std::size_t i = 0; i < a.result.season_summaries.size(); ++i) {
    const auto &sa = a.result.season_summaries[i];
    const auto &sb = b.result.season_summaries[i];
    REQUIRE(sa.champion == sb.champion);
    REQUIRE(sa.champion_record == sb.champion_record);
    REQUIRE(sa.draft_order == sb.draft_order);
  }
  REQUIRE(a.result.total_free_agency_signings ==
          b.result.total_free_agency_signings);
}

TEST_CASE("same seed, same season", "[history][determinism]") {
  BasicLeagueGenerator gen;
  const LeagueState league = make_league(gen, 606);
  LeagueHistorySimulator sim(gen, gen, gen);

  SeededRandom ra(7), rb(7);
  const SeasonResult a = sim.play_season(league, ra);
  const SeasonResult b = sim.play_season(league, rb);
  REQUIRE(a.state.schedule.games.size() == b.state.schedule.games.size());
  for (std::size_t i = 0; i < a.state.schedule.games.size(); ++i) {
    const auto &ga = a.state.schedule.games[i];
    const auto &gb = b.state.schedule.games[i];
    REQUIRE(ga.id == gb.id);
    REQUIRE(ga.home_score == gb.home_score);
    REQUIRE(ga.away_score == gb.away_score);
  }
  REQUIRE(a.draft_order == b.draft_order);
  REQUIRE(a.bracket.champion == b.bracket.champion);
}

TEST_CASE("a season already under way is finished, not replayed",
          "[history]") {
  BasicLeagueGenerator gen;
  LeagueState league = make_league(gen, 707);
  // Week 1 has been played by hand: every home side won 20-3.
  for (auto &g : league.schedule.games) {
    if (g.week != 1)
      continue;
    g.is_complete = true;
    g.home_score = 20;
    g.away_score = 3;
    g.winner = g.home;
  }

  LeagueHistorySimulator sim(gen, gen, gen);
  SeededRandom rng(8);
  const SeasonResult r = sim.play_season(league, rng);
  for (const auto &g : r.state.schedule.games) {
    REQUIRE(g.is_complete);
    if (g.week == 1) {
      REQUIRE(g.home_score == 20);
      REQUIRE(g.away_score == 3);
    }
  }
  for (const auto &t : r.state.teams)
    REQUIRE(t.current_record.games() == kGamesPerTeam);
}

TEST_CASE("a cycle plays a season and an offseason", "[history]") {
  BasicLeagueGenerator gen;
  const LeagueState league = make_league(gen, 808);
  LeagueHistorySimulator sim(gen, gen, gen);
  SeededRandom rng(9);

  const CycleResult c = sim.run_cycle(league, rng);
  REQUIRE(c.summary.year == 2025);
  REQUIRE(c.summary.champion.has_value());
  REQUIRE(c.state.calendar.year == 2026);
  REQUIRE(c.state.calendar.phase == SeasonPhase::Preseason);
  REQUIRE(c.offseason.draft_picks.size() ==
          static_cast<std::size_t>(kNumTeams * kDraftRounds));
  REQUIRE(c.state.season_history.size() == 1);

  // A second cycle schedules off the first season's standings.
  const CycleResult next = sim.run_cycle(c.state, rng);
  REQUIRE(next.summary.year == 2026);
  REQUIRE(next.state.calendar.year == 2027);
  for (const auto &t : next.state.teams)
    REQUIRE(t.all_time_record.games() == 2 * kGamesPerTeam);
}
