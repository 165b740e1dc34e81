#include "league_core/draft_order.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <set>

#include "test_helpers.hpp"

using namespace league_core;

namespace {

// Records spread out by team id so every team has a distinct win pct.
std::vector<Team> spread_records() {
  std::vector<Team> teams = default_teams();
  for (auto &t : teams) {
    t.current_record.wins = t.id % 17;
    t.current_record.losses = 17 - t.id % 17;
  }
  return teams;
}

void require_permutation(const std::vector<TeamId> &order) {
  REQUIRE(order.size() == static_cast<std::size_t>(kNumTeams));
  const std::set<TeamId> unique(order.begin(), order.end());
  REQUIRE(unique.size() == static_cast<std::size_t>(kNumTeams));
  REQUIRE(*unique.begin() == 0);
  REQUIRE(*unique.rbegin() == kNumTeams - 1);
}

} // namespace

TEST_CASE("finished seasons order the draft by elimination",
          "[draft_order]") {
  const std::vector<Team> teams = spread_records();
  const Standings st = standings_from_records(teams);
  StrengthTable strengths;
  strengths.values = Eigen::MatrixXd::Constant(kNumTeams, 2, 50.0);
  SeededRandom rng(4);
  const PlayoffBracket bracket = simulate_playoffs(
      generate_playoff_bracket(st, 2025), strengths, rng, QuickSimConfig{});
  REQUIRE(bracket.stage == BracketStage::Complete);

  const PartialDraftOrder partial = compute_primary_draft_order(st, bracket);
  REQUIRE(partial.complete);

  const std::vector<TeamId> order =
      calculate_draft_order(st, bracket, team_ids(teams));
  require_permutation(order);
  REQUIRE(validate_draft_order(order, team_ids(teams)).empty());
  REQUIRE(order.back() == *bracket.champion);
  REQUIRE(order[kNumTeams - 2] == *bracket.runner_up);

  // The 18 non-playoff teams pick first, worst record first.
  for (int i = 0; i < 18; ++i)
    REQUIRE_FALSE(bracket.field.contains(order[i]));
  for (int i = 1; i < 18; ++i)
    REQUIRE(st.find(order[i - 1])->win_pct <= st.find(order[i])->win_pct);
  // Wild card losers come next.
  for (int i = 18; i < 24; ++i)
    REQUIRE(elimination_round(bracket, order[i]) == PlayoffRound::WildCard);
}

TEST_CASE("an unfinished bracket still yields a full draft order",
          "[draft_order]") {
  const std::vector<Team> teams = spread_records();
  const Standings st = standings_from_records(teams);
  const PlayoffBracket seeded = generate_playoff_bracket(st, 2025);

  const PartialDraftOrder partial = compute_primary_draft_order(st, seeded);
  REQUIRE_FALSE(partial.complete);
  REQUIRE(partial.order.size() == 18);

  const std::vector<TeamId> order =
      calculate_draft_order(st, seeded, team_ids(teams));
  require_permutation(order);
}

TEST_CASE("reconciling drops strangers and duplicates", "[draft_order]") {
  const std::vector<Team> teams = spread_records();
  const Standings st = standings_from_records(teams);
  PartialDraftOrder partial;
  partial.order = {5, 5, 77, 3};
  const std::vector<TeamId> order =
      reconcile_draft_order(partial, team_ids(teams), st);
  require_permutation(order);
  REQUIRE(order[0] == 5);
  REQUIRE(order[1] == 3);
  // Missing teams follow by record; team 0 and 17 are winless.
  REQUIRE(order[2] == 0);
  REQUIRE(order[3] == 17);
}

TEST_CASE("draft order validation", "[draft_order]") {
  const std::vector<TeamId> all = team_ids(default_teams());
  std::vector<TeamId> order = all;
  REQUIRE(validate_draft_order(order, all).empty());
  order[3] = order[4];
  REQUIRE_FALSE(validate_draft_order(order, all).empty());
  order.pop_back();
  REQUIRE_FALSE(validate_draft_order(order, all).empty());
}

TEST_CASE("picks follow the order every round and keep trade history",
          "[draft_order]") {
  std::vector<TeamId> order = team_ids(default_teams());
  std::reverse(order.begin(), order.end());
  const std::vector<DraftPick> picks = create_draft_picks(order, 2026, 7);
  REQUIRE(picks.size() == 7 * static_cast<std::size_t>(kNumTeams));
  REQUIRE(picks.front().original_team == 31);
  REQUIRE(picks.front().overall == 1);
  REQUIRE(picks[kNumTeams].round == 2);
  REQUIRE(picks[kNumTeams].original_team == 31);
  REQUIRE(picks.back().overall == 7 * kNumTeams);
  REQUIRE(picks.front().id == "pick-2026-1-1");

  const DraftPick moved = transfer_pick(transfer_pick(picks.front(), 4), 9);
  REQUIRE(moved.current_team == 9);
  REQUIRE(moved.original_team == 31);
  REQUIRE(moved.trade_history == std::vector<TeamId>{31, 4});
}
