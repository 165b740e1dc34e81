#include "league_core/playoffs.hpp"

#include <catch2/catch.hpp>

#include <set>

using namespace league_core;

namespace {

// AFC seeds are teams 1..7, NFC seeds teams 21..27.
PlayoffField numbered_field() {
  PlayoffField field;
  for (int s = 1; s <= kPlayoffSeedsPerConference; ++s) {
    field.seeds[conference_index(Conference::AFC)].push_back(s);
    field.seeds[conference_index(Conference::NFC)].push_back(20 + s);
  }
  return field;
}

// Every home side wins the current round.
PlayoffBracket home_sides_win(PlayoffBracket b) {
  for (const auto &m : b.current_round())
    b = record_result(b, m.id, 24, 10);
  return b;
}

} // namespace

TEST_CASE("reseeding pairs the best with the worst", "[playoffs]") {
  const auto pairs = reseed_pairings({6, 1, 4, 5});
  REQUIRE(pairs.size() == 2);
  REQUIRE(pairs[0] == std::make_pair(1, 6));
  REQUIRE(pairs[1] == std::make_pair(4, 5));
  REQUIRE(reseed_pairings({3}).empty());
}

TEST_CASE("wild card round leaves the top seed idle", "[playoffs]") {
  const PlayoffBracket seeded = generate_playoff_bracket(numbered_field(), 2024);
  REQUIRE(seeded.stage == BracketStage::Seeded);
  REQUIRE(round_complete(seeded));

  const PlayoffBracket wc = advance(seeded);
  REQUIRE(wc.stage == BracketStage::WildCard);
  REQUIRE(wc.wild_card.size() == 6);
  std::set<std::pair<int, int>> afc_pairs;
  for (const auto &m : wc.wild_card) {
    REQUIRE(m.home_seed < m.away_seed);
    if (m.conference == Conference::AFC)
      afc_pairs.insert({m.home_seed, m.away_seed});
  }
  REQUIRE(afc_pairs == std::set<std::pair<int, int>>{{2, 7}, {3, 6}, {4, 5}});
  REQUIRE(wc.seed_of(1) == 1);
  REQUIRE(wc.seed_of(27) == 7);
  REQUIRE(wc.seed_of(15) == 0);
}

TEST_CASE("an unfinished round does not advance", "[playoffs]") {
  PlayoffBracket b = advance(generate_playoff_bracket(numbered_field(), 2024));
  b = record_result(b, b.wild_card.front().id, 20, 17);
  REQUIRE_FALSE(round_complete(b));
  const PlayoffBracket same = advance(b);
  REQUIRE(same.stage == BracketStage::WildCard);
  REQUIRE(same.divisional.empty());
}

TEST_CASE("playoff results must have a winner", "[playoffs]") {
  const PlayoffBracket b =
      advance(generate_playoff_bracket(numbered_field(), 2024));
  REQUIRE_THROWS_AS(record_result(b, b.wild_card.front().id, 17, 17),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(record_result(b, "p2024-sb", 20, 17),
                    std::invalid_argument);
}

TEST_CASE("the bracket reseeds after each round", "[playoffs]") {
  PlayoffBracket b = advance(generate_playoff_bracket(numbered_field(), 2024));
  b = advance(home_sides_win(b));
  REQUIRE(b.stage == BracketStage::Divisional);
  REQUIRE(b.divisional.size() == 4);
  for (const auto &m : b.divisional) {
    if (m.home_seed == 1)
      REQUIRE(m.away_seed == 4);
    else
      REQUIRE(std::make_pair(m.home_seed, m.away_seed) == std::make_pair(2, 3));
  }

  b = advance(home_sides_win(b));
  REQUIRE(b.stage == BracketStage::ConferenceChampionship);
  REQUIRE(b.conference_championships.size() == 2);

  b = advance(home_sides_win(b));
  REQUIRE(b.stage == BracketStage::SuperBowl);
  REQUIRE(b.super_bowl.has_value());
  // NFC is the nominal home side in even years.
  REQUIRE(b.super_bowl->home == 21);
  REQUIRE(b.super_bowl->away == 1);

  b = advance(home_sides_win(b));
  REQUIRE(b.stage == BracketStage::Complete);
  REQUIRE(b.champion == 21);
  REQUIRE(b.runner_up == 1);
  REQUIRE(elimination_round(b, 1) == PlayoffRound::SuperBowl);
  REQUIRE(elimination_round(b, 7) == PlayoffRound::WildCard);
  REQUIRE_FALSE(elimination_round(b, 21).has_value());
  REQUIRE(all_playoff_games(b).size() == 13);
}

TEST_CASE("simulated playoffs crown one champion", "[playoffs]") {
  StrengthTable strengths;
  strengths.values = Eigen::MatrixXd::Constant(kNumTeams, 2, 50.0);
  const QuickSimConfig cfg;
  for (std::uint64_t seed = 1; seed <= 20; ++seed) {
    SeededRandom rng(seed);
    const PlayoffBracket b = simulate_playoffs(
        generate_playoff_bracket(numbered_field(), 2025), strengths, rng, cfg);
    REQUIRE(b.stage == BracketStage::Complete);
    REQUIRE(b.champion.has_value());
    REQUIRE(b.runner_up.has_value());
    REQUIRE(*b.champion != *b.runner_up);
    const auto games = all_playoff_games(b);
    REQUIRE(games.size() == 13);
    for (const auto &g : games) {
      REQUIRE(g.is_complete);
      REQUIRE(g.home_score != g.away_score);
    }
  }
}
