#pragma once

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "league_core/config.hpp"
#include "league_core/quick_sim.hpp"
#include "league_core/random.hpp"
#include "league_core/standings.hpp"
#include "league_core/types.hpp"

namespace league_core {

enum class PlayoffRound {
  WildCard = 0,
  Divisional = 1,
  ConferenceChampionship = 2,
  SuperBowl = 3
};

// Round currently being played; Seeded has no games yet.
enum class BracketStage {
  Seeded,
  WildCard,
  Divisional,
  ConferenceChampionship,
  SuperBowl,
  Complete
};

struct PlayoffMatchup {
  std::string id;
  PlayoffRound round{PlayoffRound::WildCard};
  std::optional<Conference> conference; // empty for the Super Bowl
  TeamId home{-1};
  TeamId away{-1};
  int home_seed{0};
  int away_seed{0};
  bool is_complete{false};
  int home_score{0};
  int away_score{0};
  std::optional<TeamId> winner;

  std::optional<TeamId> loser() const;
};

struct PlayoffBracket {
  int year{0};
  BracketStage stage{BracketStage::Seeded};
  PlayoffField field;
  std::vector<PlayoffMatchup> wild_card;
  std::vector<PlayoffMatchup> divisional;
  std::vector<PlayoffMatchup> conference_championships;
  std::optional<PlayoffMatchup> super_bowl;
  std::array<std::optional<TeamId>, kNumConferences> conference_champions;
  std::optional<TeamId> champion;
  std::optional<TeamId> runner_up;

  // Matchups of the round named by `stage`; empty for Seeded and Complete.
  std::vector<PlayoffMatchup> current_round() const;
  int seed_of(TeamId team) const; // 0 when not in the field
};

PlayoffBracket generate_playoff_bracket(const PlayoffField &field, int year);
PlayoffBracket generate_playoff_bracket(const Standings &standings, int year);

// True once every matchup of the current round has a winner. Seeded
// counts as complete; Complete has nothing left to play.
bool round_complete(const PlayoffBracket &bracket);

// Builds the next round. Returns the bracket unchanged while any game of
// the current round is unresolved, or once it is Complete.
PlayoffBracket advance(const PlayoffBracket &bracket);

// Records a final score. Ties and unknown game ids are rejected.
PlayoffBracket record_result(const PlayoffBracket &bracket,
                             const std::string &game_id, int home_score,
                             int away_score);

// Pairs the highest remaining seed with the lowest, the next highest with
// the next lowest, and so on. Returns (home seed, away seed) pairs.
std::vector<std::pair<int, int>> reseed_pairings(std::vector<int> seeds);

// Plays the current round with the quick simulator.
PlayoffBracket play_current_round(const PlayoffBracket &bracket,
                                  const StrengthTable &strengths,
                                  RandomSource &rng, const QuickSimConfig &cfg);

// Drives the bracket from Seeded to Complete.
PlayoffBracket simulate_playoffs(const PlayoffBracket &bracket,
                                 const StrengthTable &strengths,
                                 RandomSource &rng, const QuickSimConfig &cfg);

// Round a team lost in; empty for the champion and for teams with no
// recorded loss.
std::optional<PlayoffRound> elimination_round(const PlayoffBracket &bracket,
                                              TeamId team);

// Every playoff game played so far, in round order.
std::vector<PlayoffMatchup> all_playoff_games(const PlayoffBracket &bracket);

} // namespace league_core
