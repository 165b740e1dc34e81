#include "league_core/playoffs.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace league_core {

static const char *round_tag(PlayoffRound r) {
  switch (r) {
  case PlayoffRound::WildCard: return "wc";
  case PlayoffRound::Divisional: return "div";
  case PlayoffRound::ConferenceChampionship: return "conf";
  case PlayoffRound::SuperBowl: return "sb";
  }
  return "";
}

std::optional<TeamId> PlayoffMatchup::loser() const {
  if (!winner)
    return std::nullopt;
  return *winner == home ? away : home;
}

std::vector<PlayoffMatchup> PlayoffBracket::current_round() const {
  switch (stage) {
  case BracketStage::WildCard: return wild_card;
  case BracketStage::Divisional: return divisional;
  case BracketStage::ConferenceChampionship: return conference_championships;
  case BracketStage::SuperBowl:
    if (super_bowl)
      return {*super_bowl};
    return {};
  default: return {};
  }
}

int PlayoffBracket::seed_of(TeamId team) const {
  for (const auto &conf : field.seeds) {
    auto it = std::find(conf.begin(), conf.end(), team);
    if (it != conf.end())
      return static_cast<int>(it - conf.begin()) + 1;
  }
  return 0;
}

PlayoffBracket generate_playoff_bracket(const PlayoffField &field, int year) {
  PlayoffBracket b;
  b.year = year;
  b.stage = BracketStage::Seeded;
  b.field = field;
  return b;
}

PlayoffBracket generate_playoff_bracket(const Standings &standings, int year) {
  return generate_playoff_bracket(determine_playoff_teams(standings), year);
}

std::vector<std::pair<int, int>> reseed_pairings(std::vector<int> seeds) {
  std::sort(seeds.begin(), seeds.end());
  std::vector<std::pair<int, int>> pairs;
  int i = 0;
  int j = static_cast<int>(seeds.size()) - 1;
  while (i < j)
    pairs.emplace_back(seeds[i++], seeds[j--]);
  return pairs;
}

static bool matchups_complete(const std::vector<PlayoffMatchup> &games) {
  return std::all_of(games.begin(), games.end(),
                     [](const PlayoffMatchup &m) {
                       return m.is_complete && m.winner.has_value();
                     });
}

bool round_complete(const PlayoffBracket &b) {
  switch (b.stage) {
  case BracketStage::Seeded: return true;
  case BracketStage::Complete: return false;
  default: return matchups_complete(b.current_round());
  }
}

std::vector<PlayoffMatchup> all_playoff_games(const PlayoffBracket &b) {
  std::vector<PlayoffMatchup> out = b.wild_card;
  out.insert(out.end(), b.divisional.begin(), b.divisional.end());
  out.insert(out.end(), b.conference_championships.begin(),
             b.conference_championships.end());
  if (b.super_bowl)
    out.push_back(*b.super_bowl);
  return out;
}

// Seeds in a conference not yet beaten in any recorded game.
static std::vector<int> surviving_seeds(const PlayoffBracket &b, int conf) {
  std::vector<TeamId> losers;
  for (const auto &m : all_playoff_games(b)) {
    if (auto l = m.loser())
      losers.push_back(*l);
  }
  std::vector<int> seeds;
  const auto &field = b.field.seeds[conf];
  for (std::size_t i = 0; i < field.size(); ++i) {
    if (std::find(losers.begin(), losers.end(), field[i]) == losers.end())
      seeds.push_back(static_cast<int>(i) + 1);
  }
  return seeds;
}

static PlayoffMatchup make_matchup(const PlayoffBracket &b, PlayoffRound round,
                                   int conf, int home_seed, int away_seed) {
  PlayoffMatchup m;
  m.round = round;
  m.conference = static_cast<Conference>(conf);
  m.home_seed = home_seed;
  m.away_seed = away_seed;
  m.home = b.field.seeds[conf][home_seed - 1];
  m.away = b.field.seeds[conf][away_seed - 1];
  m.id = fmt::format("p{}-{}-{}-{}v{}", b.year, round_tag(round),
                     to_string(static_cast<Conference>(conf)), home_seed,
                     away_seed);
  return m;
}

static std::vector<PlayoffMatchup> build_wild_card(const PlayoffBracket &b) {
  std::vector<PlayoffMatchup> games;
  for (int c = 0; c < kNumConferences; ++c) {
    const int n = static_cast<int>(b.field.seeds[c].size());
    // Leave four teams for the divisional round; the top seeds rest.
    const int n_games = std::max(0, n - 4);
    std::vector<int> playing;
    for (int s = n - 2 * n_games + 1; s <= n; ++s)
      playing.push_back(s);
    for (const auto &p : reseed_pairings(playing))
      games.push_back(make_matchup(b, PlayoffRound::WildCard, c, p.first, p.second));
  }
  return games;
}

static std::vector<PlayoffMatchup> build_reseeded_round(PlayoffBracket &b,
                                                        PlayoffRound round) {
  std::vector<PlayoffMatchup> games;
  for (int c = 0; c < kNumConferences; ++c) {
    const std::vector<int> seeds = surviving_seeds(b, c);
    if (seeds.size() == 1 && round == PlayoffRound::ConferenceChampionship) {
      b.conference_champions[c] = b.field.seeds[c][seeds.front() - 1];
      continue;
    }
    for (const auto &p : reseed_pairings(seeds))
      games.push_back(make_matchup(b, round, c, p.first, p.second));
  }
  return games;
}

static void settle_champion(PlayoffBracket &b) {
  b.stage = BracketStage::Complete;
  if (b.super_bowl && b.super_bowl->winner) {
    b.champion = b.super_bowl->winner;
    b.runner_up = b.super_bowl->loser();
  }
}

PlayoffBracket advance(const PlayoffBracket &bracket) {
  if (!round_complete(bracket))
    return bracket;

  PlayoffBracket b = bracket;
  switch (b.stage) {
  case BracketStage::Seeded:
    b.wild_card = build_wild_card(b);
    b.stage = BracketStage::WildCard;
    break;
  case BracketStage::WildCard:
    b.divisional = build_reseeded_round(b, PlayoffRound::Divisional);
    b.stage = BracketStage::Divisional;
    break;
  case BracketStage::Divisional:
    b.conference_championships =
        build_reseeded_round(b, PlayoffRound::ConferenceChampionship);
    b.stage = BracketStage::ConferenceChampionship;
    break;
  case BracketStage::ConferenceChampionship: {
    for (const auto &m : b.conference_championships) {
      if (m.conference)
        b.conference_champions[conference_index(*m.conference)] = m.winner;
    }
    const auto &afc = b.conference_champions[conference_index(Conference::AFC)];
    const auto &nfc = b.conference_champions[conference_index(Conference::NFC)];
    if (afc && nfc) {
      // Nominal home side alternates by year; it never affects seeding.
      const bool nfc_home = b.year % 2 == 0;
      PlayoffMatchup m;
      m.round = PlayoffRound::SuperBowl;
      m.home = nfc_home ? *nfc : *afc;
      m.away = nfc_home ? *afc : *nfc;
      m.home_seed = b.seed_of(m.home);
      m.away_seed = b.seed_of(m.away);
      m.id = fmt::format("p{}-{}", b.year, round_tag(PlayoffRound::SuperBowl));
      b.super_bowl = m;
      b.stage = BracketStage::SuperBowl;
    } else {
      b.champion = afc ? afc : nfc;
      b.stage = BracketStage::Complete;
    }
    break;
  }
  case BracketStage::SuperBowl:
    settle_champion(b);
    break;
  case BracketStage::Complete:
    break;
  }
  return b;
}

static bool record_in(std::vector<PlayoffMatchup> &games,
                      const std::string &game_id, int home_score,
                      int away_score) {
  for (auto &m : games) {
    if (m.id != game_id)
      continue;
    m.home_score = home_score;
    m.away_score = away_score;
    m.winner = home_score > away_score ? m.home : m.away;
    m.is_complete = true;
    return true;
  }
  return false;
}

PlayoffBracket record_result(const PlayoffBracket &bracket,
                             const std::string &game_id, int home_score,
                             int away_score) {
  if (home_score == away_score) {
    throw std::invalid_argument(
        fmt::format("playoff game {} cannot end tied", game_id));
  }
  PlayoffBracket b = bracket;
  bool found = false;
  switch (b.stage) {
  case BracketStage::WildCard:
    found = record_in(b.wild_card, game_id, home_score, away_score);
    break;
  case BracketStage::Divisional:
    found = record_in(b.divisional, game_id, home_score, away_score);
    break;
  case BracketStage::ConferenceChampionship:
    found = record_in(b.conference_championships, game_id, home_score,
                      away_score);
    break;
  case BracketStage::SuperBowl:
    if (b.super_bowl && b.super_bowl->id == game_id) {
      std::vector<PlayoffMatchup> one{*b.super_bowl};
      found = record_in(one, game_id, home_score, away_score);
      b.super_bowl = one.front();
    }
    break;
  default:
    break;
  }
  if (!found) {
    throw std::invalid_argument(
        fmt::format("playoff game {} is not in the current round", game_id));
  }
  return b;
}

PlayoffBracket play_current_round(const PlayoffBracket &bracket,
                                  const StrengthTable &strengths,
                                  RandomSource &rng, const QuickSimConfig &cfg) {
  PlayoffBracket b = bracket;
  for (const auto &m : bracket.current_round()) {
    if (m.is_complete)
      continue;
    const QuickGameResult r =
        simulate_game(m.home, m.away, strengths, true, rng, cfg);
    b = record_result(b, m.id, r.home_score, r.away_score);
  }
  return b;
}

PlayoffBracket simulate_playoffs(const PlayoffBracket &bracket,
                                 const StrengthTable &strengths,
                                 RandomSource &rng, const QuickSimConfig &cfg) {
  PlayoffBracket b = bracket;
  // Each pass either plays a round or moves the stage forward.
  for (int guard = 0; guard < 16 && b.stage != BracketStage::Complete; ++guard) {
    if (round_complete(b))
      b = advance(b);
    else
      b = play_current_round(b, strengths, rng, cfg);
  }
  return b;
}

std::optional<PlayoffRound> elimination_round(const PlayoffBracket &b,
                                              TeamId team) {
  for (const auto &m : all_playoff_games(b)) {
    auto l = m.loser();
    if (l && *l == team)
      return m.round;
  }
  return std::nullopt;
}

} // namespace league_core
