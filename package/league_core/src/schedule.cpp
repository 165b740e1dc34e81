#include "league_core/schedule.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <stdexcept>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "league_core/log.hpp"

namespace league_core {

// Same-conference division faced in full, [division][year % 3].
static const int kIntraRotation[4][3] = {
    {2, 1, 3}, {3, 0, 2}, {0, 3, 1}, {1, 2, 0}};

// NFC division faced by each AFC division, [year % 4][afc division].
static const int kInterRotationAfc[4][4] = {
    {3, 2, 1, 0}, {2, 1, 0, 3}, {1, 0, 3, 2}, {0, 3, 2, 1}};

static int positive_mod(int a, int m) { return ((a % m) + m) % m; }

static void require_dense_ids(const std::vector<Team> &teams) {
  const int n = static_cast<int>(teams.size());
  if (n == 0 || n % 2 != 0) {
    throw std::invalid_argument(
        fmt::format("schedule: need an even, non-zero team count (got {})", n));
  }
  for (int i = 0; i < n; ++i) {
    if (teams[i].id != i) {
      throw std::invalid_argument(
          fmt::format("schedule: team at index {} has id {}", i, teams[i].id));
    }
  }
}

std::vector<ScheduledGame> SeasonSchedule::games_in_week(int week) const {
  std::vector<ScheduledGame> out;
  for (const auto &g : games) {
    if (g.week == week)
      out.push_back(g);
  }
  return out;
}

std::vector<ScheduledGame> SeasonSchedule::games_for_team(TeamId team) const {
  std::vector<ScheduledGame> out;
  for (const auto &g : games) {
    if (g.home == team || g.away == team)
      out.push_back(g);
  }
  return out;
}

DivisionStandings default_division_standings(const std::vector<Team> &teams) {
  DivisionStandings out;
  for (const auto &t : teams)
    out[conference_index(t.conference)][division_index(t.division)].push_back(
        t.id);
  for (auto &conf : out)
    for (auto &div : conf)
      std::sort(div.begin(), div.end());
  return out;
}

// Prior finish order per division; any division whose entry is not a
// permutation of its current members falls back to id order.
static DivisionStandings finish_grid(const std::vector<Team> &teams,
                                     const DivisionStandings &previous) {
  DivisionStandings grid = default_division_standings(teams);
  for (int c = 0; c < kNumConferences; ++c) {
    for (int d = 0; d < kDivisionsPerConference; ++d) {
      std::vector<TeamId> prev = previous[c][d];
      std::vector<TeamId> sorted_prev = prev;
      std::sort(sorted_prev.begin(), sorted_prev.end());
      if (sorted_prev == grid[c][d]) {
        grid[c][d] = prev;
      } else if (!prev.empty()) {
        log::warn("schedule: prior standings for {} {} do not match the "
                  "division; using id order",
                  to_string(static_cast<Conference>(c)),
                  to_string(static_cast<Division>(d)));
      }
    }
  }
  return grid;
}

std::vector<int> assign_bye_weeks(const std::vector<Team> &teams,
                                  RandomSource &rng,
                                  const ScheduleConfig &cfg) {
  const int n = static_cast<int>(teams.size());
  const int weeks = std::max(1, cfg.weeks);
  int first = std::clamp(cfg.first_bye_week, 1, weeks);
  int last = std::clamp(cfg.last_bye_week, first, weeks);
  int cap = std::max(2, cfg.max_teams_per_bye);
  cap -= cap % 2;

  const int pairs = n / 2;
  if ((last - first + 1) * cap < n) {
    log::warn("schedule: bye window {}-{} cannot hold {} teams at {} per "
              "week; widening to the full season",
              first, last, n, cap);
    first = 1;
    last = weeks;
    while (weeks * cap < n)
      cap += 2;
  }

  std::vector<int> window;
  for (int w = first; w <= last; ++w)
    window.push_back(w);
  rng.shuffle(window);

  const int slots = static_cast<int>(window.size());
  const int base = pairs / slots;
  const int extra = pairs % slots;

  std::vector<TeamId> order = team_ids(teams);
  rng.shuffle(order);

  std::vector<int> byes(n, first);
  std::size_t next = 0;
  for (int k = 0; k < slots; ++k) {
    const int pair_count = base + (k < extra ? 1 : 0);
    for (int p = 0; p < pair_count; ++p) {
      for (int side = 0; side < 2 && next < order.size(); ++side)
        byes[order[next++]] = window[k];
    }
  }
  return byes;
}

static ScheduledGame make_game(const std::vector<Team> &teams, TeamId home,
                               TeamId away, GameComponent component) {
  ScheduledGame g;
  g.home = home;
  g.away = away;
  g.component = component;
  g.is_divisional = same_division(teams[home], teams[away]);
  g.is_conference = same_conference(teams[home], teams[away]);
  return g;
}

namespace {

// The formula as 18 league-wide rounds. Each divisional round is kept per
// division so the week layout can differ between divisions; every other
// round is a perfect matching of the whole league.
struct FormulaRounds {
  // [conference][division][leg]: three pairings of the division, each
  // played twice. Legs 2k and 2k + 1 are pairing k with home sides swapped.
  std::array<std::array<std::array<std::vector<ScheduledGame>, 6>,
                        kDivisionsPerConference>,
             kNumConferences>
      divisional;
  std::vector<std::vector<ScheduledGame>> league; // components B to E
};

} // namespace

static constexpr int kDivisionalLegs = 6;
static constexpr int kPairingsPerDivision = 3;

// Finish-slot pairs for the three ways to split a division in two.
static const int kDivisionPairings[kPairingsPerDivision][2][2] = {
    {{0, 1}, {2, 3}}, {{0, 2}, {1, 3}}, {{0, 3}, {1, 2}}};

static FormulaRounds formula_rounds(const std::vector<Team> &teams,
                                    const DivisionStandings &grid, int year) {
  FormulaRounds out;
  const int parity = positive_mod(year, 2);

  for (int c = 0; c < kNumConferences; ++c) {
    // A: home and away against each division rival.
    for (int d = 0; d < kDivisionsPerConference; ++d) {
      const auto &div = grid[c][d];
      for (int p = 0; p < kPairingsPerDivision; ++p) {
        for (int leg = 0; leg < 2; ++leg) {
          auto &games = out.divisional[c][d][2 * p + leg];
          for (const auto &pair : kDivisionPairings[p]) {
            const TeamId a = div[pair[0]];
            const TeamId b = div[pair[1]];
            games.push_back(make_game(teams, leg == 0 ? a : b,
                                      leg == 0 ? b : a,
                                      GameComponent::Divisional));
          }
        }
      }
    }
  }

  // B: a full same-conference division on a three-year cycle, as four
  // rounds of the 4x4 cross product.
  for (int k = 0; k < kTeamsPerDivision; ++k) {
    std::vector<ScheduledGame> round;
    for (int c = 0; c < kNumConferences; ++c) {
      for (int d = 0; d < kDivisionsPerConference; ++d) {
        const int partner = kIntraRotation[d][positive_mod(year, 3)];
        if (partner < d)
          continue;
        for (int i = 0; i < kTeamsPerDivision; ++i) {
          const int j = (i + k) % kTeamsPerDivision;
          const TeamId a = grid[c][d][i];
          const TeamId b = grid[c][partner][j];
          const bool a_home = (i + j + parity) % 2 == 0;
          round.push_back(make_game(teams, a_home ? a : b, a_home ? b : a,
                                    GameComponent::IntraConference));
        }
      }
    }
    out.league.push_back(std::move(round));
  }

  const int afc = conference_index(Conference::AFC);
  const int nfc = conference_index(Conference::NFC);
  const int *inter_now = kInterRotationAfc[positive_mod(year, 4)];
  const int *inter_past = kInterRotationAfc[positive_mod(year - 2, 4)];

  // C: a full opposite-conference division on a four-year cycle.
  for (int k = 0; k < kTeamsPerDivision; ++k) {
    std::vector<ScheduledGame> round;
    for (int d = 0; d < kDivisionsPerConference; ++d) {
      for (int i = 0; i < kTeamsPerDivision; ++i) {
        const int j = (i + k) % kTeamsPerDivision;
        const TeamId a = grid[afc][d][i];
        const TeamId b = grid[nfc][inter_now[d]][j];
        const bool afc_home = (i + j + parity) % 2 == 0;
        round.push_back(make_game(teams, afc_home ? a : b, afc_home ? b : a,
                                  GameComponent::InterConference));
      }
    }
    out.league.push_back(std::move(round));
  }

  // D: same-finish teams from the two remaining divisions. The division
  // pairs left over form a 4-cycle; orienting it gives one home game each,
  // and alternate edges of the cycle give two rounds.
  std::array<std::vector<ScheduledGame>, 2> standings_rounds;
  for (int c = 0; c < kNumConferences; ++c) {
    const int p0 = kIntraRotation[0][positive_mod(year, 3)];
    std::vector<int> others;
    for (int d = 1; d < kDivisionsPerConference; ++d) {
      if (d != p0)
        others.push_back(d);
    }
    const int cycle[4] = {0, others[0], p0, others[1]};
    for (int f = 0; f < kTeamsPerDivision; ++f) {
      const bool forward = positive_mod(year + f, 2) == 0;
      for (int k = 0; k < 4; ++k) {
        const TeamId a = grid[c][cycle[k]][f];
        const TeamId b = grid[c][cycle[(k + 1) % 4]][f];
        standings_rounds[k % 2].push_back(
            make_game(teams, forward ? a : b, forward ? b : a,
                      GameComponent::StandingsBased));
      }
    }
  }
  for (auto &round : standings_rounds)
    out.league.push_back(std::move(round));

  // E: same finish in the division met two seasons ago; AFC hosts in
  // odd years.
  std::vector<ScheduledGame> seventeenth;
  for (int d = 0; d < kDivisionsPerConference; ++d) {
    for (int f = 0; f < kTeamsPerDivision; ++f) {
      const TeamId a = grid[afc][d][f];
      const TeamId b = grid[nfc][inter_past[d]][f];
      const bool afc_home = parity == 1;
      seventeenth.push_back(make_game(teams, afc_home ? a : b,
                                      afc_home ? b : a,
                                      GameComponent::SeventeenthGame));
    }
  }
  out.league.push_back(std::move(seventeenth));
  return out;
}

std::vector<ScheduledGame>
build_formula_matchups(const std::vector<Team> &teams,
                       const DivisionStandings &previous, int year) {
  std::vector<ScheduledGame> games;
  if (!has_standard_alignment(teams))
    return games;
  require_dense_ids(teams);

  const FormulaRounds rounds =
      formula_rounds(teams, finish_grid(teams, previous), year);
  for (const auto &conf : rounds.divisional)
    for (const auto &div : conf)
      for (const auto &leg : div)
        games.insert(games.end(), leg.begin(), leg.end());
  for (const auto &round : rounds.league)
    games.insert(games.end(), round.begin(), round.end());
  return games;
}

static void finalize_games(std::vector<ScheduledGame> &games, int year) {
  std::sort(games.begin(), games.end(),
            [](const ScheduledGame &a, const ScheduledGame &b) {
              if (a.week != b.week)
                return a.week < b.week;
              return a.home < b.home;
            });
  for (auto &g : games)
    g.id = fmt::format("g{}-w{:02d}-{}-{}", year, g.week, g.home, g.away);
}

// Week layout. Every round of the formula is a week in which all 32 teams
// play, which leaves one spare week. Byes come from the divisional rounds:
// one pairing of each division is split so that each half sits out one of
// its two legs, and the games those halves skip move to the spare week.
// Bye weeks are then the slots holding those legs, placed inside the bye
// window; the rest of the rounds fill the other weeks in random order.
std::optional<SeasonSchedule>
build_formula_schedule(const std::vector<Team> &teams,
                       const DivisionStandings &previous, int year,
                       RandomSource &rng, const ScheduleConfig &cfg) {
  if (!has_standard_alignment(teams))
    return std::nullopt;
  require_dense_ids(teams);
  if (cfg.games_per_team != kGamesPerTeam ||
      cfg.weeks != cfg.games_per_team + 1)
    return std::nullopt;

  const int n = static_cast<int>(teams.size());
  const int first = std::clamp(cfg.first_bye_week, 1, cfg.weeks);
  const int last = std::clamp(cfg.last_bye_week, first, cfg.weeks);
  const int pairs_per_week = std::max(1, cfg.max_teams_per_bye / 2);
  const int bye_slots = std::min(kDivisionalLegs, last - first + 1);
  const int bye_pairs = n / 2;
  if (bye_slots < 2 || bye_slots * pairs_per_week < bye_pairs) {
    log::debug("schedule: bye window {}-{} at {} teams per week cannot hold "
               "the formula byes for {}",
               first, last, cfg.max_teams_per_bye, year);
    return std::nullopt;
  }

  const FormulaRounds rounds =
      formula_rounds(teams, finish_grid(teams, previous), year);

  // Two distinct bye slots per division, always topping up the emptiest.
  constexpr int kDivisions = kNumConferences * kDivisionsPerConference;
  std::vector<int> slot_load(bye_slots, 0);
  std::array<std::array<int, 2>, kDivisions> div_bye_slots{};
  std::vector<int> div_order(kDivisions);
  std::iota(div_order.begin(), div_order.end(), 0);
  rng.shuffle(div_order);
  for (int dv : div_order) {
    std::vector<int> slots(bye_slots);
    std::iota(slots.begin(), slots.end(), 0);
    rng.shuffle(slots);
    std::stable_sort(slots.begin(), slots.end(), [&slot_load](int a, int b) {
      return slot_load[a] < slot_load[b];
    });
    div_bye_slots[dv] = {slots[0], slots[1]};
    slot_load[slots[0]] += 1;
    slot_load[slots[1]] += 1;
  }

  // Rounds 0-5 are divisional slots, then the league rounds, then the spare.
  const int n_rounds = cfg.weeks;
  const int spare = n_rounds - 1;
  std::vector<std::vector<ScheduledGame>> by_round(n_rounds);
  std::vector<int> bye_round(n, -1);

  for (int c = 0; c < kNumConferences; ++c) {
    for (int d = 0; d < kDivisionsPerConference; ++d) {
      const auto &legs = rounds.divisional[c][d];
      const auto &split = div_bye_slots[c * kDivisionsPerConference + d];
      const int pairing = rng.uniform_int(0, kPairingsPerDivision - 1);

      std::vector<int> free_slots;
      for (int k = 0; k < kDivisionalLegs; ++k) {
        if (k != split[0] && k != split[1])
          free_slots.push_back(k);
      }
      rng.shuffle(free_slots);

      std::size_t next = 0;
      for (int leg = 0; leg < kDivisionalLegs; ++leg) {
        if (leg / 2 != pairing) {
          const int slot = free_slots[next++];
          by_round[slot].insert(by_round[slot].end(), legs[leg].begin(),
                                legs[leg].end());
          continue;
        }
        // Leg 2p skips its first game, leg 2p + 1 its second.
        const int half = leg % 2;
        const int slot = split[half];
        const ScheduledGame &sits = legs[leg][half];
        by_round[slot].push_back(legs[leg][1 - half]);
        by_round[spare].push_back(sits);
        bye_round[sits.home] = slot;
        bye_round[sits.away] = slot;
      }
    }
  }
  for (std::size_t r = 0; r < rounds.league.size(); ++r)
    by_round[kDivisionalLegs + r] = rounds.league[r];

  std::vector<int> window;
  for (int w = first; w <= last; ++w)
    window.push_back(w);
  rng.shuffle(window);
  std::vector<int> week_of(n_rounds, 0);
  std::vector<bool> taken(cfg.weeks + 1, false);
  for (int k = 0; k < bye_slots; ++k) {
    week_of[k] = window[k];
    taken[window[k]] = true;
  }
  std::vector<int> rest;
  for (int w = 1; w <= cfg.weeks; ++w) {
    if (!taken[w])
      rest.push_back(w);
  }
  rng.shuffle(rest);
  for (int r = bye_slots, k = 0; r < n_rounds; ++r, ++k)
    week_of[r] = rest[k];

  SeasonSchedule schedule;
  schedule.year = year;
  schedule.bye_weeks.assign(n, 0);
  for (TeamId t = 0; t < n; ++t)
    schedule.bye_weeks[t] = week_of[bye_round[t]];
  for (int r = 0; r < n_rounds; ++r) {
    for (auto g : by_round[r]) {
      g.week = week_of[r];
      schedule.games.push_back(g);
    }
  }
  finalize_games(schedule.games, year);
  return schedule;
}

SeasonSchedule build_fallback_schedule(const std::vector<Team> &teams,
                                       int year,
                                       const std::vector<int> &bye_weeks,
                                       RandomSource &rng,
                                       const ScheduleConfig &cfg) {
  require_dense_ids(teams);
  const int n = static_cast<int>(teams.size());

  SeasonSchedule schedule;
  schedule.year = year;
  schedule.bye_weeks = bye_weeks;
  schedule.used_fallback = true;

  Eigen::ArrayXXi met = Eigen::ArrayXXi::Zero(n, n);
  std::vector<int> home_games(n, 0);

  for (int w = 1; w <= cfg.weeks; ++w) {
    std::vector<TeamId> avail;
    for (TeamId t = 0; t < n; ++t) {
      if (bye_weeks[t] != w)
        avail.push_back(t);
    }
    rng.shuffle(avail);
    while (avail.size() >= 2) {
      const TeamId t = avail.back();
      avail.pop_back();
      std::size_t pick = 0;
      for (std::size_t k = 1; k < avail.size(); ++k) {
        if (met(t, avail[k]) < met(t, avail[pick]))
          pick = k;
      }
      const TeamId u = avail[pick];
      avail.erase(avail.begin() + static_cast<std::ptrdiff_t>(pick));

      const bool t_home = home_games[t] <= home_games[u];
      const TeamId home = t_home ? t : u;
      const TeamId away = t_home ? u : t;
      home_games[home] += 1;
      met(t, u) += 1;
      met(u, t) += 1;

      ScheduledGame g = make_game(teams, home, away, GameComponent::Fallback);
      g.week = w;
      schedule.games.push_back(g);
    }
  }
  finalize_games(schedule.games, year);
  return schedule;
}

SeasonSchedule generate_season_schedule(const std::vector<Team> &teams,
                                        const DivisionStandings &previous,
                                        int year, RandomSource &rng,
                                        const ScheduleConfig &cfg) {
  require_dense_ids(teams);
  std::optional<SeasonSchedule> primary =
      build_formula_schedule(teams, previous, year, rng, cfg);
  if (primary && validate_schedule(*primary, teams, cfg).empty())
    return *primary;

  log::warn("schedule: formula schedule for {} unavailable; using random "
            "weekly pairing",
            year);
  const std::vector<int> byes = assign_bye_weeks(teams, rng, cfg);
  return build_fallback_schedule(teams, year, byes, rng, cfg);
}

std::vector<std::string> validate_schedule(const SeasonSchedule &schedule,
                                           const std::vector<Team> &teams,
                                           const ScheduleConfig &cfg) {
  std::vector<std::string> errors;
  const int n = static_cast<int>(teams.size());
  if (static_cast<int>(schedule.bye_weeks.size()) != n) {
    errors.push_back(fmt::format("bye table has {} entries for {} teams",
                                 schedule.bye_weeks.size(), n));
    return errors;
  }

  Eigen::ArrayXXi load = Eigen::ArrayXXi::Zero(n, cfg.weeks + 1);
  std::set<std::pair<TeamId, TeamId>> divisional_pairs;
  for (const auto &g : schedule.games) {
    if (g.home < 0 || g.home >= n || g.away < 0 || g.away >= n) {
      errors.push_back(fmt::format("game {} names an unknown team", g.id));
      continue;
    }
    if (g.home == g.away)
      errors.push_back(fmt::format("game {}: team {} plays itself", g.id, g.home));
    if (g.week < 1 || g.week > cfg.weeks) {
      errors.push_back(fmt::format("game {}: week {} out of range", g.id, g.week));
      continue;
    }
    load(g.home, g.week) += 1;
    load(g.away, g.week) += 1;
    if (g.is_divisional)
      divisional_pairs.insert({g.home, g.away});
  }

  for (TeamId t = 0; t < n; ++t) {
    const int games = load.row(t).sum();
    if (games != cfg.games_per_team)
      errors.push_back(fmt::format("team {} has {} games", t, games));
    const int bye = schedule.bye_weeks[t];
    if (bye < 1 || bye > cfg.weeks) {
      errors.push_back(fmt::format("team {} has bye week {}", t, bye));
      continue;
    }
    if (load(t, bye) > 0)
      errors.push_back(fmt::format("team {} plays during its bye week {}", t, bye));
    for (int w = 1; w <= cfg.weeks; ++w) {
      if (load(t, w) > 1)
        errors.push_back(fmt::format("team {} plays {} games in week {}", t,
                                     load(t, w), w));
      if (w != bye && load(t, w) == 0)
        errors.push_back(fmt::format("team {} is idle outside its bye in week {}",
                                     t, w));
    }
  }

  if (!schedule.used_fallback && has_standard_alignment(teams)) {
    for (const auto &a : teams) {
      for (const auto &b : teams) {
        if (a.id != b.id && same_division(a, b) &&
            divisional_pairs.count({a.id, b.id}) == 0)
          errors.push_back(fmt::format("team {} never hosts division rival {}",
                                       a.id, b.id));
      }
    }
  }
  return errors;
}

} // namespace league_core
