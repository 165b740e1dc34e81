#include "league_core/quick_sim.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace league_core {

TeamStrength StrengthTable::get(TeamId team) const {
  if (team < 0 || team >= values.rows())
    return TeamStrength{};
  return TeamStrength{values(team, 0), values(team, 1)};
}

TeamStrength compute_team_strength(const Team &team, const PlayerTable &players,
                                   const CoachTable &coaches,
                                   const QuickSimConfig &cfg) {
  double off_sum = 0.0, def_sum = 0.0;
  int off_n = 0, def_n = 0;
  for (const PlayerId pid : team.roster) {
    const Player *p = players.find(pid);
    if (!p)
      continue;
    const double rating = overall_rating(*p);
    if (is_offensive(p->position)) {
      off_sum += rating;
      ++off_n;
    } else if (is_defensive(p->position)) {
      def_sum += rating;
      ++def_n;
    }
  }

  double coach_bonus = 0.0;
  for (const Coach *c : team_staff(coaches, team.id))
    coach_bonus += (c->game_day_iq - 50) * cfg.coach_iq_weight;

  TeamStrength s;
  s.offense = (off_n > 0 ? off_sum / off_n : cfg.default_strength) + coach_bonus;
  s.defense = (def_n > 0 ? def_sum / def_n : cfg.default_strength) + coach_bonus;
  s.offense = std::clamp(s.offense, cfg.min_strength, cfg.max_strength);
  s.defense = std::clamp(s.defense, cfg.min_strength, cfg.max_strength);
  return s;
}

StrengthTable compute_strength_table(const std::vector<Team> &teams,
                                     const PlayerTable &players,
                                     const CoachTable &coaches,
                                     const QuickSimConfig &cfg) {
  TeamId max_id = -1;
  for (const auto &t : teams)
    max_id = std::max(max_id, t.id);

  StrengthTable table;
  table.values = Eigen::MatrixXd::Constant(max_id + 1, 2, cfg.default_strength);
  for (const auto &t : teams) {
    const TeamStrength s = compute_team_strength(t, players, coaches, cfg);
    table.values(t.id, 0) = s.offense;
    table.values(t.id, 1) = s.defense;
  }
  return table;
}

int sample_score(double offense, double opposing_defense, bool home,
                 RandomSource &rng, const QuickSimConfig &cfg) {
  double mean = cfg.base_score +
                (offense - opposing_defense) / 100.0 * cfg.strength_scale;
  if (home)
    mean += cfg.home_field_advantage;
  const double raw = mean + rng.normal() * cfg.score_stddev;
  return std::max(0, static_cast<int>(std::lround(raw)));
}

static BoxScore sample_box_score(int home_score, int away_score,
                                 RandomSource &rng) {
  BoxScore box;
  box.home_yards = std::max(80, 180 + home_score * 6 + rng.uniform_int(-60, 60));
  box.away_yards = std::max(80, 180 + away_score * 6 + rng.uniform_int(-60, 60));
  // The losing side tends to give the ball away more.
  const int home_bias = home_score < away_score ? 1 : 0;
  const int away_bias = away_score < home_score ? 1 : 0;
  box.home_turnovers = rng.uniform_int(0, 2 + home_bias);
  box.away_turnovers = rng.uniform_int(0, 2 + away_bias);
  box.margin = std::abs(home_score - away_score);
  box.blowout = box.margin >= 21;
  return box;
}

QuickGameResult resolve_game(TeamId home, TeamId away, int home_score,
                             int away_score, bool playoff, RandomSource &rng,
                             const QuickSimConfig &cfg) {
  QuickGameResult r;
  r.home_score = home_score;
  r.away_score = away_score;

  if (r.home_score == r.away_score) {
    if (playoff) {
      while (r.home_score == r.away_score) {
        const int points = rng.uniform_int(3, 7);
        if (rng.chance(cfg.overtime_home_edge))
          r.home_score += points;
        else
          r.away_score += points;
      }
      r.overtime = true;
    } else if (rng.chance(cfg.overtime_resolution_chance)) {
      if (rng.chance(cfg.overtime_home_edge))
        r.home_score += cfg.overtime_points;
      else
        r.away_score += cfg.overtime_points;
      r.overtime = true;
    }
  }

  if (r.home_score > r.away_score)
    r.winner = home;
  else if (r.away_score > r.home_score)
    r.winner = away;
  r.box_score = sample_box_score(r.home_score, r.away_score, rng);
  return r;
}

QuickGameResult simulate_game(TeamId home, TeamId away,
                              const StrengthTable &strengths, bool playoff,
                              RandomSource &rng, const QuickSimConfig &cfg) {
  const TeamStrength h = strengths.get(home);
  const TeamStrength a = strengths.get(away);
  const int home_score = sample_score(h.offense, a.defense, true, rng, cfg);
  const int away_score = sample_score(a.offense, h.defense, false, rng, cfg);
  return resolve_game(home, away, home_score, away_score, playoff, rng, cfg);
}

void simulate_regular_season(SeasonSchedule &schedule, std::vector<Team> &teams,
                             const StrengthTable &strengths, RandomSource &rng,
                             const QuickSimConfig &cfg) {
  for (auto &g : schedule.games) {
    if (g.is_complete)
      continue;
    const QuickGameResult r =
        simulate_game(g.home, g.away, strengths, false, rng, cfg);
    g.home_score = r.home_score;
    g.away_score = r.away_score;
    g.winner = r.winner;
    g.box_score = r.box_score;
    g.is_complete = true;
    apply_game_result(teams, g.home, g.away, g.home_score, g.away_score);
  }
}

} // namespace league_core
