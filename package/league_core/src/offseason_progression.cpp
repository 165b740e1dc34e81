#include "league_core/offseason.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace league_core {

double age_growth_modifier(int age) {
  if (age <= 23)
    return 1.3;
  if (age <= 25)
    return 1.15;
  if (age <= 27)
    return 1.0;
  if (age <= 29)
    return 0.85;
  if (age <= 31)
    return 0.6;
  if (age <= 33)
    return 0.3;
  return 0.1;
}

double progression_delta(int age, double overall, int potential,
                         int coach_development, RandomSource &rng) {
  const double coach_factor = 1.0 + (coach_development - 50) / 100.0;
  const double gap = std::max(0.0, potential - overall);
  double delta = gap * 0.2 * age_growth_modifier(age) * coach_factor;
  if (age >= 30) {
    // Good development staff slows the decline, it never stops it.
    delta -= (age - 29) * 0.6 / std::max(0.5, coach_factor);
  }
  return delta + rng.normal();
}

PlayerTable process_progression(const PlayerTable &players,
                                const std::vector<Team> &teams,
                                const CoachTable &coaches, RandomSource &rng) {
  std::unordered_map<PlayerId, int> development_of;
  for (const auto &team : teams) {
    const Coach *hc = find_team_coach(coaches, team.id, CoachRole::HeadCoach);
    const int dev = hc ? hc->development : 50;
    for (const PlayerId pid : team.roster)
      development_of[pid] = dev;
  }

  PlayerTable out;
  for (const auto &kv : players) {
    Player p = kv.second;
    p.age += 1;
    p.experience += 1;
    p.injury_weeks = 0;

    if (p.skills.size() == 0)
      p.skills = Eigen::VectorXd::Constant(kNumSkills, 50.0);
    auto it = development_of.find(p.id);
    const int dev = it != development_of.end() ? it->second : 50;
    const double delta =
        progression_delta(p.age, overall_rating(p), p.potential, dev, rng);
    for (int i = 0; i < p.skills.size(); ++i) {
      p.skills(i) = std::clamp(p.skills(i) + delta + rng.normal() * 0.5,
                               kMinSkill, kMaxSkill);
    }

    const int overall = static_cast<int>(std::lround(overall_rating(p)));
    if (p.age >= 30)
      p.potential = std::max(overall, p.potential - 2);
    else
      p.potential = std::max(p.potential, overall);
    out.upsert(p);
  }
  return out;
}

} // namespace league_core
