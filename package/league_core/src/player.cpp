#include "league_core/player.hpp"

namespace league_core {

double overall_rating(const Player &p) {
  if (p.skills.size() == 0)
    return 50.0;
  return p.skills.mean();
}

SkillTier tier_for_rating(double rating) {
  if (rating >= 78.0)
    return SkillTier::Elite;
  if (rating >= 68.0)
    return SkillTier::Starter;
  if (rating >= 58.0)
    return SkillTier::Backup;
  return SkillTier::Fringe;
}

SkillTier skill_tier(const Player &p) { return tier_for_rating(overall_rating(p)); }

const std::array<int, kNumPositions> &ideal_position_counts() {
  // QB RB WR TE LT LG C RG RT DE DT OLB ILB CB FS SS K P
  static const std::array<int, kNumPositions> counts = {
      2, 3, 5, 3, 2, 2, 2, 2, 2, 4, 3, 3, 3, 5, 2, 2, 1, 1};
  return counts;
}

Eigen::ArrayXi position_counts(const std::vector<PlayerId> &roster,
                               const PlayerTable &players) {
  Eigen::ArrayXi counts = Eigen::ArrayXi::Zero(kNumPositions);
  for (const PlayerId pid : roster) {
    const Player *p = players.find(pid);
    if (p)
      counts(position_index(p->position)) += 1;
  }
  return counts;
}

Eigen::ArrayXi positional_needs(const Eigen::ArrayXi &counts) {
  Eigen::ArrayXi ideal(kNumPositions);
  for (int i = 0; i < kNumPositions; ++i)
    ideal(i) = ideal_position_counts()[i];
  return (ideal - counts).max(0);
}

Position most_needed_position(const Eigen::ArrayXi &counts) {
  const Eigen::ArrayXi needs = positional_needs(counts);
  Eigen::Index best = 0;
  if (needs.maxCoeff(&best) > 0)
    return all_positions()[best];

  // Depth beyond the ideal chart: fill the thinnest position by ratio.
  double best_ratio = 1e9;
  for (int i = 0; i < kNumPositions; ++i) {
    const double ratio = static_cast<double>(counts(i)) /
                         static_cast<double>(ideal_position_counts()[i]);
    if (ratio < best_ratio) {
      best_ratio = ratio;
      best = i;
    }
  }
  return all_positions()[best];
}

} // namespace league_core
