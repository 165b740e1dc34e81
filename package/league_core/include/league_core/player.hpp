#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "league_core/entity_table.hpp"
#include "league_core/types.hpp"

namespace league_core {

// Number of technical skill ratings carried per player.
constexpr int kNumSkills = 6;
constexpr double kMinSkill = 1.0;
constexpr double kMaxSkill = 99.0;

struct Player {
  PlayerId id{0};
  std::string name;
  Position position{Position::QB};
  int age{22};
  int experience{0};
  Eigen::VectorXd skills; // length kNumSkills, each in [1, 99]
  int potential{50};      // overall rating the player can grow toward
  std::optional<ContractId> contract_id; // empty when unsigned
  int injury_weeks{0};
  int draft_year{0};
  int draft_round{0}; // 0 for undrafted
  int draft_pick{0};
  int morale{70};
};

struct Prospect {
  Player player;
  int projected_round{7};
  double draft_value{0.0};
};

using PlayerTable = EntityTable<Player>;

// Mean of the skill vector; 50 for a player without ratings.
double overall_rating(const Player &p);

SkillTier tier_for_rating(double rating);
SkillTier skill_tier(const Player &p);

// Ideal active depth chart, indexed by position_index().
const std::array<int, kNumPositions> &ideal_position_counts();

// Count of roster players per position; stale ids are ignored.
Eigen::ArrayXi position_counts(const std::vector<PlayerId> &roster,
                               const PlayerTable &players);

// Shortfall against the ideal depth chart, never negative.
Eigen::ArrayXi positional_needs(const Eigen::ArrayXi &counts);

// Position a roster should add next: the largest shortfall, or the
// position furthest below its ideal share when every need is met.
Position most_needed_position(const Eigen::ArrayXi &counts);

} // namespace league_core
