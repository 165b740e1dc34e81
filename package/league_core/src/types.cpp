#include "league_core/types.hpp"

namespace league_core {

Conference opposite(Conference c) {
  return c == Conference::AFC ? Conference::NFC : Conference::AFC;
}

bool is_offensive(Position p) {
  switch (p) {
  case Position::QB:
  case Position::RB:
  case Position::WR:
  case Position::TE:
  case Position::LT:
  case Position::LG:
  case Position::C:
  case Position::RG:
  case Position::RT:
    return true;
  default:
    return false;
  }
}

bool is_defensive(Position p) {
  switch (p) {
  case Position::DE:
  case Position::DT:
  case Position::OLB:
  case Position::ILB:
  case Position::CB:
  case Position::FS:
  case Position::SS:
    return true;
  default:
    return false;
  }
}

const char *to_string(Conference c) {
  return c == Conference::AFC ? "AFC" : "NFC";
}

const char *to_string(Division d) {
  switch (d) {
  case Division::East: return "East";
  case Division::North: return "North";
  case Division::South: return "South";
  case Division::West: return "West";
  }
  return "";
}

const char *to_string(Position p) {
  static const char *names[kNumPositions] = {
      "QB", "RB", "WR", "TE", "LT",  "LG",  "C",  "RG", "RT",
      "DE", "DT", "OLB", "ILB", "CB", "FS", "SS", "K", "P"};
  const int idx = position_index(p);
  return (idx >= 0 && idx < kNumPositions) ? names[idx] : "";
}

const char *to_string(SkillTier t) {
  switch (t) {
  case SkillTier::Fringe: return "fringe";
  case SkillTier::Backup: return "backup";
  case SkillTier::Starter: return "starter";
  case SkillTier::Elite: return "elite";
  }
  return "";
}

const char *to_string(CoachRole r) {
  switch (r) {
  case CoachRole::HeadCoach: return "headCoach";
  case CoachRole::OffensiveCoordinator: return "offensiveCoordinator";
  case CoachRole::DefensiveCoordinator: return "defensiveCoordinator";
  }
  return "";
}

const std::array<Position, kNumPositions> &all_positions() {
  static const std::array<Position, kNumPositions> positions = {
      Position::QB, Position::RB, Position::WR,  Position::TE,
      Position::LT, Position::LG, Position::C,   Position::RG,
      Position::RT, Position::DE, Position::DT,  Position::OLB,
      Position::ILB, Position::CB, Position::FS, Position::SS,
      Position::K,  Position::P};
  return positions;
}

} // namespace league_core
