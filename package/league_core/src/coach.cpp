#include "league_core/coach.hpp"

namespace league_core {

const Coach *find_team_coach(const CoachTable &coaches, TeamId team,
                             CoachRole role) {
  for (const auto &kv : coaches) {
    const Coach &c = kv.second;
    if (c.team_id && *c.team_id == team && c.role == role)
      return &c;
  }
  return nullptr;
}

std::vector<const Coach *> team_staff(const CoachTable &coaches, TeamId team) {
  std::vector<const Coach *> out;
  for (const auto &kv : coaches) {
    if (kv.second.team_id && *kv.second.team_id == team)
      out.push_back(&kv.second);
  }
  return out;
}

} // namespace league_core
