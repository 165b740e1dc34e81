#pragma once

#include <optional>
#include <string>
#include <vector>

#include "league_core/entity_table.hpp"
#include "league_core/types.hpp"

namespace league_core {

struct CoachContract {
  int years_remaining{1};
  Money salary{0};
};

struct Coach {
  CoachId id{0};
  std::string name;
  CoachRole role{CoachRole::HeadCoach};
  std::optional<TeamId> team_id; // empty while in the available pool
  int game_day_iq{50};
  int development{50};
  int age{45};
  int hired_year{0};
  int tenure_years{0};
  int years_unemployed{0};
  std::optional<CoachContract> contract;
};

using CoachTable = EntityTable<Coach>;

// The coach holding `role` for `team`, or nullptr.
const Coach *find_team_coach(const CoachTable &coaches, TeamId team,
                             CoachRole role);

// Every coach employed by `team`, ordered by id.
std::vector<const Coach *> team_staff(const CoachTable &coaches, TeamId team);

} // namespace league_core
