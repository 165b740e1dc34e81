#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace league_core {

using TeamId = int;
using PlayerId = std::int64_t;
using ContractId = std::int64_t;
using CoachId = std::int64_t;

// Money is carried in thousands of dollars.
using Money = std::int64_t;

constexpr int kNumTeams = 32;
constexpr int kNumConferences = 2;
constexpr int kDivisionsPerConference = 4;
constexpr int kTeamsPerDivision = 4;
constexpr int kRegularSeasonWeeks = 18;
constexpr int kGamesPerTeam = 17;
constexpr int kPlayoffSeedsPerConference = 7;
constexpr int kDraftRounds = 7;
constexpr int kActiveRosterLimit = 53;
constexpr Money kDefaultSalaryCap = 255000;

enum class Conference { AFC = 0, NFC = 1 };

// Order matters: the schedule rotation tables index divisions this way.
enum class Division { East = 0, North = 1, South = 2, West = 3 };

enum class Position {
  QB = 0,
  RB,
  WR,
  TE,
  LT,
  LG,
  C,
  RG,
  RT,
  DE,
  DT,
  OLB,
  ILB,
  CB,
  FS,
  SS,
  K,
  P
};
constexpr int kNumPositions = 18;

enum class SkillTier { Fringe = 0, Backup = 1, Starter = 2, Elite = 3 };

enum class CoachRole {
  HeadCoach = 0,
  OffensiveCoordinator = 1,
  DefensiveCoordinator = 2
};
constexpr int kNumCoachRoles = 3;

constexpr int conference_index(Conference c) { return static_cast<int>(c); }
constexpr int division_index(Division d) { return static_cast<int>(d); }
constexpr int position_index(Position p) { return static_cast<int>(p); }

Conference opposite(Conference c);

bool is_offensive(Position p);
bool is_defensive(Position p);

const char *to_string(Conference c);
const char *to_string(Division d);
const char *to_string(Position p);
const char *to_string(SkillTier t);
const char *to_string(CoachRole r);

// Every position in enum order, for iteration.
const std::array<Position, kNumPositions> &all_positions();

} // namespace league_core
