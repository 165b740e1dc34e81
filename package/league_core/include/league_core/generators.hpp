#pragma once

#include <optional>
#include <vector>

#include "league_core/coach.hpp"
#include "league_core/contract.hpp"
#include "league_core/player.hpp"
#include "league_core/random.hpp"
#include "league_core/types.hpp"

namespace league_core {

struct PlayerConstraints {
  std::optional<Position> position;
  std::optional<SkillTier> tier;
  int min_age{22};
  int max_age{28};
};

// Produces players with unique ids, a known position and age >= 21.
class PlayerGenerator {
public:
  virtual ~PlayerGenerator() = default;

  virtual Player generate_player(const PlayerConstraints &cons,
                                 RandomSource &rng) = 0;
  virtual std::vector<Player> generate_roster(TeamId team,
                                              RandomSource &rng) = 0;
  // Sorted best prospect first.
  virtual std::vector<Prospect> generate_draft_class(int year,
                                                     RandomSource &rng) = 0;
};

struct RosterContracts {
  std::vector<Player> players; // contract_id filled in
  std::vector<Contract> contracts;
};

class ContractGenerator {
public:
  virtual ~ContractGenerator() = default;

  // Writes a contract for agreed terms and allocates its id.
  virtual Contract create_contract(PlayerId player, TeamId team,
                                   const ContractOffer &offer, int year,
                                   ContractType type) = 0;
  // Market-value offer for a player.
  virtual ContractOffer value_player(const Player &player,
                                     RandomSource &rng) = 0;
  virtual Contract generate_contract(const Player &player, TeamId team,
                                     int year, RandomSource &rng) = 0;
  // Contracts for a freshly generated roster, lengths staggered.
  virtual RosterContracts
  generate_roster_contracts(const std::vector<Player> &roster, TeamId team,
                            int year, RandomSource &rng) = 0;
};

class CoachGenerator {
public:
  virtual ~CoachGenerator() = default;

  virtual Coach generate_coach(CoachRole role, std::optional<TeamId> team,
                               int year, RandomSource &rng) = 0;
};

struct GeneratorConfig {
  int roster_size{kActiveRosterLimit};
  int draft_class_size{256};
  Money salary_cap{kDefaultSalaryCap};
  double max_value_share{0.055}; // top market value as a share of the cap
};

// Default collaborator used by tests, demos and the Python module.
class BasicLeagueGenerator : public PlayerGenerator,
                             public ContractGenerator,
                             public CoachGenerator {
public:
  BasicLeagueGenerator() = default;
  explicit BasicLeagueGenerator(GeneratorConfig cfg) : cfg_(cfg) {}

  Player generate_player(const PlayerConstraints &cons,
                         RandomSource &rng) override;
  std::vector<Player> generate_roster(TeamId team, RandomSource &rng) override;
  std::vector<Prospect> generate_draft_class(int year,
                                             RandomSource &rng) override;

  Contract create_contract(PlayerId player, TeamId team,
                           const ContractOffer &offer, int year,
                           ContractType type) override;
  ContractOffer value_player(const Player &player, RandomSource &rng) override;
  Contract generate_contract(const Player &player, TeamId team, int year,
                             RandomSource &rng) override;
  RosterContracts generate_roster_contracts(const std::vector<Player> &roster,
                                            TeamId team, int year,
                                            RandomSource &rng) override;

  Coach generate_coach(CoachRole role, std::optional<TeamId> team, int year,
                       RandomSource &rng) override;

  const GeneratorConfig &config() const { return cfg_; }

private:
  GeneratorConfig cfg_{};
  PlayerId next_player_id_{1};
  ContractId next_contract_id_{1};
  CoachId next_coach_id_{1};
};

// Market multiplier by position, 1.0 for quarterbacks.
double position_value_multiplier(Position p);

} // namespace league_core
