#pragma once

#include <array>
#include <optional>
#include <vector>

#include "league_core/entity_table.hpp"
#include "league_core/types.hpp"

namespace league_core {

enum class ContractStatus { Active, Expired, Released };
enum class ContractType { Rookie, Veteran, Minimum };

struct ContractYear {
  int year{0};
  Money base_salary{0};
  Money prorated_bonus{0};
  Money cap_hit{0};
  bool guaranteed{false};
};

// Terms agreed before a contract is written. Amounts are per season.
struct ContractOffer {
  int years{1};
  Money salary_per_year{0};
  Money bonus_per_year{0};
  int guaranteed_years{0};
};

struct Contract {
  ContractId id{0};
  PlayerId player_id{0};
  TeamId team_id{-1};
  ContractStatus status{ContractStatus::Active};
  ContractType type{ContractType::Veteran};
  int signed_year{0};
  int total_years{1};
  int years_remaining{1};
  Money total_value{0};
  Money guaranteed_money{0};
  std::vector<ContractYear> yearly; // one entry per season covered
  std::optional<int> released_year;
};

using ContractTable = EntityTable<Contract>;

// Builds the yearly breakdown for an offer starting in signed_year.
Contract make_contract(ContractId id, PlayerId player, TeamId team,
                       const ContractOffer &offer, int signed_year,
                       ContractType type);

// Cap hit in a season; 0 outside the contract's years.
Money cap_hit_for_year(const Contract &c, int year);

// Advances one season. A contract reaching zero years remaining expires.
// Non-active contracts are returned unchanged.
Contract advance_contract_year(const Contract &c);

// Remaining prorated bonus from `year` on, accelerated on release.
Money dead_cap_on_release(const Contract &c, int year);

Contract release_contract(const Contract &c, int year);

// League minimum salary by accrued seasons (thousands).
Money minimum_salary(int experience);

// Rookie-scale average annual value by draft slot (thousands).
Money rookie_slot_value(int round, int overall_pick);

// Sum of active contract cap hits for a team in a season.
Money team_cap_usage(const ContractTable &contracts, TeamId team, int year);

// Accelerated dead money from contracts the team released in `year`.
Money team_dead_money(const ContractTable &contracts, TeamId team, int year);

// Committed cap for the three seasons after `year`.
std::array<Money, 3> future_commitments(const ContractTable &contracts,
                                        TeamId team, int year);

// Moves every contract's seasons by `delta` years.
ContractTable shift_contract_years(const ContractTable &contracts, int delta);

// Drops contracts no longer relevant to any season from `year` on.
ContractTable prune_inactive_contracts(const ContractTable &contracts,
                                       int year);

} // namespace league_core
