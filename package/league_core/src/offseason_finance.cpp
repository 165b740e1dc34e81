#include "league_core/offseason.hpp"

namespace league_core {

std::vector<Team> update_team_finances(const std::vector<Team> &teams,
                                       const ContractTable &contracts,
                                       int season, Money salary_cap) {
  std::vector<Team> out = teams;
  for (auto &team : out) {
    TeamFinances &f = team.finances;
    f.salary_cap = salary_cap;
    f.cap_usage = team_cap_usage(contracts, team.id, season);
    f.dead_money = team_dead_money(contracts, team.id, season);
    f.cap_space = salary_cap - f.cap_usage - f.dead_money;
    const auto future = future_commitments(contracts, team.id, season);
    f.next_year_committed = future[0];
    f.two_years_out_committed = future[1];
    f.three_years_out_committed = future[2];
  }
  return out;
}

} // namespace league_core
