#include "league_core/contract.hpp"

#include <algorithm>

namespace league_core {

Contract make_contract(ContractId id, PlayerId player, TeamId team,
                       const ContractOffer &offer, int signed_year,
                       ContractType type) {
  Contract c;
  c.id = id;
  c.player_id = player;
  c.team_id = team;
  c.status = ContractStatus::Active;
  c.type = type;
  c.signed_year = signed_year;
  c.total_years = std::max(1, offer.years);
  c.years_remaining = c.total_years;

  const Money salary = std::max<Money>(0, offer.salary_per_year);
  const Money bonus = std::max<Money>(0, offer.bonus_per_year);
  for (int i = 0; i < c.total_years; ++i) {
    ContractYear y;
    y.year = signed_year + i;
    y.base_salary = salary;
    y.prorated_bonus = bonus;
    y.cap_hit = salary + bonus;
    y.guaranteed = i < offer.guaranteed_years;
    c.yearly.push_back(y);
    c.total_value += y.cap_hit;
    if (y.guaranteed)
      c.guaranteed_money += salary;
  }
  // The signing bonus is guaranteed in full.
  c.guaranteed_money += bonus * c.total_years;
  return c;
}

Money cap_hit_for_year(const Contract &c, int year) {
  for (const auto &y : c.yearly) {
    if (y.year == year)
      return y.cap_hit;
  }
  return 0;
}

Contract advance_contract_year(const Contract &c) {
  if (c.status != ContractStatus::Active)
    return c;
  Contract next = c;
  next.years_remaining = std::max(0, c.years_remaining - 1);
  if (next.years_remaining == 0)
    next.status = ContractStatus::Expired;
  return next;
}

Money dead_cap_on_release(const Contract &c, int year) {
  Money dead = 0;
  for (const auto &y : c.yearly) {
    if (y.year >= year)
      dead += y.prorated_bonus;
  }
  return dead;
}

Contract release_contract(const Contract &c, int year) {
  Contract out = c;
  out.status = ContractStatus::Released;
  out.released_year = year;
  return out;
}

Money minimum_salary(int experience) {
  static const Money table[] = {795, 915, 990, 1065, 1145, 1215};
  const int idx = std::clamp(experience, 0, 5);
  return table[idx];
}

Money rookie_slot_value(int round, int overall_pick) {
  Money value = 0;
  if (round <= 1) {
    value = 12000 - static_cast<Money>(overall_pick - 1) * 220;
  } else if (round == 2) {
    value = 3500 - static_cast<Money>(overall_pick - 33) * 40;
  } else if (round == 3) {
    value = 2000 - static_cast<Money>(overall_pick - 65) * 20;
  } else if (round <= 5) {
    value = 1200 - static_cast<Money>(overall_pick - 97) * 5;
  } else {
    value = 900 - static_cast<Money>(round - 5) * 30;
  }
  return std::max(value, minimum_salary(0));
}

Money team_cap_usage(const ContractTable &contracts, TeamId team, int year) {
  Money total = 0;
  for (const auto &kv : contracts) {
    const Contract &c = kv.second;
    if (c.team_id == team && c.status == ContractStatus::Active)
      total += cap_hit_for_year(c, year);
  }
  return total;
}

Money team_dead_money(const ContractTable &contracts, TeamId team, int year) {
  Money total = 0;
  for (const auto &kv : contracts) {
    const Contract &c = kv.second;
    if (c.team_id == team && c.status == ContractStatus::Released &&
        c.released_year && *c.released_year == year)
      total += dead_cap_on_release(c, year);
  }
  return total;
}

std::array<Money, 3> future_commitments(const ContractTable &contracts,
                                        TeamId team, int year) {
  std::array<Money, 3> out{0, 0, 0};
  for (const auto &kv : contracts) {
    const Contract &c = kv.second;
    if (c.team_id != team || c.status != ContractStatus::Active)
      continue;
    for (int i = 0; i < 3; ++i)
      out[i] += cap_hit_for_year(c, year + 1 + i);
  }
  return out;
}

ContractTable shift_contract_years(const ContractTable &contracts, int delta) {
  ContractTable out;
  for (const auto &kv : contracts) {
    Contract c = kv.second;
    c.signed_year += delta;
    for (auto &y : c.yearly)
      y.year += delta;
    if (c.released_year)
      *c.released_year += delta;
    out.upsert(c);
  }
  return out;
}

ContractTable prune_inactive_contracts(const ContractTable &contracts,
                                       int year) {
  ContractTable out;
  for (const auto &kv : contracts) {
    const Contract &c = kv.second;
    if (c.status == ContractStatus::Active) {
      out.upsert(c);
    } else if (c.status == ContractStatus::Released && c.released_year &&
               *c.released_year >= year) {
      out.upsert(c);
    }
  }
  return out;
}

} // namespace league_core
