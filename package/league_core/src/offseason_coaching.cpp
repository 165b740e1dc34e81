#include "league_core/offseason.hpp"

#include <algorithm>
#include <initializer_list>

#include "league_core/log.hpp"

namespace league_core {

double head_coach_fire_probability(double win_pct) {
  if (win_pct < 0.25)
    return 0.8;
  if (win_pct < 0.35)
    return 0.5;
  if (win_pct < 0.45)
    return 0.2;
  if (win_pct < 0.5)
    return 0.08;
  return 0.0;
}

namespace {

class StaffMarket {
public:
  StaffMarket(CoachTable &coaches, int season, RandomSource &rng,
              CoachGenerator &generator, const OffseasonConfig &cfg)
      : coaches_(coaches), season_(season), rng_(rng), generator_(generator),
        cfg_(cfg) {}

  void release(CoachId id) {
    Coach *c = coaches_.find_mutable(id);
    if (!c)
      return;
    c->team_id.reset();
    c->contract.reset();
    c->tenure_years = 0;
    c->years_unemployed = 0;
  }

  // Fills `role` for `team`, from the pool or a fresh candidate. The coach
  // just let go is never brought straight back.
  CoachId hire(TeamId team, CoachRole role,
               std::optional<CoachId> exclude = std::nullopt) {
    if (rng_.chance(cfg_.pool_hire_chance)) {
      Coach *best = nullptr;
      for (const CoachId id : coaches_.ids()) {
        Coach *c = coaches_.find_mutable(id);
        if (c->team_id || c->role != role || (exclude && *exclude == id))
          continue;
        if (!best || c->game_day_iq > best->game_day_iq)
          best = c;
      }
      if (best) {
        best->team_id = team;
        best->hired_year = season_;
        best->tenure_years = 0;
        best->years_unemployed = 0;
        best->contract = CoachContract{rng_.uniform_int(2, 5),
                                       role == CoachRole::HeadCoach ? 7000 : 2500};
        return best->id;
      }
    }
    const Coach fresh = generator_.generate_coach(role, team, season_, rng_);
    coaches_.upsert(fresh);
    return fresh.id;
  }

private:
  CoachTable &coaches_;
  int season_;
  RandomSource &rng_;
  CoachGenerator &generator_;
  const OffseasonConfig &cfg_;
};

} // namespace

CoachingResult process_coaching_changes(const std::vector<Team> &teams,
                                        const CoachTable &coaches, int season,
                                        RandomSource &rng,
                                        CoachGenerator &generator,
                                        const OffseasonConfig &cfg) {
  CoachingResult out;
  for (const auto &kv : coaches) {
    Coach c = kv.second;
    if (!c.team_id) {
      c.years_unemployed += 1;
      if (c.years_unemployed > cfg.coach_pool_patience_years)
        continue;
    }
    out.coaches.upsert(c);
  }

  StaffMarket market(out.coaches, season, rng, generator, cfg);
  auto change = [&out](TeamId team, CoachRole role, std::optional<CoachId> before,
                       CoachId after, CoachChangeReason reason) {
    out.changes.push_back(CoachChange{team, role, before, after, reason});
  };

  for (const auto &team : teams) {
    const double pct = team.current_record.win_pct();
    std::vector<CoachId> hired_now;

    const Coach *hc = find_team_coach(out.coaches, team.id, CoachRole::HeadCoach);
    if (hc && team.current_record.games() > 0 &&
        rng.chance(head_coach_fire_probability(pct))) {
      const CoachId fired = hc->id;
      market.release(fired);
      const CoachId hired = market.hire(team.id, CoachRole::HeadCoach, fired);
      hired_now.push_back(hired);
      change(team.id, CoachRole::HeadCoach, fired, hired, CoachChangeReason::Fired);

      for (const CoachRole role : {CoachRole::OffensiveCoordinator,
                                   CoachRole::DefensiveCoordinator}) {
        const Coach *coord = find_team_coach(out.coaches, team.id, role);
        if (coord && rng.chance(cfg.coordinator_fire_chance)) {
          const CoachId gone = coord->id;
          market.release(gone);
          const CoachId replacement = market.hire(team.id, role, gone);
          hired_now.push_back(replacement);
          change(team.id, role, gone, replacement,
                 CoachChangeReason::FollowedHeadCoach);
        }
      }
    }

    for (const CoachRole role :
         {CoachRole::HeadCoach, CoachRole::OffensiveCoordinator,
          CoachRole::DefensiveCoordinator}) {
      const Coach *current = find_team_coach(out.coaches, team.id, role);
      if (!current) {
        const CoachId hired = market.hire(team.id, role);
        hired_now.push_back(hired);
        change(team.id, role, std::nullopt, hired, CoachChangeReason::Vacancy);
        continue;
      }
      if (std::find(hired_now.begin(), hired_now.end(), current->id) !=
          hired_now.end())
        continue;

      Coach *c = out.coaches.find_mutable(current->id);
      c->tenure_years += 1;
      if (!c->contract)
        continue;
      c->contract->years_remaining -= 1;
      if (c->contract->years_remaining > 0)
        continue;
      if (pct > 0.45 || rng.chance(0.5)) {
        c->contract->years_remaining = rng.uniform_int(2, 4);
        c->contract->salary = c->contract->salary * 105 / 100;
        continue;
      }
      const CoachId gone = c->id;
      market.release(gone);
      const CoachId hired = market.hire(team.id, role, gone);
      change(team.id, role, gone, hired, CoachChangeReason::ContractExpired);
    }
  }

  log::debug("coaching: {} staff changes", out.changes.size());
  return out;
}

} // namespace league_core
