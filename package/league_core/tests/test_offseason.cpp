#include "league_core/offseason.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <set>

#include "test_helpers.hpp"

using namespace league_core;
using league_core_test::make_league;
using league_core_test::teams_with_record;

namespace {

Player veteran(PlayerId id, int age, double rating) {
  Player p;
  p.id = id;
  p.name = "Test Player";
  p.position = Position::ILB;
  p.age = age;
  p.experience = std::max(0, age - 22);
  p.skills = Eigen::VectorXd::Constant(kNumSkills, rating);
  p.potential = static_cast<int>(rating);
  return p;
}

CoachTable full_staffs(BasicLeagueGenerator &gen, RandomSource &rng) {
  CoachTable coaches;
  for (TeamId t = 0; t < kNumTeams; ++t) {
    for (const CoachRole role :
         {CoachRole::HeadCoach, CoachRole::OffensiveCoordinator,
          CoachRole::DefensiveCoordinator})
      coaches.upsert(gen.generate_coach(role, t, 2024, rng));
  }
  return coaches;
}

int count_reason(const std::vector<CoachChange> &changes,
                 CoachChangeReason reason) {
  int n = 0;
  for (const auto &c : changes)
    n += c.reason == reason;
  return n;
}

// Every rostered player has an active contract with the team, and
// nobody is on two rosters.
void require_signed_rosters(const PlayerTable &players,
                            const ContractTable &contracts,
                            const std::vector<Team> &teams, int limit) {
  std::set<PlayerId> seen;
  for (const auto &team : teams) {
    REQUIRE(static_cast<int>(team.roster.size()) <= limit);
    for (const PlayerId pid : team.roster) {
      REQUIRE(seen.insert(pid).second);
      const Player *p = players.find(pid);
      REQUIRE(p != nullptr);
      REQUIRE(p->contract_id.has_value());
      const Contract &c = contracts.get(*p->contract_id);
      REQUIRE(c.status == ContractStatus::Active);
      REQUIRE(c.team_id == team.id);
    }
  }
}

} // namespace

TEST_CASE("young players grow and old players decline", "[offseason]") {
  SeededRandom rng(3);
  double young = 0.0, old = 0.0;
  for (int i = 0; i < 200; ++i) {
    young += progression_delta(22, 60.0, 85, 50, rng);
    old += progression_delta(34, 60.0, 60, 50, rng);
  }
  REQUIRE(young / 200.0 > 3.0);
  REQUIRE(old / 200.0 < -1.0);
  REQUIRE(age_growth_modifier(22) > age_growth_modifier(30));
}

TEST_CASE("progression ages every player", "[offseason]") {
  BasicLeagueGenerator gen;
  const LeagueState league = make_league(gen, 2);
  SeededRandom rng(9);
  const PlayerTable next =
      process_progression(league.players, league.teams, league.coaches, rng);
  REQUIRE(next.size() == league.players.size());
  for (const auto &kv : league.players) {
    const Player &after = next.get(kv.first);
    REQUIRE(after.age == kv.second.age + 1);
    REQUIRE(after.experience == kv.second.experience + 1);
    REQUIRE(after.injury_weeks == 0);
    for (Eigen::Index k = 0; k < after.skills.size(); ++k) {
      REQUIRE(after.skills(k) >= 1.0);
      REQUIRE(after.skills(k) <= 99.0);
    }
  }
}

TEST_CASE("retirement odds rise with age and without a contract",
          "[offseason]") {
  REQUIRE(retirement_probability(veteran(1, 24, 65), true) == Approx(0.0));
  REQUIRE(retirement_probability(veteran(1, 36, 65), true) >
          retirement_probability(veteran(1, 31, 65), true));
  REQUIRE(retirement_probability(veteran(1, 29, 65), false) >=
          0.25);
  REQUIRE(retirement_probability(veteran(1, 45, 40), false) <= 0.98);
}

TEST_CASE("retired players leave rosters and void their contracts",
          "[offseason]") {
  BasicLeagueGenerator gen;
  const LeagueState league = make_league(gen, 4);
  // Age everyone past forty so most of them retire.
  PlayerTable old;
  for (const auto &kv : league.players) {
    Player p = kv.second;
    p.age = 41;
    old.upsert(p);
  }
  SeededRandom rng(5);
  const RetirementResult r =
      process_retirements(old, league.contracts, league.teams, rng);
  REQUIRE(r.retired.size() > league.players.size() / 2);
  REQUIRE(r.players.size() + r.retired.size() == league.players.size());
  for (const PlayerId pid : r.retired) {
    REQUIRE_FALSE(r.players.has(pid));
    const Contract &c = r.contracts.get(*league.players.get(pid).contract_id);
    REQUIRE(c.status == ContractStatus::Expired);
  }
  require_signed_rosters(r.players, r.contracts, r.teams, kActiveRosterLimit);
}

TEST_CASE("expiring contracts create free agents", "[offseason]") {
  std::vector<Team> teams = default_teams();
  PlayerTable players;
  ContractTable contracts;
  ContractOffer one_year, three_years;
  one_year.years = 1;
  one_year.salary_per_year = 900;
  three_years.years = 3;
  three_years.salary_per_year = 2000;

  Player leaving = veteran(1, 27, 70);
  Player staying = veteran(2, 27, 70);
  contracts.upsert(make_contract(10, 1, 0, one_year, 2025, ContractType::Veteran));
  contracts.upsert(make_contract(11, 2, 0, three_years, 2025, ContractType::Veteran));
  leaving.contract_id = 10;
  staying.contract_id = 11;
  players.upsert(leaving);
  players.upsert(staying);
  teams[0].roster = {1, 2};

  const ExpirationResult r = process_contract_expirations(players, contracts, teams);
  REQUIRE(r.new_free_agents == std::vector<PlayerId>{1});
  REQUIRE(r.teams[0].roster == std::vector<PlayerId>{2});
  REQUIRE_FALSE(r.players.get(1).contract_id.has_value());
  REQUIRE(r.contracts.get(10).status == ContractStatus::Expired);
  REQUIRE(r.contracts.get(11).years_remaining == 2);
}

TEST_CASE("losing teams fire head coaches, winning teams never do",
          "[offseason][coaching]") {
  REQUIRE(head_coach_fire_probability(0.7) == Approx(0.0));
  REQUIRE(head_coach_fire_probability(0.1) > head_coach_fire_probability(0.4));

  const OffseasonConfig cfg;
  int fired_losing = 0, fired_winning = 0;
  for (std::uint64_t seed = 1; seed <= 30; ++seed) {
    BasicLeagueGenerator gen;
    SeededRandom rng(seed);
    const CoachTable coaches = full_staffs(gen, rng);

    const CoachingResult losing = process_coaching_changes(
        teams_with_record(2, 15), coaches, 2025, rng, gen, cfg);
    fired_losing += count_reason(losing.changes, CoachChangeReason::Fired);

    const CoachingResult winning = process_coaching_changes(
        teams_with_record(12, 5), coaches, 2025, rng, gen, cfg);
    fired_winning += count_reason(winning.changes, CoachChangeReason::Fired);
  }
  REQUIRE(fired_winning == 0);
  REQUIRE(fired_losing > 500);
}

TEST_CASE("every staff is complete after coaching changes",
          "[offseason][coaching]") {
  BasicLeagueGenerator gen;
  SeededRandom rng(12);
  CoachTable coaches = full_staffs(gen, rng);
  // Team 3 has lost its offensive coordinator.
  const Coach *oc = find_team_coach(coaches, 3, CoachRole::OffensiveCoordinator);
  REQUIRE(oc != nullptr);
  const CoachId vacated = oc->id;
  coaches.erase(vacated);

  const CoachingResult r = process_coaching_changes(
      teams_with_record(3, 14), coaches, 2025, rng, gen, OffseasonConfig{});
  REQUIRE(count_reason(r.changes, CoachChangeReason::Vacancy) >= 1);
  for (TeamId t = 0; t < kNumTeams; ++t)
    REQUIRE(team_staff(r.coaches, t).size() == 3);
  for (const auto &c : r.changes) {
    if (c.before)
      REQUIRE(*c.before != c.after);
  }
}

TEST_CASE("the AI draft fills every pick", "[offseason][draft]") {
  BasicLeagueGenerator gen;
  const LeagueState league = make_league(gen, 6);
  SeededRandom rng(7);
  const std::vector<Prospect> draft_class = gen.generate_draft_class(2026, rng);
  const std::vector<DraftPick> picks =
      create_draft_picks(team_ids(league.teams), 2026, kDraftRounds);

  const DraftResult r =
      process_ai_draft(picks, draft_class, league.players, league.contracts,
                       league.teams, 2026, rng, gen, OffseasonConfig{});
  REQUIRE(r.drafted.size() == picks.size());
  REQUIRE(r.drafted.size() + r.undrafted.size() == draft_class.size());
  for (const auto &pick : r.picks)
    REQUIRE(pick.selected_player.has_value());
  for (std::size_t t = 0; t < r.teams.size(); ++t)
    REQUIRE(r.teams[t].roster.size() ==
            league.teams[t].roster.size() + kDraftRounds);

  for (const PlayerId pid : r.drafted) {
    const Player &p = r.players.get(pid);
    REQUIRE(p.draft_year == 2026);
    REQUIRE(p.draft_round >= 1);
    const Contract &c = r.contracts.get(*p.contract_id);
    REQUIRE(c.type == ContractType::Rookie);
    REQUIRE(c.signed_year == 2026);
  }
  for (const PlayerId pid : r.undrafted) {
    REQUIRE_FALSE(r.players.get(pid).contract_id.has_value());
    REQUIRE(r.players.get(pid).draft_round == 0);
  }
}

TEST_CASE("the draft board ranks prospects whatever order they arrive in",
          "[offseason][draft]") {
  BasicLeagueGenerator gen;
  const LeagueState league = make_league(gen, 8);
  SeededRandom rng(9);
  std::vector<Prospect> draft_class = gen.generate_draft_class(2026, rng);
  REQUIRE(draft_class.size() > 100);

  // One position throughout so need is the same for every prospect; the
  // only blue-chip prospects sit at the back of the list.
  std::set<PlayerId> blue_chip;
  for (std::size_t i = 0; i < draft_class.size(); ++i) {
    Player &p = draft_class[i].player;
    p.position = Position::WR;
    draft_class[i].draft_value = 0.0;
    const bool top = i + kNumTeams >= draft_class.size();
    p.potential = top ? 95 : 50;
    if (top)
      blue_chip.insert(p.id);
  }

  const std::vector<DraftPick> picks =
      create_draft_picks(team_ids(league.teams), 2026, 1);
  const DraftResult r =
      process_ai_draft(picks, draft_class, league.players, league.contracts,
                       league.teams, 2026, rng, gen, OffseasonConfig{});
  REQUIRE(r.drafted.size() == static_cast<std::size_t>(kNumTeams));
  for (const PlayerId pid : r.drafted)
    REQUIRE(blue_chip.count(pid) == 1);
}

TEST_CASE("prospect ceilings drive the talent score", "[offseason][draft]") {
  Prospect high, low;
  high.player = veteran(1, 21, 60);
  high.player.potential = 92;
  low.player = veteran(2, 21, 60);
  low.player.potential = 55;
  REQUIRE(prospect_talent_score(high) > prospect_talent_score(low));
}

TEST_CASE("free agency signs players within roster and cap limits",
          "[offseason][free_agency]") {
  BasicLeagueGenerator gen;
  LeagueState league = make_league(gen, 15);
  SeededRandom rng(16);
  const OffseasonConfig cfg;

  // Every team drops below the free agency target.
  const int open_spots = cfg.roster_limit - cfg.free_agency_roster_target + 5;
  std::vector<PlayerId> candidates;
  for (auto &team : league.teams) {
    for (int k = 0; k < open_spots; ++k) {
      const PlayerId pid = team.roster.back();
      team.roster.pop_back();
      Player p = league.players.get(pid);
      Contract c = league.contracts.get(*p.contract_id);
      c.status = ContractStatus::Expired;
      league.contracts.upsert(c);
      p.contract_id.reset();
      league.players.upsert(p);
      candidates.push_back(pid);
    }
  }

  const FreeAgencyResult r =
      process_ai_free_agency(candidates, league.players, league.contracts,
                             league.teams, 2026, rng, gen, cfg);
  REQUIRE_FALSE(r.signings.empty());
  std::size_t before = 0, after = 0;
  for (std::size_t t = 0; t < r.teams.size(); ++t) {
    before += league.teams[t].roster.size();
    after += r.teams[t].roster.size();
  }
  REQUIRE(after == before + r.signings.size());
  for (const auto &s : r.signings) {
    const Contract &c = r.contracts.get(s.contract);
    REQUIRE(c.player_id == s.player);
    REQUIRE(c.team_id == s.team);
    REQUIRE(c.status == ContractStatus::Active);
    REQUIRE(*r.players.get(s.player).contract_id == s.contract);
    REQUIRE(s.average_value >= minimum_salary(0));
  }
  require_signed_rosters(r.players, r.contracts, r.teams, cfg.roster_limit);
}

TEST_CASE("roster maintenance lands every team on the limit",
          "[offseason][roster]") {
  BasicLeagueGenerator gen;
  LeagueState league = make_league(gen, 21);
  SeededRandom rng(22);
  const OffseasonConfig cfg;

  // Team 0 is overloaded to 70, team 1 cut down to 10.
  for (int k = 0; k < 17; ++k) {
    PlayerConstraints cons;
    Player p = gen.generate_player(cons, rng);
    const Contract c = gen.generate_contract(p, 0, 2026, rng);
    p.contract_id = c.id;
    league.players.upsert(p);
    league.contracts.upsert(c);
    league.teams[0].roster.push_back(p.id);
  }
  std::vector<PlayerId> dropped(league.teams[1].roster.begin() + 10,
                                league.teams[1].roster.end());
  league.teams[1].roster.resize(10);
  for (const PlayerId pid : dropped) {
    Player p = league.players.get(pid);
    Contract c = league.contracts.get(*p.contract_id);
    c.status = ContractStatus::Expired;
    league.contracts.upsert(c);
    p.contract_id.reset();
    league.players.upsert(p);
  }
  REQUIRE(league.teams[0].roster.size() == 70);

  const RosterMaintenanceResult r = process_roster_maintenance(
      league.players, league.contracts, league.teams, 2026, rng, gen, gen, cfg);
  for (const auto &team : r.teams)
    REQUIRE(team.roster.size() == static_cast<std::size_t>(cfg.roster_limit));
  REQUIRE(r.released.size() >= 17);
  // Cut players may be picked up by another team, never kept.
  const auto &kept = r.teams[0].roster;
  for (const PlayerId pid : r.released)
    REQUIRE(std::find(kept.begin(), kept.end(), pid) == kept.end());
  require_signed_rosters(r.players, r.contracts, r.teams, cfg.roster_limit);

  SECTION("finances follow the contracts") {
    const std::vector<Team> teams =
        update_team_finances(r.teams, r.contracts, 2026, cfg.salary_cap);
    for (const auto &t : teams) {
      REQUIRE(t.finances.cap_usage == team_cap_usage(r.contracts, t.id, 2026));
      REQUIRE(t.finances.dead_money == team_dead_money(r.contracts, t.id, 2026));
      REQUIRE(t.finances.cap_space ==
              cfg.salary_cap - t.finances.cap_usage - t.finances.dead_money);
    }
  }
}

TEST_CASE("a full offseason keeps rosters signed and legal",
          "[offseason]") {
  BasicLeagueGenerator gen;
  const LeagueState league = make_league(gen, 31);
  SeededRandom rng(32);
  LeagueConfig cfg;

  std::vector<TeamId> order = team_ids(league.teams);
  const OffseasonOutcome out =
      run_offseason(league, order, 2025, rng, gen, gen, gen, cfg);
  const LeagueState &s = out.state;

  require_signed_rosters(s.players, s.contracts, s.teams,
                         cfg.offseason.roster_limit);
  for (const auto &t : s.teams) {
    REQUIRE(t.roster.size() ==
            static_cast<std::size_t>(cfg.offseason.roster_limit));
    REQUIRE(t.finances.cap_usage == team_cap_usage(s.contracts, t.id, 2026));
  }
  REQUIRE(out.report.draft_picks.size() ==
          static_cast<std::size_t>(kNumTeams * kDraftRounds));
  REQUIRE(out.report.draft_picks.front().original_team == order.front());
  REQUIRE(s.draft_class.empty());
  for (const PlayerId pid : out.report.retired)
    REQUIRE_FALSE(s.players.has(pid));
}
