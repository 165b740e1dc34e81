#include "league_core/league_state.hpp"

#include <initializer_list>

#include "league_core/log.hpp"
#include "league_core/offseason.hpp"

namespace league_core {

namespace {

struct Franchise {
  const char *city;
  const char *name;
  const char *abbreviation;
};

// Listed conference by conference, division by division (East, North,
// South, West), four teams each.
const Franchise kFranchises[kNumTeams] = {
    {"Boston", "Minutemen", "BOS"},     {"Hartford", "Whalers", "HFD"},
    {"Buffalo", "Blizzard", "BUF"},     {"Newark", "Ironmen", "NWK"},
    {"Pittsburgh", "Forge", "PIT"},     {"Cleveland", "Rockers", "CLE"},
    {"Cincinnati", "Kings", "CIN"},     {"Baltimore", "Harbormen", "BAL"},
    {"Houston", "Roughnecks", "HOU"},   {"Memphis", "Blues", "MEM"},
    {"Nashville", "Sound", "NSH"},      {"San Antonio", "Missions", "SAT"},
    {"Denver", "Summit", "DEN"},        {"Las Vegas", "Aces", "LVA"},
    {"San Diego", "Tides", "SDG"},      {"Portland", "Pioneers", "POR"},
    {"Philadelphia", "Liberty", "PHI"}, {"Washington", "Sentinels", "WAS"},
    {"Brooklyn", "Bridges", "BKN"},     {"Richmond", "Generals", "RIC"},
    {"Chicago", "Stockyards", "CHI"},   {"Detroit", "Motors", "DET"},
    {"Milwaukee", "Brewers", "MIL"},    {"Minneapolis", "Frost", "MIN"},
    {"Atlanta", "Firebirds", "ATL"},    {"Orlando", "Gators", "ORL"},
    {"New Orleans", "Krewe", "NOL"},    {"Charlotte", "Hornets", "CHA"},
    {"Seattle", "Sound", "SEA"},        {"Phoenix", "Scorpions", "PHX"},
    {"Sacramento", "Gold", "SAC"},      {"Salt Lake", "Peaks", "SLC"}};

} // namespace

std::vector<Team> default_teams(Money salary_cap) {
  std::vector<Team> teams;
  teams.reserve(kNumTeams);
  for (int i = 0; i < kNumTeams; ++i) {
    Team t;
    t.id = i;
    t.city = kFranchises[i].city;
    t.name = kFranchises[i].name;
    t.abbreviation = kFranchises[i].abbreviation;
    const int per_conference = kDivisionsPerConference * kTeamsPerDivision;
    t.conference = static_cast<Conference>(i / per_conference);
    t.division =
        static_cast<Division>((i % per_conference) / kTeamsPerDivision);
    t.finances.salary_cap = salary_cap;
    t.finances.cap_space = salary_cap;
    teams.push_back(t);
  }
  return teams;
}

LeagueState create_league(int year, PlayerGenerator &players,
                          ContractGenerator &contracts, CoachGenerator &coaches,
                          RandomSource &rng, const LeagueConfig &cfg) {
  LeagueState s;
  s.calendar.year = year;
  s.calendar.phase = SeasonPhase::Preseason;
  s.teams = default_teams(cfg.offseason.salary_cap);

  for (auto &team : s.teams) {
    const std::vector<Player> roster = players.generate_roster(team.id, rng);
    const RosterContracts signed_roster =
        contracts.generate_roster_contracts(roster, team.id, year, rng);
    for (const auto &p : signed_roster.players) {
      s.players.upsert(p);
      team.roster.push_back(p.id);
    }
    for (const auto &c : signed_roster.contracts)
      s.contracts.upsert(c);

    for (const CoachRole role :
         {CoachRole::HeadCoach, CoachRole::OffensiveCoordinator,
          CoachRole::DefensiveCoordinator})
      s.coaches.upsert(coaches.generate_coach(role, team.id, year, rng));
  }

  s.teams = update_team_finances(s.teams, s.contracts, year,
                                 cfg.offseason.salary_cap);
  s.draft_class = players.generate_draft_class(year + 1, rng);
  s.draft_picks =
      create_draft_picks(team_ids(s.teams), year + 1, cfg.offseason.draft_rounds);
  s.previous_standings = default_division_standings(s.teams);
  s.schedule = generate_season_schedule(s.teams, s.previous_standings, year,
                                        rng, cfg.schedule);

  log::info("created league for {}: {} players, {} contracts, {} coaches",
            year, s.players.size(), s.contracts.size(), s.coaches.size());
  return s;
}

} // namespace league_core
