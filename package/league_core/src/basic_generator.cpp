#include "league_core/generators.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace league_core {

static const char *kFirstNames[] = {
    "Aaron", "Marcus", "Tyler", "Jalen", "Derrick", "Caleb", "Andre",
    "Brandon", "Trevor", "Darius", "Cole", "Isaiah", "Jordan", "Malik",
    "Nate", "Owen", "Quinton", "Reggie", "Sam", "Terrell", "Victor", "Wes"};
static const char *kLastNames[] = {
    "Adams", "Baker", "Carter", "Dawson", "Ellis", "Fowler", "Griffin",
    "Harris", "Irving", "Jackson", "Kelly", "Lawson", "Moore", "Nelson",
    "Owens", "Parker", "Reed", "Sanders", "Thomas", "Underwood", "Vaughn",
    "Walker", "Young"};

template <typename T, std::size_t N>
static const T &pick_from(const T (&arr)[N], RandomSource &rng) {
  return arr[rng.uniform_int(0, static_cast<int>(N) - 1)];
}

static std::string random_name(RandomSource &rng) {
  return fmt::format("{} {}", pick_from(kFirstNames, rng),
                     pick_from(kLastNames, rng));
}

// Centre of each tier's rating band.
static double tier_target(SkillTier t) {
  switch (t) {
  case SkillTier::Elite: return 83.0;
  case SkillTier::Starter: return 72.0;
  case SkillTier::Backup: return 62.0;
  case SkillTier::Fringe: return 52.0;
  }
  return 52.0;
}

static SkillTier random_tier(RandomSource &rng) {
  const double u = rng.uniform();
  if (u < 0.10)
    return SkillTier::Elite;
  if (u < 0.40)
    return SkillTier::Starter;
  if (u < 0.75)
    return SkillTier::Backup;
  return SkillTier::Fringe;
}

static Position random_position(RandomSource &rng) {
  const auto &ideal = ideal_position_counts();
  int total = 0;
  for (int c : ideal)
    total += c;
  int roll = rng.uniform_int(0, total - 1);
  for (int i = 0; i < kNumPositions; ++i) {
    roll -= ideal[i];
    if (roll < 0)
      return all_positions()[i];
  }
  return Position::WR;
}

static Eigen::VectorXd sample_skills(double target, double spread,
                                     RandomSource &rng) {
  Eigen::VectorXd skills(kNumSkills);
  for (int i = 0; i < kNumSkills; ++i)
    skills(i) = std::clamp(target + rng.normal() * spread, kMinSkill, kMaxSkill);
  return skills;
}

double position_value_multiplier(Position p) {
  switch (p) {
  case Position::QB: return 1.0;
  case Position::DE: return 0.92;
  case Position::CB: return 0.88;
  case Position::LT: return 0.85;
  case Position::WR: return 0.82;
  case Position::RT: return 0.8;
  case Position::DT: return 0.78;
  case Position::OLB: return 0.75;
  case Position::FS:
  case Position::SS: return 0.72;
  case Position::TE: return 0.7;
  case Position::ILB: return 0.68;
  case Position::RB: return 0.65;
  case Position::LG:
  case Position::RG: return 0.62;
  case Position::C: return 0.6;
  case Position::K: return 0.35;
  case Position::P: return 0.32;
  }
  return 0.5;
}

Player BasicLeagueGenerator::generate_player(const PlayerConstraints &cons,
                                             RandomSource &rng) {
  Player p;
  p.id = next_player_id_++;
  p.name = random_name(rng);
  p.position = cons.position ? *cons.position : random_position(rng);
  const int lo = std::max(21, cons.min_age);
  p.age = rng.uniform_int(lo, std::max(lo, cons.max_age));
  p.experience = std::max(0, p.age - 22);
  const SkillTier tier = cons.tier ? *cons.tier : random_tier(rng);
  p.skills = sample_skills(tier_target(tier), 3.0, rng);
  // Keep the requested tier even after sampling noise.
  const double shift = tier_target(tier) - overall_rating(p);
  p.skills = (p.skills.array() + shift).min(kMaxSkill).max(kMinSkill).matrix();
  const int overall = static_cast<int>(std::lround(overall_rating(p)));
  const int headroom = p.age <= 25 ? rng.uniform_int(0, 12) : rng.uniform_int(0, 3);
  p.potential = std::min(99, overall + headroom);
  p.morale = rng.uniform_int(55, 85);
  return p;
}

std::vector<Player> BasicLeagueGenerator::generate_roster(TeamId,
                                                          RandomSource &rng) {
  std::vector<Player> roster;
  Eigen::ArrayXi counts = Eigen::ArrayXi::Zero(kNumPositions);
  while (static_cast<int>(roster.size()) < cfg_.roster_size) {
    const Position pos = most_needed_position(counts);
    const int depth = counts(position_index(pos));
    PlayerConstraints cons;
    cons.position = pos;
    cons.min_age = 22;
    cons.max_age = 33;
    if (depth == 0) {
      cons.tier = rng.chance(0.25) ? SkillTier::Elite : SkillTier::Starter;
    } else if (depth == 1) {
      cons.tier = rng.chance(0.5) ? SkillTier::Starter : SkillTier::Backup;
    } else {
      cons.tier = rng.chance(0.6) ? SkillTier::Backup : SkillTier::Fringe;
    }
    roster.push_back(generate_player(cons, rng));
    counts(position_index(pos)) += 1;
  }
  return roster;
}

std::vector<Prospect> BasicLeagueGenerator::generate_draft_class(
    int year, RandomSource &rng) {
  std::vector<Prospect> prospects;
  prospects.reserve(static_cast<std::size_t>(cfg_.draft_class_size));
  for (int i = 0; i < cfg_.draft_class_size; ++i) {
    Prospect pr;
    Player &p = pr.player;
    p.id = next_player_id_++;
    p.name = random_name(rng);
    p.position = random_position(rng);
    p.age = rng.uniform_int(21, 23);
    p.experience = 0;
    p.skills = sample_skills(55.0 + rng.normal() * 6.0, 4.0, rng);
    const int overall = static_cast<int>(std::lround(overall_rating(p)));
    p.potential = std::min(99, overall + rng.uniform_int(5, 25));
    p.draft_year = year;
    pr.draft_value = 0.6 * p.potential + 0.4 * overall + rng.normal() * 2.0;
    prospects.push_back(pr);
  }
  std::sort(prospects.begin(), prospects.end(),
            [](const Prospect &a, const Prospect &b) {
              if (a.draft_value != b.draft_value)
                return a.draft_value > b.draft_value;
              return a.player.id < b.player.id;
            });
  for (std::size_t i = 0; i < prospects.size(); ++i)
    prospects[i].projected_round =
        std::min(kDraftRounds, static_cast<int>(i) / kNumTeams + 1);
  return prospects;
}

Contract BasicLeagueGenerator::create_contract(PlayerId player, TeamId team,
                                               const ContractOffer &offer,
                                               int year, ContractType type) {
  return make_contract(next_contract_id_++, player, team, offer, year, type);
}

ContractOffer BasicLeagueGenerator::value_player(const Player &player,
                                                 RandomSource &rng) {
  const SkillTier tier = skill_tier(player);
  double share = 0.0;
  int years = 1;
  double guarantee = 0.2;
  switch (tier) {
  case SkillTier::Elite:
    share = rng.uniform_real(0.85, 1.1);
    years = 4;
    guarantee = 0.6;
    break;
  case SkillTier::Starter:
    share = rng.uniform_real(0.45, 0.7);
    years = 3;
    guarantee = 0.45;
    break;
  case SkillTier::Backup:
    share = rng.uniform_real(0.15, 0.35);
    years = 2;
    guarantee = 0.3;
    break;
  case SkillTier::Fringe:
    share = rng.uniform_real(0.05, 0.15);
    years = 1;
    guarantee = 0.2;
    break;
  }
  if (player.age >= 34)
    years = 1;
  else if (player.age >= 31)
    years = std::min(years, 2);

  const double cap = static_cast<double>(cfg_.salary_cap);
  const Money aav = std::max(
      minimum_salary(player.experience),
      static_cast<Money>(std::lround(cap * cfg_.max_value_share * share *
                                     position_value_multiplier(player.position))));
  ContractOffer offer;
  offer.years = years;
  offer.bonus_per_year = static_cast<Money>(std::lround(aav * guarantee * 0.5));
  offer.salary_per_year = aav - offer.bonus_per_year;
  offer.guaranteed_years =
      static_cast<int>(std::ceil(static_cast<double>(years) * guarantee));
  return offer;
}

Contract BasicLeagueGenerator::generate_contract(const Player &player,
                                                 TeamId team, int year,
                                                 RandomSource &rng) {
  return create_contract(player.id, team, value_player(player, rng), year,
                         ContractType::Veteran);
}

RosterContracts BasicLeagueGenerator::generate_roster_contracts(
    const std::vector<Player> &roster, TeamId team, int year,
    RandomSource &rng) {
  RosterContracts out;
  for (const auto &p : roster) {
    ContractOffer offer = value_player(p, rng);
    // Stagger remaining terms so expirations spread across seasons.
    offer.years = rng.uniform_int(1, offer.years);
    offer.guaranteed_years = std::min(offer.guaranteed_years, offer.years);
    const Contract c =
        create_contract(p.id, team, offer, year, ContractType::Veteran);
    Player signed_player = p;
    signed_player.contract_id = c.id;
    out.players.push_back(signed_player);
    out.contracts.push_back(c);
  }
  return out;
}

Coach BasicLeagueGenerator::generate_coach(CoachRole role,
                                           std::optional<TeamId> team,
                                           int year, RandomSource &rng) {
  Coach c;
  c.id = next_coach_id_++;
  c.name = random_name(rng);
  c.role = role;
  c.team_id = team;
  c.game_day_iq = std::clamp(
      static_cast<int>(std::lround(50.0 + rng.normal() * 12.0)), 20, 95);
  c.development = std::clamp(
      static_cast<int>(std::lround(50.0 + rng.normal() * 12.0)), 20, 95);
  c.age = rng.uniform_int(35, 65);
  c.hired_year = year;
  CoachContract cc;
  cc.years_remaining = rng.uniform_int(2, 5);
  cc.salary = role == CoachRole::HeadCoach ? rng.uniform_int(5000, 12000)
                                           : rng.uniform_int(1500, 4000);
  c.contract = cc;
  return c;
}

} // namespace league_core
