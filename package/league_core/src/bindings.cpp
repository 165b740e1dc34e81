#include "league_core/history.hpp"
#include "league_core/invariants.hpp"
#include "league_core/league_state.hpp"
#include "league_core/log.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <stdexcept>
#include <utility>

namespace nb = nanobind;
namespace lc = league_core;

// Builds a league for start_year and replays `years` seasons of history in
// front of it.
static lc::HistoryResult
simulate_history(int years, int start_year, std::uint64_t seed,
                 const lc::LeagueConfig &config, lc::ProgressCallback on_progress,
                 lc::CancelCheck should_cancel) {
  lc::SeededRandom rng(seed);
  lc::GeneratorConfig gen_cfg;
  gen_cfg.salary_cap = config.offseason.salary_cap;
  gen_cfg.roster_size = config.offseason.roster_limit;
  lc::BasicLeagueGenerator gen(gen_cfg);

  const lc::LeagueState initial =
      lc::create_league(start_year, gen, gen, gen, rng, config);
  lc::LeagueHistorySimulator sim(gen, gen, gen);
  sim.set_league_config(config);

  lc::HistoryConfig cfg;
  cfg.years = years;
  cfg.on_progress = std::move(on_progress);
  cfg.should_cancel = std::move(should_cancel);
  return sim.run(initial, cfg, rng);
}

NB_MODULE(league_core, m) {
  m.doc() = "Football league history simulation core.";

  nb::enum_<lc::Conference>(m, "Conference")
      .value("AFC", lc::Conference::AFC)
      .value("NFC", lc::Conference::NFC);

  nb::enum_<lc::Division>(m, "Division")
      .value("East", lc::Division::East)
      .value("North", lc::Division::North)
      .value("South", lc::Division::South)
      .value("West", lc::Division::West);

  nb::enum_<lc::HistoryPhase>(m, "HistoryPhase")
      .value("Season", lc::HistoryPhase::Season)
      .value("Offseason", lc::HistoryPhase::Offseason);

  // Configuration
  nb::class_<lc::ScheduleConfig>(m, "ScheduleConfig")
      .def(nb::init<>())
      .def_rw("weeks", &lc::ScheduleConfig::weeks)
      .def_rw("games_per_team", &lc::ScheduleConfig::games_per_team)
      .def_rw("first_bye_week", &lc::ScheduleConfig::first_bye_week)
      .def_rw("last_bye_week", &lc::ScheduleConfig::last_bye_week)
      .def_rw("max_teams_per_bye", &lc::ScheduleConfig::max_teams_per_bye);

  nb::class_<lc::QuickSimConfig>(m, "QuickSimConfig")
      .def(nb::init<>())
      .def_rw("base_score", &lc::QuickSimConfig::base_score)
      .def_rw("strength_scale", &lc::QuickSimConfig::strength_scale)
      .def_rw("home_field_advantage", &lc::QuickSimConfig::home_field_advantage)
      .def_rw("score_stddev", &lc::QuickSimConfig::score_stddev)
      .def_rw("default_strength", &lc::QuickSimConfig::default_strength)
      .def_rw("coach_iq_weight", &lc::QuickSimConfig::coach_iq_weight)
      .def_rw("overtime_resolution_chance",
              &lc::QuickSimConfig::overtime_resolution_chance);

  nb::class_<lc::OffseasonConfig>(m, "OffseasonConfig")
      .def(nb::init<>())
      .def_rw("roster_limit", &lc::OffseasonConfig::roster_limit)
      .def_rw("draft_rounds", &lc::OffseasonConfig::draft_rounds)
      .def_rw("salary_cap", &lc::OffseasonConfig::salary_cap)
      .def_rw("free_agency_roster_target",
              &lc::OffseasonConfig::free_agency_roster_target)
      .def_rw("coordinator_fire_chance",
              &lc::OffseasonConfig::coordinator_fire_chance)
      .def_rw("pool_hire_chance", &lc::OffseasonConfig::pool_hire_chance);

  nb::class_<lc::LeagueConfig>(m, "LeagueConfig")
      .def(nb::init<>())
      .def_rw("schedule", &lc::LeagueConfig::schedule)
      .def_rw("quick_sim", &lc::LeagueConfig::quick_sim)
      .def_rw("offseason", &lc::LeagueConfig::offseason);

  // Teams
  nb::class_<lc::AllTimeRecord>(m, "AllTimeRecord")
      .def(nb::init<>())
      .def_rw("wins", &lc::AllTimeRecord::wins)
      .def_rw("losses", &lc::AllTimeRecord::losses)
      .def_rw("ties", &lc::AllTimeRecord::ties)
      .def("__repr__", [](const lc::AllTimeRecord &r) {
        return fmt::format("AllTimeRecord({})",
                           lc::record_string(r.wins, r.losses, r.ties));
      });

  nb::class_<lc::TeamFinances>(m, "TeamFinances")
      .def(nb::init<>())
      .def_rw("salary_cap", &lc::TeamFinances::salary_cap)
      .def_rw("cap_usage", &lc::TeamFinances::cap_usage)
      .def_rw("dead_money", &lc::TeamFinances::dead_money)
      .def_rw("cap_space", &lc::TeamFinances::cap_space);

  nb::class_<lc::Team>(m, "Team")
      .def(nb::init<>())
      .def_rw("id", &lc::Team::id)
      .def_rw("city", &lc::Team::city)
      .def_rw("name", &lc::Team::name)
      .def_rw("abbreviation", &lc::Team::abbreviation)
      .def_rw("conference", &lc::Team::conference)
      .def_rw("division", &lc::Team::division)
      .def_rw("roster", &lc::Team::roster)
      .def_rw("all_time_record", &lc::Team::all_time_record)
      .def_rw("championships", &lc::Team::championships)
      .def_rw("last_championship_year", &lc::Team::last_championship_year)
      .def_rw("playoff_appearances", &lc::Team::playoff_appearances)
      .def_rw("finances", &lc::Team::finances)
      .def("__repr__", [](const lc::Team &t) {
        return fmt::format("Team({} {}, titles={}, all_time={})", t.city,
                           t.name, t.championships,
                           lc::record_string(t.all_time_record.wins,
                                             t.all_time_record.losses,
                                             t.all_time_record.ties));
      });

  // History
  nb::class_<lc::HistoricalSeasonSummary>(m, "HistoricalSeasonSummary")
      .def(nb::init<>())
      .def_rw("year", &lc::HistoricalSeasonSummary::year)
      .def_rw("champion", &lc::HistoricalSeasonSummary::champion)
      .def_rw("champion_record", &lc::HistoricalSeasonSummary::champion_record)
      .def_rw("runner_up", &lc::HistoricalSeasonSummary::runner_up)
      .def_rw("playoff_teams", &lc::HistoricalSeasonSummary::playoff_teams)
      .def_rw("draft_order", &lc::HistoricalSeasonSummary::draft_order)
      .def_rw("schedule_fallback",
              &lc::HistoricalSeasonSummary::schedule_fallback)
      .def("__repr__", [](const lc::HistoricalSeasonSummary &s) {
        return fmt::format("HistoricalSeasonSummary(year={}, champion={}, "
                           "record={})",
                           s.year, s.champion ? *s.champion : -1,
                           s.champion_record);
      });

  nb::class_<lc::HistoryResult>(m, "HistoryResult")
      .def_ro("season_summaries", &lc::HistoryResult::season_summaries)
      .def_ro("years_simulated", &lc::HistoryResult::years_simulated)
      .def_ro("total_retirements", &lc::HistoryResult::total_retirements)
      .def_ro("total_draft_picks", &lc::HistoryResult::total_draft_picks)
      .def_ro("total_free_agency_signings",
              &lc::HistoryResult::total_free_agency_signings)
      .def_ro("total_coaching_changes",
              &lc::HistoryResult::total_coaching_changes)
      .def_ro("cancelled", &lc::HistoryResult::cancelled)
      .def_prop_ro("year",
                   [](const lc::HistoryResult &r) {
                     return r.state.calendar.year;
                   })
      .def_prop_ro("teams",
                   [](const lc::HistoryResult &r) { return r.state.teams; })
      .def("invariant_errors",
           [](const lc::HistoryResult &r, const lc::LeagueConfig &cfg) {
             return lc::check_league_invariants(r.state, cfg);
           },
           nb::arg("config") = lc::LeagueConfig{})
      .def("__repr__", [](const lc::HistoryResult &r) {
        return fmt::format("HistoryResult(years={}, retirements={}, picks={}, "
                           "signings={}, coaching_changes={}, cancelled={})",
                           r.years_simulated, r.total_retirements,
                           r.total_draft_picks, r.total_free_agency_signings,
                           r.total_coaching_changes, r.cancelled);
      });

  m.def("simulate_history", &simulate_history, nb::arg("years"),
        nb::arg("start_year"), nb::arg("seed"),
        nb::arg("config") = lc::LeagueConfig{},
        nb::arg("on_progress") = nb::none(),
        nb::arg("should_cancel") = nb::none());

  m.def("set_log_level", [](const std::string &level) {
    if (level == "debug")
      lc::log::set_level(lc::log::Level::Debug);
    else if (level == "info")
      lc::log::set_level(lc::log::Level::Info);
    else if (level == "warn")
      lc::log::set_level(lc::log::Level::Warn);
    else if (level == "error")
      lc::log::set_level(lc::log::Level::Error);
    else if (level == "off")
      lc::log::set_level(lc::log::Level::Off);
    else
      throw std::invalid_argument(fmt::format("unknown log level '{}'", level));
  });
}
