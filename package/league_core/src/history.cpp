#include "league_core/history.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

#include "league_core/invariants.hpp"
#include "league_core/log.hpp"

namespace league_core {

const char *to_string(HistoryPhase phase) {
  switch (phase) {
  case HistoryPhase::Season:
    return "season";
  case HistoryPhase::Offseason:
    return "offseason";
  }
  return "unknown";
}

// Moves every dated record of a freshly built league by `delta` seasons so
// contracts, staff and the draft line up with the first replayed year.
static LeagueState rebase_years(LeagueState s, int delta) {
  if (delta == 0)
    return s;
  s.calendar.year += delta;
  s.contracts = shift_contract_years(s.contracts, delta);

  PlayerTable players;
  for (const auto &kv : s.players) {
    Player p = kv.second;
    if (p.draft_year != 0)
      p.draft_year += delta;
    players.upsert(p);
  }
  s.players = std::move(players);

  CoachTable coaches;
  for (const auto &kv : s.coaches) {
    Coach c = kv.second;
    c.hired_year += delta;
    coaches.upsert(c);
  }
  s.coaches = std::move(coaches);

  for (auto &p : s.draft_class)
    p.player.draft_year += delta;
  for (auto &pick : s.draft_picks) {
    pick.year += delta;
    pick.id = fmt::format("pick-{}-{}-{}", pick.year, pick.round, pick.overall);
  }
  return s;
}

SeasonResult LeagueHistorySimulator::play_season(const LeagueState &state,
                                                 RandomSource &rng) const {
  SeasonResult out;
  out.state = state;
  LeagueState &s = out.state;
  const int year = s.calendar.year;

  s.teams = reset_season_records(s.teams);

  // A schedule already under way for this year is finished, not replaced.
  const bool keep_schedule =
      s.schedule.year == year && !s.schedule.games.empty() &&
      validate_schedule(s.schedule, s.teams, cfg_.schedule).empty();
  if (keep_schedule) {
    for (const auto &g : s.schedule.games) {
      if (g.is_complete)
        apply_game_result(s.teams, g.home, g.away, g.home_score, g.away_score);
    }
  } else {
    s.schedule = generate_season_schedule(s.teams, s.previous_standings, year,
                                          rng, cfg_.schedule);
  }

  s.calendar.phase = SeasonPhase::RegularSeason;
  const StrengthTable strengths =
      compute_strength_table(s.teams, s.players, s.coaches, cfg_.quick_sim);
  simulate_regular_season(s.schedule, s.teams, strengths, rng, cfg_.quick_sim);
  s.calendar.week = cfg_.schedule.weeks;

  out.standings = calculate_standings(s.schedule.games, s.teams);
  const PlayoffField field = determine_playoff_teams(out.standings);
  for (const auto &seeds : field.seeds) {
    for (std::size_t i = 0; i < seeds.size(); ++i) {
      if (Team *t = find_team(s.teams, seeds[i]))
        t->playoff_seed = static_cast<int>(i) + 1;
    }
  }

  s.calendar.phase = SeasonPhase::Playoffs;
  out.bracket = simulate_playoffs(generate_playoff_bracket(field, year),
                                  strengths, rng, cfg_.quick_sim);
  if (out.bracket.stage != BracketStage::Complete)
    log::warn("season {}: playoffs ended without a champion", year);

  out.draft_order =
      calculate_draft_order(out.standings, out.bracket, team_ids(s.teams));

  HistoricalSeasonSummary &summary = out.summary;
  summary.year = year;
  summary.champion = out.bracket.champion;
  summary.runner_up = out.bracket.runner_up;
  summary.playoff_teams = field.all_teams();
  summary.draft_order = out.draft_order;
  summary.schedule_fallback = s.schedule.used_fallback;
  if (summary.champion) {
    if (const TeamStanding *row = out.standings.find(*summary.champion))
      summary.champion_record = record_string(row->wins, row->losses, row->ties);
  }

  s.teams = fold_season_records(s.teams, out.bracket.champion, year);
  s.previous_standings = out.standings.division_order;
  s.season_history.push_back(summary);
  return out;
}

OffseasonOutcome
LeagueHistorySimulator::run_offseason_for(const SeasonResult &season,
                                          RandomSource &rng) const {
  return run_offseason(season.state, season.draft_order,
                       season.state.calendar.year, rng, *player_gen_,
                       *contract_gen_, *coach_gen_, cfg_);
}

LeagueState LeagueHistorySimulator::close_year(LeagueState state,
                                               int year) const {
  state.contracts = prune_inactive_contracts(state.contracts, year + 1);
  state.calendar.year = year + 1;
  state.calendar.week = 0;
  state.calendar.phase = SeasonPhase::Preseason;
  return state;
}

CycleResult LeagueHistorySimulator::run_cycle(const LeagueState &state,
                                              RandomSource &rng) const {
  const int year = state.calendar.year;
  SeasonResult season = play_season(state, rng);
  OffseasonOutcome off = run_offseason_for(season, rng);

  CycleResult out;
  out.summary = std::move(season.summary);
  out.offseason = std::move(off.report);
  out.state = close_year(std::move(off.state), year);
  return out;
}

LeagueState LeagueHistorySimulator::finalize(LeagueState s, int start_year,
                                             RandomSource &rng) const {
  s.calendar.year = start_year;
  s.calendar.week = 0;
  s.calendar.phase = SeasonPhase::Preseason;
  s.teams = reset_season_records(s.teams);
  s.teams = update_team_finances(s.teams, s.contracts, start_year,
                                 cfg_.offseason.salary_cap);
  // Classes carry the season their rookies first play.
  s.draft_class = player_gen_->generate_draft_class(start_year + 1, rng);
  s.draft_picks = create_draft_picks(team_ids(s.teams), start_year + 1,
                                     cfg_.offseason.draft_rounds);
  s.schedule = generate_season_schedule(s.teams, s.previous_standings,
                                        start_year, rng, cfg_.schedule);
  return s;
}

HistoryResult LeagueHistorySimulator::run(const LeagueState &initial,
                                          const HistoryConfig &cfg,
                                          RandomSource &rng) const {
  if (cfg.years < 0)
    throw std::invalid_argument(
        fmt::format("history years must be non-negative, got {}", cfg.years));

  const int start_year = initial.calendar.year;
  const auto cancelled = [&cfg]() {
    return cfg.should_cancel && cfg.should_cancel();
  };
  const auto report = [&cfg](int index, HistoryPhase phase) {
    if (cfg.on_progress)
      cfg.on_progress(index, cfg.years, phase);
  };

  HistoryResult res;
  LeagueState s = rebase_years(initial, -cfg.years);
  s.teams = update_team_finances(s.teams, s.contracts, s.calendar.year,
                                 cfg_.offseason.salary_cap);

  log::info("simulating {} seasons of history from {}", cfg.years,
            s.calendar.year);
  for (int i = 0; i < cfg.years; ++i) {
    if (cancelled()) {
      res.cancelled = true;
      break;
    }
    const int year = s.calendar.year;
    report(i + 1, HistoryPhase::Season);
    SeasonResult season = play_season(s, rng);
    res.season_summaries.push_back(season.summary);

    if (cancelled()) {
      s = std::move(season.state);
      res.cancelled = true;
      ++res.years_simulated;
      break;
    }
    report(i + 1, HistoryPhase::Offseason);
    OffseasonOutcome off = run_offseason_for(season, rng);
    res.total_retirements += static_cast<int>(off.report.retired.size());
    res.total_free_agency_signings +=
        static_cast<int>(off.report.signings.size());
    res.total_coaching_changes +=
        static_cast<int>(off.report.coaching_changes.size());
    for (const auto &pick : off.report.draft_picks) {
      if (pick.selected_player)
        ++res.total_draft_picks;
    }
    s = close_year(std::move(off.state), year);
    ++res.years_simulated;
  }
  if (res.cancelled)
    log::warn("history cancelled after {} of {} seasons", res.years_simulated,
              cfg.years);

  res.state = finalize(std::move(s), start_year, rng);
  for (const auto &err : check_league_invariants(res.state, cfg_))
    log::error("history: {}", err);
  return res;
}

} // namespace league_core
