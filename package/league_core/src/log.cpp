#include "league_core/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace league_core::log {

static std::mutex g_mu;
static std::atomic<Level> g_level{Level::Warn};

static const char *label(Level l) {
  switch (l) {
  case Level::Debug: return "DEBUG";
  case Level::Info: return "INFO";
  case Level::Warn: return "WARN";
  case Level::Error: return "ERROR";
  default: return "";
  }
}

void set_level(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

bool enabled(Level lvl) {
  const Level current = g_level;
  return current != Level::Off && lvl >= current;
}

void write(Level lvl, const std::string &msg) {
  if (!enabled(lvl))
    return;
  std::lock_guard<std::mutex> lock(g_mu);
  fmt::print(stderr, "[{}] {}\n", label(lvl), msg);
}

} // namespace league_core::log
