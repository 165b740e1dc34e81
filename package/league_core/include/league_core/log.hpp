#pragma once

#include <string>
#include <utility>

#include <fmt/format.h>

namespace league_core::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();
bool enabled(Level lvl);

// Writes "[LEVEL] msg" to stderr.
void write(Level lvl, const std::string &msg);

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Debug))
    write(Level::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Info))
    write(Level::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Warn))
    write(Level::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args &&...args) {
  if (enabled(Level::Error))
    write(Level::Error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace league_core::log
