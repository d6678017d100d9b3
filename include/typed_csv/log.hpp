#pragma once
#include <sstream>
#include <string_view>

namespace tc {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Process-wide threshold. Defaults to Warn, or to TC_LOG_LEVEL
// (error|warn|info|debug) when that environment variable is set.
LogLevel log_level() noexcept;
void set_log_level(LogLevel lvl) noexcept;

// Writes "[typed-csv] <level>: <msg>" to stderr when enabled.
void log_line(LogLevel lvl, std::string_view msg);

inline bool log_enabled(LogLevel lvl) noexcept { return lvl <= log_level(); }

template <typename... Args>
void log(LogLevel lvl, const Args&... args) {
  if (!log_enabled(lvl)) return;
  std::ostringstream o;
  (o << ... << args);
  log_line(lvl, o.str());
}

}
