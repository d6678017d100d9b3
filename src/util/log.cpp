#include "typed_csv/log.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace tc {

static LogLevel level_from_env() {
  const char* v = std::getenv("TC_LOG_LEVEL");
  if (!v || !*v) return LogLevel::Warn;
  std::string s(v);
  if (s == "error") return LogLevel::Error;
  if (s == "info")  return LogLevel::Info;
  if (s == "debug") return LogLevel::Debug;
  return LogLevel::Warn;
}

static std::atomic<int>& level_slot() {
  static std::atomic<int> lvl{static_cast<int>(level_from_env())};
  return lvl;
}

LogLevel log_level() noexcept { return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed)); }

void set_log_level(LogLevel lvl) noexcept { level_slot().store(static_cast<int>(lvl), std::memory_order_relaxed); }

void log_line(LogLevel lvl, std::string_view msg) {
  if (!log_enabled(lvl)) return;
  static const char* names[] = {"error", "warn", "info", "debug"};
  static std::mutex mu; // partitioned reads log from worker threads
  std::lock_guard<std::mutex> lock(mu);
  std::cerr << "[typed-csv] " << names[static_cast<int>(lvl)] << ": " << msg << "\n";
}

}
