#include "trip_state/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>

namespace trip_state {
namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sink_mu;
std::ostream *g_sink = &std::cerr;

const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    break;
  }
  return "-";
}
} // namespace

void set_log_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "debug")
    return LogLevel::Debug;
  if (s == "info")
    return LogLevel::Info;
  if (s == "warn" || s == "warning")
    return LogLevel::Warn;
  if (s == "error")
    return LogLevel::Error;
  if (s == "off" || s == "none")
    return LogLevel::Off;
  return std::nullopt;
}

void set_log_sink(std::ostream &out) {
  std::lock_guard<std::mutex> lock(g_sink_mu);
  g_sink = &out;
}

void log_line(LogLevel level, std::string_view component,
              std::string_view message) {
  if (level == LogLevel::Off || level < g_level.load())
    return;
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  std::lock_guard<std::mutex> lock(g_sink_mu);
  *g_sink << now_ms << " " << level_tag(level) << " [" << component << "] "
          << message << "\n";
}

} // namespace trip_state
