#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace trip_state {

enum class LogLevel { Debug, Info, Warn, Error, Off };

void set_log_level(LogLevel level);
LogLevel log_level();
std::optional<LogLevel> parse_log_level(const std::string &name);

// Defaults to std::cerr. The stream must outlive every later log call.
void set_log_sink(std::ostream &out);

void log_line(LogLevel level, std::string_view component,
              std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) {
  log_line(LogLevel::Debug, component, message);
}
inline void log_info(std::string_view component, std::string_view message) {
  log_line(LogLevel::Info, component, message);
}
inline void log_warn(std::string_view component, std::string_view message) {
  log_line(LogLevel::Warn, component, message);
}
inline void log_error(std::string_view component, std::string_view message) {
  log_line(LogLevel::Error, component, message);
}

} // namespace trip_state
