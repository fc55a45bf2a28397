#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace netmon_agent::core {

enum class LogLevel : std::uint8_t {
  debug = 0,
  info,
  warn,
  error,
};

[[nodiscard]] const char* to_string(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string& value);

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

void log(LogLevel level, const std::string& tag, const std::string& message);

inline void log_debug(const std::string& tag, const std::string& message) { log(LogLevel::debug, tag, message); }
inline void log_info(const std::string& tag, const std::string& message) { log(LogLevel::info, tag, message); }
inline void log_warn(const std::string& tag, const std::string& message) { log(LogLevel::warn, tag, message); }
inline void log_error(const std::string& tag, const std::string& message) { log(LogLevel::error, tag, message); }

}  // namespace netmon_agent::core
