#include "core/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

namespace netmon_agent::core {
namespace {

std::atomic<LogLevel> g_log_level{LogLevel::info};
std::mutex g_log_mutex;

}  // namespace

const char* to_string(const LogLevel level) noexcept {
  switch (level) {
    case LogLevel::debug:
      return "debug";
    case LogLevel::info:
      return "info";
    case LogLevel::warn:
      return "warn";
    case LogLevel::error:
      return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& value) {
  if (value == "debug") {
    return LogLevel::debug;
  }
  if (value == "info") {
    return LogLevel::info;
  }
  if (value == "warn") {
    return LogLevel::warn;
  }
  if (value == "error") {
    return LogLevel::error;
  }
  return std::nullopt;
}

void set_log_level(const LogLevel level) noexcept { g_log_level.store(level); }

LogLevel log_level() noexcept { return g_log_level.load(); }

void log(const LogLevel level, const std::string& tag, const std::string& message) {
  if (level < g_log_level.load()) {
    return;
  }

  std::ostringstream line;
  line << '[' << tag << "] ";
  if (level == LogLevel::warn || level == LogLevel::error) {
    line << to_string(level) << ": ";
  }
  line << message << '\n';

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << line.str();
}

}  // namespace netmon_agent::core
