#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace netmon_agent::core {

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z.
inline std::string iso8601_utc(const std::chrono::system_clock::time_point point) {
  const auto since_epoch = point.time_since_epoch();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(point);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32]{};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  char fraction[8]{};
  std::snprintf(fraction, sizeof(fraction), ".%03dZ", static_cast<int>(millis < 0 ? 0 : millis));
  return std::string(buffer, written) + fraction;
}

inline std::string iso8601_now() { return iso8601_utc(std::chrono::system_clock::now()); }

}  // namespace netmon_agent::core
