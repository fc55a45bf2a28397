#pragma once

#include <chrono>
#include <mutex>

#include "core/log.hpp"

namespace netmon_agent::core {

// Settings the controller may change at runtime through update_config.
struct RuntimeSettingsValues {
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds status_check_interval{std::chrono::seconds(30)};
  int status_failure_threshold{2};
  bool auto_scan{true};
  std::chrono::seconds auto_scan_interval{300};
  LogLevel log_level{LogLevel::info};
};

class RuntimeSettings {
 public:
  explicit RuntimeSettings(RuntimeSettingsValues values = {}) : values_(values) {}

  [[nodiscard]] RuntimeSettingsValues get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
  }

  void set(const RuntimeSettingsValues& values) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_ = values;
  }

 private:
  mutable std::mutex mutex_{};
  RuntimeSettingsValues values_;
};

}  // namespace netmon_agent::core
