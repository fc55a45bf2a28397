#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "model/monitor.hpp"
#include "model/segment.hpp"

namespace netmon_agent::monitor {

inline constexpr std::int64_t kDefaultCheckIntervalSeconds = 60;

// Monitored devices that belong to one of the remote_monitor segments.
std::vector<model::DeviceToMonitor> select_remote_devices(const std::vector<model::DeviceToMonitor>& devices,
                                                          const std::vector<model::NetworkSegment>& segments);

// Independent per-device cadence keyed by device ID.
class RemoteScheduler {
 public:
  using Clock = std::chrono::steady_clock;

  // Devices whose own interval has elapsed. Each returned device is stamped as
  // checked at `now`, so a second call within the interval skips it.
  std::vector<model::DeviceToMonitor> take_due(const std::vector<model::DeviceToMonitor>& devices, Clock::time_point now);

  // Forgets every device ID not in `active_ids`.
  void prune(const std::unordered_set<std::string>& active_ids);

  [[nodiscard]] std::optional<Clock::time_point> last_check(const std::string& device_id) const;
  [[nodiscard]] std::size_t tracked_count() const;

 private:
  mutable std::mutex mutex_{};
  std::unordered_map<std::string, Clock::time_point> last_check_{};
};

}  // namespace netmon_agent::monitor
