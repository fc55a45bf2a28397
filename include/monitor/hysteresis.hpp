#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "model/device.hpp"

namespace netmon_agent::monitor {

// Suppresses online -> offline flaps until `threshold` consecutive offline
// observations. Offline -> online is reported immediately.
class HysteresisEngine {
 public:
  explicit HysteresisEngine(int threshold = 2);

  // Returns the status to report for this raw observation. Addresses ending in
  // .0 or .255 are always offline and never tracked.
  model::DeviceStatus apply(const std::string& ip, model::DeviceStatus raw);

  // Drops tracking for every IP not in `active`.
  void prune(const std::unordered_set<std::string>& active);

  void set_threshold(int threshold);
  [[nodiscard]] int threshold() const;

  [[nodiscard]] int failure_count(const std::string& ip) const;
  [[nodiscard]] std::optional<model::DeviceStatus> last_known_status(const std::string& ip) const;
  [[nodiscard]] std::size_t tracked_count() const;

 private:
  mutable std::mutex mutex_{};
  int threshold_;
  std::unordered_map<std::string, int> failure_count_{};
  std::unordered_map<std::string, model::DeviceStatus> last_known_status_{};
};

}  // namespace netmon_agent::monitor
