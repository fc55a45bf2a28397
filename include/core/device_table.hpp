#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "model/device.hpp"

namespace netmon_agent::core {

// Shared IP-keyed view of every discovered device. All writes are per-key
// read-modify-write under one lock; the map is never replaced wholesale.
class DeviceTable {
 public:
  // Identity fields (name, mac) come from the scan; status, response time and
  // last check are kept from the existing entry.
  void merge_discovered(const std::vector<model::DiscoveredDevice>& devices);

  // Returns false when the IP is not in the table.
  bool update_status(const std::string& ip, model::DeviceStatus status, std::optional<double> response_time_ms,
                     std::optional<std::string> last_check);

  [[nodiscard]] std::vector<model::DeviceInfo> snapshot() const;
  [[nodiscard]] std::optional<model::DeviceInfo> find(const std::string& ip) const;
  [[nodiscard]] std::unordered_set<std::string> ips() const;
  // Devices whose IP falls inside `cidr`. Malformed CIDRs count zero.
  [[nodiscard]] std::size_t count_in(const std::string& cidr) const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_{};
  std::map<std::string, model::DeviceInfo> devices_{};
};

}  // namespace netmon_agent::core
