#include "core/device_table.hpp"

#include <utility>

#include "net/cidr.hpp"

namespace netmon_agent::core {

void DeviceTable::merge_discovered(const std::vector<model::DiscoveredDevice>& devices) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& device : devices) {
    model::DeviceInfo info = model::to_device_info(device);
    const auto existing = devices_.find(info.ip);
    if (existing != devices_.end()) {
      info.status = existing->second.status;
      info.response_time_ms = existing->second.response_time_ms;
      info.last_check = existing->second.last_check;
      existing->second = std::move(info);
    } else {
      const std::string key = info.ip;
      devices_.emplace(key, std::move(info));
    }
  }
}

bool DeviceTable::update_status(const std::string& ip, const model::DeviceStatus status,
                                std::optional<double> response_time_ms, std::optional<std::string> last_check) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = devices_.find(ip);
  if (it == devices_.end()) {
    return false;
  }
  it->second.status = status;
  it->second.response_time_ms = response_time_ms;
  if (last_check.has_value()) {
    it->second.last_check = std::move(last_check);
  }
  return true;
}

std::vector<model::DeviceInfo> DeviceTable::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::DeviceInfo> out;
  out.reserve(devices_.size());
  for (const auto& [ip, info] : devices_) {
    out.push_back(info);
  }
  return out;
}

std::optional<model::DeviceInfo> DeviceTable::find(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = devices_.find(ip);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::unordered_set<std::string> DeviceTable::ips() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_set<std::string> out;
  for (const auto& entry : devices_) {
    out.insert(entry.first);
  }
  return out;
}

std::size_t DeviceTable::count_in(const std::string& cidr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& entry : devices_) {
    if (net::is_in_cidr(entry.first, cidr)) {
      ++count;
    }
  }
  return count;
}

std::size_t DeviceTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

}  // namespace netmon_agent::core
