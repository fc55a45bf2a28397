#include "monitor/hysteresis.hpp"

#include <algorithm>

#include "net/cidr.hpp"

namespace netmon_agent::monitor {

HysteresisEngine::HysteresisEngine(const int threshold) : threshold_(std::max(0, threshold)) {}

model::DeviceStatus HysteresisEngine::apply(const std::string& ip, const model::DeviceStatus raw) {
  if (net::is_network_or_broadcast_suffix(ip)) {
    return model::DeviceStatus::offline;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  int& count = failure_count_[ip];
  const auto previous = last_known_status_.find(ip);
  const bool was_online = previous != last_known_status_.end() && previous->second == model::DeviceStatus::online;

  model::DeviceStatus reported = raw;
  if (raw == model::DeviceStatus::offline && was_online && count < threshold_) {
    ++count;
    reported = model::DeviceStatus::online;
  } else if (raw == model::DeviceStatus::online) {
    count = 0;
  }

  last_known_status_[ip] = reported;
  return reported;
}

void HysteresisEngine::prune(const std::unordered_set<std::string>& active) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::erase_if(failure_count_, [&active](const auto& entry) { return active.count(entry.first) == 0; });
  std::erase_if(last_known_status_, [&active](const auto& entry) { return active.count(entry.first) == 0; });
}

void HysteresisEngine::set_threshold(const int threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  threshold_ = std::max(0, threshold);
}

int HysteresisEngine::threshold() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return threshold_;
}

int HysteresisEngine::failure_count(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = failure_count_.find(ip);
  return it == failure_count_.end() ? 0 : it->second;
}

std::optional<model::DeviceStatus> HysteresisEngine::last_known_status(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_known_status_.find(ip);
  if (it == last_known_status_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t HysteresisEngine::tracked_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_known_status_.size();
}

}  // namespace netmon_agent::monitor
