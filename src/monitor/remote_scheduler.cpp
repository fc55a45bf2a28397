#include "monitor/remote_scheduler.hpp"

namespace netmon_agent::monitor {

std::vector<model::DeviceToMonitor> select_remote_devices(const std::vector<model::DeviceToMonitor>& devices,
                                                          const std::vector<model::NetworkSegment>& segments) {
  std::unordered_set<std::string> remote_ids;
  for (const auto& segment : segments) {
    if (segment.segment_type == model::SegmentType::remote_monitor) {
      remote_ids.insert(segment.id);
    }
  }

  std::vector<model::DeviceToMonitor> selected;
  for (const auto& device : devices) {
    if (device.is_monitored && device.network_segment_id.has_value() &&
        remote_ids.count(*device.network_segment_id) != 0) {
      selected.push_back(device);
    }
  }
  return selected;
}

std::vector<model::DeviceToMonitor> RemoteScheduler::take_due(const std::vector<model::DeviceToMonitor>& devices,
                                                              const Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::DeviceToMonitor> due;
  for (const auto& device : devices) {
    const std::int64_t seconds = device.check_interval_seconds.value_or(0) > 0 ? *device.check_interval_seconds
                                                                               : kDefaultCheckIntervalSeconds;
    const auto it = last_check_.find(device.id);
    if (it != last_check_.end() && now - it->second < std::chrono::seconds(seconds)) {
      continue;
    }
    last_check_[device.id] = now;
    due.push_back(device);
  }
  return due;
}

void RemoteScheduler::prune(const std::unordered_set<std::string>& active_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::erase_if(last_check_, [&active_ids](const auto& entry) { return active_ids.count(entry.first) == 0; });
}

std::optional<RemoteScheduler::Clock::time_point> RemoteScheduler::last_check(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_check_.find(device_id);
  if (it == last_check_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t RemoteScheduler::tracked_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_check_.size();
}

}  // namespace netmon_agent::monitor
