#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/log.hpp"
#include "model/device.hpp"

namespace netmon_agent::sinks {

struct SegmentView {
  std::string id{};
  std::string name{};
  std::string cidr{};
  std::optional<std::string> last_scan{};
  std::size_t device_count{0};
  bool scanning{false};
};

// Receives state changes for a local operator view. Calls come from every
// agent loop, so implementations must be thread-safe.
class UiSink {
 public:
  virtual void update_connection(bool connected, const std::optional<std::string>& agent_id,
                                 const std::optional<std::string>& organization_id) = 0;
  virtual void update_segments(const std::vector<SegmentView>& segments) = 0;
  virtual void update_devices(const std::vector<model::DeviceInfo>& devices) = 0;
  virtual void update_device_status(const std::string& ip, model::DeviceStatus status,
                                    std::optional<double> response_time_ms) = 0;
  virtual void update_segment_scanning(const std::string& segment_id, bool scanning) = 0;
  virtual void update_version_info(const std::optional<std::string>& latest_version, bool upgrade_available) = 0;
  virtual void add_log(core::LogLevel level, const std::string& message) = 0;
  virtual ~UiSink() = default;
};

std::unique_ptr<UiSink> make_null_ui_sink();

// One line per event on stdout, for running the agent in a terminal.
std::unique_ptr<UiSink> make_stdout_ui_sink();

}  // namespace netmon_agent::sinks
