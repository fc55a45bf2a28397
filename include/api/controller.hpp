#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/command.hpp"
#include "model/device.hpp"
#include "model/monitor.hpp"
#include "model/segment.hpp"

namespace netmon_agent::api {

// Any failed controller call: transport error, non-2xx status or a body that
// does not match the contract.
class ControllerError : public std::runtime_error {
 public:
  explicit ControllerError(const std::string& message, long status_code = 0)
      : std::runtime_error(message), status_code_(status_code) {}

  [[nodiscard]] long status_code() const noexcept { return status_code_; }

 private:
  long status_code_;
};

struct HeartbeatRequest {
  std::string version{};
  std::string hostname{};
  std::int64_t uptime_seconds{0};
};

struct HeartbeatResponse {
  std::string agent_id{};
  std::string organization_id{};
  std::vector<model::NetworkSegment> segments{};
  // Push channel endpoint and secret.
  std::optional<std::string> realtime_url{};
  std::optional<std::string> realtime_key{};
  std::optional<std::string> latest_agent_version{};
  bool upgrade_available{false};
  std::vector<model::AgentCommand> pending_commands{};
};

struct DiscoveryUploadResult {
  std::int64_t created{0};
  std::int64_t updated{0};
  std::int64_t unchanged{0};
};

struct StatusUploadResult {
  std::int64_t processed{0};
  std::vector<std::string> errors{};
};

struct AutoSegmentRequest {
  std::string cidr{};
  std::string name{};
  std::string interface_name{};
};

struct PongResult {
  double latency_ms{0.0};
};

// Controller REST contract. Every call throws ControllerError on failure.
class ControllerApi {
 public:
  virtual HeartbeatResponse heartbeat(const HeartbeatRequest& request) = 0;
  virtual DiscoveryUploadResult upload_discovered_devices(const std::string& segment_id,
                                                          const std::vector<model::DiscoveredDevice>& devices) = 0;
  virtual std::vector<model::DeviceToMonitor> devices_to_monitor() = 0;
  virtual StatusUploadResult upload_status_reports(const std::vector<model::StatusReport>& reports) = 0;
  virtual model::NetworkSegment register_auto_segment(const AutoSegmentRequest& request) = 0;
  virtual void acknowledge_command(const std::string& command_id, const model::CommandAck& ack) = 0;
  // With a command ID this call is the acknowledgement of that ping command.
  virtual PongResult send_pong(const std::optional<std::string>& command_id) = 0;
  virtual ~ControllerApi() = default;
};

}  // namespace netmon_agent::api
