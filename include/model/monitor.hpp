#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "model/device.hpp"

namespace netmon_agent::model {

enum class CheckType : std::uint8_t {
  ping = 0,
  tcp,
  http,
  dns,
  ssl,
};

// Controller-registered device with its own check cadence.
struct DeviceToMonitor {
  std::string id{};
  std::optional<std::string> ip_address{};
  std::optional<std::string> hostname{};
  CheckType check_type{CheckType::ping};
  std::optional<int> port{};
  std::optional<std::string> url{};
  bool is_monitored{true};
  std::optional<std::int64_t> check_interval_seconds{};
  std::optional<int> ssl_expiry_warn_days{};
  std::optional<std::string> dns_expected_ip{};
  std::optional<std::string> network_segment_id{};
};

struct StatusReport {
  std::optional<std::string> device_id{};
  std::string ip_address{};
  DeviceStatus status{DeviceStatus::unknown};
  std::optional<double> response_time_ms{};
  CheckType check_type{CheckType::ping};
  std::string checked_at{};
  std::optional<std::string> error{};
  std::optional<std::string> ssl_expiry_at{};
  std::optional<std::string> ssl_issuer{};
  std::optional<std::string> ssl_subject{};
};

[[nodiscard]] const char* to_string(CheckType type) noexcept;
// Unknown values fall back to ping.
[[nodiscard]] CheckType parse_check_type(const std::string& value) noexcept;

}  // namespace netmon_agent::model
