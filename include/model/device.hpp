#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace netmon_agent::model {

enum class DeviceType : std::uint8_t {
  unknown = 0,
  server,
  workstation,
  network,
  printer,
  iot,
};

enum class DeviceStatus : std::uint8_t {
  unknown = 0,
  online,
  offline,
  degraded,
};

enum class DiscoveryMethod : std::uint8_t {
  arp = 0,
  mdns,
  ssdp,
  ping,
  snmp,
};

struct SnmpInfo {
  std::optional<std::string> sys_name{};
  std::optional<std::string> sys_descr{};
  std::optional<std::string> sys_contact{};
  std::optional<std::string> sys_location{};
};

struct UpnpInfo {
  std::optional<std::string> friendly_name{};
  std::optional<std::string> manufacturer{};
  std::optional<std::string> device_type{};
};

// Unit produced by a discovery source. Identity is ip_address.
struct DiscoveredDevice {
  std::string ip_address{};
  std::optional<std::string> mac_address{};
  std::optional<std::string> hostname{};
  std::optional<std::string> netbios_name{};
  std::optional<std::string> manufacturer{};
  std::set<std::string> os_hints{};
  DeviceType device_type{DeviceType::unknown};
  std::set<int> open_ports{};
  std::set<std::string> services{};
  std::optional<SnmpInfo> snmp_info{};
  std::optional<UpnpInfo> upnp_info{};
  DiscoveryMethod discovery_method{DiscoveryMethod::arp};
};

// Externally visible projection kept in the shared device table.
struct DeviceInfo {
  std::string id{};
  std::string name{};
  std::string ip{};
  std::optional<std::string> mac{};
  DeviceStatus status{DeviceStatus::unknown};
  std::optional<double> response_time_ms{};
  std::optional<std::string> last_check{};
};

[[nodiscard]] const char* to_string(DeviceType type) noexcept;
[[nodiscard]] const char* to_string(DeviceStatus status) noexcept;
[[nodiscard]] const char* to_string(DiscoveryMethod method) noexcept;

[[nodiscard]] std::optional<DeviceType> parse_device_type(const std::string& value);
[[nodiscard]] std::optional<DeviceStatus> parse_device_status(const std::string& value);
[[nodiscard]] std::optional<DiscoveryMethod> parse_discovery_method(const std::string& value);

DeviceInfo to_device_info(const DiscoveredDevice& device);

}  // namespace netmon_agent::model
