#include "model/device.hpp"

namespace netmon_agent::model {

const char* to_string(const DeviceType type) noexcept {
  switch (type) {
    case DeviceType::server:
      return "server";
    case DeviceType::workstation:
      return "workstation";
    case DeviceType::network:
      return "network";
    case DeviceType::printer:
      return "printer";
    case DeviceType::iot:
      return "iot";
    case DeviceType::unknown:
      break;
  }
  return "unknown";
}

const char* to_string(const DeviceStatus status) noexcept {
  switch (status) {
    case DeviceStatus::online:
      return "online";
    case DeviceStatus::offline:
      return "offline";
    case DeviceStatus::degraded:
      return "degraded";
    case DeviceStatus::unknown:
      break;
  }
  return "unknown";
}

const char* to_string(const DiscoveryMethod method) noexcept {
  switch (method) {
    case DiscoveryMethod::arp:
      return "arp";
    case DiscoveryMethod::mdns:
      return "mdns";
    case DiscoveryMethod::ssdp:
      return "ssdp";
    case DiscoveryMethod::ping:
      return "ping";
    case DiscoveryMethod::snmp:
      return "snmp";
  }
  return "arp";
}

std::optional<DeviceType> parse_device_type(const std::string& value) {
  if (value == "server") {
    return DeviceType::server;
  }
  if (value == "workstation") {
    return DeviceType::workstation;
  }
  if (value == "network") {
    return DeviceType::network;
  }
  if (value == "printer") {
    return DeviceType::printer;
  }
  if (value == "iot") {
    return DeviceType::iot;
  }
  if (value == "unknown") {
    return DeviceType::unknown;
  }
  return std::nullopt;
}

std::optional<DeviceStatus> parse_device_status(const std::string& value) {
  if (value == "online") {
    return DeviceStatus::online;
  }
  if (value == "offline") {
    return DeviceStatus::offline;
  }
  if (value == "degraded") {
    return DeviceStatus::degraded;
  }
  if (value == "unknown") {
    return DeviceStatus::unknown;
  }
  return std::nullopt;
}

std::optional<DiscoveryMethod> parse_discovery_method(const std::string& value) {
  if (value == "arp") {
    return DiscoveryMethod::arp;
  }
  if (value == "mdns") {
    return DiscoveryMethod::mdns;
  }
  if (value == "ssdp") {
    return DiscoveryMethod::ssdp;
  }
  if (value == "ping") {
    return DiscoveryMethod::ping;
  }
  if (value == "snmp") {
    return DiscoveryMethod::snmp;
  }
  return std::nullopt;
}

DeviceInfo to_device_info(const DiscoveredDevice& device) {
  DeviceInfo info{};
  info.id = device.ip_address;
  info.name = device.hostname.value_or(device.ip_address);
  info.ip = device.ip_address;
  info.mac = device.mac_address;
  return info;
}

}  // namespace netmon_agent::model
