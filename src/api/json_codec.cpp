#include "api/json_codec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace netmon_agent {
namespace {

using nlohmann::json;

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

template <typename T>
T field_or(const json& j, const char* key, T fallback) {
  auto value = optional_field<T>(j, key);
  return value.has_value() ? std::move(*value) : std::move(fallback);
}

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

}  // namespace

namespace model {

void to_json(json& j, const SnmpInfo& info) {
  j = json::object();
  put_optional(j, "sysName", info.sys_name);
  put_optional(j, "sysDescr", info.sys_descr);
  put_optional(j, "sysContact", info.sys_contact);
  put_optional(j, "sysLocation", info.sys_location);
}

void to_json(json& j, const UpnpInfo& info) {
  j = json::object();
  put_optional(j, "friendlyName", info.friendly_name);
  put_optional(j, "manufacturer", info.manufacturer);
  put_optional(j, "deviceType", info.device_type);
}

void to_json(json& j, const DiscoveredDevice& device) {
  j = json{
      {"ip_address", device.ip_address},
      {"os_hints", device.os_hints},
      {"device_type", to_string(device.device_type)},
      {"open_ports", device.open_ports},
      {"services", device.services},
      {"discovery_method", to_string(device.discovery_method)},
  };
  put_optional(j, "mac_address", device.mac_address);
  put_optional(j, "hostname", device.hostname);
  put_optional(j, "netbios_name", device.netbios_name);
  put_optional(j, "manufacturer", device.manufacturer);
  if (device.snmp_info.has_value()) {
    j["snmp_info"] = *device.snmp_info;
  }
  if (device.upnp_info.has_value()) {
    j["upnp_info"] = *device.upnp_info;
  }
}

void to_json(json& j, const StatusReport& report) {
  j = json{
      {"ip_address", report.ip_address},
      {"status", to_string(report.status)},
      {"response_time_ms", report.response_time_ms.has_value() ? json(*report.response_time_ms) : json(nullptr)},
      {"check_type", to_string(report.check_type)},
      {"checked_at", report.checked_at},
  };
  put_optional(j, "device_id", report.device_id);
  put_optional(j, "error", report.error);
  put_optional(j, "ssl_expiry_at", report.ssl_expiry_at);
  put_optional(j, "ssl_issuer", report.ssl_issuer);
  put_optional(j, "ssl_subject", report.ssl_subject);
}

void to_json(json& j, const CommandAck& ack) {
  j = json{{"success", ack.success}};
  put_optional(j, "result", ack.result);
  put_optional(j, "error", ack.error);
}

void from_json(const json& j, NetworkSegment& segment) {
  segment.id = j.at("id").get<std::string>();
  segment.name = field_or<std::string>(j, "name", segment.id);
  segment.cidr = j.at("cidr").get<std::string>();
  segment.scan_interval_seconds = field_or<std::int64_t>(j, "scan_interval_seconds", 300);
  segment.segment_type =
      parse_segment_type(field_or<std::string>(j, "segment_type", "local_scan")).value_or(SegmentType::local_scan);
  segment.is_auto_registered = field_or<bool>(j, "is_auto_registered", false);
  segment.interface_name = optional_field<std::string>(j, "interface_name");
}

void from_json(const json& j, DeviceToMonitor& device) {
  device.id = j.at("id").get<std::string>();
  device.ip_address = optional_field<std::string>(j, "ip_address");
  device.hostname = optional_field<std::string>(j, "hostname");
  device.check_type = parse_check_type(field_or<std::string>(j, "check_type", "ping"));
  device.port = optional_field<int>(j, "port");
  device.url = optional_field<std::string>(j, "url");
  device.is_monitored = field_or<bool>(j, "is_monitored", true);
  device.check_interval_seconds = optional_field<std::int64_t>(j, "check_interval_seconds");
  device.ssl_expiry_warn_days = optional_field<int>(j, "ssl_expiry_warn_days");
  device.dns_expected_ip = optional_field<std::string>(j, "dns_expected_ip");
  device.network_segment_id = optional_field<std::string>(j, "network_segment_id");
}

void from_json(const json& j, AgentCommand& command) {
  command.id = j.at("id").get<std::string>();
  command.command_type = j.at("command_type").get<std::string>();
  const auto payload = j.find("payload");
  command.payload = payload != j.end() && payload->is_object() ? *payload : json::object();
  // Unrecognised states are never acted on.
  command.status = parse_command_status(field_or<std::string>(j, "status", "pending")).value_or(CommandStatus::completed);
}

}  // namespace model

namespace api {

void to_json(json& j, const HeartbeatRequest& request) {
  j = json{
      {"version", request.version},
      {"hostname", request.hostname},
      {"uptime_seconds", request.uptime_seconds},
  };
}

void to_json(json& j, const AutoSegmentRequest& request) {
  j = json{
      {"cidr", request.cidr},
      {"name", request.name},
      {"interface_name", request.interface_name},
  };
}

void from_json(const json& j, HeartbeatResponse& response) {
  response.agent_id = j.at("agent_id").get<std::string>();
  response.organization_id = field_or<std::string>(j, "organization_id", "");
  response.segments = field_or<std::vector<model::NetworkSegment>>(j, "segments", {});
  response.realtime_url = optional_field<std::string>(j, "supabase_url");
  response.realtime_key = optional_field<std::string>(j, "supabase_anon_key");
  response.latest_agent_version = optional_field<std::string>(j, "latest_agent_version");
  response.upgrade_available = field_or<bool>(j, "upgrade_available", false);
  response.pending_commands = field_or<std::vector<model::AgentCommand>>(j, "pending_commands", {});
}

void from_json(const json& j, DiscoveryUploadResult& result) {
  result.created = field_or<std::int64_t>(j, "created", 0);
  result.updated = field_or<std::int64_t>(j, "updated", 0);
  result.unchanged = field_or<std::int64_t>(j, "unchanged", 0);
}

void from_json(const json& j, StatusUploadResult& result) {
  result.processed = field_or<std::int64_t>(j, "processed", 0);
  result.errors = field_or<std::vector<std::string>>(j, "errors", {});
}

}  // namespace api
}  // namespace netmon_agent
