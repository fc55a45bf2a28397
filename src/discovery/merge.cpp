#include "discovery/merge.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "net/cidr.hpp"

namespace netmon_agent::discovery {
namespace {

void fill_if_empty(std::optional<std::string>& target, const std::optional<std::string>& source) {
  const bool target_empty = !target.has_value() || target->empty();
  if (target_empty && source.has_value() && !source->empty()) {
    target = source;
  }
}

template <typename T>
void fill_if_absent(std::optional<T>& target, const std::optional<T>& source) {
  if (!target.has_value() && source.has_value()) {
    target = source;
  }
}

// Unparseable addresses sort after every valid one, then lexically.
std::pair<std::uint64_t, std::string> ip_sort_key(const std::string& ip) {
  const auto parsed = net::parse_ipv4(ip);
  return {parsed.has_value() ? *parsed : (std::uint64_t{1} << 32U), ip};
}

}  // namespace

void merge_into(model::DiscoveredDevice& target, const model::DiscoveredDevice& source) {
  fill_if_empty(target.mac_address, source.mac_address);
  fill_if_empty(target.hostname, source.hostname);
  fill_if_empty(target.netbios_name, source.netbios_name);
  fill_if_empty(target.manufacturer, source.manufacturer);
  fill_if_absent(target.upnp_info, source.upnp_info);
  fill_if_absent(target.snmp_info, source.snmp_info);

  if (target.device_type == model::DeviceType::unknown) {
    target.device_type = source.device_type;
  }
  // Layer-2 sources rank first so the reported method does not depend on arrival order.
  if (source.discovery_method < target.discovery_method) {
    target.discovery_method = source.discovery_method;
  }

  target.os_hints.insert(source.os_hints.begin(), source.os_hints.end());
  target.open_ports.insert(source.open_ports.begin(), source.open_ports.end());
  target.services.insert(source.services.begin(), source.services.end());
}

std::vector<model::DiscoveredDevice> merge_devices(const std::vector<std::vector<model::DiscoveredDevice>>& sources) {
  std::map<std::pair<std::uint64_t, std::string>, model::DiscoveredDevice> merged;
  for (const auto& devices : sources) {
    for (const auto& device : devices) {
      if (device.ip_address.empty()) {
        continue;
      }
      const auto key = ip_sort_key(device.ip_address);
      const auto it = merged.find(key);
      if (it == merged.end()) {
        merged.emplace(key, device);
      } else {
        merge_into(it->second, device);
      }
    }
  }

  std::vector<model::DiscoveredDevice> result;
  result.reserve(merged.size());
  for (auto& [key, device] : merged) {
    result.push_back(std::move(device));
  }
  return result;
}

}  // namespace netmon_agent::discovery
