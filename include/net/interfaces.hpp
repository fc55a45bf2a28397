#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netmon_agent::net {

struct InterfaceAddress {
  std::string name{};
  std::uint32_t address{0};
  std::uint32_t netmask{0};
  bool loopback{false};
};

struct LocalNetwork {
  std::string interface_name{};
  std::string ip_address{};
  std::string cidr{};
};

// IPv4 addresses of every interface that is up.
std::vector<InterfaceAddress> list_ipv4_interfaces();

// Network Target Classifier: true when the segment overlaps any local interface
// network (either contains the other). Malformed CIDRs are treated as remote.
[[nodiscard]] bool is_local_network(const std::string& cidr, const std::vector<InterfaceAddress>& interfaces);
[[nodiscard]] bool is_local_network(const std::string& cidr);

// Picks the interface a human would call "the LAN": physical names first,
// virtual bridges and tunnels skipped, link-local ignored.
[[nodiscard]] std::optional<LocalNetwork> detect_primary_network(const std::vector<InterfaceAddress>& interfaces);

}  // namespace netmon_agent::net
