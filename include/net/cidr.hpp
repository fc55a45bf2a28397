#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netmon_agent::net {

struct Ipv4Network {
  std::uint32_t address{0};
  std::uint32_t mask{0};
  int prefix{0};

  [[nodiscard]] std::uint32_t network() const noexcept { return address & mask; }
  [[nodiscard]] std::uint32_t broadcast() const noexcept { return network() | ~mask; }
};

[[nodiscard]] std::optional<std::uint32_t> parse_ipv4(const std::string& text);
[[nodiscard]] std::string format_ipv4(std::uint32_t address);
[[nodiscard]] std::uint32_t prefix_to_mask(int prefix) noexcept;

// Throws std::invalid_argument on a malformed address or a prefix outside 0..32.
Ipv4Network parse_cidr(const std::string& cidr);

// Usable host addresses. Network and broadcast are excluded for prefix <= 30.
std::vector<std::string> expand_cidr(const std::string& cidr);

[[nodiscard]] std::size_t cidr_host_count(const std::string& cidr);

// False for malformed input.
[[nodiscard]] bool is_in_cidr(const std::string& ip, const std::string& cidr);

// True when either network contains the other.
[[nodiscard]] bool networks_overlap(const Ipv4Network& lhs, const Ipv4Network& rhs) noexcept;

// AA:BB:CC:DD:EE:FF, or the input unchanged when it is not 12 hex digits.
[[nodiscard]] std::string normalize_mac(const std::string& mac);

// Network and broadcast addresses of a /24 style segment.
[[nodiscard]] bool is_network_or_broadcast_suffix(const std::string& ip);

}  // namespace netmon_agent::net
