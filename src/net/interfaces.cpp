#include "net/interfaces.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <memory>
#include <stdexcept>

#include "net/cidr.hpp"

namespace netmon_agent::net {
namespace {

constexpr std::array<const char*, 5> kPreferredPrefixes = {"eth", "en", "wlan", "wi-fi", "ethernet"};
constexpr std::array<const char*, 8> kVirtualPrefixes = {"docker", "veth", "br-", "virbr", "vmnet", "vbox", "tun", "tap"};

struct IfAddrsDeleter {
  void operator()(ifaddrs* addrs) const {
    if (addrs != nullptr) {
      freeifaddrs(addrs);
    }
  }
};

std::string lowercase(const std::string& value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template <std::size_t N>
bool has_any_prefix(const std::string& name, const std::array<const char*, N>& prefixes) {
  const std::string lower = lowercase(name);
  return std::any_of(prefixes.begin(), prefixes.end(),
                     [&lower](const char* prefix) { return lower.rfind(prefix, 0) == 0; });
}

bool is_link_local(const std::uint32_t address) noexcept { return (address & 0xFFFF0000U) == 0xA9FE0000U; }

LocalNetwork to_local_network(const InterfaceAddress& iface) {
  const int prefix = std::popcount(iface.netmask);
  return LocalNetwork{
      .interface_name = iface.name,
      .ip_address = format_ipv4(iface.address),
      .cidr = format_ipv4(iface.address & iface.netmask) + "/" + std::to_string(prefix),
  };
}

}  // namespace

std::vector<InterfaceAddress> list_ipv4_interfaces() {
  ifaddrs* raw = nullptr;
  if (getifaddrs(&raw) != 0) {
    throw std::runtime_error("getifaddrs failed");
  }
  std::unique_ptr<ifaddrs, IfAddrsDeleter> addrs(raw);

  std::vector<InterfaceAddress> result;
  for (const ifaddrs* it = addrs.get(); it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_netmask == nullptr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((it->ifa_flags & IFF_UP) == 0) {
      continue;
    }

    const auto* address = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    const auto* netmask = reinterpret_cast<const sockaddr_in*>(it->ifa_netmask);
    result.push_back(InterfaceAddress{
        .name = it->ifa_name != nullptr ? it->ifa_name : "",
        .address = ntohl(address->sin_addr.s_addr),
        .netmask = ntohl(netmask->sin_addr.s_addr),
        .loopback = (it->ifa_flags & IFF_LOOPBACK) != 0,
    });
  }
  return result;
}

bool is_local_network(const std::string& cidr, const std::vector<InterfaceAddress>& interfaces) {
  Ipv4Network target{};
  try {
    target = parse_cidr(cidr);
  } catch (const std::invalid_argument&) {
    return false;
  }

  return std::any_of(interfaces.begin(), interfaces.end(), [&target](const InterfaceAddress& iface) {
    const Ipv4Network local{.address = iface.address, .mask = iface.netmask, .prefix = std::popcount(iface.netmask)};
    return networks_overlap(target, local);
  });
}

bool is_local_network(const std::string& cidr) { return is_local_network(cidr, list_ipv4_interfaces()); }

std::optional<LocalNetwork> detect_primary_network(const std::vector<InterfaceAddress>& interfaces) {
  std::vector<const InterfaceAddress*> candidates;
  for (const auto& iface : interfaces) {
    if (iface.loopback || is_link_local(iface.address) || iface.netmask == 0) {
      continue;
    }
    candidates.push_back(&iface);
  }

  for (const auto* iface : candidates) {
    if (has_any_prefix(iface->name, kPreferredPrefixes)) {
      return to_local_network(*iface);
    }
  }
  for (const auto* iface : candidates) {
    if (!has_any_prefix(iface->name, kVirtualPrefixes)) {
      return to_local_network(*iface);
    }
  }
  return std::nullopt;
}

}  // namespace netmon_agent::net
