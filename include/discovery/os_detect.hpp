#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "model/device.hpp"

namespace netmon_agent::net {
class Pinger;
}

namespace netmon_agent::discovery {

struct OsGuess {
  std::vector<std::string> os_hints{};
  model::DeviceType device_type{model::DeviceType::unknown};
};

// TTL range first, then open-port and service signals. Hints accumulate.
OsGuess classify_os(std::optional<int> ttl, const std::set<int>& open_ports, const std::set<std::string>& services);

// Measures TTL with one echo (2 s) and classifies.
OsGuess detect_os(net::Pinger& pinger, const std::string& ip, const std::set<int>& open_ports,
                  const std::set<std::string>& services);

}  // namespace netmon_agent::discovery
