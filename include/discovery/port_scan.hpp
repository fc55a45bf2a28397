#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netmon_agent::net {
class TcpConnector;
}

namespace netmon_agent::discovery {

struct PortScanOptions {
  std::vector<std::uint16_t> ports{};
  std::chrono::milliseconds timeout{2000};
  std::size_t concurrency{10};
};

// The twenty well-known ports probed during enrichment.
const std::vector<std::uint16_t>& common_ports();

[[nodiscard]] std::optional<std::string> port_service_name(std::uint16_t port);

// Open ports in ascending order. An empty options.ports means common_ports().
std::vector<std::uint16_t> scan_ports(net::TcpConnector& connector, const std::string& ip,
                                      const PortScanOptions& options = {});

}  // namespace netmon_agent::discovery
