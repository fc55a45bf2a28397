#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/device.hpp"

namespace netmon_agent::net {
class Pinger;
class TcpConnector;
}  // namespace netmon_agent::net

namespace netmon_agent::monitor {

struct FallbackPort {
  std::uint16_t port;
  const char* name;
};

// 80 HTTP, 443 HTTPS, 22 SSH, 3389 RDP, 445 SMB, 53 DNS.
const std::vector<FallbackPort>& fallback_ports();

struct ProbeResult {
  model::DeviceStatus status{model::DeviceStatus::offline};
  std::optional<double> response_time_ms{};
  // "ping", the fallback port name, or "none".
  std::string method{"none"};
};

struct ProbeCascadeOptions {
  std::chrono::seconds ping_timeout{5};
  std::chrono::milliseconds tcp_timeout{5000};
};

// ICMP first; on failure all fallback ports are tried concurrently and the
// first connect to complete decides the method.
class ProbeCascade {
 public:
  ProbeCascade(net::Pinger& pinger, net::TcpConnector& tcp, ProbeCascadeOptions options = {});

  ProbeResult probe(const std::string& ip);

 private:
  net::Pinger& pinger_;
  net::TcpConnector& tcp_;
  ProbeCascadeOptions options_;
};

}  // namespace netmon_agent::monitor
