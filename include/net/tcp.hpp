#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace netmon_agent::net {

struct TcpResult {
  bool open{false};
  double response_time_ms{0.0};
  std::optional<std::string> error{};
};

// TCP connect capability. Implementations never throw.
class TcpConnector {
 public:
  virtual TcpResult connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) = 0;
  virtual ~TcpConnector() = default;
};

std::unique_ptr<TcpConnector> make_socket_connector();

}  // namespace netmon_agent::net
