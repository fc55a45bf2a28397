#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace netmon_agent::net {

struct PingResult {
  bool alive{false};
  std::optional<double> time_ms{};
  std::optional<int> ttl{};
  std::optional<std::string> error{};
};

// ICMP echo capability. Implementations never throw.
class Pinger {
 public:
  virtual PingResult ping(const std::string& host, std::chrono::seconds timeout) = 0;
  // Best-effort broadcast echo used to warm the kernel ARP cache.
  virtual void ping_broadcast(const std::string& broadcast_address) = 0;
  virtual ~Pinger() = default;
};

// Parses the output of iputils/BSD ping for a single echo.
PingResult parse_ping_output(const std::string& output);

// Runs the system `ping` binary.
std::unique_ptr<Pinger> make_system_pinger();

}  // namespace netmon_agent::net
