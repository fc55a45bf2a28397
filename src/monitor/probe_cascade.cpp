#include "monitor/probe_cascade.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>

#include "core/log.hpp"
#include "net/ping.hpp"
#include "net/tcp.hpp"

namespace netmon_agent::monitor {

const std::vector<FallbackPort>& fallback_ports() {
  static const std::vector<FallbackPort> kPorts = {
      {80, "HTTP"}, {443, "HTTPS"}, {22, "SSH"}, {3389, "RDP"}, {445, "SMB"}, {53, "DNS"},
  };
  return kPorts;
}

ProbeCascade::ProbeCascade(net::Pinger& pinger, net::TcpConnector& tcp, ProbeCascadeOptions options)
    : pinger_(pinger), tcp_(tcp), options_(options) {}

ProbeResult ProbeCascade::probe(const std::string& ip) {
  const auto echo = pinger_.ping(ip, options_.ping_timeout);
  if (echo.alive) {
    return ProbeResult{.status = model::DeviceStatus::online, .response_time_ms = echo.time_ms, .method = "ping"};
  }

  std::mutex mutex;
  std::optional<ProbeResult> winner;

  std::vector<std::thread> attempts;
  attempts.reserve(fallback_ports().size());
  for (const auto& fallback : fallback_ports()) {
    attempts.emplace_back([&, fallback]() {
      const auto result = tcp_.connect(ip, fallback.port, options_.tcp_timeout);
      if (!result.open) {
        return;
      }
      std::lock_guard<std::mutex> lock(mutex);
      if (!winner.has_value()) {
        winner = ProbeResult{
            .status = model::DeviceStatus::online,
            .response_time_ms = result.response_time_ms,
            .method = fallback.name,
        };
      }
    });
  }
  for (auto& attempt : attempts) {
    attempt.join();
  }

  if (winner.has_value()) {
    core::log_debug("probe", ip + " online via " + winner->method + " (ICMP blocked)");
    return *winner;
  }
  return ProbeResult{};
}

}  // namespace netmon_agent::monitor
