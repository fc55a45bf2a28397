#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "model/monitor.hpp"

namespace netmon_agent::net {
class DnsResolver;
class HttpClient;
class Pinger;
class TcpConnector;
class TlsInspector;
}  // namespace netmon_agent::net

namespace netmon_agent::monitor {

struct CheckBackends {
  net::Pinger& pinger;
  net::TcpConnector& tcp;
  net::HttpClient& http;
  net::DnsResolver& dns;
  net::TlsInspector& tls;
};

struct CheckTimeouts {
  std::chrono::seconds ping{5};
  std::chrono::milliseconds tcp{5000};
  std::chrono::milliseconds http{10000};
  std::chrono::milliseconds dns{10000};
  std::chrono::milliseconds ssl{10000};
};

inline constexpr int kDefaultCheckPort = 443;
inline constexpr int kDefaultSslWarnDays = 30;

// 2xx/3xx online, 4xx/5xx degraded.
[[nodiscard]] model::DeviceStatus classify_http_status(long status_code) noexcept;

// Online when resolved (and matching expected_ip if given), degraded on mismatch, offline otherwise.
[[nodiscard]] model::DeviceStatus classify_dns(const std::vector<std::string>& addresses,
                                               const std::optional<std::string>& expected_ip);

struct CertificateVerdict {
  model::DeviceStatus status{model::DeviceStatus::offline};
  long days_until_expiry{0};
};

// Expired offline, within warn_days degraded, otherwise online. Days are floored.
[[nodiscard]] CertificateVerdict classify_certificate(std::chrono::system_clock::time_point valid_to,
                                                      std::chrono::system_clock::time_point now, int warn_days);

// hostname, else ip_address. nullopt when the device has neither.
[[nodiscard]] std::optional<std::string> check_target(const model::DeviceToMonitor& device);

// Runs one check by check_type. Never throws for probe failures.
model::StatusReport run_check(const model::DeviceToMonitor& device, CheckBackends& backends,
                              const CheckTimeouts& timeouts = {});

}  // namespace netmon_agent::monitor
