#include "monitor/health_check.hpp"

#include <algorithm>
#include <chrono>

#include "core/log.hpp"
#include "core/timestamp.hpp"
#include "net/dns_resolver.hpp"
#include "net/http_client.hpp"
#include "net/ping.hpp"
#include "net/tcp.hpp"
#include "net/tls_inspector.hpp"

namespace netmon_agent::monitor {
namespace {

using model::DeviceStatus;

std::uint16_t port_or_default(const model::DeviceToMonitor& device) {
  const int port = device.port.value_or(kDefaultCheckPort);
  return static_cast<std::uint16_t>(port > 0 && port <= 65535 ? port : kDefaultCheckPort);
}

void check_ping(const std::string& target, CheckBackends& backends, const CheckTimeouts& timeouts,
                model::StatusReport& report) {
  const auto result = backends.pinger.ping(target, timeouts.ping);
  report.status = result.alive ? DeviceStatus::online : DeviceStatus::offline;
  report.response_time_ms = result.time_ms;
  if (!result.alive) {
    report.error = result.error.value_or("no reply");
  }
}

void check_tcp(const model::DeviceToMonitor& device, const std::string& target, CheckBackends& backends,
               const CheckTimeouts& timeouts, model::StatusReport& report) {
  const auto result = backends.tcp.connect(target, port_or_default(device), timeouts.tcp);
  report.status = result.open ? DeviceStatus::online : DeviceStatus::offline;
  if (result.open) {
    report.response_time_ms = result.response_time_ms;
  } else {
    report.error = result.error.value_or("connection failed");
  }
}

void check_http(const model::DeviceToMonitor& device, const std::string& target, CheckBackends& backends,
                const CheckTimeouts& timeouts, model::StatusReport& report) {
  net::HttpRequest request{};
  request.url = device.url.has_value() && !device.url->empty() ? *device.url : "https://" + target;
  request.timeout = timeouts.http;
  request.follow_redirects = true;
  request.max_redirects = 5;

  const auto response = backends.http.send(request);
  if (response.transport_error.has_value()) {
    report.status = DeviceStatus::offline;
    report.error = response.transport_error;
    return;
  }
  report.status = classify_http_status(response.status_code);
  report.response_time_ms = response.elapsed_ms;
  if (report.status == DeviceStatus::degraded) {
    report.error = "HTTP " + std::to_string(response.status_code);
  }
}

void check_dns(const model::DeviceToMonitor& device, const std::string& target, CheckBackends& backends,
               const CheckTimeouts& timeouts, model::StatusReport& report) {
  const auto start = std::chrono::steady_clock::now();
  const auto result = backends.dns.resolve_a(target, timeouts.dns);
  report.response_time_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  report.status = classify_dns(result.addresses, device.dns_expected_ip);

  if (!result.resolved()) {
    report.error = result.error.value_or("DNS lookup failed");
  } else if (report.status == DeviceStatus::degraded) {
    report.error = "expected " + device.dns_expected_ip.value_or("") + ", got " + result.addresses.front();
  }
}

void check_ssl(const model::DeviceToMonitor& device, const std::string& target, CheckBackends& backends,
               const CheckTimeouts& timeouts, model::StatusReport& report) {
  const auto result = backends.tls.inspect(target, port_or_default(device), timeouts.ssl);
  if (!result.certificate.has_value()) {
    report.status = DeviceStatus::offline;
    report.error = result.error.value_or("TLS handshake failed");
    return;
  }

  const auto& certificate = *result.certificate;
  const auto verdict = classify_certificate(certificate.valid_to, std::chrono::system_clock::now(),
                                            device.ssl_expiry_warn_days.value_or(kDefaultSslWarnDays));
  report.status = verdict.status;
  report.response_time_ms = result.response_time_ms;
  report.ssl_expiry_at = core::iso8601_utc(certificate.valid_to);
  report.ssl_issuer = certificate.issuer;
  report.ssl_subject = certificate.subject;
  if (verdict.days_until_expiry < 0) {
    report.error = "certificate expired " + std::to_string(-verdict.days_until_expiry) + " days ago";
  }
}

}  // namespace

DeviceStatus classify_http_status(const long status_code) noexcept {
  if (status_code >= 400) {
    return DeviceStatus::degraded;
  }
  return DeviceStatus::online;
}

DeviceStatus classify_dns(const std::vector<std::string>& addresses, const std::optional<std::string>& expected_ip) {
  if (addresses.empty()) {
    return DeviceStatus::offline;
  }
  if (expected_ip.has_value() && !expected_ip->empty() &&
      std::find(addresses.begin(), addresses.end(), *expected_ip) == addresses.end()) {
    return DeviceStatus::degraded;
  }
  return DeviceStatus::online;
}

CertificateVerdict classify_certificate(const std::chrono::system_clock::time_point valid_to,
                                        const std::chrono::system_clock::time_point now, const int warn_days) {
  const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(valid_to - now).count();
  constexpr long kSecondsPerDay = 86400;
  long days = remaining / kSecondsPerDay;
  if (remaining < 0 && remaining % kSecondsPerDay != 0) {
    --days;
  }

  CertificateVerdict verdict{};
  verdict.days_until_expiry = days;
  if (days < 0) {
    verdict.status = DeviceStatus::offline;
  } else if (days <= warn_days) {
    verdict.status = DeviceStatus::degraded;
  } else {
    verdict.status = DeviceStatus::online;
  }
  return verdict;
}

std::optional<std::string> check_target(const model::DeviceToMonitor& device) {
  if (device.hostname.has_value() && !device.hostname->empty()) {
    return device.hostname;
  }
  if (device.ip_address.has_value() && !device.ip_address->empty()) {
    return device.ip_address;
  }
  return std::nullopt;
}

model::StatusReport run_check(const model::DeviceToMonitor& device, CheckBackends& backends,
                              const CheckTimeouts& timeouts) {
  model::StatusReport report{};
  report.device_id = device.id;
  report.check_type = device.check_type;

  const auto target = check_target(device);
  report.ip_address = device.ip_address.value_or(target.value_or(""));
  if (!target.has_value()) {
    report.status = DeviceStatus::unknown;
    report.error = "device has no hostname or IP address";
    report.checked_at = core::iso8601_now();
    return report;
  }

  switch (device.check_type) {
    case model::CheckType::tcp:
      check_tcp(device, *target, backends, timeouts, report);
      break;
    case model::CheckType::http:
      check_http(device, *target, backends, timeouts, report);
      break;
    case model::CheckType::dns:
      check_dns(device, *target, backends, timeouts, report);
      break;
    case model::CheckType::ssl:
      check_ssl(device, *target, backends, timeouts, report);
      break;
    case model::CheckType::ping:
      check_ping(*target, backends, timeouts, report);
      break;
  }

  report.checked_at = core::iso8601_now();
  core::log_debug("remote", std::string(model::to_string(device.check_type)) + " " + *target + ": " +
                                model::to_string(report.status));
  return report;
}

}  // namespace netmon_agent::monitor
