#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace netmon_agent::net {

struct CertificateInfo {
  std::chrono::system_clock::time_point valid_to{};
  std::string issuer{};
  std::string subject{};
};

struct TlsInspectResult {
  std::optional<CertificateInfo> certificate{};
  double response_time_ms{0.0};
  std::optional<std::string> error{};
};

// TLS handshake with peer verification disabled so expired or self-signed
// certificates can still be read. Implementations never throw.
class TlsInspector {
 public:
  virtual TlsInspectResult inspect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) = 0;
  virtual ~TlsInspector() = default;
};

std::unique_ptr<TlsInspector> make_openssl_inspector();

}  // namespace netmon_agent::net
