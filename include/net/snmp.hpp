#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "model/device.hpp"

namespace netmon_agent::net {

inline constexpr const char* kOidSysDescr = "1.3.6.1.2.1.1.1.0";
inline constexpr const char* kOidSysContact = "1.3.6.1.2.1.1.4.0";
inline constexpr const char* kOidSysName = "1.3.6.1.2.1.1.5.0";
inline constexpr const char* kOidSysLocation = "1.3.6.1.2.1.1.6.0";

struct SnmpVarbind {
  std::string oid{};
  // Empty for exception values (noSuchObject and friends) and non-string types.
  std::optional<std::string> value{};
};

struct SnmpResponse {
  std::int32_t request_id{0};
  std::int32_t error_status{0};
  std::vector<SnmpVarbind> varbinds{};
};

// SNMPv2c GetRequest with NULL values for each OID.
std::vector<std::uint8_t> encode_get_request(const std::string& community, std::int32_t request_id,
                                             const std::vector<std::string>& oids);

// Throws std::runtime_error on malformed BER.
SnmpResponse decode_response(const std::uint8_t* data, std::size_t size);

// Maps the system group varbinds onto SnmpInfo. Returns nullopt if none were present.
std::optional<model::SnmpInfo> to_snmp_info(const SnmpResponse& response);

// Queries sysDescr, sysName, sysContact and sysLocation. Implementations never throw.
class SnmpClient {
 public:
  virtual std::optional<model::SnmpInfo> query_system(const std::string& ip, const std::string& community,
                                                      std::chrono::milliseconds timeout) = 0;
  virtual ~SnmpClient() = default;
};

std::unique_ptr<SnmpClient> make_udp_snmp_client();
// Always returns nullopt; installed when UDP sockets are unavailable.
std::unique_ptr<SnmpClient> make_none_snmp_client();

}  // namespace netmon_agent::net
