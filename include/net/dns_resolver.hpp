#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netmon_agent::net {

struct DnsLookupResult {
  std::vector<std::string> addresses{};
  std::optional<std::string> error{};

  [[nodiscard]] bool resolved() const noexcept { return !addresses.empty(); }
};

// A-record lookup capability. Implementations never throw.
class DnsResolver {
 public:
  virtual DnsLookupResult resolve_a(const std::string& name, std::chrono::milliseconds timeout) = 0;
  virtual ~DnsResolver() = default;
};

// Queries each server over UDP/53 in order, splitting the timeout between them.
std::unique_ptr<DnsResolver> make_udp_resolver(std::vector<std::string> servers = {"8.8.8.8", "1.1.1.1"});

}  // namespace netmon_agent::net
