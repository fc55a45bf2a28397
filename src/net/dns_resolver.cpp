#include "net/dns_resolver.hpp"

#include <sys/socket.h>

#include <random>
#include <stdexcept>
#include <utility>

#include "net/dns_message.hpp"
#include "net/socket.hpp"

namespace netmon_agent::net {
namespace {

constexpr std::uint16_t kDnsPort = 53;

std::uint16_t next_query_id() {
  thread_local std::mt19937 generator{std::random_device{}()};
  return static_cast<std::uint16_t>(generator() & 0xFFFFU);
}

class UdpResolver final : public DnsResolver {
 public:
  explicit UdpResolver(std::vector<std::string> servers) : servers_(std::move(servers)) {}

  DnsLookupResult resolve_a(const std::string& name, const std::chrono::milliseconds timeout) override {
    DnsLookupResult result{};
    if (servers_.empty()) {
      result.error = "no resolvers configured";
      return result;
    }

    const auto per_server = timeout / static_cast<long>(servers_.size());
    for (const auto& server : servers_) {
      try {
        result = query(server, name, per_server);
      } catch (const std::runtime_error& ex) {
        result = DnsLookupResult{.addresses = {}, .error = std::string(ex.what())};
      }
      if (result.resolved()) {
        return result;
      }
    }
    return result;
  }

 private:
  DnsLookupResult query(const std::string& server, const std::string& name,
                        const std::chrono::milliseconds timeout) const {
    const auto address = resolve_ipv4(server, kDnsPort);
    if (!address.has_value()) {
      return DnsLookupResult{.addresses = {}, .error = "invalid resolver " + server};
    }

    const Socket socket = open_udp_socket();
    const std::uint16_t id = next_query_id();
    const auto packet = dns::encode_query(id, {dns::Question{.name = name, .type = dns::kTypeA}}, true);
    if (::sendto(socket.fd(), packet.data(), packet.size(), 0, reinterpret_cast<const sockaddr*>(&*address),
                 sizeof(*address)) < 0) {
      return DnsLookupResult{.addresses = {}, .error = "sendto " + server + " failed"};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::uint8_t buffer[1500]{};
    while (true) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0 || !wait_readable(socket, remaining)) {
        return DnsLookupResult{.addresses = {}, .error = "timeout querying " + server};
      }

      const ssize_t received = ::recv(socket.fd(), buffer, sizeof(buffer), 0);
      if (received <= 0) {
        continue;
      }

      const dns::Message message = dns::decode_message(buffer, static_cast<std::size_t>(received));
      if (message.id != id || !message.is_response()) {
        continue;
      }
      if (message.rcode != 0) {
        return DnsLookupResult{.addresses = {}, .error = "rcode " + std::to_string(message.rcode)};
      }

      DnsLookupResult result{};
      for (const auto& record : message.records) {
        if (record.type == dns::kTypeA && !record.data.empty()) {
          result.addresses.push_back(record.data);
        }
      }
      if (!result.resolved()) {
        result.error = "no A records for " + name;
      }
      return result;
    }
  }

  std::vector<std::string> servers_;
};

}  // namespace

std::unique_ptr<DnsResolver> make_udp_resolver(std::vector<std::string> servers) {
  return std::make_unique<UdpResolver>(std::move(servers));
}

}  // namespace netmon_agent::net
