#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model/device.hpp"
#include "net/dns_message.hpp"

namespace netmon_agent::net {
class HttpClient;
}

namespace netmon_agent::discovery {

class OuiDatabase;

// One discovery protocol. Implementations catch their own failures, log them
// and return no devices.
class DiscoverySource {
 public:
  [[nodiscard]] virtual const char* name() const noexcept = 0;
  virtual std::vector<model::DiscoveredDevice> discover(const std::string& cidr, std::chrono::milliseconds timeout) = 0;
  virtual ~DiscoverySource() = default;
};

// Kernel neighbour table (/proc/net/arp format), filtered to the CIDR.
std::unique_ptr<DiscoverySource> make_arp_source(const OuiDatabase& oui, std::string table_path = "/proc/net/arp");
// PTR queries for common service types on 224.0.0.251:5353.
std::unique_ptr<DiscoverySource> make_mdns_source();
// M-SEARCH ssdp:all on 239.255.255.250:1900. Device descriptions are fetched with http.
std::unique_ptr<DiscoverySource> make_ssdp_source(net::HttpClient& http);
// Installed when the protocol cannot run on this host.
std::unique_ptr<DiscoverySource> make_none_source(const char* name);

// Can this host open and bind a UDP socket for multicast queries.
[[nodiscard]] bool udp_multicast_available();

std::vector<model::DiscoveredDevice> parse_arp_table(const std::string& text, const std::string& cidr,
                                                     const OuiDatabase& oui);

// Accumulates mDNS answers from many responders into per-IP devices.
class MdnsCollector {
 public:
  void add(const net::dns::Message& message);
  [[nodiscard]] std::vector<model::DiscoveredDevice> devices() const;

 private:
  std::map<std::string, model::DiscoveredDevice> devices_{};
};

const std::vector<std::string>& mdns_service_types();

struct SsdpResponse {
  std::optional<std::string> server{};
  std::optional<std::string> location{};
};

// Header names are matched case-insensitively.
[[nodiscard]] std::optional<SsdpResponse> parse_ssdp_response(const std::string& text);
// friendlyName, manufacturer and deviceType from a UPnP device description.
[[nodiscard]] std::optional<model::UpnpInfo> parse_upnp_description(const std::string& xml);

}  // namespace netmon_agent::discovery
