#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "core/log.hpp"
#include "core/worker_pool.hpp"
#include "discovery/source.hpp"
#include "net/http_client.hpp"
#include "net/socket.hpp"

namespace netmon_agent::discovery {
namespace {

constexpr const char* kMdnsGroup = "224.0.0.251";
constexpr std::uint16_t kMdnsPort = 5353;
constexpr const char* kSsdpGroup = "239.255.255.250";
constexpr std::uint16_t kSsdpPort = 1900;
constexpr std::chrono::milliseconds kDescriptionTimeout{3000};
constexpr std::size_t kDescriptionConcurrency = 5;

using DatagramHandler = std::function<void(const std::uint8_t* data, std::size_t size, const std::string& sender)>;

std::string strip_local_suffix(std::string name) {
  for (const char* suffix : {".local.", ".local"}) {
    const std::string tail = suffix;
    if (name.size() >= tail.size() && name.compare(name.size() - tail.size(), tail.size(), tail) == 0) {
      name.erase(name.size() - tail.size());
      break;
    }
  }
  return name;
}

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

net::Socket open_multicast_socket() {
  net::Socket socket = net::open_udp_socket();

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  local.sin_port = 0;
  if (::bind(socket.fd(), reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
    throw std::runtime_error("unable to bind UDP socket");
  }

  const unsigned char ttl = 4;
  setsockopt(socket.fd(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
  return socket;
}

void send_to_group(const net::Socket& socket, const char* group, std::uint16_t port, const void* data,
                   std::size_t size) {
  sockaddr_in destination{};
  destination.sin_family = AF_INET;
  destination.sin_port = htons(port);
  inet_pton(AF_INET, group, &destination.sin_addr);
  if (::sendto(socket.fd(), data, size, 0, reinterpret_cast<const sockaddr*>(&destination), sizeof(destination)) < 0) {
    throw std::runtime_error(std::string("multicast send to ") + group + " failed");
  }
}

// Delivers every datagram received before the deadline.
void listen_window(const net::Socket& socket, std::chrono::milliseconds timeout, const DatagramHandler& handler) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::uint8_t buffer[9000]{};
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0 || !net::wait_readable(socket, remaining)) {
      return;
    }

    sockaddr_in sender{};
    socklen_t sender_length = sizeof(sender);
    const ssize_t received =
        ::recvfrom(socket.fd(), buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&sender), &sender_length);
    if (received <= 0) {
      continue;
    }

    char address[INET_ADDRSTRLEN]{};
    inet_ntop(AF_INET, &sender.sin_addr, address, sizeof(address));
    handler(buffer, static_cast<std::size_t>(received), address);
  }
}

class MdnsSource final : public DiscoverySource {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "mdns"; }

  std::vector<model::DiscoveredDevice> discover(const std::string&, const std::chrono::milliseconds timeout) override {
    try {
      const net::Socket socket = open_multicast_socket();

      std::vector<net::dns::Question> questions;
      for (const auto& service : mdns_service_types()) {
        questions.push_back(net::dns::Question{.name = service, .type = net::dns::kTypePtr, .unicast_response = true});
      }
      const auto packet = net::dns::encode_query(0, questions, false);
      send_to_group(socket, kMdnsGroup, kMdnsPort, packet.data(), packet.size());

      MdnsCollector collector;
      listen_window(socket, timeout, [&collector](const std::uint8_t* data, std::size_t size, const std::string&) {
        try {
          const auto message = net::dns::decode_message(data, size);
          if (message.is_response()) {
            collector.add(message);
          }
        } catch (const std::runtime_error& ex) {
          core::log_debug("mdns", std::string("ignoring malformed response: ") + ex.what());
        }
      });

      auto devices = collector.devices();
      core::log_info("mdns", "scan found " + std::to_string(devices.size()) + " devices");
      return devices;
    } catch (const std::exception& ex) {
      core::log_warn("mdns", std::string("scan failed (multicast may not be supported): ") + ex.what());
      return {};
    }
  }
};

class SsdpSource final : public DiscoverySource {
 public:
  explicit SsdpSource(net::HttpClient& http) : http_(http) {}

  [[nodiscard]] const char* name() const noexcept override { return "ssdp"; }

  std::vector<model::DiscoveredDevice> discover(const std::string&, const std::chrono::milliseconds timeout) override {
    try {
      const net::Socket socket = open_multicast_socket();
      const std::string search =
          "M-SEARCH * HTTP/1.1\r\n"
          "HOST: 239.255.255.250:1900\r\n"
          "MAN: \"ssdp:discover\"\r\n"
          "MX: 3\r\n"
          "ST: ssdp:all\r\n\r\n";
      send_to_group(socket, kSsdpGroup, kSsdpPort, search.data(), search.size());

      std::map<std::string, model::DiscoveredDevice> devices;
      std::map<std::string, std::string> locations;
      listen_window(socket, timeout, [&](const std::uint8_t* data, std::size_t size, const std::string& sender) {
        const auto response = parse_ssdp_response(std::string(reinterpret_cast<const char*>(data), size));
        if (!response.has_value()) {
          return;
        }
        auto& device = devices[sender];
        device.ip_address = sender;
        device.discovery_method = model::DiscoveryMethod::ssdp;
        if (response->server.has_value()) {
          device.os_hints.insert(*response->server);
        }
        if (response->location.has_value()) {
          locations.emplace(sender, *response->location);
        }
      });

      fetch_descriptions(devices, locations);

      std::vector<model::DiscoveredDevice> result;
      result.reserve(devices.size());
      for (auto& [ip, device] : devices) {
        result.push_back(std::move(device));
      }
      core::log_info("ssdp", "scan found " + std::to_string(result.size()) + " devices");
      return result;
    } catch (const std::exception& ex) {
      core::log_warn("ssdp", std::string("scan failed: ") + ex.what());
      return {};
    }
  }

 private:
  void fetch_descriptions(std::map<std::string, model::DiscoveredDevice>& devices,
                          const std::map<std::string, std::string>& locations) {
    std::vector<std::pair<std::string, std::string>> targets(locations.begin(), locations.end());
    core::run_bounded(targets, kDescriptionConcurrency, [&](const std::pair<std::string, std::string>& target) {
      net::HttpRequest request{};
      request.url = target.second;
      request.timeout = kDescriptionTimeout;
      const auto response = http_.send(request);
      if (!response.ok()) {
        return;
      }

      const auto info = parse_upnp_description(response.body);
      if (!info.has_value()) {
        return;
      }
      auto& device = devices.at(target.first);
      device.upnp_info = info;
      if (!device.hostname.has_value() && info->friendly_name.has_value()) {
        device.hostname = info->friendly_name;
      }
      if (!device.manufacturer.has_value() && info->manufacturer.has_value()) {
        device.manufacturer = info->manufacturer;
      }
    });
  }

  net::HttpClient& http_;
};

class NoneSource final : public DiscoverySource {
 public:
  explicit NoneSource(const char* name) : name_(name) {}

  [[nodiscard]] const char* name() const noexcept override { return name_; }

  std::vector<model::DiscoveredDevice> discover(const std::string&, std::chrono::milliseconds) override { return {}; }

 private:
  const char* name_;
};

}  // namespace

const std::vector<std::string>& mdns_service_types() {
  static const std::vector<std::string> kServiceTypes = {
      "_http._tcp.local",    "_https._tcp.local",      "_printer._tcp.local", "_ipp._tcp.local",
      "_ssh._tcp.local",     "_smb._tcp.local",        "_googlecast._tcp.local", "_airplay._tcp.local",
      "_raop._tcp.local",    "_workstation._tcp.local", "_services._dns-sd._udp.local",
  };
  return kServiceTypes;
}

void MdnsCollector::add(const net::dns::Message& message) {
  for (const auto& record : message.records) {
    if (record.type != net::dns::kTypeA || record.data.empty()) {
      continue;
    }
    const std::string hostname = strip_local_suffix(record.name);
    auto [it, inserted] = devices_.try_emplace(record.data);
    auto& device = it->second;
    if (inserted) {
      device.ip_address = record.data;
      device.discovery_method = model::DiscoveryMethod::mdns;
    }
    if (!device.hostname.has_value() && !hostname.empty()) {
      device.hostname = hostname;
    }
  }

  for (const auto& record : message.records) {
    if (record.type == net::dns::kTypePtr) {
      const std::string service = strip_local_suffix(record.name);
      for (auto& [ip, device] : devices_) {
        if (device.hostname.has_value() && !device.hostname->empty() &&
            record.data.find(*device.hostname) != std::string::npos) {
          device.services.insert(service);
        }
      }
    } else if (record.type == net::dns::kTypeSrv && record.port != 0) {
      const std::string target = strip_local_suffix(record.data);
      for (auto& [ip, device] : devices_) {
        if (device.hostname == target) {
          device.open_ports.insert(record.port);
        }
      }
    }
  }
}

std::vector<model::DiscoveredDevice> MdnsCollector::devices() const {
  std::vector<model::DiscoveredDevice> result;
  result.reserve(devices_.size());
  for (const auto& [ip, device] : devices_) {
    result.push_back(device);
  }
  return result;
}

std::optional<SsdpResponse> parse_ssdp_response(const std::string& text) {
  std::istringstream input(text);
  std::string status_line;
  if (!std::getline(input, status_line)) {
    return std::nullopt;
  }
  const std::string status = lowercase(trim(status_line));
  if (status.rfind("http/1.1 200", 0) != 0 && status.rfind("notify", 0) != 0) {
    return std::nullopt;
  }

  SsdpResponse response{};
  std::string line;
  while (std::getline(input, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = lowercase(trim(line.substr(0, colon)));
    const std::string value = trim(line.substr(colon + 1));
    if (value.empty()) {
      continue;
    }
    if (key == "server") {
      response.server = value;
    } else if (key == "location") {
      response.location = value;
    }
  }
  return response;
}

std::optional<model::UpnpInfo> parse_upnp_description(const std::string& xml) {
  const auto extract = [&xml](const char* tag) -> std::optional<std::string> {
    const std::regex pattern(std::string("<") + tag + ">([^<]+)</" + tag + ">");
    std::smatch match;
    if (std::regex_search(xml, match, pattern) && match.size() >= 2) {
      return match[1].str();
    }
    return std::nullopt;
  };

  model::UpnpInfo info{};
  info.friendly_name = extract("friendlyName");
  info.manufacturer = extract("manufacturer");
  info.device_type = extract("deviceType");
  if (!info.friendly_name && !info.manufacturer && !info.device_type) {
    return std::nullopt;
  }
  return info;
}

bool udp_multicast_available() {
  try {
    const net::Socket socket = open_multicast_socket();
    return socket.valid();
  } catch (const std::runtime_error&) {
    return false;
  }
}

std::unique_ptr<DiscoverySource> make_mdns_source() { return std::make_unique<MdnsSource>(); }

std::unique_ptr<DiscoverySource> make_ssdp_source(net::HttpClient& http) { return std::make_unique<SsdpSource>(http); }

std::unique_ptr<DiscoverySource> make_none_source(const char* name) { return std::make_unique<NoneSource>(name); }

}  // namespace netmon_agent::discovery
