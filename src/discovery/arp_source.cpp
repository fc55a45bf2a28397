#include <fstream>
#include <sstream>
#include <utility>

#include "core/log.hpp"
#include "discovery/oui.hpp"
#include "discovery/source.hpp"
#include "net/cidr.hpp"

namespace netmon_agent::discovery {
namespace {

constexpr const char* kIncompleteMac = "00:00:00:00:00:00";

class ArpSource final : public DiscoverySource {
 public:
  ArpSource(const OuiDatabase& oui, std::string table_path) : oui_(oui), table_path_(std::move(table_path)) {}

  [[nodiscard]] const char* name() const noexcept override { return "arp"; }

  std::vector<model::DiscoveredDevice> discover(const std::string& cidr, std::chrono::milliseconds) override {
    std::ifstream input(table_path_);
    if (!input.is_open()) {
      core::log_warn("arp", "unable to open " + table_path_);
      return {};
    }
    std::ostringstream content;
    content << input.rdbuf();

    auto devices = parse_arp_table(content.str(), cidr, oui_);
    core::log_debug("arp", "found " + std::to_string(devices.size()) + " devices in " + cidr);
    return devices;
  }

 private:
  const OuiDatabase& oui_;
  std::string table_path_;
};

}  // namespace

std::vector<model::DiscoveredDevice> parse_arp_table(const std::string& text, const std::string& cidr,
                                                     const OuiDatabase& oui) {
  std::vector<model::DiscoveredDevice> devices;
  std::istringstream input(text);
  std::string line;
  std::getline(input, line);

  while (std::getline(input, line)) {
    std::istringstream fields(line);
    std::string ip;
    std::string hw_type;
    std::string flags;
    std::string mac;
    std::string mask;
    std::string dev;
    if (!(fields >> ip >> hw_type >> flags >> mac >> mask >> dev)) {
      continue;
    }

    if (mac == kIncompleteMac || flags == "0x0" || !net::is_in_cidr(ip, cidr)) {
      continue;
    }

    model::DiscoveredDevice device{};
    device.ip_address = ip;
    device.mac_address = net::normalize_mac(mac);
    device.manufacturer = oui.lookup(*device.mac_address);
    device.discovery_method = model::DiscoveryMethod::arp;
    devices.push_back(std::move(device));
  }
  return devices;
}

std::unique_ptr<DiscoverySource> make_arp_source(const OuiDatabase& oui, std::string table_path) {
  return std::make_unique<ArpSource>(oui, std::move(table_path));
}

}  // namespace netmon_agent::discovery
