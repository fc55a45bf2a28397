#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "discovery/port_scan.hpp"
#include "model/device.hpp"

namespace netmon_agent::net {
class BannerGrabber;
class Pinger;
class SnmpClient;
class TcpConnector;
}  // namespace netmon_agent::net

namespace netmon_agent::discovery {

struct EnrichmentOptions {
  bool port_scan{true};
  bool snmp{true};
  std::size_t batch_size{5};
  std::size_t banner_concurrency{5};
  std::chrono::milliseconds banner_timeout{3000};
  std::string snmp_community{"public"};
  std::chrono::milliseconds snmp_timeout{3000};
  PortScanOptions port_scan_options{};
};

struct EnrichmentCapabilities {
  net::TcpConnector& tcp;
  net::BannerGrabber& banners;
  net::Pinger& pinger;
  net::SnmpClient& snmp;
};

// Best-effort augmentation of merged devices: port scan, banner grab, OS
// heuristic and SNMP system group. Batches run one after another; devices in a
// batch run concurrently. A failure on one device leaves its fields absent.
class EnrichmentPipeline {
 public:
  EnrichmentPipeline(EnrichmentCapabilities capabilities, EnrichmentOptions options);

  void enrich(std::vector<model::DiscoveredDevice>& devices);

  // Throws whatever a capability throws; enrich() isolates those failures.
  void enrich_device(model::DiscoveredDevice& device);

  [[nodiscard]] const EnrichmentOptions& options() const noexcept { return options_; }

 private:
  void add_port_services(model::DiscoveredDevice& device, const std::vector<std::uint16_t>& open_ports);

  EnrichmentCapabilities capabilities_;
  EnrichmentOptions options_;
};

}  // namespace netmon_agent::discovery
