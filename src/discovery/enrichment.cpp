#include "discovery/enrichment.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "core/log.hpp"
#include "core/worker_pool.hpp"
#include "discovery/os_detect.hpp"
#include "net/banner.hpp"
#include "net/ping.hpp"
#include "net/snmp.hpp"
#include "net/tcp.hpp"

namespace netmon_agent::discovery {

EnrichmentPipeline::EnrichmentPipeline(EnrichmentCapabilities capabilities, EnrichmentOptions options)
    : capabilities_(capabilities), options_(std::move(options)) {}

void EnrichmentPipeline::enrich(std::vector<model::DiscoveredDevice>& devices) {
  if (devices.empty()) {
    return;
  }

  core::log_info("enrich", "enriching " + std::to_string(devices.size()) + " devices (ports=" +
                               (options_.port_scan ? "true" : "false") + ", snmp=" + (options_.snmp ? "true" : "false") +
                               ")");

  const std::size_t batch_size = std::max<std::size_t>(1, options_.batch_size);
  for (std::size_t begin = 0; begin < devices.size(); begin += batch_size) {
    const std::size_t end = std::min(devices.size(), begin + batch_size);
    std::vector<model::DiscoveredDevice*> batch;
    for (std::size_t i = begin; i < end; ++i) {
      batch.push_back(&devices[i]);
    }

    core::run_bounded(batch, batch_size, [this](model::DiscoveredDevice* device) {
      try {
        enrich_device(*device);
      } catch (const std::exception& ex) {
        core::log_debug("enrich", "enrichment error for " + device->ip_address + ": " + ex.what());
      }
    });
  }

  core::log_info("enrich", "enrichment complete for " + std::to_string(devices.size()) + " devices");
}

void EnrichmentPipeline::enrich_device(model::DiscoveredDevice& device) {
  const std::string& ip = device.ip_address;

  if (options_.port_scan) {
    const auto open_ports = scan_ports(capabilities_.tcp, ip, options_.port_scan_options);
    if (!open_ports.empty()) {
      add_port_services(device, open_ports);
    }
  }

  const OsGuess guess = detect_os(capabilities_.pinger, ip, device.open_ports, device.services);
  device.os_hints.insert(guess.os_hints.begin(), guess.os_hints.end());
  if (guess.device_type != model::DeviceType::unknown) {
    device.device_type = guess.device_type;
  }

  if (options_.snmp) {
    const auto info = capabilities_.snmp.query_system(ip, options_.snmp_community, options_.snmp_timeout);
    if (info.has_value()) {
      device.snmp_info = info;
      if (!device.hostname.has_value() && info->sys_name.has_value() && !info->sys_name->empty()) {
        device.hostname = info->sys_name;
      }
    }
  }
}

void EnrichmentPipeline::add_port_services(model::DiscoveredDevice& device,
                                           const std::vector<std::uint16_t>& open_ports) {
  for (const auto port : open_ports) {
    device.open_ports.insert(port);
    if (const auto name = port_service_name(port)) {
      device.services.insert(*name);
    }
  }

  const auto banners = core::map_bounded(open_ports, options_.banner_concurrency, [&](const std::uint16_t port) {
    const auto raw = capabilities_.banners.grab(device.ip_address, port, options_.banner_timeout);
    if (!raw.has_value()) {
      return std::optional<std::string>{};
    }
    const std::string line = net::first_banner_line(*raw);
    core::log_debug("banner", device.ip_address + ":" + std::to_string(port) + ": " + line.substr(0, 80));
    return net::identify_service(line, port);
  });

  for (const auto& service : banners) {
    if (service.has_value()) {
      device.services.insert(*service);
    }
  }
}

}  // namespace netmon_agent::discovery
