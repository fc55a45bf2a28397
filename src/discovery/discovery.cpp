#include "discovery/discovery.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>
#include <utility>

#include "core/log.hpp"
#include "core/worker_pool.hpp"
#include "discovery/merge.hpp"
#include "net/cidr.hpp"
#include "net/ping.hpp"

namespace netmon_agent::discovery {
namespace {

std::vector<model::DiscoveredDevice> run_source(DiscoverySource* source, const std::string& cidr,
                                                std::chrono::milliseconds timeout) {
  if (source == nullptr) {
    return {};
  }
  try {
    return source->discover(cidr, timeout);
  } catch (const std::exception& ex) {
    core::log_warn("discovery", std::string(source->name()) + " failed: " + ex.what());
    return {};
  }
}

std::vector<model::DiscoveredDevice> filter_to_cidr(std::vector<model::DiscoveredDevice> devices,
                                                    const std::string& cidr) {
  devices.erase(std::remove_if(devices.begin(), devices.end(),
                               [&cidr](const model::DiscoveredDevice& device) {
                                 return !net::is_in_cidr(device.ip_address, cidr);
                               }),
                devices.end());
  return devices;
}

}  // namespace

DiscoveryEngine::DiscoveryEngine(DiscoveryOptions options, net::Pinger& pinger, DiscoverySources sources,
                                 LocalityClassifier is_local)
    : options_(options), pinger_(pinger), sources_(std::move(sources)), is_local_(std::move(is_local)) {}

std::vector<model::DiscoveredDevice> DiscoveryEngine::discover(const std::string& cidr) {
  net::parse_cidr(cidr);

  if (is_local_(cidr)) {
    core::log_info("discovery", "segment " + cidr + " is local; using ARP + mDNS + SSDP");
    return discover_local(cidr);
  }

  core::log_info("discovery", "segment " + cidr + " is remote; using ping sweep");
  return ping_sweep(cidr);
}

std::vector<model::DiscoveredDevice> DiscoveryEngine::discover_local(const std::string& cidr) {
  const net::Ipv4Network network = net::parse_cidr(cidr);
  const std::string broadcast = net::format_ipv4(network.broadcast());
  core::log_debug("discovery", "pinging broadcast address " + broadcast);
  pinger_.ping_broadcast(broadcast);
  if (options_.arp_settle_delay.count() > 0) {
    std::this_thread::sleep_for(options_.arp_settle_delay);
  }

  const auto timeout = options_.multicast_timeout;
  auto arp_future = std::async(std::launch::async, run_source, sources_.arp.get(), cidr, timeout);
  auto mdns_future = std::async(std::launch::async, run_source, sources_.mdns.get(), cidr, timeout);
  auto ssdp_future = std::async(std::launch::async, run_source, sources_.ssdp.get(), cidr, timeout);

  auto arp_devices = arp_future.get();
  auto mdns_devices = mdns_future.get();
  auto ssdp_devices = ssdp_future.get();
  core::log_info("discovery", "results: ARP " + std::to_string(arp_devices.size()) + ", mDNS " +
                                  std::to_string(mdns_devices.size()) + ", SSDP " +
                                  std::to_string(ssdp_devices.size()));

  const std::size_t mdns_total = mdns_devices.size();
  const std::size_t ssdp_total = ssdp_devices.size();
  mdns_devices = filter_to_cidr(std::move(mdns_devices), cidr);
  ssdp_devices = filter_to_cidr(std::move(ssdp_devices), cidr);
  if (mdns_devices.size() != mdns_total || ssdp_devices.size() != ssdp_total) {
    core::log_info("discovery", "after CIDR filter: mDNS " + std::to_string(mdns_devices.size()) + ", SSDP " +
                                    std::to_string(ssdp_devices.size()));
  }

  return merge_devices({arp_devices, mdns_devices, ssdp_devices});
}

std::vector<model::DiscoveredDevice> DiscoveryEngine::ping_sweep(const std::string& cidr) {
  const std::size_t host_count = net::cidr_host_count(cidr);
  if (host_count > options_.max_sweep_addresses) {
    throw std::invalid_argument("segment " + cidr + " too large for a ping sweep (" + std::to_string(host_count) +
                                " addresses)");
  }

  const auto addresses = net::expand_cidr(cidr);
  core::log_info("discovery", "ping sweep starting for " + cidr + " (" + std::to_string(addresses.size()) +
                                  " IPs, concurrency " + std::to_string(options_.ping_concurrency) + ")");

  const auto alive = core::map_bounded(addresses, options_.ping_concurrency, [this](const std::string& ip) {
    return pinger_.ping(ip, options_.ping_timeout).alive ? 1 : 0;
  });

  std::vector<model::DiscoveredDevice> devices;
  for (std::size_t i = 0; i < addresses.size(); ++i) {
    if (alive[i] == 0) {
      continue;
    }
    model::DiscoveredDevice device{};
    device.ip_address = addresses[i];
    device.discovery_method = model::DiscoveryMethod::ping;
    devices.push_back(std::move(device));
  }

  core::log_info("discovery", "ping sweep complete: " + std::to_string(devices.size()) + "/" +
                                  std::to_string(addresses.size()) + " hosts responded");
  return devices;
}

}  // namespace netmon_agent::discovery
