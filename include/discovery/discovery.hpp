#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "discovery/source.hpp"
#include "model/device.hpp"

namespace netmon_agent::net {
class Pinger;
}

namespace netmon_agent::discovery {

struct DiscoveryOptions {
  std::size_t ping_concurrency{50};
  std::chrono::seconds ping_timeout{5};
  std::chrono::milliseconds arp_settle_delay{2000};
  std::chrono::milliseconds multicast_timeout{5000};
  // Remote sweeps larger than this are refused.
  std::size_t max_sweep_addresses{65536};
};

struct DiscoverySources {
  std::unique_ptr<DiscoverySource> arp{};
  std::unique_ptr<DiscoverySource> mdns{};
  std::unique_ptr<DiscoverySource> ssdp{};
};

using LocalityClassifier = std::function<bool(const std::string& cidr)>;

// Chooses a strategy per segment and returns the merged, not yet enriched, device list.
class DiscoveryEngine {
 public:
  DiscoveryEngine(DiscoveryOptions options, net::Pinger& pinger, DiscoverySources sources,
                  LocalityClassifier is_local);

  std::vector<model::DiscoveredDevice> discover(const std::string& cidr);

  // Broadcast echo, settle delay, then ARP + mDNS + SSDP concurrently.
  std::vector<model::DiscoveredDevice> discover_local(const std::string& cidr);

  // One echo per usable address on a bounded pool. MAC and manufacturer stay absent.
  std::vector<model::DiscoveredDevice> ping_sweep(const std::string& cidr);

 private:
  DiscoveryOptions options_;
  net::Pinger& pinger_;
  DiscoverySources sources_;
  LocalityClassifier is_local_;
};

}  // namespace netmon_agent::discovery
