#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/log.hpp"
#include "discovery/discovery.hpp"
#include "discovery/enrichment.hpp"
#include "discovery/merge.hpp"
#include "discovery/os_detect.hpp"
#include "discovery/oui.hpp"
#include "discovery/port_scan.hpp"
#include "discovery/source.hpp"
#include "net/banner.hpp"
#include "net/dns_message.hpp"
#include "net/ping.hpp"
#include "net/snmp.hpp"
#include "net/tcp.hpp"

namespace model = netmon_agent::model;
namespace net = netmon_agent::net;
using netmon_agent::discovery::DiscoveryEngine;
using netmon_agent::discovery::DiscoveryOptions;
using netmon_agent::discovery::DiscoverySource;
using netmon_agent::discovery::DiscoverySources;
using netmon_agent::discovery::EnrichmentCapabilities;
using netmon_agent::discovery::EnrichmentOptions;
using netmon_agent::discovery::EnrichmentPipeline;
using netmon_agent::discovery::MdnsCollector;
using netmon_agent::discovery::OuiDatabase;
using netmon_agent::discovery::classify_os;
using netmon_agent::discovery::merge_devices;
using netmon_agent::discovery::parse_arp_table;
using netmon_agent::discovery::parse_ssdp_response;
using netmon_agent::discovery::parse_upnp_description;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

class FakePinger final : public net::Pinger {
 public:
  explicit FakePinger(std::map<std::string, int> alive_ttl) : alive_ttl_(std::move(alive_ttl)) {}

  net::PingResult ping(const std::string& host, std::chrono::seconds) override {
    calls_.fetch_add(1);
    const auto it = alive_ttl_.find(host);
    if (it == alive_ttl_.end()) {
      return net::PingResult{.error = std::string("timeout")};
    }
    return net::PingResult{.alive = true, .time_ms = 1.5, .ttl = it->second};
  }

  void ping_broadcast(const std::string& broadcast_address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    broadcasts_.push_back(broadcast_address);
  }

  [[nodiscard]] int calls() const { return calls_.load(); }
  [[nodiscard]] std::vector<std::string> broadcasts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return broadcasts_;
  }

 private:
  std::map<std::string, int> alive_ttl_;
  std::atomic<int> calls_{0};
  mutable std::mutex mutex_{};
  std::vector<std::string> broadcasts_{};
};

class FakeTcp final : public net::TcpConnector {
 public:
  explicit FakeTcp(std::set<std::string> open) : open_(std::move(open)) {}

  net::TcpResult connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds) override {
    if (open_.count(host + ":" + std::to_string(port)) != 0) {
      return net::TcpResult{.open = true, .response_time_ms = 2.0};
    }
    return net::TcpResult{.error = std::string("connection refused")};
  }

 private:
  std::set<std::string> open_;
};

class FakeBanners final : public net::BannerGrabber {
 public:
  std::optional<std::string> grab(const std::string&, std::uint16_t port, std::chrono::milliseconds) override {
    if (port == 22) {
      return std::string("SSH-2.0-OpenSSH_9.6\r\n");
    }
    return std::nullopt;
  }
};

class FakeSnmp final : public net::SnmpClient {
 public:
  std::optional<model::SnmpInfo> query_system(const std::string& ip, const std::string& community,
                                              std::chrono::milliseconds) override {
    if (ip == "10.0.0.3") {
      throw std::runtime_error("socket exploded");
    }
    if (community != "public") {
      return std::nullopt;
    }
    return model::SnmpInfo{.sys_name = std::string("core-switch"), .sys_descr = std::string("Cisco IOS")};
  }
};

class FixedSource final : public DiscoverySource {
 public:
  FixedSource(const char* name, std::vector<model::DiscoveredDevice> devices, bool throws = false)
      : name_(name), devices_(std::move(devices)), throws_(throws) {}

  [[nodiscard]] const char* name() const noexcept override { return name_; }

  std::vector<model::DiscoveredDevice> discover(const std::string&, std::chrono::milliseconds) override {
    if (throws_) {
      throw std::runtime_error("source failure");
    }
    return devices_;
  }

 private:
  const char* name_;
  std::vector<model::DiscoveredDevice> devices_;
  bool throws_;
};

model::DiscoveredDevice device(const char* ip, model::DiscoveryMethod method) {
  model::DiscoveredDevice d{};
  d.ip_address = ip;
  d.discovery_method = method;
  return d;
}

int test_merge_is_order_independent() {
  auto arp = device("192.168.1.20", model::DiscoveryMethod::arp);
  arp.mac_address = "AA:BB:CC:00:00:01";
  arp.manufacturer = "Acme";

  auto mdns = device("192.168.1.20", model::DiscoveryMethod::mdns);
  mdns.hostname = "printer";
  mdns.services = {"_ipp._tcp"};
  mdns.mac_address = "";

  auto ssdp = device("192.168.1.3", model::DiscoveryMethod::ssdp);
  ssdp.os_hints = {"Linux UPnP/1.0"};

  const auto forward = merge_devices({{arp}, {mdns}, {ssdp}});
  const auto reverse = merge_devices({{ssdp}, {mdns}, {arp}});

  if (forward.size() != 2 || reverse.size() != 2) {
    return fail("test_merge_is_order_independent", "duplicate IPs should collapse");
  }
  if (forward[0].ip_address != "192.168.1.3" || forward[1].ip_address != "192.168.1.20") {
    return fail("test_merge_is_order_independent", "result should be ordered by numeric IP");
  }
  for (const auto* merged : {&forward[1], &reverse[1]}) {
    if (merged->mac_address != std::optional<std::string>("AA:BB:CC:00:00:01")) {
      return fail("test_merge_is_order_independent", "empty MAC must not shadow a real one");
    }
    if (merged->hostname != std::optional<std::string>("printer") || merged->services.count("_ipp._tcp") == 0) {
      return fail("test_merge_is_order_independent", "mDNS fields should be folded in");
    }
    if (merged->discovery_method != model::DiscoveryMethod::arp) {
      return fail("test_merge_is_order_independent", "layer-2 method should win");
    }
  }
  return 0;
}

int test_arp_table_parsing() {
  OuiDatabase oui = OuiDatabase::parse(
      "OUI/MA-L            Organization\n"
      "00-1A-2B   (hex)\t\tAyecom Technology Co., Ltd.\n"
      "001A2B     (base 16)\t\tAyecom Technology Co., Ltd.\n");
  if (oui.size() != 1) {
    return fail("test_arp_table_parsing", "OUI registry should parse hex lines only");
  }

  const std::string table =
      "IP address       HW type     Flags       HW address            Mask     Device\n"
      "192.168.1.1      0x1         0x2         00:1a:2b:11:22:33     *        eth0\n"
      "192.168.1.9      0x1         0x0         00:00:00:00:00:00     *        eth0\n"
      "192.168.1.7      0x1         0x2         00:00:00:00:00:00     *        eth0\n"
      "10.9.9.9         0x1         0x2         de:ad:be:ef:00:01     *        eth1\n";
  const auto devices = parse_arp_table(table, "192.168.1.0/24", oui);
  if (devices.size() != 1) {
    return fail("test_arp_table_parsing", "incomplete and out-of-segment entries should be dropped");
  }
  if (devices[0].mac_address != std::optional<std::string>("00:1A:2B:11:22:33") ||
      devices[0].manufacturer != std::optional<std::string>("Ayecom Technology Co., Ltd.") ||
      devices[0].discovery_method != model::DiscoveryMethod::arp) {
    return fail("test_arp_table_parsing", "ARP entry fields mismatch");
  }
  return 0;
}

int test_mdns_and_ssdp_parsing() {
  net::dns::Message message{};
  message.flags = 0x8400;
  message.records.push_back(net::dns::ResourceRecord{.name = "nas.local", .type = net::dns::kTypeA, .data = "192.168.1.40"});
  message.records.push_back(
      net::dns::ResourceRecord{.name = "_smb._tcp.local", .type = net::dns::kTypePtr, .data = "nas._smb._tcp.local"});
  message.records.push_back(
      net::dns::ResourceRecord{.name = "nas._smb._tcp.local", .type = net::dns::kTypeSrv, .data = "nas.local", .port = 445});

  MdnsCollector collector;
  collector.add(message);
  const auto devices = collector.devices();
  if (devices.size() != 1 || devices[0].hostname != std::optional<std::string>("nas") ||
      devices[0].services.count("_smb._tcp") == 0 || devices[0].open_ports.count(445) == 0 ||
      devices[0].discovery_method != model::DiscoveryMethod::mdns) {
    return fail("test_mdns_and_ssdp_parsing", "mDNS answers should build one device");
  }

  const auto ssdp = parse_ssdp_response(
      "HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=1800\r\nlocation: http://192.168.1.1:49152/desc.xml\r\n"
      "Server: Linux/5.4 UPnP/1.0 MiniUPnPd/2.2\r\n\r\n");
  if (!ssdp.has_value() || ssdp->location != std::optional<std::string>("http://192.168.1.1:49152/desc.xml") ||
      ssdp->server != std::optional<std::string>("Linux/5.4 UPnP/1.0 MiniUPnPd/2.2")) {
    return fail("test_mdns_and_ssdp_parsing", "SSDP headers should match case-insensitively");
  }
  if (parse_ssdp_response("M-SEARCH * HTTP/1.1\r\n").has_value()) {
    return fail("test_mdns_and_ssdp_parsing", "search requests are not responses");
  }

  const auto upnp = parse_upnp_description(
      "<root><device><deviceType>urn:schemas-upnp-org:device:InternetGatewayDevice:1</deviceType>"
      "<friendlyName>Gateway</friendlyName><manufacturer>Netgear</manufacturer></device></root>");
  if (!upnp.has_value() || upnp->friendly_name != std::optional<std::string>("Gateway") ||
      upnp->manufacturer != std::optional<std::string>("Netgear")) {
    return fail("test_mdns_and_ssdp_parsing", "UPnP description fields mismatch");
  }
  if (parse_upnp_description("<root/>").has_value()) {
    return fail("test_mdns_and_ssdp_parsing", "empty description should yield nothing");
  }
  return 0;
}

int test_os_classification() {
  const auto windows = classify_os(128, {135, 445, 3389}, {});
  if (windows.device_type != model::DeviceType::workstation || windows.os_hints.empty() ||
      windows.os_hints.front() != "Windows") {
    return fail("test_os_classification", "TTL 128 with RDP should be a Windows workstation");
  }

  const auto printer = classify_os(64, {22, 9100}, {});
  if (printer.device_type != model::DeviceType::printer) {
    return fail("test_os_classification", "JetDirect port should mark a printer");
  }

  const auto router = classify_os(255, {}, {});
  if (router.device_type != model::DeviceType::network) {
    return fail("test_os_classification", "TTL 255 should be network equipment");
  }

  const auto database = classify_os(std::nullopt, {80, 5432}, {});
  if (database.device_type != model::DeviceType::server ||
      std::find(database.os_hints.begin(), database.os_hints.end(), "Database Server") == database.os_hints.end()) {
    return fail("test_os_classification", "web plus postgres should be a database server");
  }

  const auto unknown = classify_os(std::nullopt, {}, {});
  if (unknown.device_type != model::DeviceType::unknown || !unknown.os_hints.empty()) {
    return fail("test_os_classification", "no signals should produce no guess");
  }
  return 0;
}

int test_enrichment_isolates_failures() {
  FakePinger pinger({{"10.0.0.2", 64}, {"10.0.0.3", 64}});
  FakeTcp tcp({"10.0.0.2:22", "10.0.0.2:80"});
  FakeBanners banners;
  FakeSnmp snmp;

  EnrichmentOptions options{};
  options.port_scan_options.timeout = std::chrono::milliseconds(10);
  EnrichmentPipeline pipeline(EnrichmentCapabilities{tcp, banners, pinger, snmp}, options);

  std::vector<model::DiscoveredDevice> devices = {
      device("10.0.0.2", model::DiscoveryMethod::ping),
      device("10.0.0.3", model::DiscoveryMethod::ping),
  };
  pipeline.enrich(devices);

  const auto& host = devices[0];
  if (host.open_ports != std::set<int>{22, 80}) {
    return fail("test_enrichment_isolates_failures", "open ports should come from the port scan");
  }
  if (host.services.count("ssh") == 0 || host.services.count("http") == 0) {
    return fail("test_enrichment_isolates_failures", "port and banner services should be recorded");
  }
  if (host.device_type != model::DeviceType::server || host.os_hints.count("Linux/Unix") == 0) {
    return fail("test_enrichment_isolates_failures", "TTL 64 should classify as Linux server");
  }
  if (!host.snmp_info.has_value() || host.hostname != std::optional<std::string>("core-switch")) {
    return fail("test_enrichment_isolates_failures", "sysName should fill a missing hostname");
  }

  const auto& broken = devices[1];
  if (broken.snmp_info.has_value() || broken.hostname.has_value()) {
    return fail("test_enrichment_isolates_failures", "failed SNMP should leave fields absent");
  }
  if (broken.ip_address != "10.0.0.3") {
    return fail("test_enrichment_isolates_failures", "failed device must stay in the list");
  }
  return 0;
}

int test_remote_segment_uses_ping_sweep() {
  FakePinger pinger({{"10.0.0.1", 64}});
  DiscoverySources sources{};
  sources.arp = std::make_unique<FixedSource>("arp", std::vector<model::DiscoveredDevice>{});
  DiscoveryOptions options{};
  options.arp_settle_delay = std::chrono::milliseconds(0);
  DiscoveryEngine engine(options, pinger, std::move(sources), [](const std::string&) { return false; });

  const auto devices = engine.discover("10.0.0.0/30");
  if (pinger.calls() != 2) {
    return fail("test_remote_segment_uses_ping_sweep", "a /30 sweep should ping exactly two hosts");
  }
  if (devices.size() != 1 || devices[0].ip_address != "10.0.0.1" ||
      devices[0].discovery_method != model::DiscoveryMethod::ping || devices[0].mac_address.has_value()) {
    return fail("test_remote_segment_uses_ping_sweep", "sweep result should hold the live host only");
  }
  if (!pinger.broadcasts().empty()) {
    return fail("test_remote_segment_uses_ping_sweep", "remote sweep must not broadcast");
  }

  try {
    (void)engine.discover("10.0.0.0/33");
    return fail("test_remote_segment_uses_ping_sweep", "malformed CIDR should be rejected");
  } catch (const std::invalid_argument&) {
  }
  try {
    (void)engine.discover("10.0.0.0/8");
    return fail("test_remote_segment_uses_ping_sweep", "oversized sweep should be refused");
  } catch (const std::invalid_argument&) {
  }
  return 0;
}

int test_local_segment_merges_sources() {
  FakePinger pinger({});

  auto arp_device = device("192.168.1.20", model::DiscoveryMethod::arp);
  arp_device.mac_address = "AA:BB:CC:00:00:01";
  auto mdns_device = device("192.168.1.20", model::DiscoveryMethod::mdns);
  mdns_device.hostname = "printer";
  auto stray = device("172.16.0.5", model::DiscoveryMethod::ssdp);

  DiscoverySources sources{};
  sources.arp = std::make_unique<FixedSource>("arp", std::vector<model::DiscoveredDevice>{arp_device});
  sources.mdns = std::make_unique<FixedSource>("mdns", std::vector<model::DiscoveredDevice>{mdns_device});
  sources.ssdp = std::make_unique<FixedSource>("ssdp", std::vector<model::DiscoveredDevice>{stray}, true);

  DiscoveryOptions options{};
  options.arp_settle_delay = std::chrono::milliseconds(0);
  DiscoveryEngine engine(options, pinger, std::move(sources), [](const std::string&) { return true; });

  const auto devices = engine.discover("192.168.1.0/24");
  if (pinger.calls() != 0) {
    return fail("test_local_segment_merges_sources", "local discovery must not ping sweep");
  }
  const auto broadcasts = pinger.broadcasts();
  if (broadcasts.size() != 1 || broadcasts[0] != "192.168.1.255") {
    return fail("test_local_segment_merges_sources", "broadcast warm-up should target the segment broadcast");
  }
  if (devices.size() != 1 || devices[0].hostname != std::optional<std::string>("printer") ||
      devices[0].mac_address != std::optional<std::string>("AA:BB:CC:00:00:01")) {
    return fail("test_local_segment_merges_sources", "ARP and mDNS results should merge, failed SSDP ignored");
  }
  return 0;
}

}  // namespace

int main() {
  netmon_agent::core::set_log_level(netmon_agent::core::LogLevel::error);

  if (int rc = test_merge_is_order_independent(); rc != 0) {
    return rc;
  }
  if (int rc = test_arp_table_parsing(); rc != 0) {
    return rc;
  }
  if (int rc = test_mdns_and_ssdp_parsing(); rc != 0) {
    return rc;
  }
  if (int rc = test_os_classification(); rc != 0) {
    return rc;
  }
  if (int rc = test_enrichment_isolates_failures(); rc != 0) {
    return rc;
  }
  if (int rc = test_remote_segment_uses_ping_sweep(); rc != 0) {
    return rc;
  }
  if (int rc = test_local_segment_merges_sources(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] discovery unit tests\n";
  return 0;
}
