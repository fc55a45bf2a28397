#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "api/controller.hpp"
#include "api/http_controller.hpp"
#include "api/realtime_channel.hpp"
#include "core/agent.hpp"
#include "core/backoff.hpp"
#include "core/command_processor.hpp"
#include "core/config.hpp"
#include "core/device_table.hpp"
#include "core/log.hpp"
#include "core/segment_table.hpp"
#include "core/version.hpp"
#include "discovery/discovery.hpp"
#include "discovery/enrichment.hpp"
#include "monitor/probe_cascade.hpp"
#include "net/banner.hpp"
#include "net/dns_resolver.hpp"
#include "net/http_client.hpp"
#include "net/ping.hpp"
#include "net/snmp.hpp"
#include "net/tcp.hpp"
#include "net/tls_inspector.hpp"
#include "sinks/ui_sink.hpp"
#include "upgrade/upgrade_trigger.hpp"

namespace api = netmon_agent::api;
namespace core = netmon_agent::core;
namespace discovery = netmon_agent::discovery;
namespace model = netmon_agent::model;
namespace monitor = netmon_agent::monitor;
namespace net = netmon_agent::net;
namespace sinks = netmon_agent::sinks;
namespace upgrade = netmon_agent::upgrade;

using nlohmann::json;

namespace {

struct RedisMockState {
  std::mutex mutex{};
  int connect_calls{0};
  std::string last_host{};
  int last_port{0};
  std::vector<std::string> commands{};
  int get_reply_calls{0};
  std::string pending_payload{};
};

RedisMockState g_redis_mock{};

redisReply* make_string_reply(const std::string& value) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_STRING;
  reply->str = strdup(value.c_str());
  reply->len = value.size();
  return reply;
}

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char* ip, int port, const struct timeval) {
  {
    std::lock_guard<std::mutex> lock(g_redis_mock.mutex);
    g_redis_mock.connect_calls += 1;
    g_redis_mock.last_host = ip;
    g_redis_mock.last_port = port;
  }
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  context->fd = -1;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  std::va_list args;
  va_start(args, format);
  const char* argument = va_arg(args, const char*);
  va_end(args);

  std::string command(format);
  const auto placeholder = command.find("%s");
  if (placeholder != std::string::npos) {
    command.replace(placeholder, 2, argument != nullptr ? argument : "");
  }
  {
    std::lock_guard<std::mutex> lock(g_redis_mock.mutex);
    g_redis_mock.commands.push_back(command);
  }

  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

int redisGetReply(redisContext* c, void** reply) {
  std::string payload;
  {
    std::lock_guard<std::mutex> lock(g_redis_mock.mutex);
    g_redis_mock.get_reply_calls += 1;
    payload = std::move(g_redis_mock.pending_payload);
    g_redis_mock.pending_payload.clear();
  }
  if (payload.empty()) {
    c->err = REDIS_ERR_EOF;
    std::strncpy(c->errstr, "Server closed the connection", sizeof(c->errstr) - 1);
    return REDIS_ERR;
  }

  auto* message = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  message->type = REDIS_REPLY_ARRAY;
  message->elements = 3;
  message->element = static_cast<redisReply**>(std::calloc(3, sizeof(redisReply*)));
  message->element[0] = make_string_reply("message");
  message->element[1] = make_string_reply("agent_commands:agent-1");
  message->element[2] = make_string_reply(payload);
  *reply = message;
  return REDIS_OK;
}

void freeReplyObject(void* raw) {
  auto* reply = static_cast<redisReply*>(raw);
  if (reply == nullptr) {
    return;
  }
  if (reply->element != nullptr) {
    for (std::size_t i = 0; i < reply->elements; ++i) {
      freeReplyObject(reply->element[i]);
    }
    std::free(reply->element);
  }
  std::free(reply->str);
  std::free(reply);
}

}  // extern "C"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const char* file_name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / file_name;
  std::ofstream out(path);
  out << content;
  return path;
}

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

model::NetworkSegment make_segment(const std::string& id, const std::string& cidr,
                                   model::SegmentType type = model::SegmentType::local_scan) {
  model::NetworkSegment segment{};
  segment.id = id;
  segment.name = "segment " + id;
  segment.cidr = cidr;
  segment.segment_type = type;
  return segment;
}

model::AgentCommand make_command(const std::string& id, const std::string& type, json payload = json::object()) {
  model::AgentCommand command{};
  command.id = id;
  command.command_type = type;
  command.payload = std::move(payload);
  return command;
}

class FakeController final : public api::ControllerApi {
 public:
  api::HeartbeatResponse heartbeat(const api::HeartbeatRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex);
    heartbeats.push_back(request);
    if (heartbeat_fails) {
      throw api::ControllerError("POST /heartbeat: HTTP 503", 503);
    }
    return heartbeat_response;
  }

  api::DiscoveryUploadResult upload_discovered_devices(const std::string& segment_id,
                                                       const std::vector<model::DiscoveredDevice>& devices) override {
    std::lock_guard<std::mutex> lock(mutex);
    discovered_uploads.emplace_back(segment_id, devices);
    return api::DiscoveryUploadResult{static_cast<std::int64_t>(devices.size()), 0, 0};
  }

  std::vector<model::DeviceToMonitor> devices_to_monitor() override {
    std::lock_guard<std::mutex> lock(mutex);
    if (monitored_fails) {
      throw api::ControllerError("GET /devices: HTTP 500", 500);
    }
    return monitored;
  }

  api::StatusUploadResult upload_status_reports(const std::vector<model::StatusReport>& reports) override {
    std::lock_guard<std::mutex> lock(mutex);
    status_uploads.push_back(reports);
    return api::StatusUploadResult{static_cast<std::int64_t>(reports.size()), {}};
  }

  model::NetworkSegment register_auto_segment(const api::AutoSegmentRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex);
    auto_requests.push_back(request);
    model::NetworkSegment segment = make_segment("auto-1", request.cidr);
    segment.name = request.name;
    return segment;
  }

  void acknowledge_command(const std::string& command_id, const model::CommandAck& ack) override {
    std::lock_guard<std::mutex> lock(mutex);
    acks.emplace_back(command_id, ack);
    if (ack_fails) {
      throw api::ControllerError("POST /commands/ack: HTTP 502", 502);
    }
  }

  api::PongResult send_pong(const std::optional<std::string>& command_id) override {
    std::lock_guard<std::mutex> lock(mutex);
    pongs.push_back(command_id);
    return api::PongResult{12.5};
  }

  std::size_t ack_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return acks.size();
  }

  std::mutex mutex{};
  api::HeartbeatResponse heartbeat_response{};
  bool heartbeat_fails{false};
  std::vector<model::DeviceToMonitor> monitored{};
  bool monitored_fails{false};
  bool ack_fails{false};
  std::vector<api::HeartbeatRequest> heartbeats{};
  std::vector<std::pair<std::string, std::vector<model::DiscoveredDevice>>> discovered_uploads{};
  std::vector<std::vector<model::StatusReport>> status_uploads{};
  std::vector<api::AutoSegmentRequest> auto_requests{};
  std::vector<std::pair<std::string, model::CommandAck>> acks{};
  std::vector<std::optional<std::string>> pongs{};
};

class FakeHost final : public core::CommandHost {
 public:
  core::ScanSummary scan_all_now() override {
    if (scan_throws) {
      throw std::runtime_error("discovery socket closed");
    }
    ++scans;
    return core::ScanSummary{1, 3};
  }

  core::SegmentScanResult scan_segment(const std::string& segment_id) override {
    scanned_segments.push_back(segment_id);
    return segment_result;
  }

  void request_restart() override { ++restarts; }

  void settings_changed(const core::RuntimeSettingsValues& values) override {
    ++settings_updates;
    last_values = values;
  }

  bool scan_throws{false};
  std::atomic<int> scans{0};
  core::SegmentScanResult segment_result{core::SegmentScanStatus::scanned, 4};
  std::vector<std::string> scanned_segments{};
  int restarts{0};
  int settings_updates{0};
  core::RuntimeSettingsValues last_values{};
};

class FakeUpgrader final : public upgrade::UpgradeTrigger {
 public:
  upgrade::UpgradeResult perform_upgrade(const std::string& target_version, const std::string& download_url) override {
    calls.emplace_back(target_version, download_url);
    return upgrade::UpgradeResult{true, "upgrade handed off"};
  }

  std::vector<std::pair<std::string, std::string>> calls{};
};

class FakePinger final : public net::Pinger {
 public:
  net::PingResult ping(const std::string& host, std::chrono::seconds) override {
    net::PingResult result{};
    if (host == "10.0.0.1" && alive.load()) {
      result.alive = true;
      result.time_ms = 1.5;
      result.ttl = 64;
    } else {
      result.error = "timeout";
    }
    return result;
  }

  void ping_broadcast(const std::string&) override {}

  std::atomic<bool> alive{true};
};

class FakeTcp final : public net::TcpConnector {
 public:
  net::TcpResult connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds) override {
    net::TcpResult result{};
    if (host == "10.0.0.1" && port == 22 && ssh_open.load()) {
      result.open = true;
      result.response_time_ms = 3.0;
    } else {
      result.error = "connection refused";
    }
    return result;
  }

  std::atomic<bool> ssh_open{true};
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

class NoSnmp final : public net::SnmpClient {
 public:
  std::optional<model::SnmpInfo> query_system(const std::string&, const std::string&, std::chrono::milliseconds) override {
    return std::nullopt;
  }
};

class NoHttp final : public net::HttpClient {
 public:
  net::HttpResponse send(const net::HttpRequest&) override {
    net::HttpResponse response{};
    response.transport_error = "unreachable";
    return response;
  }
};

class NoDns final : public net::DnsResolver {
 public:
  net::DnsLookupResult resolve_a(const std::string&, std::chrono::milliseconds) override {
    return net::DnsLookupResult{{}, std::string("no answer")};
  }
};

class NoTls final : public net::TlsInspector {
 public:
  net::TlsInspectResult inspect(const std::string&, std::uint16_t, std::chrono::milliseconds) override {
    net::TlsInspectResult result{};
    result.error = "handshake failed";
    return result;
  }
};

class EmptySource final : public discovery::DiscoverySource {
 public:
  const char* name() const noexcept override { return "empty"; }
  std::vector<model::DiscoveredDevice> discover(const std::string&, std::chrono::milliseconds) override { return {}; }
};

// Everything an Agent needs, wired to fakes. Segments are classified remote,
// so discovery runs a ping sweep.
struct AgentHarness {
  AgentHarness()
      : engine(discovery::DiscoveryOptions{}, pinger, make_sources(), [](const std::string&) { return false; }),
        enrichment(discovery::EnrichmentCapabilities{tcp, banners, pinger, snmp}, discovery::EnrichmentOptions{}),
        probes(pinger, tcp),
        ui(sinks::make_null_ui_sink()) {}

  static discovery::DiscoverySources make_sources() {
    discovery::DiscoverySources sources{};
    sources.arp = std::make_unique<EmptySource>();
    sources.mdns = std::make_unique<EmptySource>();
    sources.ssdp = std::make_unique<EmptySource>();
    return sources;
  }

  static core::AgentConfig make_config() {
    core::AgentConfig config{};
    config.controller.url = "https://ctl.example.com";
    config.controller.api_key = "test-key";
    config.realtime.enabled = false;
    config.status_failure_threshold = 2;
    return config;
  }

  core::AgentServices services() {
    return core::AgentServices{
        controller,
        engine,
        enrichment,
        probes,
        monitor::CheckBackends{pinger, tcp, http, dns, tls},
        upgrader,
        *ui,
        detect,
    };
  }

  FakeController controller{};
  FakePinger pinger{};
  FakeTcp tcp{};
  FakeBanners banners{};
  NoSnmp snmp{};
  NoHttp http{};
  NoDns dns{};
  NoTls tls{};
  FakeUpgrader upgrader{};
  discovery::DiscoveryEngine engine;
  discovery::EnrichmentPipeline enrichment;
  monitor::ProbeCascade probes;
  std::unique_ptr<sinks::UiSink> ui;
  std::function<std::optional<net::LocalNetwork>()> detect{};
};

int test_config_parsing_and_validation() {
  const auto good = write_config("netmon_agent_good.yaml",
                                 "# agent config\n"
                                 "controller:\n"
                                 "  url: \"https://ctl.example.com/\"\n"
                                 "  api_key: vp_acme_abcdefghijklmnopqrstuvwx\n"
                                 "  request_timeout_s: 15\n"
                                 "heartbeat_interval_s: 30\n"
                                 "status_check:\n"
                                 "  interval_s: 10\n"
                                 "  failure_threshold: 3\n"
                                 "scan:\n"
                                 "  auto_register: false\n"
                                 "  ping_concurrency: 20\n"
                                 "  snmp_community: private  # read-only\n"
                                 "realtime:\n"
                                 "  enabled: no\n"
                                 "upgrade:\n"
                                 "  enabled: yes\n"
                                 "  on_minor: false\n"
                                 "log:\n"
                                 "  level: debug\n");

  core::AgentConfig config{};
  try {
    config = core::load_agent_config(good.string());
  } catch (const std::exception& e) {
    std::filesystem::remove(good);
    std::cerr << e.what() << '\n';
    return fail("test_config_parsing_and_validation", "valid config should load");
  }
  std::filesystem::remove(good);

  if (config.controller.url != "https://ctl.example.com") {
    return fail("test_config_parsing_and_validation", "trailing slash should be stripped from controller url");
  }
  if (config.controller.request_timeout != std::chrono::seconds(15) || config.heartbeat_interval != std::chrono::seconds(30) ||
      config.status_check_interval != std::chrono::seconds(10) || config.status_failure_threshold != 3) {
    return fail("test_config_parsing_and_validation", "interval settings parsed incorrectly");
  }
  if (config.scan.auto_register || config.scan.ping_concurrency != 20 || config.scan.snmp_community != "private") {
    return fail("test_config_parsing_and_validation", "scan section parsed incorrectly");
  }
  if (config.realtime.enabled || !config.upgrade.enabled || config.upgrade.on_minor ||
      config.log_level != core::LogLevel::debug) {
    return fail("test_config_parsing_and_validation", "boolean or log settings parsed incorrectly");
  }

  const std::vector<std::pair<const char*, std::string>> invalid = {
      {"netmon_agent_unknown_key.yaml", "controller:\n  url: https://x\n  api_key: k\n  proxy: none\n"},
      {"netmon_agent_short_heartbeat.yaml", "controller:\n  url: https://x\n  api_key: k\nheartbeat_interval_s: 5\n"},
      {"netmon_agent_bad_interval.yaml", "controller:\n  url: https://x\n  api_key: k\nstatus_check:\n  interval_s: 10s\n"},
      {"netmon_agent_bad_scheme.yaml", "controller:\n  url: ftp://x\n  api_key: k\n"},
      {"netmon_agent_missing_key.yaml", "controller:\n  url: https://x\n"},
      {"netmon_agent_bad_api_key.yaml", "controller:\n  url: https://x\n  api_key: vp_acme_short\n"},
      {"netmon_agent_bad_level.yaml", "controller:\n  url: https://x\n  api_key: k\nlog:\n  level: verbose\n"},
  };
  for (const auto& [file_name, content] : invalid) {
    const auto path = write_config(file_name, content);
    bool threw = false;
    try {
      (void)core::load_agent_config(path.string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    std::filesystem::remove(path);
    if (!threw) {
      std::cerr << "accepted " << file_name << '\n';
      return fail("test_config_parsing_and_validation", "invalid config should be rejected");
    }
  }

  bool missing_threw = false;
  try {
    (void)core::load_agent_config("/nonexistent/netmon-agent.yaml");
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_parsing_and_validation", "missing config file should throw");
  }

  if (!core::is_valid_api_key("legacy-key") || !core::is_valid_api_key("vp_org1_ABCDEFGHIJKLMNOPQRST") ||
      core::is_valid_api_key("vp_org1_ABCDEFGHIJKLMNOPQRS") || core::is_valid_api_key("vp__ABCDEFGHIJKLMNOPQRSTUV")) {
    return fail("test_config_parsing_and_validation", "api key format check is wrong");
  }

  return 0;
}

int test_version_gating() {
  if (core::compare_versions("1.2.0", "1.10.0") >= 0 || core::compare_versions("v2.0", "2.0.0") != 0 ||
      core::compare_versions("1.0.1", "1.0.0") <= 0) {
    return fail("test_version_gating", "version comparison is wrong");
  }
  if (!core::should_auto_upgrade("1.0.1", "1.0.0", false)) {
    return fail("test_version_gating", "patch upgrades should always be allowed");
  }
  if (core::should_auto_upgrade("1.1.0", "1.0.0", false) || !core::should_auto_upgrade("1.1.0", "1.0.0", true)) {
    return fail("test_version_gating", "minor upgrades should follow allow_minor");
  }
  if (core::should_auto_upgrade("2.0.0", "1.9.9", true)) {
    return fail("test_version_gating", "major upgrades should be blocked");
  }
  if (core::should_auto_upgrade("1.0.0", "1.0.0", true) || core::should_auto_upgrade("0.9.0", "1.0.0", true)) {
    return fail("test_version_gating", "same or older versions should not upgrade");
  }
  return 0;
}

int test_segment_lease_exclusivity() {
  core::SegmentTable table{};
  const auto diff = table.apply_assignment({make_segment("a", "10.0.0.0/24"), make_segment("b", "10.0.1.0/24")});
  if (diff.added.size() != 2 || !diff.updated.empty() || !diff.removed.empty()) {
    return fail("test_segment_lease_exclusivity", "initial assignment diff is wrong");
  }

  auto lease = table.try_acquire("a");
  if (!lease.has_value() || !table.is_scanning("a")) {
    return fail("test_segment_lease_exclusivity", "first acquire should succeed");
  }
  if (table.try_acquire("a").has_value()) {
    return fail("test_segment_lease_exclusivity", "second acquire should be refused while scanning");
  }
  if (table.try_acquire("missing").has_value()) {
    return fail("test_segment_lease_exclusivity", "unknown segment should not be acquired");
  }

  model::NetworkSegment renamed = make_segment("a", "10.0.0.0/24");
  renamed.name = "renamed";
  const auto second = table.apply_assignment({renamed});
  if (second.updated.size() != 1 || second.removed.size() != 1 || second.removed.front() != "b") {
    return fail("test_segment_lease_exclusivity", "update/remove diff is wrong");
  }
  if (!table.is_scanning("a")) {
    return fail("test_segment_lease_exclusivity", "reassignment should not clear an in-flight scan");
  }

  lease.reset();
  if (table.is_scanning("a")) {
    return fail("test_segment_lease_exclusivity", "dropping the lease should clear scanning");
  }

  try {
    auto scoped = table.try_acquire("a");
    if (!scoped.has_value()) {
      return fail("test_segment_lease_exclusivity", "acquire after release should succeed");
    }
    throw std::runtime_error("scan failed");
  } catch (const std::runtime_error&) {
  }
  if (table.is_scanning("a")) {
    return fail("test_segment_lease_exclusivity", "lease should release on exception");
  }

  return 0;
}

int test_segment_scan_cadence() {
  core::SegmentTable table{};
  model::NetworkSegment scheduled = make_segment("s", "10.1.0.0/24");
  scheduled.scan_interval_seconds = 60;
  model::NetworkSegment automatic = make_segment("auto", "10.2.0.0/24");
  automatic.is_auto_registered = true;
  automatic.scan_interval_seconds = 5;
  table.apply_assignment({scheduled});
  table.upsert(automatic);
  table.set_auto_registered_interval(std::chrono::seconds(120));

  const auto t0 = core::SegmentTable::Clock::now();
  if (!table.try_acquire_due("s", t0).has_value()) {
    return fail("test_segment_scan_cadence", "never-scanned segment should be due");
  }
  if (table.try_acquire_due("s", t0 + std::chrono::seconds(59)).has_value()) {
    return fail("test_segment_scan_cadence", "segment should not be due before its interval");
  }
  if (!table.try_acquire_due("s", t0 + std::chrono::seconds(60)).has_value()) {
    return fail("test_segment_scan_cadence", "segment should be due after its interval");
  }

  if (table.scan_interval(automatic) != std::chrono::seconds(120)) {
    return fail("test_segment_scan_cadence", "auto-registered segments should use the auto scan interval");
  }
  if (!table.try_acquire_due("auto", t0).has_value() ||
      table.try_acquire_due("auto", t0 + std::chrono::seconds(60)).has_value()) {
    return fail("test_segment_scan_cadence", "auto-registered cadence is wrong");
  }

  // The controller echoes the registered segment back without the local flag.
  model::NetworkSegment echoed = automatic;
  echoed.is_auto_registered = false;
  table.apply_assignment({scheduled, echoed});
  const auto stored = table.find("auto");
  if (!stored.has_value() || !stored->is_auto_registered) {
    return fail("test_segment_scan_cadence", "echoed segment should stay auto-registered");
  }
  if (table.try_acquire_due("auto", t0 + std::chrono::seconds(60)).has_value() ||
      !table.try_acquire_due("auto", t0 + std::chrono::seconds(120)).has_value()) {
    return fail("test_segment_scan_cadence", "echoed segment should keep the auto scan interval");
  }
  return 0;
}

int test_device_table_merge() {
  core::DeviceTable table{};
  model::DiscoveredDevice device{};
  device.ip_address = "192.168.1.20";
  device.hostname = "nas";
  device.mac_address = "aa:bb:cc:dd:ee:ff";
  table.merge_discovered({device});

  if (!table.update_status("192.168.1.20", model::DeviceStatus::online, 4.0, std::string("2024-05-01T12:00:00.000Z"))) {
    return fail("test_device_table_merge", "known device status should update");
  }
  if (table.update_status("192.168.1.99", model::DeviceStatus::online, std::nullopt, std::nullopt)) {
    return fail("test_device_table_merge", "unknown device should not be created by a status update");
  }

  device.hostname = "nas-renamed";
  table.merge_discovered({device});
  const auto merged = table.find("192.168.1.20");
  if (!merged.has_value() || merged->name != "nas-renamed" || merged->status != model::DeviceStatus::online ||
      merged->response_time_ms != 4.0 || !merged->last_check.has_value()) {
    return fail("test_device_table_merge", "rescan should refresh identity and keep status");
  }
  if (table.count_in("192.168.1.0/24") != 1 || table.count_in("10.0.0.0/8") != 0 || table.count_in("garbage") != 0) {
    return fail("test_device_table_merge", "count_in is wrong");
  }
  return 0;
}

struct ProcessorHarness {
  ProcessorHarness(bool upgrade_enabled = true, bool on_minor = true)
      : ui(sinks::make_null_ui_sink()),
        processor(controller, host, settings, upgrader, *ui,
                  core::CommandProcessorOptions{upgrade_enabled, on_minor, "1.2.0"}) {}

  FakeController controller{};
  FakeHost host{};
  core::RuntimeSettings settings{};
  FakeUpgrader upgrader{};
  std::unique_ptr<sinks::UiSink> ui;
  core::CommandProcessor processor;
};

int test_command_acknowledged_once() {
  ProcessorHarness harness{};

  auto ack = harness.processor.execute(make_command("c1", "scan_now"), true);
  if (!ack.success || harness.controller.ack_count() != 1 || harness.host.scans.load() != 1) {
    return fail("test_command_acknowledged_once", "scan_now should run and ack once");
  }

  harness.host.scan_throws = true;
  ack = harness.processor.execute(make_command("c2", "scan_now"), true);
  if (ack.success || ack.error != "discovery socket closed" || harness.controller.ack_count() != 2) {
    return fail("test_command_acknowledged_once", "throwing command should ack failure exactly once");
  }

  ack = harness.processor.execute(make_command("c3", "reticulate"), true);
  if (ack.success || ack.error != "Unknown command: reticulate" || harness.controller.ack_count() != 3) {
    return fail("test_command_acknowledged_once", "unknown command should ack failure");
  }

  ack = harness.processor.execute(make_command("c4", "ping"), true);
  if (!ack.success || harness.controller.ack_count() != 3 || harness.controller.pongs.size() != 1 ||
      harness.controller.pongs.front() != std::optional<std::string>("c4")) {
    return fail("test_command_acknowledged_once", "ping should be acknowledged through the pong call only");
  }

  harness.controller.ack_fails = true;
  ack = harness.processor.execute(make_command("c5", "update_config", json{{"logLevel", "warn"}}), true);
  if (!ack.success || harness.controller.ack_count() != 4) {
    return fail("test_command_acknowledged_once", "ack delivery failure should not escape");
  }
  harness.controller.ack_fails = false;
  core::set_log_level(core::LogLevel::error);

  ack = harness.processor.execute(make_command("c6", "restart"), true);
  if (!ack.success || harness.host.restarts != 1 || harness.controller.ack_count() != 5 ||
      !ack.result.has_value() || ack.result->value("restarting", false) != true) {
    return fail("test_command_acknowledged_once", "restart should ack and then request a restart");
  }

  ack = harness.processor.execute(make_command("local-1", "scan_now"), false);
  if (!ack.success || harness.controller.ack_count() != 5) {
    return fail("test_command_acknowledged_once", "local commands should not be acknowledged");
  }

  return 0;
}

int test_scan_segment_messages() {
  ProcessorHarness harness{};

  auto ack = harness.processor.execute(make_command("s1", "scan_segment"), true);
  if (ack.success || ack.error != "segment_id required") {
    return fail("test_scan_segment_messages", "missing segment_id should fail");
  }

  harness.host.segment_result = core::SegmentScanResult{core::SegmentScanStatus::not_found, 0};
  ack = harness.processor.execute(make_command("s2", "scan_segment", json{{"segment_id", "seg-9"}}), true);
  if (ack.success || ack.error != "Segment not found") {
    return fail("test_scan_segment_messages", "unknown segment should fail");
  }

  harness.host.segment_result = core::SegmentScanResult{core::SegmentScanStatus::busy, 0};
  ack = harness.processor.execute(make_command("s3", "scan_segment", json{{"segment_id", "seg-1"}}), true);
  if (ack.success || ack.error != "Segment already scanning") {
    return fail("test_scan_segment_messages", "busy segment should fail");
  }

  harness.host.segment_result = core::SegmentScanResult{core::SegmentScanStatus::scanned, 4};
  ack = harness.processor.execute(make_command("s4", "scan_segment", json{{"segment_id", "seg-1"}}), true);
  if (!ack.success || !ack.result.has_value() || ack.result->value("devices_found", 0) != 4 ||
      ack.result->value("segment_id", std::string()) != "seg-1") {
    return fail("test_scan_segment_messages", "scanned segment should report devices found");
  }
  if (harness.controller.ack_count() != 4) {
    return fail("test_scan_segment_messages", "every scan_segment should ack once");
  }
  return 0;
}

int test_upgrade_policy_messages() {
  {
    ProcessorHarness harness{};
    const auto ack = harness.processor.execute(make_command("u1", "upgrade", json{{"target_version", "1.2.1"}}), true);
    if (ack.success || ack.error != "target_version and download_url required") {
      return fail("test_upgrade_policy_messages", "missing download_url should fail");
    }
  }

  const json patch{{"target_version", "1.2.1"}, {"download_url", "https://dl.example.com/agent-1.2.1"}};
  const json major{{"target_version", "2.0.0"}, {"download_url", "https://dl.example.com/agent-2.0.0"}};

  {
    ProcessorHarness harness{false};
    const auto ack = harness.processor.execute(make_command("u2", "upgrade", patch), true);
    if (!ack.success || ack.result->value("message", std::string()) != "Auto-upgrade disabled - manual upgrade required" ||
        !harness.upgrader.calls.empty()) {
      return fail("test_upgrade_policy_messages", "disabled upgrades should not run");
    }
  }

  {
    ProcessorHarness harness{};
    const auto ack = harness.processor.execute(make_command("u3", "upgrade", major), true);
    if (!ack.success || ack.result->value("message", std::string()) != "Upgrade blocked by policy (major version change)" ||
        !harness.upgrader.calls.empty()) {
      return fail("test_upgrade_policy_messages", "major upgrades should be blocked");
    }
  }

  {
    ProcessorHarness harness{true, false};
    const json minor{{"target_version", "1.3.0"}, {"download_url", "https://dl.example.com/agent-1.3.0"}};
    const auto ack = harness.processor.execute(make_command("u5", "upgrade", minor), true);
    if (!ack.success ||
        ack.result->value("message", std::string()) != "Upgrade blocked by policy (minor version change, upgrade.on_minor is off)" ||
        !harness.upgrader.calls.empty()) {
      return fail("test_upgrade_policy_messages", "blocked minor upgrade should name the on_minor setting");
    }
  }

  {
    ProcessorHarness harness{};
    const auto ack = harness.processor.execute(make_command("u4", "upgrade", patch), true);
    if (!ack.success || ack.result->value("message", std::string()) != "Upgrade starting..." ||
        ack.result->value("current_version", std::string()) != "1.2.0" || harness.upgrader.calls.size() != 1 ||
        harness.upgrader.calls.front().second != "https://dl.example.com/agent-1.2.1") {
      return fail("test_upgrade_policy_messages", "allowed upgrade should be handed to the trigger");
    }
    if (harness.controller.ack_count() != 1) {
      return fail("test_upgrade_policy_messages", "upgrade should ack exactly once");
    }
  }
  return 0;
}

int test_config_update_minimums() {
  ProcessorHarness harness{};
  const json result = harness.processor.apply_config_update(json{
      {"heartbeatInterval", 5},
      {"statusCheckInterval", 15},
      {"statusFailureThreshold", 0},
      {"autoScanInterval", 600},
      {"logLevel", "error"},
      {"enableAutoScan", "yes"},
      {"somethingElse", 1},
  });

  const json& applied = result.at("applied");
  if (applied.contains("heartbeatInterval") || applied.contains("enableAutoScan") || applied.contains("somethingElse")) {
    return fail("test_config_update_minimums", "invalid values should be skipped");
  }
  if (applied.value("statusCheckInterval", 0) != 15 || applied.value("statusFailureThreshold", -1) != 0 ||
      applied.value("autoScanInterval", 0) != 600 || applied.value("logLevel", std::string()) != "error") {
    return fail("test_config_update_minimums", "valid values should be reported as applied");
  }

  const core::RuntimeSettingsValues values = harness.settings.get();
  if (values.heartbeat_interval != std::chrono::seconds(60) || values.status_check_interval != std::chrono::seconds(15) ||
      values.status_failure_threshold != 0 || values.auto_scan_interval != std::chrono::seconds(600) || !values.auto_scan) {
    return fail("test_config_update_minimums", "runtime settings not updated correctly");
  }
  if (harness.host.settings_updates != 1 || harness.host.last_values.auto_scan_interval != std::chrono::seconds(600)) {
    return fail("test_config_update_minimums", "host should be told about the new settings");
  }

  core::set_log_level(core::LogLevel::error);
  return 0;
}

int test_command_dispatcher_dedup() {
  ProcessorHarness harness{};

  model::AgentCommand done = make_command("old", "scan_now");
  done.status = model::CommandStatus::completed;
  if (harness.processor.submit(done)) {
    return fail("test_command_dispatcher_dedup", "non-pending commands should be rejected");
  }
  if (!harness.processor.submit(make_command("c1", "scan_now")) || harness.processor.submit(make_command("c1", "scan_now"))) {
    return fail("test_command_dispatcher_dedup", "a queued command id should only be accepted once");
  }
  if (!harness.processor.submit_local("ping") || harness.processor.submit_local("restart")) {
    return fail("test_command_dispatcher_dedup", "only scan_now and ping are local commands");
  }

  std::thread dispatcher([&harness] { harness.processor.run(); });
  const bool drained = wait_until([&harness] { return harness.processor.in_flight() == 0; });
  if (drained && !harness.processor.submit(make_command("c1", "scan_now"))) {
    harness.processor.stop();
    dispatcher.join();
    return fail("test_command_dispatcher_dedup", "a finished command id may be submitted again");
  }
  const bool drained_again = wait_until([&harness] { return harness.processor.in_flight() == 0; });
  harness.processor.stop();
  dispatcher.join();

  if (!drained || !drained_again) {
    return fail("test_command_dispatcher_dedup", "dispatcher did not drain the queue");
  }
  if (harness.host.scans.load() != 2 || harness.controller.ack_count() != 2 || harness.controller.pongs.size() != 1 ||
      harness.controller.pongs.front().has_value()) {
    return fail("test_command_dispatcher_dedup", "dispatcher ran the wrong set of commands");
  }
  if (harness.processor.submit(make_command("c9", "scan_now"))) {
    return fail("test_command_dispatcher_dedup", "submit after stop should be rejected");
  }
  return 0;
}

int test_realtime_message_parsing() {
  const auto insert = api::parse_realtime_message(
      R"({"type":"INSERT","record":{"id":"c1","command_type":"scan_now","status":"pending","payload":{}}})");
  if (!insert.has_value() || insert->id != "c1" || insert->command_type != "scan_now") {
    return fail("test_realtime_message_parsing", "pending insert should yield a command");
  }
  if (api::parse_realtime_message(R"({"type":"INSERT","record":{"id":"c1","command_type":"ping","status":"completed"}})")) {
    return fail("test_realtime_message_parsing", "completed insert should be ignored");
  }
  if (!api::parse_realtime_message(
          R"({"type":"UPDATE","record":{"id":"c2","command_type":"ping","status":"pending"},"old_record":{"status":"failed"}})")) {
    return fail("test_realtime_message_parsing", "update into pending should yield a command");
  }
  if (api::parse_realtime_message(
          R"({"type":"UPDATE","record":{"id":"c2","command_type":"ping","status":"pending"},"old_record":{"status":"pending"}})")) {
    return fail("test_realtime_message_parsing", "pending to pending update should be ignored");
  }
  if (api::parse_realtime_message("not json") || api::parse_realtime_message(R"({"type":"DELETE","record":{}})") ||
      api::parse_realtime_message(R"({"type":"INSERT","record":{"status":"pending"}})")) {
    return fail("test_realtime_message_parsing", "malformed payloads should be ignored");
  }

  const auto full = api::parse_redis_url("redis://:s3cret@rt.example.com:6380/0");
  if (!full.has_value() || full->host != "rt.example.com" || full->port != 6380 || full->password != "s3cret") {
    return fail("test_realtime_message_parsing", "full redis url parsed incorrectly");
  }
  const auto bare = api::parse_redis_url("redis://localhost");
  if (!bare.has_value() || bare->port != 6379 || !bare->password.empty()) {
    return fail("test_realtime_message_parsing", "bare redis url parsed incorrectly");
  }
  if (api::parse_redis_url("https://project.supabase.co") || api::parse_redis_url("redis://host:99999") ||
      api::parse_redis_url("redis://")) {
    return fail("test_realtime_message_parsing", "unsupported urls should be rejected");
  }
  if (api::command_channel_name("agent-1") != "agent_commands:agent-1") {
    return fail("test_realtime_message_parsing", "channel name is wrong");
  }

  if (api::realtime_transport("https://project.supabase.co") != api::RealtimeTransport::supabase ||
      api::realtime_transport("redis://relay:6379") != api::RealtimeTransport::redis ||
      api::realtime_transport("ftp://project.supabase.co") != api::RealtimeTransport::unsupported ||
      api::realtime_transport("project.supabase.co") != api::RealtimeTransport::unsupported) {
    return fail("test_realtime_message_parsing", "transport selection by scheme is wrong");
  }
  const auto hosted = api::supabase_socket_endpoint("https://project.supabase.co/", "eyJ.a+b");
  if (!hosted.has_value() || !hosted->tls || hosted->host != "project.supabase.co" || hosted->port != "443" ||
      hosted->target != "/realtime/v1/websocket?apikey=eyJ.a%2Bb&vsn=1.0.0") {
    return fail("test_realtime_message_parsing", "hosted realtime endpoint is wrong");
  }
  const auto local = api::supabase_socket_endpoint("http://127.0.0.1:54321", "anon");
  if (!local.has_value() || local->tls || local->port != "54321" ||
      local->target != "/realtime/v1/websocket?apikey=anon&vsn=1.0.0") {
    return fail("test_realtime_message_parsing", "local realtime endpoint is wrong");
  }
  if (api::supabase_socket_endpoint("https://host:0", "k") || api::supabase_socket_endpoint("redis://host", "k")) {
    return fail("test_realtime_message_parsing", "bad realtime endpoints should be rejected");
  }

  const json join = json::parse(api::phoenix_join_message("agent-1", "anon", "1"));
  const json& changes = join["payload"]["config"]["postgres_changes"];
  if (join.value("topic", std::string()) != "realtime:agent-commands-agent-1" ||
      join.value("event", std::string()) != "phx_join" || join["payload"].value("access_token", std::string()) != "anon" ||
      changes.size() != 2 || changes[0].value("event", std::string()) != "INSERT" ||
      changes[1].value("event", std::string()) != "UPDATE" ||
      changes[1].value("table", std::string()) != "agent_commands" ||
      changes[1].value("filter", std::string()) != "agent_id=eq.agent-1") {
    return fail("test_realtime_message_parsing", "join message is wrong");
  }

  const std::string topic = api::command_topic("agent-1");
  using Kind = api::PhoenixEvent::Kind;
  if (api::parse_phoenix_frame(R"({"topic":"realtime:agent-commands-agent-1","event":"phx_reply","ref":"1","payload":{"status":"ok","response":{}}})",
                               topic, "1")
          .kind != Kind::joined) {
    return fail("test_realtime_message_parsing", "ok join reply should be recognised");
  }
  if (api::parse_phoenix_frame(R"({"topic":"realtime:agent-commands-agent-1","event":"phx_reply","ref":"1","payload":{"status":"error","response":{"reason":"unauthorized"}}})",
                               topic, "1")
          .kind != Kind::join_failed) {
    return fail("test_realtime_message_parsing", "rejected join should be reported");
  }
  const auto change = api::parse_phoenix_frame(
      R"({"topic":"realtime:agent-commands-agent-1","event":"postgres_changes","ref":null,"payload":{"ids":[7],"data":{"type":"INSERT","schema":"public","table":"agent_commands","record":{"id":"c7","command_type":"scan_now","status":"pending"}}}})",
      topic, "1");
  if (change.kind != Kind::command || !change.command.has_value() || change.command->id != "c7") {
    return fail("test_realtime_message_parsing", "pending insert change should yield a command");
  }
  if (api::parse_phoenix_frame(R"({"topic":"realtime:agent-commands-other","event":"postgres_changes","payload":{"data":{"type":"INSERT","record":{"id":"x","command_type":"ping","status":"pending"}}}})",
                               topic, "1")
          .kind != Kind::ignored) {
    return fail("test_realtime_message_parsing", "frames for other topics should be ignored");
  }
  const auto heartbeat =
      api::parse_phoenix_frame(R"({"topic":"phoenix","event":"phx_reply","ref":"4","payload":{"status":"ok"}})", topic, "1");
  if (heartbeat.kind != Kind::heartbeat_reply || heartbeat.detail != "4" ||
      api::parse_phoenix_frame(R"({"topic":"realtime:agent-commands-agent-1","event":"phx_close","payload":{}})", topic, "1")
              .kind != Kind::closed) {
    return fail("test_realtime_message_parsing", "heartbeat replies and channel close are misclassified");
  }
  return 0;
}

int test_realtime_channel_delivers_commands() {
  {
    std::lock_guard<std::mutex> lock(g_redis_mock.mutex);
    g_redis_mock.pending_payload =
        R"({"type":"INSERT","record":{"id":"rt-1","command_type":"scan_now","status":"pending"}})";
  }

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<model::AgentCommand> received;
  std::vector<bool> connection_changes;

  api::RealtimeHandlers handlers{};
  handlers.on_command = [&](model::AgentCommand command) {
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(std::move(command));
    cv.notify_all();
  };
  handlers.on_connection_change = [&](bool connected) {
    std::lock_guard<std::mutex> lock(mutex);
    connection_changes.push_back(connected);
    cv.notify_all();
  };

  api::RealtimeChannel channel(handlers, std::chrono::seconds(30));
  channel.update(api::RealtimeCredentials{"redis://:inline@rt.example.com:6380", ""}, "agent-1");
  if (!channel.running()) {
    return fail("test_realtime_channel_delivers_commands", "redis endpoint should start a subscriber");
  }

  bool delivered = false;
  {
    std::unique_lock<std::mutex> lock(mutex);
    delivered = cv.wait_for(lock, std::chrono::seconds(3), [&] { return !received.empty() && connection_changes.size() >= 2; });
  }
  // Same credentials and agent must not reconnect.
  channel.update(api::RealtimeCredentials{"redis://:inline@rt.example.com:6380", ""}, "agent-1");
  channel.stop();

  if (!delivered) {
    return fail("test_realtime_channel_delivers_commands", "command was not delivered");
  }
  if (received.front().id != "rt-1" || connection_changes.front() != true || connection_changes.back() != false) {
    return fail("test_realtime_channel_delivers_commands", "delivered command or connection events are wrong");
  }

  std::lock_guard<std::mutex> lock(g_redis_mock.mutex);
  if (g_redis_mock.connect_calls != 1 || g_redis_mock.last_host != "rt.example.com" || g_redis_mock.last_port != 6380) {
    return fail("test_realtime_channel_delivers_commands", "subscriber connected to the wrong endpoint");
  }
  if (g_redis_mock.commands.size() != 2 || g_redis_mock.commands[0] != "AUTH inline" ||
      g_redis_mock.commands[1] != "SUBSCRIBE agent_commands:agent-1") {
    return fail("test_realtime_channel_delivers_commands", "subscriber sent the wrong commands");
  }

  api::RealtimeChannel unsupported(api::RealtimeHandlers{});
  unsupported.update(api::RealtimeCredentials{"ftp://project.supabase.co", "anon"}, "agent-1");
  if (unsupported.running() || unsupported.transport() != api::RealtimeTransport::unsupported) {
    return fail("test_realtime_channel_delivers_commands", "unsupported endpoint should fall back to polling");
  }
  return 0;
}

// Plays the Realtime server for one client: answers the join and pushes one
// pending command change, then reads until the client goes away.
class RealtimeTestServer {
 public:
  RealtimeTestServer() : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { serve(); });
  }

  ~RealtimeTestServer() {
    if (!accepted_.load()) {
      // Unblocks accept when the client never came.
      boost::asio::io_context poke_io;
      tcp::socket poke(poke_io);
      boost::system::error_code ignored;
      poke.connect(acceptor_.local_endpoint(), ignored);
    }
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  [[nodiscard]] std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  // Valid after the client disconnected.
  void wait_done() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::string target{};
  json join{};

 private:
  using tcp = boost::asio::ip::tcp;

  void serve() {
    namespace beast = boost::beast;
    tcp::socket socket(io_);
    boost::system::error_code ec;
    acceptor_.accept(socket, ec);
    accepted_ = true;
    if (ec) {
      return;
    }

    beast::flat_buffer buffer;
    beast::http::request<beast::http::string_body> request;
    beast::http::read(socket, buffer, request, ec);
    if (ec) {
      return;
    }
    target = std::string(request.target());

    beast::websocket::stream<tcp::socket> ws(std::move(socket));
    ws.accept(request, ec);
    if (ec) {
      return;
    }
    beast::flat_buffer frame;
    ws.read(frame, ec);
    if (ec) {
      return;
    }
    join = json::parse(beast::buffers_to_string(frame.data()), nullptr, false);
    const std::string topic = join.is_object() ? join.value("topic", std::string()) : std::string();

    const json reply = {
        {"topic", topic},
        {"event", "phx_reply"},
        {"ref", join.is_object() ? join.value("ref", std::string()) : std::string()},
        {"payload", {{"status", "ok"}, {"response", {{"postgres_changes", json::array()}}}}},
    };
    const json record = {{"id", "rt-9"}, {"agent_id", "agent-1"}, {"command_type", "ping"}, {"status", "pending"}};
    const json change = {
        {"topic", topic},
        {"event", "postgres_changes"},
        {"ref", nullptr},
        {"payload", {{"ids", json::array({1})}, {"data", {{"type", "INSERT"}, {"table", "agent_commands"}, {"record", record}}}}},
    };
    ws.text(true);
    ws.write(boost::asio::buffer(reply.dump()), ec);
    ws.write(boost::asio::buffer(change.dump()), ec);

    while (!ec) {
      frame.consume(frame.size());
      ws.read(frame, ec);
    }
  }

  boost::asio::io_context io_{};
  tcp::acceptor acceptor_;
  unsigned short port_{0};
  std::atomic<bool> accepted_{false};
  std::thread thread_{};
};

int test_supabase_channel_delivers_commands() {
  RealtimeTestServer server;

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<model::AgentCommand> received;
  std::vector<bool> connection_changes;

  api::RealtimeHandlers handlers{};
  handlers.on_command = [&](model::AgentCommand command) {
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(std::move(command));
    cv.notify_all();
  };
  handlers.on_connection_change = [&](bool connected) {
    std::lock_guard<std::mutex> lock(mutex);
    connection_changes.push_back(connected);
    cv.notify_all();
  };

  api::RealtimeChannel channel(handlers, std::chrono::seconds(30));
  channel.update(api::RealtimeCredentials{server.url(), "anon-key"}, "agent-1");
  if (!channel.running() || channel.transport() != api::RealtimeTransport::supabase) {
    return fail("test_supabase_channel_delivers_commands", "project url should start a websocket subscriber");
  }

  bool delivered = false;
  {
    std::unique_lock<std::mutex> lock(mutex);
    delivered = cv.wait_for(lock, std::chrono::seconds(5), [&] { return !received.empty() && !connection_changes.empty(); });
  }
  channel.stop();
  server.wait_done();

  if (!delivered) {
    return fail("test_supabase_channel_delivers_commands", "command was not delivered");
  }
  if (received.size() != 1 || received.front().id != "rt-9" || received.front().command_type != "ping") {
    return fail("test_supabase_channel_delivers_commands", "delivered command is wrong");
  }
  if (connection_changes.front() != true || connection_changes.back() != false) {
    return fail("test_supabase_channel_delivers_commands", "connection should be reported up then down");
  }
  if (server.target != "/realtime/v1/websocket?apikey=anon-key&vsn=1.0.0") {
    return fail("test_supabase_channel_delivers_commands", "websocket request target is wrong");
  }
  if (!server.join.is_object() || server.join.value("event", std::string()) != "phx_join" ||
      server.join.value("topic", std::string()) != "realtime:agent-commands-agent-1" ||
      server.join["payload"].value("access_token", std::string()) != "anon-key") {
    return fail("test_supabase_channel_delivers_commands", "join message is wrong");
  }
  return 0;
}

class ScriptedHttp final : public net::HttpClient {
 public:
  net::HttpResponse send(const net::HttpRequest& request) override {
    requests.push_back(request);
    return next;
  }

  net::HttpResponse next{};
  std::vector<net::HttpRequest> requests{};
};

int test_http_controller_contract() {
  ScriptedHttp http{};
  api::ControllerOptions options{};
  options.base_url = "https://ctl.example.com";
  options.api_key = "vp_acme_abcdefghijklmnopqrstuvwx";
  auto controller = api::make_http_controller(options, http);

  http.next.status_code = 200;
  http.next.body = json{
      {"agent_id", "agent-1"},
      {"organization_id", "org-1"},
      {"segments", json::array({json{{"id", "seg-1"}, {"name", "Office"}, {"cidr", "10.0.0.0/24"},
                                     {"segment_type", "remote_monitor"}, {"scan_interval_seconds", 120}}})},
      {"supabase_url", "https://project.supabase.co"},
      {"supabase_anon_key", "anon"},
      {"latest_agent_version", "1.1.0"},
      {"upgrade_available", true},
      {"pending_commands", json::array({json{{"id", "c1"}, {"command_type", "ping"}, {"status", "pending"}}})},
  }.dump();

  api::HeartbeatRequest request{};
  request.version = "1.0.0";
  request.hostname = "edge-1";
  request.uptime_seconds = 42;
  const api::HeartbeatResponse response = controller->heartbeat(request);

  const net::HttpRequest& sent = http.requests.back();
  if (sent.method != net::HttpMethod::post || sent.url != "https://ctl.example.com/api/agent/heartbeat" ||
      sent.headers.at("Authorization") != "Bearer vp_acme_abcdefghijklmnopqrstuvwx") {
    return fail("test_http_controller_contract", "heartbeat request line or auth header is wrong");
  }
  const json sent_body = json::parse(sent.body);
  if (sent_body.value("hostname", std::string()) != "edge-1" || sent_body.value("uptime_seconds", 0) != 42) {
    return fail("test_http_controller_contract", "heartbeat body is wrong");
  }
  if (response.agent_id != "agent-1" || response.segments.size() != 1 ||
      response.segments.front().segment_type != model::SegmentType::remote_monitor ||
      response.segments.front().scan_interval_seconds != 120) {
    return fail("test_http_controller_contract", "heartbeat segments decoded incorrectly");
  }
  if (response.realtime_url != std::optional<std::string>("https://project.supabase.co") ||
      response.realtime_key != std::optional<std::string>("anon") || !response.upgrade_available ||
      response.pending_commands.size() != 1 || response.pending_commands.front().command_type != "ping") {
    return fail("test_http_controller_contract", "heartbeat extras decoded incorrectly");
  }

  http.next.body = R"({"latency_ms": 8.5})";
  const auto pong = controller->send_pong(std::string("c1"));
  if (pong.latency_ms != 8.5 || http.requests.back().url != "https://ctl.example.com/api/agent/ping" ||
      json::parse(http.requests.back().body).value("command_id", std::string()) != "c1") {
    return fail("test_http_controller_contract", "pong request or latency is wrong");
  }

  http.next.body = R"({"ok": true})";
  controller->acknowledge_command("c1", model::CommandAck{false, std::nullopt, std::string("Segment not found")});
  if (http.requests.back().url != "https://ctl.example.com/api/agent/commands/c1/ack") {
    return fail("test_http_controller_contract", "ack url is wrong");
  }

  http.next.status_code = 500;
  http.next.body = R"({"error":"boom"})";
  try {
    (void)controller->devices_to_monitor();
    return fail("test_http_controller_contract", "HTTP 500 should throw");
  } catch (const api::ControllerError& e) {
    if (e.status_code() != 500) {
      return fail("test_http_controller_contract", "status code should be carried on the error");
    }
  }

  http.next.status_code = 200;
  http.next.body = "[]";
  try {
    (void)controller->heartbeat(request);
    return fail("test_http_controller_contract", "non-object body should throw");
  } catch (const api::ControllerError&) {
  }

  http.next.body = R"({"items": []})";
  try {
    (void)controller->devices_to_monitor();
    return fail("test_http_controller_contract", "missing devices array should throw");
  } catch (const api::ControllerError&) {
  }

  http.next.body.clear();
  http.next.transport_error = "Couldn't connect to server";
  try {
    (void)controller->heartbeat(request);
    return fail("test_http_controller_contract", "transport error should throw");
  } catch (const api::ControllerError& e) {
    if (e.status_code() != 0) {
      return fail("test_http_controller_contract", "transport errors carry no status code");
    }
  }
  return 0;
}

int test_discovery_upload_with_latin1_strings() {
  ScriptedHttp http{};
  api::ControllerOptions options{};
  options.base_url = "https://ctl.example.com";
  options.api_key = "vp_acme_abcdefghijklmnopqrstuvwx";
  auto controller = api::make_http_controller(options, http);
  http.next.status_code = 200;
  http.next.body = R"({"created": 1, "updated": 0, "unchanged": 0})";

  model::DiscoveredDevice printer{};
  printer.ip_address = "10.0.0.7";
  printer.hostname = std::string("caf\xE9-printer");
  printer.snmp_info = model::SnmpInfo{std::string("caf\xE9"), std::string("Imprimante \xE0 jet"), std::nullopt, std::nullopt};

  api::DiscoveryUploadResult result{};
  try {
    result = controller->upload_discovered_devices("seg-1", {printer});
  } catch (const std::exception& e) {
    std::cerr << "  " << e.what() << '\n';
    return fail("test_discovery_upload_with_latin1_strings", "non UTF-8 device strings should not abort the upload");
  }
  if (result.created != 1 || http.requests.size() != 1) {
    return fail("test_discovery_upload_with_latin1_strings", "upload should reach the controller once");
  }

  const json sent = json::parse(http.requests.back().body, nullptr, false);
  if (sent.is_discarded() || sent["devices"].size() != 1) {
    return fail("test_discovery_upload_with_latin1_strings", "request body should be valid JSON");
  }
  const json& device = sent["devices"][0];
  if (device.value("hostname", std::string()) != "caf\xEF\xBF\xBD-printer" ||
      device.value("ip_address", std::string()) != "10.0.0.7") {
    return fail("test_discovery_upload_with_latin1_strings", "invalid bytes should be replaced, the rest kept");
  }
  return 0;
}

int test_scan_and_status_end_to_end() {
  AgentHarness harness{};
  harness.controller.heartbeat_response.agent_id = "agent-1";
  harness.controller.heartbeat_response.segments = {make_segment("seg-1", "10.0.0.0/30")};

  core::Agent agent(AgentHarness::make_config(), harness.services());

  if (!agent.heartbeat_once() || agent.segments().size() != 1 || agent.agent_id() != std::optional<std::string>("agent-1")) {
    return fail("test_scan_and_status_end_to_end", "heartbeat should assign the segment");
  }

  agent.scan_cycle(core::SegmentTable::Clock::now());
  if (harness.controller.discovered_uploads.size() != 1) {
    return fail("test_scan_and_status_end_to_end", "scan should upload once");
  }
  const auto& [segment_id, devices] = harness.controller.discovered_uploads.front();
  if (segment_id != "seg-1" || devices.size() != 1 || devices.front().ip_address != "10.0.0.1") {
    return fail("test_scan_and_status_end_to_end", "scan should find exactly 10.0.0.1");
  }
  const model::DiscoveredDevice& found = devices.front();
  if (found.open_ports != std::set<int>{22} || found.os_hints.count("Linux/Unix") == 0 ||
      found.discovery_method != model::DiscoveryMethod::ping || found.mac_address.has_value()) {
    return fail("test_scan_and_status_end_to_end", "enrichment results are wrong");
  }

  agent.scan_cycle(core::SegmentTable::Clock::now());
  if (harness.controller.discovered_uploads.size() != 1) {
    return fail("test_scan_and_status_end_to_end", "segment should not rescan before its interval");
  }

  model::DeviceToMonitor tracked{};
  tracked.id = "dev-1";
  tracked.ip_address = "10.0.0.1";
  harness.controller.monitored = {tracked};

  agent.status_cycle();
  if (harness.controller.status_uploads.size() != 1 ||
      harness.controller.status_uploads.back().front().status != model::DeviceStatus::online) {
    return fail("test_scan_and_status_end_to_end", "first status check should report online");
  }

  harness.pinger.alive = false;
  harness.tcp.ssh_open = false;
  agent.status_cycle();
  if (harness.controller.status_uploads.size() != 2) {
    return fail("test_scan_and_status_end_to_end", "second status check should upload");
  }
  const auto& reports = harness.controller.status_uploads.back();
  if (reports.size() != 1 || reports.front().device_id != std::optional<std::string>("dev-1") ||
      reports.front().status != model::DeviceStatus::online) {
    return fail("test_scan_and_status_end_to_end", "one failed probe should not flip the device offline");
  }
  const auto stored = agent.devices().find("10.0.0.1");
  if (!stored.has_value() || stored->status != model::DeviceStatus::online) {
    return fail("test_scan_and_status_end_to_end", "device table should keep the suppressed status");
  }

  harness.controller.monitored_fails = true;
  agent.status_cycle();
  if (harness.controller.status_uploads.size() != 2) {
    return fail("test_scan_and_status_end_to_end", "status upload should be skipped when tracked devices are unknown");
  }
  return 0;
}

int test_heartbeat_failures_and_commands() {
  AgentHarness harness{};
  core::Agent agent(AgentHarness::make_config(), harness.services());

  harness.controller.heartbeat_fails = true;
  if (agent.heartbeat_once()) {
    return fail("test_heartbeat_failures_and_commands", "failed heartbeat should report false");
  }

  harness.controller.heartbeat_fails = false;
  harness.controller.heartbeat_response.agent_id = "agent-1";
  harness.controller.heartbeat_response.pending_commands = {make_command("c1", "scan_now"), make_command("c1", "scan_now")};
  if (!agent.heartbeat_once() || agent.commands().in_flight() != 1) {
    return fail("test_heartbeat_failures_and_commands", "pending commands should be queued once");
  }

  const auto missing = agent.scan_segment("nope");
  if (missing.status != core::SegmentScanStatus::not_found) {
    return fail("test_heartbeat_failures_and_commands", "unknown segment should be reported");
  }
  return 0;
}

int test_heartbeat_backoff_sequence() {
  using std::chrono::seconds;
  const core::AgentTimings timings{};
  core::RetryBackoff backoff(timings.heartbeat_retry_base, timings.heartbeat_retry_cap);

  const std::vector<seconds> expected{seconds(2), seconds(4), seconds(8), seconds(16), seconds(32), seconds(60), seconds(60)};
  for (const auto want : expected) {
    if (backoff.on_failure() != want) {
      return fail("test_heartbeat_backoff_sequence", "failure delays should double from 2s and cap at 60s");
    }
  }

  backoff.on_success();
  if (backoff.on_failure() != seconds(2) || backoff.on_failure() != seconds(4)) {
    return fail("test_heartbeat_backoff_sequence", "a success should restart the sequence at 2s");
  }
  return 0;
}

int test_auto_register() {
  AgentHarness harness{};
  harness.detect = [] { return std::optional<net::LocalNetwork>(net::LocalNetwork{"eth0", "192.168.5.10", "192.168.5.0/24"}); };
  core::Agent agent(AgentHarness::make_config(), harness.services());

  agent.auto_register();
  if (harness.controller.auto_requests.size() != 1 ||
      harness.controller.auto_requests.front().name != "Auto: eth0 (192.168.5.0/24)" ||
      harness.controller.auto_requests.front().interface_name != "eth0") {
    return fail("test_auto_register", "auto registration request is wrong");
  }
  const auto segments = agent.segments().segments();
  if (segments.size() != 1 || !segments.front().is_auto_registered || segments.front().cidr != "192.168.5.0/24") {
    return fail("test_auto_register", "auto-registered segment should be stored");
  }

  agent.auto_register();
  if (harness.controller.auto_requests.size() != 1) {
    return fail("test_auto_register", "agents with segments should not auto-register again");
  }

  AgentHarness disabled{};
  disabled.detect = harness.detect;
  core::AgentConfig config = AgentHarness::make_config();
  config.scan.auto_register = false;
  core::Agent quiet(config, disabled.services());
  quiet.auto_register();
  if (!disabled.controller.auto_requests.empty()) {
    return fail("test_auto_register", "auto-scan disabled should skip registration");
  }
  return 0;
}

int test_remote_cycle_uploads_checks() {
  AgentHarness harness{};
  harness.controller.heartbeat_response.agent_id = "agent-1";
  harness.controller.heartbeat_response.segments = {make_segment("remote-1", "203.0.113.0/24", model::SegmentType::remote_monitor)};
  core::AgentTimings timings{};
  core::Agent agent(AgentHarness::make_config(), harness.services(), timings);

  if (agent.remote_cycle(monitor::RemoteScheduler::Clock::now()) != timings.remote_idle_poll) {
    return fail("test_remote_cycle_uploads_checks", "no remote segments should idle");
  }
  (void)agent.heartbeat_once();

  model::DeviceToMonitor web{};
  web.id = "web-1";
  web.hostname = "10.0.0.1";
  web.network_segment_id = "remote-1";
  web.check_type = model::CheckType::tcp;
  web.port = 22;
  model::DeviceToMonitor elsewhere = web;
  elsewhere.id = "other";
  elsewhere.network_segment_id = "seg-x";
  harness.controller.monitored = {web, elsewhere};

  const auto now = monitor::RemoteScheduler::Clock::now();
  if (agent.remote_cycle(now) != timings.remote_poll) {
    return fail("test_remote_cycle_uploads_checks", "active remote monitoring should poll quickly");
  }
  if (harness.controller.status_uploads.size() != 1 || harness.controller.status_uploads.front().size() != 1) {
    return fail("test_remote_cycle_uploads_checks", "one remote report expected");
  }
  const model::StatusReport& report = harness.controller.status_uploads.front().front();
  if (report.device_id != std::optional<std::string>("web-1") || report.check_type != model::CheckType::tcp ||
      report.status != model::DeviceStatus::online) {
    return fail("test_remote_cycle_uploads_checks", "remote tcp report is wrong");
  }

  (void)agent.remote_cycle(now + std::chrono::seconds(1));
  if (harness.controller.status_uploads.size() != 1) {
    return fail("test_remote_cycle_uploads_checks", "device should not be checked again before its interval");
  }
  return 0;
}

int test_restart_command_exits_with_restart_code() {
  AgentHarness harness{};
  harness.controller.heartbeat_response.agent_id = "agent-1";
  harness.controller.heartbeat_response.pending_commands = {make_command("r1", "restart")};

  core::AgentTimings timings{};
  timings.shutdown_grace = std::chrono::seconds(5);
  core::Agent agent(AgentHarness::make_config(), harness.services(), timings);

  core::ProcessSignals signals{};
  const core::AgentExit exit = agent.run(signals);
  if (exit.code != core::kRestartExitCode || !exit.clean) {
    return fail("test_restart_command_exits_with_restart_code", "restart should exit cleanly with the restart code");
  }

  std::lock_guard<std::mutex> lock(harness.controller.mutex);
  if (harness.controller.acks.size() != 1 || harness.controller.acks.front().first != "r1" ||
      !harness.controller.acks.front().second.success) {
    return fail("test_restart_command_exits_with_restart_code", "restart should be acknowledged before exiting");
  }
  return 0;
}

int test_shutdown_signal_stops_loops() {
  AgentHarness harness{};
  harness.controller.heartbeat_response.agent_id = "agent-1";
  core::AgentTimings timings{};
  timings.shutdown_grace = std::chrono::seconds(5);
  core::Agent agent(AgentHarness::make_config(), harness.services(), timings);

  core::ProcessSignals signals{};
  signals.shutdown = 1;
  const core::AgentExit exit = agent.run(signals);
  if (exit.code != 0 || !exit.clean || !agent.stopping()) {
    return fail("test_shutdown_signal_stops_loops", "shutdown signal should exit cleanly with code 0");
  }
  return 0;
}

}  // namespace

int main() {
  core::set_log_level(core::LogLevel::error);

  if (int rc = test_config_parsing_and_validation(); rc != 0) {
    return rc;
  }
  if (int rc = test_version_gating(); rc != 0) {
    return rc;
  }
  if (int rc = test_segment_lease_exclusivity(); rc != 0) {
    return rc;
  }
  if (int rc = test_segment_scan_cadence(); rc != 0) {
    return rc;
  }
  if (int rc = test_device_table_merge(); rc != 0) {
    return rc;
  }
  if (int rc = test_command_acknowledged_once(); rc != 0) {
    return rc;
  }
  if (int rc = test_scan_segment_messages(); rc != 0) {
    return rc;
  }
  if (int rc = test_upgrade_policy_messages(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_update_minimums(); rc != 0) {
    return rc;
  }
  if (int rc = test_command_dispatcher_dedup(); rc != 0) {
    return rc;
  }
  if (int rc = test_realtime_message_parsing(); rc != 0) {
    return rc;
  }
  if (int rc = test_realtime_channel_delivers_commands(); rc != 0) {
    return rc;
  }
  if (int rc = test_supabase_channel_delivers_commands(); rc != 0) {
    return rc;
  }
  if (int rc = test_http_controller_contract(); rc != 0) {
    return rc;
  }
  if (int rc = test_discovery_upload_with_latin1_strings(); rc != 0) {
    return rc;
  }
  if (int rc = test_scan_and_status_end_to_end(); rc != 0) {
    return rc;
  }
  if (int rc = test_heartbeat_failures_and_commands(); rc != 0) {
    return rc;
  }
  if (int rc = test_heartbeat_backoff_sequence(); rc != 0) {
    return rc;
  }
  if (int rc = test_auto_register(); rc != 0) {
    return rc;
  }
  if (int rc = test_remote_cycle_uploads_checks(); rc != 0) {
    return rc;
  }
  if (int rc = test_restart_command_exits_with_restart_code(); rc != 0) {
    return rc;
  }
  if (int rc = test_shutdown_signal_stops_loops(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] agent unit tests\n";
  return 0;
}
