#include "core/agent.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <unistd.h>

#include "api/controller.hpp"
#include "api/realtime_channel.hpp"
#include "core/backoff.hpp"
#include "core/log.hpp"
#include "core/timestamp.hpp"
#include "core/version.hpp"
#include "core/worker_pool.hpp"
#include "discovery/discovery.hpp"
#include "discovery/enrichment.hpp"
#include "monitor/probe_cascade.hpp"
#include "net/cidr.hpp"
#include "sinks/ui_sink.hpp"
#include "upgrade/upgrade_trigger.hpp"

namespace netmon_agent::core {
namespace {

std::string local_hostname() {
  char buffer[256]{};
  if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

// Clears the UI scanning indicator on every exit path of a scan.
class ScanningIndicator {
 public:
  ScanningIndicator(sinks::UiSink& ui, std::string segment_id) : ui_(ui), segment_id_(std::move(segment_id)) {
    ui_.update_segment_scanning(segment_id_, true);
  }
  ~ScanningIndicator() { ui_.update_segment_scanning(segment_id_, false); }

  ScanningIndicator(const ScanningIndicator&) = delete;
  ScanningIndicator& operator=(const ScanningIndicator&) = delete;

 private:
  sinks::UiSink& ui_;
  std::string segment_id_;
};

}  // namespace

Agent::Agent(AgentConfig config, AgentServices services, AgentTimings timings)
    : config_(std::move(config)),
      services_(std::move(services)),
      timings_(timings),
      settings_(RuntimeSettingsValues{config_.heartbeat_interval, config_.status_check_interval,
                                      config_.status_failure_threshold, config_.scan.auto_register,
                                      config_.scan.auto_scan_interval, config_.log_level}),
      hysteresis_(config_.status_failure_threshold),
      commands_(services_.controller, *this, settings_, services_.upgrader, services_.ui,
                CommandProcessorOptions{config_.upgrade.enabled, config_.upgrade.on_minor, kAgentVersion}) {
  hostname_ = local_hostname();
  segments_.set_auto_registered_interval(config_.scan.auto_scan_interval);

  if (config_.realtime.enabled) {
    api::RealtimeHandlers handlers{};
    handlers.on_command = [this](model::AgentCommand command) {
      services_.ui.add_log(LogLevel::info, "Realtime command: " + command.command_type);
      commands_.submit(std::move(command));
    };
    handlers.on_connection_change = [this](const bool connected) {
      services_.ui.add_log(connected ? LogLevel::info : LogLevel::warn,
                           connected ? "Realtime connected" : "Realtime disconnected");
    };
    realtime_ = std::make_unique<api::RealtimeChannel>(std::move(handlers));
  } else {
    log_info("agent", "realtime command channel disabled; relying on heartbeat polling");
  }
}

Agent::~Agent() {
  request_shutdown(exit_code_.load());
  commands_.stop();
  if (realtime_ != nullptr) {
    realtime_->stop();
  }
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

AgentExit Agent::run(ProcessSignals& signals) {
  log_info("agent", "starting agent loops");

  spawn("dispatcher", [this] { commands_.run(); });
  spawn("heartbeat", [this] { heartbeat_loop(); });
  spawn("scan", [this] { scan_loop(); });
  spawn("status", [this] { status_loop(); });
  spawn("remote", [this] { remote_loop(); });
  spawn("auto-register", [this] {
    if (sleep_for(timings_.auto_register_delay)) {
      auto_register();
    }
  });

  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (!stopping_) {
      state_cv_.wait_for(lock, std::chrono::milliseconds(200));
      if (signals.shutdown != 0 && !stopping_) {
        log_info("agent", "shutdown signal received");
        stopping_ = true;
        break;
      }
      if (signals.scan_now != 0) {
        signals.scan_now = 0;
        lock.unlock();
        commands_.submit_local("scan_now");
        lock.lock();
      }
      if (signals.ping != 0) {
        signals.ping = 0;
        lock.unlock();
        commands_.submit_local("ping");
        lock.lock();
      }
    }
  }
  state_cv_.notify_all();

  log_info("agent", "shutting down");
  commands_.stop();
  if (realtime_ != nullptr) {
    realtime_->stop();
  }

  bool finished = false;
  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    finished = state_cv_.wait_for(lock, timings_.shutdown_grace, [this] { return running_loops_ == 0; });
  }
  if (!finished) {
    log_warn("agent", "abandoning in-flight probes after shutdown grace period");
    return AgentExit{exit_code_.load(), false};
  }

  for (auto& thread : threads_) {
    thread.join();
  }
  threads_.clear();
  return AgentExit{exit_code_.load(), true};
}

void Agent::request_shutdown(const int exit_code) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!stopping_) {
      stopping_ = true;
      exit_code_.store(exit_code);
    }
  }
  state_cv_.notify_all();
}

bool Agent::stopping() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stopping_;
}

std::optional<std::string> Agent::agent_id() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return agent_id_;
}

void Agent::spawn(const char* name, std::function<void()> body) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++running_loops_;
  }
  threads_.emplace_back([this, name, body = std::move(body)]() {
    try {
      body();
    } catch (const std::exception& e) {
      log_error("agent", std::string(name) + " loop failed: " + e.what());
      request_shutdown(kFatalExitCode);
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      --running_loops_;
    }
    state_cv_.notify_all();
  });
}

bool Agent::sleep_for(const std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return !state_cv_.wait_for(lock, duration, [this] { return stopping_; });
}

void Agent::heartbeat_loop() {
  RetryBackoff backoff(timings_.heartbeat_retry_base, timings_.heartbeat_retry_cap);
  while (!stopping()) {
    std::chrono::milliseconds delay{};
    if (heartbeat_once()) {
      backoff.on_success();
      delay = std::min(settings_.get().heartbeat_interval, timings_.heartbeat_interval_ceiling);
    } else {
      delay = backoff.on_failure();
    }
    if (!sleep_for(delay)) {
      break;
    }
  }
}

bool Agent::heartbeat_once() {
  api::HeartbeatResponse response{};
  try {
    api::HeartbeatRequest request{};
    request.version = kAgentVersion;
    request.hostname = hostname_;
    request.uptime_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count();
    response = services_.controller.heartbeat(request);
  } catch (const std::runtime_error& e) {
    log_warn("heartbeat", std::string("heartbeat failed: ") + e.what());
    services_.ui.update_connection(false, std::nullopt, std::nullopt);
    services_.ui.add_log(LogLevel::warn, std::string("Heartbeat failed: ") + e.what());
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    agent_id_ = response.agent_id;
    organization_id_ = response.organization_id;
  }
  log_debug("heartbeat", "heartbeat ok, agent " + response.agent_id + ", org " + response.organization_id);

  const SegmentDiff diff = segments_.apply_assignment(response.segments);
  for (const auto& id : diff.removed) {
    log_info("heartbeat", "segment removed: " + id);
  }
  for (const auto& segment : diff.added) {
    log_info("heartbeat", "segment added: " + segment.name + " (" + segment.cidr + ")");
  }

  services_.ui.update_connection(true, response.agent_id, response.organization_id);
  publish_segments();
  services_.ui.add_log(LogLevel::info, "Heartbeat OK - " + std::to_string(response.segments.size()) + " segment(s)");

  if (response.upgrade_available && response.latest_agent_version.has_value()) {
    log_info("heartbeat", std::string("upgrade available: ") + kAgentVersion + " -> " + *response.latest_agent_version);
    services_.ui.update_version_info(response.latest_agent_version, true);
  } else {
    services_.ui.update_version_info(std::nullopt, false);
  }

  if (!response.pending_commands.empty()) {
    log_info("heartbeat", "received " + std::to_string(response.pending_commands.size()) + " pending command(s)");
    for (auto& command : response.pending_commands) {
      commands_.submit(std::move(command));
    }
  }

  update_realtime(response.realtime_url, response.realtime_key, response.agent_id);
  return true;
}

void Agent::update_realtime(const std::optional<std::string>& url, const std::optional<std::string>& key,
                            const std::string& agent_id) {
  if (realtime_ == nullptr || agent_id.empty()) {
    return;
  }
  api::RealtimeCredentials credentials{};
  credentials.url = url.value_or(config_.realtime.url);
  credentials.key = key.value_or(config_.realtime.key);
  if (credentials.url.empty()) {
    log_debug("realtime", "no realtime credentials yet");
    return;
  }
  realtime_->update(credentials, agent_id);
}

void Agent::scan_loop() {
  while (!stopping()) {
    scan_cycle(SegmentTable::Clock::now());
    if (!sleep_for(timings_.scan_poll)) {
      break;
    }
  }
}

void Agent::scan_cycle(const SegmentTable::Clock::time_point now) {
  for (const auto& segment : segments_.segments_of_type(model::SegmentType::local_scan)) {
    if (stopping()) {
      return;
    }
    auto lease = segments_.try_acquire_due(segment.id, now);
    if (!lease.has_value()) {
      continue;
    }

    try {
      run_scan(*lease);
    } catch (const std::runtime_error& e) {
      log_error("scan", "scan failed for " + segment.name + ": " + e.what());
      services_.ui.add_log(LogLevel::error, std::string("Scan failed: ") + e.what());
    } catch (const std::invalid_argument& e) {
      log_error("scan", "scan failed for " + segment.name + ": " + e.what());
      services_.ui.add_log(LogLevel::error, std::string("Scan failed: ") + e.what());
    }
    lease.reset();
    publish_segments();
  }
}

std::size_t Agent::run_scan(const SegmentTable::ScanLease& lease) {
  const model::NetworkSegment& segment = lease.segment();
  log_info("scan", "scanning segment " + segment.name + " (" + segment.cidr + ")");
  services_.ui.add_log(LogLevel::info, "Scanning " + segment.name + " (" + segment.cidr + ")");
  const ScanningIndicator indicator(services_.ui, segment.id);

  auto devices = services_.discovery.discover(segment.cidr);
  log_info("scan", "discovered " + std::to_string(devices.size()) + " devices in " + segment.name);

  services_.enrichment.enrich(devices);
  devices_.merge_discovered(devices);
  services_.ui.update_devices(devices_.snapshot());

  if (!devices.empty()) {
    const auto result = services_.controller.upload_discovered_devices(segment.id, devices);
    log_debug("scan", "upload result: " + std::to_string(result.created) + " created, " + std::to_string(result.updated) +
                          " updated");
    services_.ui.add_log(LogLevel::info, "Discovered " + std::to_string(devices.size()) + " devices (" +
                                             std::to_string(result.created) + " new, " +
                                             std::to_string(result.updated) + " updated)");
  }
  return devices.size();
}

ScanSummary Agent::scan_all_now() {
  ScanSummary summary{};
  for (const auto& segment : segments_.segments_of_type(model::SegmentType::local_scan)) {
    auto lease = segments_.try_acquire(segment.id);
    if (!lease.has_value()) {
      continue;
    }
    summary.devices_found += run_scan(*lease);
    ++summary.segments_scanned;
  }
  publish_segments();
  return summary;
}

SegmentScanResult Agent::scan_segment(const std::string& segment_id) {
  if (!segments_.find(segment_id).has_value()) {
    return SegmentScanResult{SegmentScanStatus::not_found, 0};
  }
  auto lease = segments_.try_acquire(segment_id);
  if (!lease.has_value()) {
    return SegmentScanResult{SegmentScanStatus::busy, 0};
  }
  const std::size_t found = run_scan(*lease);
  lease.reset();
  publish_segments();
  return SegmentScanResult{SegmentScanStatus::scanned, found};
}

void Agent::status_loop() {
  while (!stopping()) {
    try {
      status_cycle();
    } catch (const std::runtime_error& e) {
      log_error("status", std::string("status check failed: ") + e.what());
    }
    if (!sleep_for(settings_.get().status_check_interval)) {
      break;
    }
  }
}

void Agent::status_cycle() {
  std::unordered_map<std::string, model::DeviceToMonitor> tracked;
  bool tracked_known = true;
  try {
    for (auto& device : services_.controller.devices_to_monitor()) {
      if (device.ip_address.has_value()) {
        const std::string ip = *device.ip_address;
        tracked.emplace(ip, std::move(device));
      }
    }
  } catch (const std::runtime_error& e) {
    tracked_known = false;
    log_warn("status", std::string("could not fetch monitored devices; status upload skipped: ") + e.what());
  }

  const auto known = devices_.snapshot();
  if (known.empty()) {
    log_debug("status", "no devices to monitor");
    return;
  }

  hysteresis_.set_threshold(settings_.get().status_failure_threshold);

  std::vector<std::string> targets;
  std::unordered_set<std::string> active;
  for (const auto& device : known) {
    if (device.ip.empty()) {
      continue;
    }
    if (net::is_network_or_broadcast_suffix(device.ip)) {
      devices_.update_status(device.ip, model::DeviceStatus::offline, std::nullopt, std::nullopt);
      services_.ui.update_device_status(device.ip, model::DeviceStatus::offline, std::nullopt);
      continue;
    }
    targets.push_back(device.ip);
    active.insert(device.ip);
  }
  log_debug("status", "checking status of " + std::to_string(targets.size()) + " discovered devices");

  const auto results = map_bounded(targets, config_.status_check_concurrency,
                                   [this](const std::string& ip) { return services_.probes.probe(ip); });

  std::vector<model::StatusReport> reports;
  for (std::size_t i = 0; i < targets.size(); ++i) {
    const std::string& ip = targets[i];
    const monitor::ProbeResult& probe = results[i];
    const model::DeviceStatus reported = hysteresis_.apply(ip, probe.status);
    const std::string checked_at = iso8601_now();

    devices_.update_status(ip, reported, probe.response_time_ms, checked_at);
    services_.ui.update_device_status(ip, reported, probe.response_time_ms);
    if (probe.status == model::DeviceStatus::online && probe.method != "ping") {
      log_debug("status", ip + " responded on " + probe.method);
    }

    const auto dashboard_device = tracked.find(ip);
    if (dashboard_device != tracked.end()) {
      model::StatusReport report{};
      report.device_id = dashboard_device->second.id;
      report.ip_address = ip;
      report.status = reported;
      report.response_time_ms = probe.response_time_ms;
      report.check_type = dashboard_device->second.check_type;
      report.checked_at = checked_at;
      reports.push_back(std::move(report));
    }
  }

  services_.ui.update_devices(devices_.snapshot());
  hysteresis_.prune(active);

  if (tracked_known && !reports.empty()) {
    const auto result = services_.controller.upload_status_reports(reports);
    log_debug("status", "status upload: " + std::to_string(result.processed) + " processed");
  }
}

void Agent::remote_loop() {
  if (!sleep_for(timings_.remote_initial_delay)) {
    return;
  }
  while (!stopping()) {
    std::chrono::milliseconds delay = timings_.remote_poll;
    try {
      delay = remote_cycle(monitor::RemoteScheduler::Clock::now());
    } catch (const std::runtime_error& e) {
      log_error("remote", std::string("remote monitor error: ") + e.what());
    }
    if (!sleep_for(delay)) {
      break;
    }
  }
}

std::chrono::milliseconds Agent::remote_cycle(const monitor::RemoteScheduler::Clock::time_point now) {
  const auto remote_segments = segments_.segments_of_type(model::SegmentType::remote_monitor);
  if (remote_segments.empty()) {
    return timings_.remote_idle_poll;
  }

  const auto remote_devices = monitor::select_remote_devices(services_.controller.devices_to_monitor(), remote_segments);
  if (remote_devices.empty()) {
    return timings_.remote_idle_poll;
  }

  std::unordered_set<std::string> active_ids;
  for (const auto& device : remote_devices) {
    active_ids.insert(device.id);
  }

  std::vector<model::DeviceToMonitor> runnable;
  for (auto& device : remote_scheduler_.take_due(remote_devices, now)) {
    if (!monitor::check_target(device).has_value()) {
      log_debug("remote", "device " + device.id + " has no hostname or IP; skipped");
      continue;
    }
    runnable.push_back(std::move(device));
  }

  const auto reports = map_bounded(runnable, timings_.remote_check_concurrency, [this](const model::DeviceToMonitor& device) {
    return monitor::run_check(device, services_.checks);
  });
  for (const auto& report : reports) {
    log_debug("remote", "remote check " + report.ip_address + " (" + model::to_string(report.check_type) +
                            "): " + model::to_string(report.status));
  }

  remote_scheduler_.prune(active_ids);

  if (!reports.empty()) {
    const auto result = services_.controller.upload_status_reports(reports);
    log_debug("remote", "remote monitor: " + std::to_string(result.processed) + " reports uploaded");
  }
  return timings_.remote_poll;
}

void Agent::auto_register() {
  if (!settings_.get().auto_scan) {
    return;
  }
  if (!segments_.empty()) {
    return;
  }

  log_info("agent", "no segments assigned; attempting auto-detection");
  try {
    const auto local = services_.detect_local_network ? services_.detect_local_network() : std::nullopt;
    if (!local.has_value()) {
      log_warn("agent", "could not detect local network for auto-scan");
      return;
    }

    api::AutoSegmentRequest request{};
    request.cidr = local->cidr;
    request.interface_name = local->interface_name;
    request.name = "Auto: " + local->interface_name + " (" + local->cidr + ")";
    log_info("agent", "detected local network: " + request.name);

    model::NetworkSegment segment = services_.controller.register_auto_segment(request);
    segment.is_auto_registered = true;
    log_info("agent", "auto-registered segment: " + segment.name);
    segments_.upsert(segment);
    publish_segments();
  } catch (const std::runtime_error& e) {
    log_warn("agent", std::string("failed to register auto-segment: ") + e.what());
  }
}

void Agent::request_restart() {
  log_info("agent", "restarting agent");
  request_shutdown(kRestartExitCode);
}

void Agent::settings_changed(const RuntimeSettingsValues& values) {
  segments_.set_auto_registered_interval(values.auto_scan_interval);
  hysteresis_.set_threshold(values.status_failure_threshold);
}

bool Agent::submit_local_command(const std::string& command_type) { return commands_.submit_local(command_type); }

void Agent::publish_segments() {
  const auto steady_now = std::chrono::steady_clock::now();
  const auto wall_now = std::chrono::system_clock::now();

  std::vector<sinks::SegmentView> views;
  for (const auto& state : segments_.snapshot()) {
    sinks::SegmentView view{};
    view.id = state.segment.id;
    view.name = state.segment.name;
    view.cidr = state.segment.cidr;
    if (state.last_scan.has_value()) {
      const auto age = std::chrono::duration_cast<std::chrono::system_clock::duration>(steady_now - *state.last_scan);
      view.last_scan = iso8601_utc(wall_now - age);
    }
    view.device_count = devices_.count_in(state.segment.cidr);
    view.scanning = state.scanning;
    views.push_back(std::move(view));
  }
  services_.ui.update_segments(views);
}

}  // namespace netmon_agent::core
