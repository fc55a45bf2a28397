#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/command_processor.hpp"
#include "core/config.hpp"
#include "core/device_table.hpp"
#include "core/runtime_settings.hpp"
#include "core/segment_table.hpp"
#include "monitor/health_check.hpp"
#include "monitor/hysteresis.hpp"
#include "monitor/remote_scheduler.hpp"
#include "net/interfaces.hpp"

namespace netmon_agent::api {
class ControllerApi;
class RealtimeChannel;
}  // namespace netmon_agent::api
namespace netmon_agent::discovery {
class DiscoveryEngine;
class EnrichmentPipeline;
}  // namespace netmon_agent::discovery
namespace netmon_agent::monitor {
class ProbeCascade;
}
namespace netmon_agent::sinks {
class UiSink;
}
namespace netmon_agent::upgrade {
class UpgradeTrigger;
}

namespace netmon_agent::core {

// EX_TEMPFAIL: the service manager restarts the agent.
inline constexpr int kRestartExitCode = 75;
inline constexpr int kFatalExitCode = 1;

struct AgentServices {
  api::ControllerApi& controller;
  discovery::DiscoveryEngine& discovery;
  discovery::EnrichmentPipeline& enrichment;
  monitor::ProbeCascade& probes;
  monitor::CheckBackends checks;
  upgrade::UpgradeTrigger& upgrader;
  sinks::UiSink& ui;
  std::function<std::optional<net::LocalNetwork>()> detect_local_network{};
};

struct AgentTimings {
  std::chrono::milliseconds scan_poll{std::chrono::seconds(5)};
  std::chrono::milliseconds remote_initial_delay{std::chrono::seconds(10)};
  std::chrono::milliseconds remote_poll{std::chrono::seconds(5)};
  std::chrono::milliseconds remote_idle_poll{std::chrono::seconds(30)};
  std::chrono::milliseconds auto_register_delay{std::chrono::seconds(5)};
  std::chrono::milliseconds heartbeat_retry_base{std::chrono::seconds(2)};
  std::chrono::milliseconds heartbeat_retry_cap{std::chrono::seconds(60)};
  std::chrono::milliseconds heartbeat_interval_ceiling{std::chrono::seconds(60)};
  std::chrono::milliseconds shutdown_grace{std::chrono::seconds(10)};
  std::size_t remote_check_concurrency{5};
};

// Set from signal handlers and polled by Agent::run.
struct ProcessSignals {
  volatile std::sig_atomic_t shutdown{0};
  // Local operator commands.
  volatile std::sig_atomic_t scan_now{0};
  volatile std::sig_atomic_t ping{0};
};

struct AgentExit {
  int code{0};
  // False when some loop was still busy after the shutdown grace period.
  bool clean{true};
};

// Runs the heartbeat, scan, status-check and remote-monitor loops plus the
// command dispatcher over shared segment and device tables.
class Agent final : public CommandHost {
 public:
  Agent(AgentConfig config, AgentServices services, AgentTimings timings = {});
  ~Agent() override;

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Starts every loop and blocks until a shutdown signal, a restart request
  // or a fatal loop failure.
  AgentExit run(ProcessSignals& signals);
  void request_shutdown(int exit_code);

  // Single loop iterations.
  bool heartbeat_once();
  void scan_cycle(SegmentTable::Clock::time_point now);
  void status_cycle();
  // Returns how long to wait before the next iteration.
  std::chrono::milliseconds remote_cycle(monitor::RemoteScheduler::Clock::time_point now);
  void auto_register();

  ScanSummary scan_all_now() override;
  SegmentScanResult scan_segment(const std::string& segment_id) override;
  void request_restart() override;
  void settings_changed(const RuntimeSettingsValues& values) override;

  // Local operator commands (scan_now, ping).
  bool submit_local_command(const std::string& command_type);

  [[nodiscard]] SegmentTable& segments() noexcept { return segments_; }
  [[nodiscard]] DeviceTable& devices() noexcept { return devices_; }
  [[nodiscard]] monitor::HysteresisEngine& hysteresis() noexcept { return hysteresis_; }
  [[nodiscard]] monitor::RemoteScheduler& remote_scheduler() noexcept { return remote_scheduler_; }
  [[nodiscard]] CommandProcessor& commands() noexcept { return commands_; }
  [[nodiscard]] RuntimeSettings& settings() noexcept { return settings_; }
  [[nodiscard]] std::optional<std::string> agent_id() const;
  [[nodiscard]] bool stopping() const;
  [[nodiscard]] int exit_code() const noexcept { return exit_code_.load(); }

 private:
  void spawn(const char* name, std::function<void()> body);
  // Returns false when shutdown began during the wait.
  bool sleep_for(std::chrono::milliseconds duration);

  void heartbeat_loop();
  void scan_loop();
  void status_loop();
  void remote_loop();

  std::size_t run_scan(const SegmentTable::ScanLease& lease);
  void publish_segments();
  void update_realtime(const std::optional<std::string>& url, const std::optional<std::string>& key,
                       const std::string& agent_id);

  AgentConfig config_;
  AgentServices services_;
  AgentTimings timings_;
  std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
  std::string hostname_{};

  RuntimeSettings settings_;
  SegmentTable segments_{};
  DeviceTable devices_{};
  monitor::HysteresisEngine hysteresis_;
  monitor::RemoteScheduler remote_scheduler_{};
  CommandProcessor commands_;
  std::unique_ptr<api::RealtimeChannel> realtime_{};

  mutable std::mutex identity_mutex_{};
  std::optional<std::string> agent_id_{};
  std::optional<std::string> organization_id_{};

  mutable std::mutex state_mutex_{};
  std::condition_variable state_cv_{};
  bool stopping_{false};
  std::atomic<int> exit_code_{0};
  std::size_t running_loops_{0};
  std::vector<std::thread> threads_{};
};

}  // namespace netmon_agent::core
