#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "core/runtime_settings.hpp"
#include "core/work_queue.hpp"
#include "model/command.hpp"

namespace netmon_agent::api {
class ControllerApi;
}
namespace netmon_agent::sinks {
class UiSink;
}
namespace netmon_agent::upgrade {
class UpgradeTrigger;
}

namespace netmon_agent::core {

struct ScanSummary {
  std::size_t segments_scanned{0};
  std::size_t devices_found{0};
};

enum class SegmentScanStatus {
  scanned,
  not_found,
  busy,
};

struct SegmentScanResult {
  SegmentScanStatus status{SegmentScanStatus::not_found};
  std::size_t devices_found{0};
};

// What commands act on. Implemented by the agent.
class CommandHost {
 public:
  // Scans every local segment that is not already scanning.
  virtual ScanSummary scan_all_now() = 0;
  virtual SegmentScanResult scan_segment(const std::string& segment_id) = 0;
  // Orderly shutdown; the process exits with the restart exit code.
  virtual void request_restart() = 0;
  // Runtime settings changed; reapply them to components that cache them.
  virtual void settings_changed(const RuntimeSettingsValues& values) = 0;
  virtual ~CommandHost() = default;
};

struct CommandProcessorOptions {
  bool upgrade_enabled{false};
  bool upgrade_on_minor{true};
  std::string current_version{};
};

// Runs controller and UI commands one at a time on the dispatcher thread.
// Every controller command produces exactly one acknowledgement, including
// when it throws. A command ID that is queued or executing is not accepted again.
class CommandProcessor {
 public:
  CommandProcessor(api::ControllerApi& controller, CommandHost& host, RuntimeSettings& settings,
                   upgrade::UpgradeTrigger& upgrader, sinks::UiSink& ui, CommandProcessorOptions options);

  // Returns false for duplicates, non-pending commands and after stop().
  bool submit(model::AgentCommand command);
  // Local operator commands run without a controller acknowledgement.
  bool submit_local(const std::string& command_type);

  // Dispatcher loop; returns after stop().
  void run();
  void stop();

  // Executes one command on the calling thread. With acknowledge set the
  // outcome is sent to the controller. Returns the outcome.
  model::CommandAck execute(const model::AgentCommand& command, bool acknowledge);

  // Validates and applies an update_config payload; returns {applied: {...}}.
  nlohmann::json apply_config_update(const nlohmann::json& updates);

  [[nodiscard]] std::size_t in_flight() const;

 private:
  struct Job {
    model::AgentCommand command{};
    bool acknowledge{true};
  };

  model::CommandAck dispatch(model::CommandType type, const model::AgentCommand& command, bool acknowledge,
                             bool& acknowledged);
  model::CommandAck run_upgrade(const model::AgentCommand& command, bool acknowledge, bool& acknowledged);
  void send_ack(const std::string& command_id, const model::CommandAck& ack);
  void finish(const std::string& command_id);

  api::ControllerApi& controller_;
  CommandHost& host_;
  RuntimeSettings& settings_;
  upgrade::UpgradeTrigger& upgrader_;
  sinks::UiSink& ui_;
  CommandProcessorOptions options_;

  WorkQueue<Job> queue_{};
  std::atomic<bool> stopping_{false};
  mutable std::mutex in_flight_mutex_{};
  std::unordered_set<std::string> in_flight_{};
  std::atomic<std::size_t> local_sequence_{0};
};

}  // namespace netmon_agent::core
