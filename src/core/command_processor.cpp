#include "core/command_processor.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <string>
#include <utility>

#include "api/controller.hpp"
#include "core/log.hpp"
#include "core/version.hpp"
#include "sinks/ui_sink.hpp"
#include "upgrade/upgrade_trigger.hpp"

namespace netmon_agent::core {
namespace {

using nlohmann::json;

model::CommandAck succeeded(json result) { return model::CommandAck{true, std::move(result), std::nullopt}; }

model::CommandAck failed(std::string error) { return model::CommandAck{false, std::nullopt, std::move(error)}; }

std::optional<double> number_at_least(const json& updates, const char* key, const double minimum) {
  const auto it = updates.find(key);
  if (it == updates.end() || !it->is_number()) {
    return std::nullopt;
  }
  const double value = it->get<double>();
  if (!std::isfinite(value) || value < minimum) {
    return std::nullopt;
  }
  return value;
}

std::chrono::milliseconds seconds_to_ms(const double seconds) {
  return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

}  // namespace

CommandProcessor::CommandProcessor(api::ControllerApi& controller, CommandHost& host, RuntimeSettings& settings,
                                   upgrade::UpgradeTrigger& upgrader, sinks::UiSink& ui, CommandProcessorOptions options)
    : controller_(controller), host_(host), settings_(settings), upgrader_(upgrader), ui_(ui), options_(std::move(options)) {
  if (options_.current_version.empty()) {
    options_.current_version = kAgentVersion;
  }
}

bool CommandProcessor::submit(model::AgentCommand command) {
  if (stopping_.load() || command.status != model::CommandStatus::pending) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    if (!in_flight_.insert(command.id).second) {
      log_debug("command", "command " + command.id + " already queued");
      return false;
    }
  }
  queue_.push(Job{std::move(command), true});
  return true;
}

bool CommandProcessor::submit_local(const std::string& command_type) {
  const auto type = model::parse_command_type(command_type);
  if (!type.has_value() || (*type != model::CommandType::scan_now && *type != model::CommandType::ping)) {
    ui_.add_log(LogLevel::warn, "Unknown UI command: " + command_type);
    return false;
  }
  if (stopping_.load()) {
    return false;
  }

  model::AgentCommand command{};
  command.id = "local-" + std::to_string(++local_sequence_);
  command.command_type = command_type;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.insert(command.id);
  }
  ui_.add_log(LogLevel::info, "UI command: " + command_type);
  queue_.push(Job{std::move(command), false});
  return true;
}

void CommandProcessor::run() {
  while (auto job = queue_.pop()) {
    if (!stopping_.load()) {
      execute(job->command, job->acknowledge);
    }
    finish(job->command.id);
  }
}

void CommandProcessor::stop() {
  stopping_.store(true);
  queue_.shutdown();
}

std::size_t CommandProcessor::in_flight() const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.size();
}

void CommandProcessor::finish(const std::string& command_id) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  in_flight_.erase(command_id);
}

model::CommandAck CommandProcessor::execute(const model::AgentCommand& command, const bool acknowledge) {
  log_info("command", "processing " + command.command_type + " (" + command.id + ")");

  bool acknowledged = false;
  model::CommandAck ack{};
  try {
    const auto type = model::parse_command_type(command.command_type);
    if (type.has_value()) {
      ack = dispatch(*type, command, acknowledge, acknowledged);
    } else {
      log_warn("command", "unknown command type: " + command.command_type);
      ack = failed("Unknown command: " + command.command_type);
    }
  } catch (const std::exception& e) {
    log_error("command", "command " + command.command_type + " failed: " + e.what());
    ui_.add_log(LogLevel::error, "Command failed: " + std::string(e.what()));
    ack = failed(e.what());
  }

  if (acknowledge && !acknowledged) {
    send_ack(command.id, ack);
  }
  return ack;
}

model::CommandAck CommandProcessor::dispatch(const model::CommandType type, const model::AgentCommand& command,
                                             const bool acknowledge, bool& acknowledged) {
  switch (type) {
    case model::CommandType::ping: {
      const auto pong = controller_.send_pong(acknowledge ? std::optional<std::string>(command.id) : std::nullopt);
      // The ping endpoint records the acknowledgement itself.
      acknowledged = true;
      log_info("command", "ping response sent, latency " + std::to_string(pong.latency_ms) + "ms");
      if (!acknowledge) {
        ui_.add_log(LogLevel::info, "Ping response: " + std::to_string(static_cast<long long>(std::llround(pong.latency_ms))) + "ms");
      }
      return succeeded(json{{"latency_ms", pong.latency_ms}});
    }

    case model::CommandType::scan_now: {
      const ScanSummary summary = host_.scan_all_now();
      log_info("command", "scan_now completed: " + std::to_string(summary.segments_scanned) + " segments, " +
                              std::to_string(summary.devices_found) + " devices");
      if (!acknowledge) {
        ui_.add_log(LogLevel::info, "Scan complete: " + std::to_string(summary.segments_scanned) + " segments, " +
                                        std::to_string(summary.devices_found) + " devices");
      }
      return succeeded(json{{"segments_scanned", summary.segments_scanned}, {"devices_found", summary.devices_found}});
    }

    case model::CommandType::scan_segment: {
      const auto segment_id = command.payload.find("segment_id");
      if (segment_id == command.payload.end() || !segment_id->is_string() || segment_id->get<std::string>().empty()) {
        return failed("segment_id required");
      }
      const std::string id = segment_id->get<std::string>();
      const SegmentScanResult result = host_.scan_segment(id);
      switch (result.status) {
        case SegmentScanStatus::not_found:
          return failed("Segment not found");
        case SegmentScanStatus::busy:
          return failed("Segment already scanning");
        case SegmentScanStatus::scanned:
          break;
      }
      log_info("command", "scan_segment completed: " + std::to_string(result.devices_found) + " devices found");
      return succeeded(json{{"segment_id", id}, {"devices_found", result.devices_found}});
    }

    case model::CommandType::update_config:
      return succeeded(apply_config_update(command.payload));

    case model::CommandType::restart: {
      log_info("command", "executing restart command");
      model::CommandAck ack = succeeded(json{{"restarting", true}});
      if (acknowledge) {
        send_ack(command.id, ack);
        acknowledged = true;
      }
      host_.request_restart();
      return ack;
    }

    case model::CommandType::upgrade:
      return run_upgrade(command, acknowledge, acknowledged);
  }

  return failed("Unknown command: " + command.command_type);
}

model::CommandAck CommandProcessor::run_upgrade(const model::AgentCommand& command, const bool acknowledge,
                                                bool& acknowledged) {
  const auto target = command.payload.find("target_version");
  const auto url = command.payload.find("download_url");
  const bool has_target = target != command.payload.end() && target->is_string() && !target->get<std::string>().empty();
  const bool has_url = url != command.payload.end() && url->is_string() && !url->get<std::string>().empty();
  if (!has_target || !has_url) {
    return failed("target_version and download_url required");
  }

  const std::string target_version = target->get<std::string>();
  const std::string download_url = url->get<std::string>();
  log_info("command", "upgrade requested: " + options_.current_version + " -> " + target_version);

  const auto outcome = [&](const std::string& message) {
    return succeeded(json{
        {"current_version", options_.current_version},
        {"target_version", target_version},
        {"message", message},
    });
  };

  if (!options_.upgrade_enabled) {
    log_warn("command", "auto-upgrade is disabled; set upgrade.enabled to allow it");
    return outcome("Auto-upgrade disabled - manual upgrade required");
  }
  const UpgradeVerdict verdict = classify_upgrade(target_version, options_.current_version, options_.upgrade_on_minor);
  if (verdict != UpgradeVerdict::allowed) {
    log_warn("command", "auto-upgrade policy blocks " + options_.current_version + " -> " + target_version + ": " +
                            to_string(verdict));
    return outcome(std::string("Upgrade blocked by policy (") + to_string(verdict) + ")");
  }

  // The trigger may end the process, so the acknowledgement goes first.
  model::CommandAck ack = outcome("Upgrade starting...");
  if (acknowledge) {
    send_ack(command.id, ack);
    acknowledged = true;
  }

  const upgrade::UpgradeResult result = upgrader_.perform_upgrade(target_version, download_url);
  if (!result.success) {
    log_error("command", "upgrade failed: " + result.message);
    ui_.add_log(LogLevel::error, "Upgrade failed: " + result.message);
  } else {
    log_info("command", result.message);
  }
  return ack;
}

json CommandProcessor::apply_config_update(const json& updates) {
  json applied = json::object();
  if (!updates.is_object()) {
    return json{{"applied", applied}};
  }

  RuntimeSettingsValues values = settings_.get();

  if (const auto value = number_at_least(updates, "heartbeatInterval", 10.0)) {
    values.heartbeat_interval = seconds_to_ms(*value);
    applied["heartbeatInterval"] = updates.at("heartbeatInterval");
  }
  if (const auto value = number_at_least(updates, "statusCheckInterval", 5.0)) {
    values.status_check_interval = seconds_to_ms(*value);
    applied["statusCheckInterval"] = updates.at("statusCheckInterval");
  }
  if (const auto value = number_at_least(updates, "statusFailureThreshold", 0.0)) {
    values.status_failure_threshold = static_cast<int>(*value);
    applied["statusFailureThreshold"] = updates.at("statusFailureThreshold");
  }
  if (const auto level = updates.find("logLevel"); level != updates.end() && level->is_string()) {
    if (const auto parsed = parse_log_level(level->get<std::string>())) {
      values.log_level = *parsed;
      applied["logLevel"] = *level;
    }
  }
  if (const auto auto_scan = updates.find("enableAutoScan"); auto_scan != updates.end() && auto_scan->is_boolean()) {
    values.auto_scan = auto_scan->get<bool>();
    applied["enableAutoScan"] = *auto_scan;
  }
  if (const auto value = number_at_least(updates, "autoScanInterval", 30.0)) {
    values.auto_scan_interval = std::chrono::seconds(std::llround(*value));
    applied["autoScanInterval"] = updates.at("autoScanInterval");
  }

  settings_.set(values);
  set_log_level(values.log_level);
  host_.settings_changed(values);
  log_info("command", "config updated: " + applied.dump());
  return json{{"applied", applied}};
}

void CommandProcessor::send_ack(const std::string& command_id, const model::CommandAck& ack) {
  try {
    controller_.acknowledge_command(command_id, ack);
  } catch (const std::runtime_error& e) {
    log_error("command", "failed to acknowledge command " + command_id + ": " + e.what());
  }
}

}  // namespace netmon_agent::core
