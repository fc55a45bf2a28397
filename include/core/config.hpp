#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "core/log.hpp"

namespace netmon_agent::core {

struct ControllerConfig {
  std::string url{};
  std::string api_key{};
  std::chrono::seconds request_timeout{30};
};

struct RealtimeConfig {
  bool enabled{true};
  // Optional static credentials; the heartbeat response overrides them.
  std::string url{};
  std::string key{};
};

struct ScanConfig {
  bool auto_register{true};
  std::chrono::seconds auto_scan_interval{300};
  std::size_t ping_concurrency{50};
  bool port_scan{true};
  bool snmp{true};
  std::string snmp_community{"public"};
};

struct UpgradeConfig {
  bool enabled{false};
  bool on_minor{true};
  std::string command{"/usr/lib/netmon-agent/upgrade.sh"};
};

struct AgentConfig {
  ControllerConfig controller{};
  std::string agent_name{"netmon-agent"};
  bool stdout_debug{false};
  std::chrono::seconds heartbeat_interval{60};
  std::chrono::seconds status_check_interval{30};
  int status_failure_threshold{2};
  std::size_t status_check_concurrency{10};
  ScanConfig scan{};
  std::string oui_database{"/usr/share/ieee-data/oui.txt"};
  RealtimeConfig realtime{};
  UpgradeConfig upgrade{};
  LogLevel log_level{LogLevel::info};
};

// Parses the file, applies NETMON_* environment overrides and validates.
// Throws std::runtime_error with a readable message on any problem.
AgentConfig load_agent_config(const std::string& path);

AgentConfig parse_agent_config(const std::string& text);
void apply_environment_overrides(AgentConfig& config);
void validate_agent_config(const AgentConfig& config);

// vp_<org>_<20+ alphanumerics>. Keys without the vp_ prefix are not checked.
[[nodiscard]] bool is_valid_api_key(const std::string& key);

}  // namespace netmon_agent::core
