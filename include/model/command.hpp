#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace netmon_agent::model {

enum class CommandType : std::uint8_t {
  scan_now = 0,
  scan_segment,
  update_config,
  restart,
  upgrade,
  ping,
};

enum class CommandStatus : std::uint8_t {
  pending = 0,
  completed,
  failed,
};

struct AgentCommand {
  std::string id{};
  // Raw wire value; unknown values are kept so they can be acknowledged as failures.
  std::string command_type{};
  nlohmann::json payload = nlohmann::json::object();
  CommandStatus status{CommandStatus::pending};
};

struct CommandAck {
  bool success{false};
  std::optional<nlohmann::json> result{};
  std::optional<std::string> error{};
};

[[nodiscard]] const char* to_string(CommandType type) noexcept;
[[nodiscard]] const char* to_string(CommandStatus status) noexcept;
[[nodiscard]] std::optional<CommandType> parse_command_type(const std::string& value);
[[nodiscard]] std::optional<CommandStatus> parse_command_status(const std::string& value);

}  // namespace netmon_agent::model
