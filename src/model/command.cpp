#include "model/command.hpp"

namespace netmon_agent::model {

const char* to_string(const CommandType type) noexcept {
  switch (type) {
    case CommandType::scan_now:
      return "scan_now";
    case CommandType::scan_segment:
      return "scan_segment";
    case CommandType::update_config:
      return "update_config";
    case CommandType::restart:
      return "restart";
    case CommandType::upgrade:
      return "upgrade";
    case CommandType::ping:
      return "ping";
  }
  return "unknown";
}

const char* to_string(const CommandStatus status) noexcept {
  switch (status) {
    case CommandStatus::pending:
      return "pending";
    case CommandStatus::completed:
      return "completed";
    case CommandStatus::failed:
      return "failed";
  }
  return "pending";
}

std::optional<CommandType> parse_command_type(const std::string& value) {
  if (value == "scan_now") {
    return CommandType::scan_now;
  }
  if (value == "scan_segment") {
    return CommandType::scan_segment;
  }
  if (value == "update_config") {
    return CommandType::update_config;
  }
  if (value == "restart") {
    return CommandType::restart;
  }
  if (value == "upgrade") {
    return CommandType::upgrade;
  }
  if (value == "ping") {
    return CommandType::ping;
  }
  return std::nullopt;
}

std::optional<CommandStatus> parse_command_status(const std::string& value) {
  if (value == "pending") {
    return CommandStatus::pending;
  }
  if (value == "completed") {
    return CommandStatus::completed;
  }
  if (value == "failed") {
    return CommandStatus::failed;
  }
  return std::nullopt;
}

}  // namespace netmon_agent::model
