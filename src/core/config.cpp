#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace netmon_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value, long long minimum) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < minimum) {
    throw std::runtime_error(key + " must be greater than or equal to " + std::to_string(minimum));
  }
  return parsed;
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "controller.url") {
    config.controller.url = value;
    return;
  }

  if (key == "controller.api_key") {
    config.controller.api_key = value;
    return;
  }

  if (key == "controller.request_timeout_s") {
    config.controller.request_timeout = std::chrono::seconds(parse_integer(key, value, 1));
    return;
  }

  if (key == "agent.name") {
    config.agent_name = value;
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "heartbeat_interval_s") {
    config.heartbeat_interval = std::chrono::seconds(parse_integer(key, value, 10));
    return;
  }

  if (key == "status_check.interval_s") {
    config.status_check_interval = std::chrono::seconds(parse_integer(key, value, 5));
    return;
  }

  if (key == "status_check.failure_threshold") {
    config.status_failure_threshold = static_cast<int>(parse_integer(key, value, 0));
    return;
  }

  if (key == "status_check.concurrency") {
    config.status_check_concurrency = static_cast<std::size_t>(parse_integer(key, value, 1));
    return;
  }

  if (key == "scan.auto_register") {
    config.scan.auto_register = parse_bool(value);
    return;
  }

  if (key == "scan.auto_scan_interval_s") {
    config.scan.auto_scan_interval = std::chrono::seconds(parse_integer(key, value, 30));
    return;
  }

  if (key == "scan.ping_concurrency") {
    config.scan.ping_concurrency = static_cast<std::size_t>(parse_integer(key, value, 1));
    return;
  }

  if (key == "scan.port_scan") {
    config.scan.port_scan = parse_bool(value);
    return;
  }

  if (key == "scan.snmp") {
    config.scan.snmp = parse_bool(value);
    return;
  }

  if (key == "scan.snmp_community") {
    config.scan.snmp_community = value;
    return;
  }

  if (key == "discovery.oui_database") {
    config.oui_database = value;
    return;
  }

  if (key == "realtime.enabled") {
    config.realtime.enabled = parse_bool(value);
    return;
  }

  if (key == "realtime.url") {
    config.realtime.url = value;
    return;
  }

  if (key == "realtime.key") {
    config.realtime.key = value;
    return;
  }

  if (key == "upgrade.enabled") {
    config.upgrade.enabled = parse_bool(value);
    return;
  }

  if (key == "upgrade.on_minor") {
    config.upgrade.on_minor = parse_bool(value);
    return;
  }

  if (key == "upgrade.command") {
    config.upgrade.command = value;
    return;
  }

  if (key == "log.level") {
    const auto level = parse_log_level(value);
    if (!level.has_value()) {
      throw std::runtime_error("log.level must be one of debug, info, warn, error");
    }
    config.log_level = *level;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

std::string getenv_or(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  return value;
}

}  // namespace

AgentConfig parse_agent_config(const std::string& text) {
  AgentConfig config{};

  std::istringstream input(text);
  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_environment_overrides(AgentConfig& config) {
  config.controller.url = getenv_or("NETMON_CONTROLLER_URL", config.controller.url);
  config.controller.api_key = getenv_or("NETMON_API_KEY", config.controller.api_key);

  const std::string level = getenv_or("NETMON_LOG_LEVEL", "");
  if (!level.empty()) {
    const auto parsed = parse_log_level(level);
    if (!parsed.has_value()) {
      throw std::runtime_error("NETMON_LOG_LEVEL must be one of debug, info, warn, error");
    }
    config.log_level = *parsed;
  }
}

void validate_agent_config(const AgentConfig& config) {
  if (config.controller.url.empty()) {
    throw std::runtime_error("controller.url is required (or NETMON_CONTROLLER_URL)");
  }
  if (config.controller.url.rfind("http://", 0) != 0 && config.controller.url.rfind("https://", 0) != 0) {
    throw std::runtime_error("controller.url must start with http:// or https://");
  }
  if (config.controller.api_key.empty()) {
    throw std::runtime_error("controller.api_key is required (or NETMON_API_KEY)");
  }
  if (!is_valid_api_key(config.controller.api_key)) {
    throw std::runtime_error("invalid controller.api_key format; expected vp_{org_prefix}_{random}");
  }
}

bool is_valid_api_key(const std::string& key) {
  if (key.rfind("vp_", 0) != 0) {
    return true;
  }
  static const std::regex pattern("^vp_[a-zA-Z0-9]+_[a-zA-Z0-9]{20,}$");
  return std::regex_match(key, pattern);
}

AgentConfig load_agent_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }
  std::ostringstream content;
  content << input.rdbuf();

  AgentConfig config = parse_agent_config(content.str());
  apply_environment_overrides(config);
  while (!config.controller.url.empty() && config.controller.url.back() == '/') {
    config.controller.url.pop_back();
  }
  validate_agent_config(config);
  return config;
}

}  // namespace netmon_agent::core
