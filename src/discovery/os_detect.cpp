#include "discovery/os_detect.hpp"

#include <algorithm>
#include <chrono>

#include "core/log.hpp"
#include "net/ping.hpp"

namespace netmon_agent::discovery {
namespace {

constexpr std::chrono::seconds kTtlProbeTimeout{2};

bool has_hint(const std::vector<std::string>& hints, const std::string& needle) {
  return std::any_of(hints.begin(), hints.end(),
                     [&needle](const std::string& hint) { return hint.find(needle) != std::string::npos; });
}

void add_hint(std::vector<std::string>& hints, const std::string& hint) {
  if (std::find(hints.begin(), hints.end(), hint) == hints.end()) {
    hints.push_back(hint);
  }
}

}  // namespace

OsGuess classify_os(const std::optional<int> ttl, const std::set<int>& open_ports,
                    const std::set<std::string>& services) {
  OsGuess guess{};
  auto& hints = guess.os_hints;
  const auto has_port = [&open_ports](int port) { return open_ports.count(port) != 0; };

  if (ttl.has_value()) {
    const int value = *ttl;
    if (value >= 97 && value <= 128) {
      add_hint(hints, "Windows");
      guess.device_type = model::DeviceType::workstation;
    } else if (value >= 33 && value <= 64) {
      add_hint(hints, "Linux/Unix");
      guess.device_type = model::DeviceType::server;
    } else if (value >= 241 && value <= 255) {
      add_hint(hints, "Network Equipment");
      guess.device_type = model::DeviceType::network;
    } else if (value >= 1 && value <= 32) {
      add_hint(hints, "Embedded/IoT");
      guess.device_type = model::DeviceType::iot;
    }
  }

  if (has_port(3389)) {
    add_hint(hints, "Windows");
    guess.device_type = model::DeviceType::workstation;
  }

  if (has_port(22) && !has_port(3389)) {
    if (!has_hint(hints, "Linux")) {
      add_hint(hints, "Linux/Unix");
    }
    if (guess.device_type == model::DeviceType::unknown) {
      guess.device_type = model::DeviceType::server;
    }
  }

  if (has_port(631) || has_port(9100) || services.count("ipp") != 0) {
    add_hint(hints, "Printer");
    guess.device_type = model::DeviceType::printer;
  }

  if (has_port(161) && !has_port(22) && !has_port(3389)) {
    add_hint(hints, "Network Equipment");
    guess.device_type = model::DeviceType::network;
  }

  if (has_port(80) || has_port(443)) {
    if (has_port(3306) || has_port(5432) || has_port(27017) || has_port(6379)) {
      add_hint(hints, "Database Server");
      guess.device_type = model::DeviceType::server;
    } else if (has_port(25) || has_port(587) || has_port(993)) {
      add_hint(hints, "Mail Server");
      guess.device_type = model::DeviceType::server;
    }
  }

  if (services.count("ssh") != 0 && services.count("http") != 0 && !has_port(445) && !has_port(3389) &&
      has_hint(hints, "Linux/Unix")) {
    add_hint(hints, "macOS (possible)");
  }

  return guess;
}

OsGuess detect_os(net::Pinger& pinger, const std::string& ip, const std::set<int>& open_ports,
                  const std::set<std::string>& services) {
  const auto echo = pinger.ping(ip, kTtlProbeTimeout);
  if (!echo.ttl.has_value()) {
    core::log_debug("osdetect", "TTL detection failed for " + ip);
  }

  OsGuess guess = classify_os(echo.ttl, open_ports, services);
  core::log_debug("osdetect", ip + ": " + std::to_string(guess.os_hints.size()) + " hints, type=" +
                                  model::to_string(guess.device_type));
  return guess;
}

}  // namespace netmon_agent::discovery
