#include "net/ping.hpp"

#include <cstdlib>
#include <regex>

#include "net/subprocess.hpp"

namespace netmon_agent::net {
namespace {

class SystemPinger final : public Pinger {
 public:
  PingResult ping(const std::string& host, const std::chrono::seconds timeout) override {
    const auto result = run_command({"ping", "-c", "1", "-W", std::to_string(timeout.count()), host},
                                    std::chrono::duration_cast<std::chrono::milliseconds>(timeout) +
                                        std::chrono::milliseconds(2000));
    if (result.exit_code == 127) {
      return PingResult{.error = std::string("ping binary unavailable")};
    }

    PingResult parsed = parse_ping_output(result.output);
    if (!parsed.alive && !parsed.error.has_value()) {
      parsed.error = result.timed_out ? "timeout" : "host unreachable";
    }
    return parsed;
  }

  void ping_broadcast(const std::string& broadcast_address) override {
    run_command({"ping", "-b", "-c", "1", "-W", "1", broadcast_address}, std::chrono::milliseconds(3000));
  }
};

}  // namespace

PingResult parse_ping_output(const std::string& output) {
  static const std::regex time_re(R"(time[=<]\s*([\d.]+)\s*ms)", std::regex::icase);
  static const std::regex ttl_re(R"(ttl[=:]\s*(\d+))", std::regex::icase);

  PingResult result{};
  result.alive = output.find("bytes from") != std::string::npos || output.find("1 received") != std::string::npos;
  if (!result.alive) {
    return result;
  }

  std::smatch match;
  if (std::regex_search(output, match, time_re) && match.size() >= 2) {
    result.time_ms = std::strtod(match[1].str().c_str(), nullptr);
  }
  if (std::regex_search(output, match, ttl_re) && match.size() >= 2) {
    result.ttl = std::atoi(match[1].str().c_str());
  }
  return result;
}

std::unique_ptr<Pinger> make_system_pinger() { return std::make_unique<SystemPinger>(); }

}  // namespace netmon_agent::net
