#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace netmon_agent::upgrade {

struct UpgradeResult {
  bool success{false};
  std::string message{};
};

// Hands a new release to whatever replaces the binary. The call may not
// return if the replacement restarts the service.
class UpgradeTrigger {
 public:
  virtual UpgradeResult perform_upgrade(const std::string& target_version, const std::string& download_url) = 0;
  virtual ~UpgradeTrigger() = default;
};

// Runs `command <target_version> <download_url>` and reports its exit status.
std::unique_ptr<UpgradeTrigger> make_command_upgrade_trigger(std::string command,
                                                             std::chrono::milliseconds timeout = std::chrono::minutes(5));

}  // namespace netmon_agent::upgrade
