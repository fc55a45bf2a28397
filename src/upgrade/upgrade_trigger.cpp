#include "upgrade/upgrade_trigger.hpp"

#include <string>
#include <utility>
#include <vector>

#include "core/log.hpp"
#include "net/subprocess.hpp"

namespace netmon_agent::upgrade {
namespace {

constexpr int kSpawnFailedExitCode = 127;

std::string last_line(const std::string& output) {
  std::string trimmed = output;
  while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r' || trimmed.back() == ' ')) {
    trimmed.pop_back();
  }
  const auto newline = trimmed.rfind('\n');
  return newline == std::string::npos ? trimmed : trimmed.substr(newline + 1);
}

class CommandUpgradeTrigger final : public UpgradeTrigger {
 public:
  CommandUpgradeTrigger(std::string command, const std::chrono::milliseconds timeout)
      : command_(std::move(command)), timeout_(timeout) {}

  UpgradeResult perform_upgrade(const std::string& target_version, const std::string& download_url) override {
    core::log_info("upgrade", "running " + command_ + " for " + target_version);
    const net::CommandResult result = net::run_command({command_, target_version, download_url}, timeout_);

    if (result.timed_out) {
      return {false, "upgrade command timed out"};
    }
    if (result.exit_code == kSpawnFailedExitCode) {
      return {false, "upgrade command not found: " + command_};
    }
    if (result.exit_code != 0) {
      const std::string detail = last_line(result.output);
      return {false, "upgrade command exited with " + std::to_string(result.exit_code) +
                         (detail.empty() ? std::string() : ": " + detail)};
    }
    return {true, "upgrade to " + target_version + " staged"};
  }

 private:
  std::string command_;
  std::chrono::milliseconds timeout_;
};

}  // namespace

std::unique_ptr<UpgradeTrigger> make_command_upgrade_trigger(std::string command, const std::chrono::milliseconds timeout) {
  return std::make_unique<CommandUpgradeTrigger>(std::move(command), timeout);
}

}  // namespace netmon_agent::upgrade
