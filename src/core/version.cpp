#include "core/version.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <vector>

namespace netmon_agent::core {
namespace {

std::vector<long> parse_components(const std::string& version) {
  std::string cleaned = version;
  if (!cleaned.empty() && (cleaned.front() == 'v' || cleaned.front() == 'V')) {
    cleaned.erase(0, 1);
  }

  std::vector<long> components;
  std::istringstream input(cleaned);
  std::string part;
  while (std::getline(input, part, '.')) {
    long value = 0;
    const auto result = std::from_chars(part.data(), part.data() + part.size(), value);
    components.push_back(result.ec == std::errc{} ? value : 0);
  }
  while (components.size() < 3) {
    components.push_back(0);
  }
  return components;
}

}  // namespace

int compare_versions(const std::string& lhs, const std::string& rhs) {
  auto left = parse_components(lhs);
  auto right = parse_components(rhs);
  const std::size_t length = std::max(left.size(), right.size());
  left.resize(length, 0);
  right.resize(length, 0);

  for (std::size_t i = 0; i < length; ++i) {
    if (left[i] > right[i]) {
      return 1;
    }
    if (left[i] < right[i]) {
      return -1;
    }
  }
  return 0;
}

UpgradeVerdict classify_upgrade(const std::string& latest, const std::string& current, const bool allow_minor) {
  if (compare_versions(latest, current) <= 0) {
    return UpgradeVerdict::not_newer;
  }

  const auto next = parse_components(latest);
  const auto now = parse_components(current);
  if (next[0] != now[0]) {
    return UpgradeVerdict::major_change;
  }
  if (next[1] != now[1] && !allow_minor) {
    return UpgradeVerdict::minor_disabled;
  }
  return UpgradeVerdict::allowed;
}

bool should_auto_upgrade(const std::string& latest, const std::string& current, const bool allow_minor) {
  return classify_upgrade(latest, current, allow_minor) == UpgradeVerdict::allowed;
}

const char* to_string(const UpgradeVerdict verdict) noexcept {
  switch (verdict) {
    case UpgradeVerdict::allowed:
      return "allowed";
    case UpgradeVerdict::not_newer:
      return "target is not newer than the running version";
    case UpgradeVerdict::major_change:
      return "major version change";
    case UpgradeVerdict::minor_disabled:
      return "minor version change, upgrade.on_minor is off";
  }
  return "unknown";
}

}  // namespace netmon_agent::core
