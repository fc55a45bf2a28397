#pragma once

#include <cstdint>
#include <string>

namespace netmon_agent::core {

inline constexpr const char* kAgentVersion = "1.0.0";

// Returns <0, 0 or >0. A leading 'v' is ignored and missing components count as 0.
int compare_versions(const std::string& lhs, const std::string& rhs);

enum class UpgradeVerdict : std::uint8_t {
  allowed = 0,
  not_newer,
  major_change,
  minor_disabled,
};

// Never across a major version; minor bumps only when allow_minor; patch bumps always.
UpgradeVerdict classify_upgrade(const std::string& latest, const std::string& current, bool allow_minor);
bool should_auto_upgrade(const std::string& latest, const std::string& current, bool allow_minor);

// Why an upgrade was refused, for acknowledgements and logs.
[[nodiscard]] const char* to_string(UpgradeVerdict verdict) noexcept;

}  // namespace netmon_agent::core
