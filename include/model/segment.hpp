#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace netmon_agent::model {

enum class SegmentType : std::uint8_t {
  local_scan = 0,
  remote_monitor,
};

struct NetworkSegment {
  std::string id{};
  std::string name{};
  std::string cidr{};
  std::int64_t scan_interval_seconds{300};
  SegmentType segment_type{SegmentType::local_scan};
  bool is_auto_registered{false};
  std::optional<std::string> interface_name{};
};

bool operator==(const NetworkSegment& lhs, const NetworkSegment& rhs);

[[nodiscard]] const char* to_string(SegmentType type) noexcept;
[[nodiscard]] std::optional<SegmentType> parse_segment_type(const std::string& value);

}  // namespace netmon_agent::model
