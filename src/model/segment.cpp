#include "model/segment.hpp"

namespace netmon_agent::model {

bool operator==(const NetworkSegment& lhs, const NetworkSegment& rhs) {
  return lhs.id == rhs.id && lhs.name == rhs.name && lhs.cidr == rhs.cidr &&
         lhs.scan_interval_seconds == rhs.scan_interval_seconds && lhs.segment_type == rhs.segment_type &&
         lhs.is_auto_registered == rhs.is_auto_registered && lhs.interface_name == rhs.interface_name;
}

const char* to_string(const SegmentType type) noexcept {
  return type == SegmentType::remote_monitor ? "remote_monitor" : "local_scan";
}

std::optional<SegmentType> parse_segment_type(const std::string& value) {
  if (value == "local_scan") {
    return SegmentType::local_scan;
  }
  if (value == "remote_monitor") {
    return SegmentType::remote_monitor;
  }
  return std::nullopt;
}

}  // namespace netmon_agent::model
