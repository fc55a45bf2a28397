#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "model/segment.hpp"

namespace netmon_agent::core {

struct SegmentScanState {
  model::NetworkSegment segment{};
  std::optional<std::chrono::steady_clock::time_point> last_scan{};
  bool scanning{false};
};

struct SegmentDiff {
  std::vector<model::NetworkSegment> added{};
  std::vector<model::NetworkSegment> updated{};
  std::vector<std::string> removed{};
};

// Shared segment assignments. The scanning flag of a segment is only ever
// owned through a ScanLease, so at most one scan per segment is in flight.
class SegmentTable {
 public:
  using Clock = std::chrono::steady_clock;

  class ScanLease {
   public:
    ScanLease(ScanLease&& other) noexcept;
    ScanLease& operator=(ScanLease&& other) noexcept;
    ScanLease(const ScanLease&) = delete;
    ScanLease& operator=(const ScanLease&) = delete;
    ~ScanLease();

    [[nodiscard]] const model::NetworkSegment& segment() const noexcept { return segment_; }

   private:
    friend class SegmentTable;
    ScanLease(SegmentTable* table, model::NetworkSegment segment);
    void release() noexcept;

    SegmentTable* table_{nullptr};
    model::NetworkSegment segment_{};
  };

  // Replaces the assignment set with `segments`. Removed segments disappear
  // at once; an in-flight scan of one keeps its lease until it finishes.
  SegmentDiff apply_assignment(const std::vector<model::NetworkSegment>& segments);

  // Adds or updates a single segment (auto-registration).
  void upsert(const model::NetworkSegment& segment);

  // Atomically checks and sets the scanning flag for an on-demand scan.
  std::optional<ScanLease> try_acquire(const std::string& segment_id);

  // Like try_acquire, but only once the segment's scan interval has elapsed
  // since the last scan. The last scan time is stamped at grant.
  std::optional<ScanLease> try_acquire_due(const std::string& segment_id, Clock::time_point now);

  // Cadence for auto-registered segments, which the controller does not schedule.
  void set_auto_registered_interval(std::chrono::seconds interval);
  [[nodiscard]] std::chrono::seconds scan_interval(const model::NetworkSegment& segment) const;

  [[nodiscard]] std::vector<model::NetworkSegment> segments() const;
  [[nodiscard]] std::vector<model::NetworkSegment> segments_of_type(model::SegmentType type) const;
  [[nodiscard]] std::vector<SegmentScanState> snapshot() const;
  [[nodiscard]] std::optional<model::NetworkSegment> find(const std::string& segment_id) const;
  [[nodiscard]] bool is_scanning(const std::string& segment_id) const;
  [[nodiscard]] bool empty() const;
  [[nodiscard]] std::size_t size() const;

 private:
  struct Entry {
    model::NetworkSegment segment{};
    std::optional<Clock::time_point> last_scan{};
  };

  std::optional<ScanLease> acquire_locked(const std::string& segment_id, std::optional<Clock::time_point> due_at);
  void release(const std::string& segment_id) noexcept;

  mutable std::mutex mutex_{};
  std::unordered_map<std::string, Entry> entries_{};
  std::vector<std::string> order_{};
  // Kept apart from entries_ so a segment removed and re-added mid-scan is still exclusive.
  std::unordered_set<std::string> scanning_{};
  std::chrono::seconds auto_registered_interval_{300};
};

}  // namespace netmon_agent::core
