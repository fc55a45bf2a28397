#include "core/segment_table.hpp"

#include <algorithm>
#include <utility>

namespace netmon_agent::core {

SegmentTable::ScanLease::ScanLease(SegmentTable* table, model::NetworkSegment segment)
    : table_(table), segment_(std::move(segment)) {}

SegmentTable::ScanLease::ScanLease(ScanLease&& other) noexcept
    : table_(std::exchange(other.table_, nullptr)), segment_(std::move(other.segment_)) {}

SegmentTable::ScanLease& SegmentTable::ScanLease::operator=(ScanLease&& other) noexcept {
  if (this != &other) {
    release();
    table_ = std::exchange(other.table_, nullptr);
    segment_ = std::move(other.segment_);
  }
  return *this;
}

SegmentTable::ScanLease::~ScanLease() { release(); }

void SegmentTable::ScanLease::release() noexcept {
  if (table_ != nullptr) {
    table_->release(segment_.id);
    table_ = nullptr;
  }
}

SegmentDiff SegmentTable::apply_assignment(const std::vector<model::NetworkSegment>& segments) {
  SegmentDiff diff{};
  std::lock_guard<std::mutex> lock(mutex_);

  std::unordered_set<std::string> incoming;
  for (const auto& segment : segments) {
    incoming.insert(segment.id);
  }

  for (auto it = order_.begin(); it != order_.end();) {
    if (incoming.count(*it) == 0) {
      diff.removed.push_back(*it);
      entries_.erase(*it);
      it = order_.erase(it);
    } else {
      ++it;
    }
  }

  for (const auto& segment : segments) {
    auto existing = entries_.find(segment.id);
    if (existing == entries_.end()) {
      entries_.emplace(segment.id, Entry{segment, std::nullopt});
      order_.push_back(segment.id);
      diff.added.push_back(segment);
      continue;
    }
    model::NetworkSegment merged = segment;
    // Heartbeats may omit the flag for segments this agent registered itself.
    merged.is_auto_registered = segment.is_auto_registered || existing->second.segment.is_auto_registered;
    if (!(existing->second.segment == merged)) {
      existing->second.segment = merged;
      diff.updated.push_back(merged);
    }
  }

  return diff;
}

void SegmentTable::upsert(const model::NetworkSegment& segment) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = entries_.find(segment.id);
  if (existing != entries_.end()) {
    existing->second.segment = segment;
    return;
  }
  entries_.emplace(segment.id, Entry{segment, std::nullopt});
  order_.push_back(segment.id);
}

std::optional<SegmentTable::ScanLease> SegmentTable::try_acquire(const std::string& segment_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return acquire_locked(segment_id, std::nullopt);
}

std::optional<SegmentTable::ScanLease> SegmentTable::try_acquire_due(const std::string& segment_id,
                                                                     const Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return acquire_locked(segment_id, now);
}

std::optional<SegmentTable::ScanLease> SegmentTable::acquire_locked(const std::string& segment_id,
                                                                    const std::optional<Clock::time_point> due_at) {
  const auto it = entries_.find(segment_id);
  if (it == entries_.end() || scanning_.count(segment_id) != 0) {
    return std::nullopt;
  }

  Entry& entry = it->second;
  if (due_at.has_value()) {
    const auto interval = entry.segment.is_auto_registered ? auto_registered_interval_
                                                           : std::chrono::seconds(entry.segment.scan_interval_seconds);
    if (entry.last_scan.has_value() && *due_at - *entry.last_scan < interval) {
      return std::nullopt;
    }
    entry.last_scan = *due_at;
  } else {
    entry.last_scan = Clock::now();
  }

  scanning_.insert(segment_id);
  return ScanLease(this, entry.segment);
}

void SegmentTable::set_auto_registered_interval(const std::chrono::seconds interval) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto_registered_interval_ = interval;
}

std::chrono::seconds SegmentTable::scan_interval(const model::NetworkSegment& segment) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return segment.is_auto_registered ? auto_registered_interval_ : std::chrono::seconds(segment.scan_interval_seconds);
}

void SegmentTable::release(const std::string& segment_id) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  scanning_.erase(segment_id);
}

std::vector<model::NetworkSegment> SegmentTable::segments() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::NetworkSegment> out;
  out.reserve(order_.size());
  for (const auto& id : order_) {
    out.push_back(entries_.at(id).segment);
  }
  return out;
}

std::vector<model::NetworkSegment> SegmentTable::segments_of_type(const model::SegmentType type) const {
  auto all = segments();
  all.erase(std::remove_if(all.begin(), all.end(), [type](const model::NetworkSegment& s) { return s.segment_type != type; }),
            all.end());
  return all;
}

std::vector<SegmentScanState> SegmentTable::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SegmentScanState> out;
  out.reserve(order_.size());
  for (const auto& id : order_) {
    const auto& entry = entries_.at(id);
    out.push_back(SegmentScanState{entry.segment, entry.last_scan, scanning_.count(id) != 0});
  }
  return out;
}

std::optional<model::NetworkSegment> SegmentTable::find(const std::string& segment_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(segment_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.segment;
}

bool SegmentTable::is_scanning(const std::string& segment_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scanning_.count(segment_id) != 0;
}

bool SegmentTable::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.empty();
}

std::size_t SegmentTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace netmon_agent::core
