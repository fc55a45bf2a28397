#pragma once

#include <algorithm>
#include <chrono>

namespace netmon_agent::core {

// Exponential retry delay: base, doubling per consecutive failure, capped.
// A success resets it to base.
class RetryBackoff {
 public:
  RetryBackoff(std::chrono::milliseconds base, std::chrono::milliseconds cap) : base_(base), cap_(cap), next_(base) {}

  // Delay to wait after one more failure.
  std::chrono::milliseconds on_failure() {
    const auto delay = next_;
    next_ = std::min(next_ * 2, cap_);
    return delay;
  }

  void on_success() { next_ = base_; }

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds cap_;
  std::chrono::milliseconds next_;
};

}  // namespace netmon_agent::core
