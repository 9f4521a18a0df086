#pragma once

#include <chrono>
#include <mutex>

namespace infstore::pipeline {

// Hands out send slots at least one interval apart across every caller. The limiter
// never blocks; callers decide how to wait for the slot they were given.
class IntervalRateLimiter {
  public:
    using Clock = std::chrono::steady_clock;

    explicit IntervalRateLimiter(std::chrono::milliseconds interval);

    Clock::time_point reserve(Clock::time_point now = Clock::now());

    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

  private:
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    Clock::time_point next_{};
};

}  // namespace infstore::pipeline
