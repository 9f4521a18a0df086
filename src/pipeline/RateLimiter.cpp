#include "pipeline/RateLimiter.hpp"

#include <algorithm>

namespace infstore::pipeline {

IntervalRateLimiter::IntervalRateLimiter(std::chrono::milliseconds interval)
    : interval_(std::max(interval, std::chrono::milliseconds::zero())) {}

IntervalRateLimiter::Clock::time_point IntervalRateLimiter::reserve(Clock::time_point now) {
    if (interval_.count() == 0) {
        return now;
    }
    std::lock_guard guard(mutex_);
    const auto slot = std::max(now, next_);
    next_ = slot + interval_;
    return slot;
}

}  // namespace infstore::pipeline
