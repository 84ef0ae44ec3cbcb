#include <clawsuite/core/rate_limiter.hpp>
#include <clawsuite/core/utils.hpp>
#include <algorithm>

namespace clawsuite {

// ============ SlidingWindowLimiter ============

SlidingWindowLimiter::SlidingWindowLimiter(int max_requests, int64_t window_ms)
    : max_requests_(max_requests)
    , window_ms_(window_ms) {}

void SlidingWindowLimiter::cleanup(int64_t now_ms) {
    int64_t cutoff = now_ms - window_ms_;

    while (!timestamps_.empty() && timestamps_.front() <= cutoff) {
        timestamps_.pop_front();
    }
}

RateLimitResult SlidingWindowLimiter::try_acquire(int64_t now_ms) {
    cleanup(now_ms);

    int current = static_cast<int>(timestamps_.size());

    if (current < max_requests_) {
        timestamps_.push_back(now_ms);
        return RateLimitResult::allow(max_requests_ - current - 1, max_requests_);
    }

    // Time until the oldest entry leaves the window
    int64_t wait_ms = (timestamps_.front() + window_ms_) - now_ms;

    return RateLimitResult::deny(std::max(wait_ms, static_cast<int64_t>(1)), max_requests_);
}

int SlidingWindowLimiter::current_count(int64_t now_ms) {
    cleanup(now_ms);
    return static_cast<int>(timestamps_.size());
}

int64_t SlidingWindowLimiter::last_request_ms() const {
    return timestamps_.empty() ? 0 : timestamps_.back();
}

// ============ KeyedRateLimiter ============

KeyedRateLimiter::KeyedRateLimiter(int limit, int64_t window_ms)
    : limit_(limit)
    , window_ms_(window_ms) {}

RateLimitResult KeyedRateLimiter::check(const std::string& key) {
    return check(key, monotonic_ms());
}

RateLimitResult KeyedRateLimiter::check(const std::string& key, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, SlidingWindowLimiter>::iterator it = limiters_.find(key);
    if (it == limiters_.end()) {
        it = limiters_.insert(std::make_pair(key,
            SlidingWindowLimiter(limit_, window_ms_))).first;
    }
    return it->second.try_acquire(now_ms);
}

void KeyedRateLimiter::reset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    limiters_.erase(key);
}

size_t KeyedRateLimiter::cleanup(int64_t max_idle_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t cutoff = monotonic_ms() - max_idle_ms;
    size_t removed = 0;

    std::map<std::string, SlidingWindowLimiter>::iterator it = limiters_.begin();
    while (it != limiters_.end()) {
        if (it->second.last_request_ms() < cutoff) {
            limiters_.erase(it++);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t KeyedRateLimiter::key_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiters_.size();
}

} // namespace clawsuite
