#ifndef CLAWSUITE_CORE_RATE_LIMITER_HPP
#define CLAWSUITE_CORE_RATE_LIMITER_HPP

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <cstdint>

namespace clawsuite {

// Rate limit result
struct RateLimitResult {
    bool allowed;
    int64_t retry_after_ms;    // Milliseconds until next allowed request
    int remaining;             // Remaining requests in window
    int limit;                 // Total limit per window

    RateLimitResult()
        : allowed(true)
        , retry_after_ms(0)
        , remaining(0)
        , limit(0) {}

    static RateLimitResult allow(int remaining, int limit) {
        RateLimitResult r;
        r.allowed = true;
        r.remaining = remaining;
        r.limit = limit;
        return r;
    }

    static RateLimitResult deny(int64_t retry_after, int limit) {
        RateLimitResult r;
        r.allowed = false;
        r.retry_after_ms = retry_after;
        r.limit = limit;
        r.remaining = 0;
        return r;
    }
};

// Sliding window: at most max_requests inside any window_ms span
class SlidingWindowLimiter {
public:
    SlidingWindowLimiter(int max_requests, int64_t window_ms);

    RateLimitResult try_acquire(int64_t now_ms);

    int current_count(int64_t now_ms);

    // Timestamp of the newest recorded request (0 when empty)
    int64_t last_request_ms() const;

private:
    void cleanup(int64_t now_ms);

    int max_requests_;
    int64_t window_ms_;
    std::deque<int64_t> timestamps_;
};

// Per-key limiter (terminal input is keyed by client address).
// Safe to call from concurrent HTTP handlers.
class KeyedRateLimiter {
public:
    KeyedRateLimiter(int limit, int64_t window_ms);

    RateLimitResult check(const std::string& key);
    RateLimitResult check(const std::string& key, int64_t now_ms);

    void reset(const std::string& key);

    // Drop keys idle for longer than max_idle_ms; returns how many went
    size_t cleanup(int64_t max_idle_ms);

    size_t key_count() const;

private:
    int limit_;
    int64_t window_ms_;
    std::map<std::string, SlidingWindowLimiter> limiters_;
    mutable std::mutex mutex_;
};

} // namespace clawsuite

#endif // CLAWSUITE_CORE_RATE_LIMITER_HPP
