#include <clawsuite/gateway/backoff.hpp>

#include <algorithm>

namespace clawsuite {

Backoff::Backoff(int64_t base_ms, int64_t max_ms, double jitter)
    : base_ms_(base_ms > 0 ? base_ms : 1)
    , max_ms_(std::max(max_ms, base_ms > 0 ? base_ms : 1))
    , jitter_(jitter < 0.0 ? 0.0 : jitter)
    , attempt_(0)
    , last_delay_ms_(0)
    , rng_(std::random_device()()) {}

int64_t Backoff::next_delay_ms() {
    int64_t delay = base_ms_;
    for (int i = 0; i < attempt_ && delay < max_ms_; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, max_ms_);

    if (jitter_ > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, jitter_);
        delay += static_cast<int64_t>(static_cast<double>(delay) * dist(rng_));
        delay = std::min(delay, max_ms_);
    }

    delay = std::max(delay, last_delay_ms_);
    last_delay_ms_ = delay;
    ++attempt_;
    return delay;
}

void Backoff::reset() {
    attempt_ = 0;
    last_delay_ms_ = 0;
}

} // namespace clawsuite
