#ifndef CLAWSUITE_GATEWAY_BACKOFF_HPP
#define CLAWSUITE_GATEWAY_BACKOFF_HPP

#include <cstdint>
#include <random>

namespace clawsuite {

// Exponential reconnect delay: base * 2^attempt plus up to jitter*delay of
// random slack, capped at max. Successive delays never shrink until reset(),
// so jitter cannot make a later retry come sooner than an earlier one.
class Backoff {
public:
    Backoff(int64_t base_ms = 1000, int64_t max_ms = 30000, double jitter = 0.2);

    // Delay before the next attempt; advances the attempt counter
    int64_t next_delay_ms();

    // Back to the base delay (after a successful open or a manual reconnect)
    void reset();

    int attempt() const { return attempt_; }
    int64_t last_delay_ms() const { return last_delay_ms_; }
    int64_t base_ms() const { return base_ms_; }
    int64_t max_ms() const { return max_ms_; }

    void seed(uint32_t value) { rng_.seed(value); }

private:
    int64_t base_ms_;
    int64_t max_ms_;
    double jitter_;
    int attempt_;
    int64_t last_delay_ms_;
    std::mt19937 rng_;
};

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_BACKOFF_HPP
