#include "fidasrelay/uplink/backoff_policy.hpp"

#include <algorithm>

namespace fidasrelay {

BackoffPolicy::BackoffPolicy(Options options, uint64_t seed)
    : options_(options)
    , rng_(seed) {
    options_.jitter = std::clamp(options_.jitter, 0.0, 1.0);
    if (options_.ceiling < options_.base) {
        options_.ceiling = options_.base;
    }
}

Milliseconds BackoffPolicy::nominal(uint32_t attempt) const {
    const int64_t base = options_.base.count();
    const int64_t ceiling = options_.ceiling.count();
    int64_t value = base;
    // Doubling past the ceiling is pointless and would overflow
    for (uint32_t i = 0; i < attempt && value < ceiling; ++i) {
        value *= 2;
    }
    return Milliseconds(std::min(value, ceiling));
}

Milliseconds BackoffPolicy::delay(uint32_t attempt) {
    const Milliseconds nominal_delay = nominal(attempt);
    std::uniform_real_distribution<double> dist(0.0, options_.jitter);
    const double jittered = static_cast<double>(nominal_delay.count()) * (1.0 + dist(rng_));
    return Milliseconds(std::min(static_cast<int64_t>(jittered), options_.ceiling.count()));
}

} // namespace fidasrelay
