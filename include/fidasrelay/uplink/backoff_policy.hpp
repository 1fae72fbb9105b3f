#pragma once

#include "fidasrelay/platform/timestamp.hpp"

#include <cstdint>
#include <random>

namespace fidasrelay {

/**
 * @brief Exponential backoff with bounded jitter
 *
 * delay(k) = min(ceiling, nominal_k * (1 + u)), u uniform in [0, jitter],
 * nominal_k = min(ceiling, base * 2^k). With jitter <= 1 the jittered delay
 * of attempt k never exceeds nominal_{k+1}, so delays are non-decreasing in
 * k and settle at the ceiling.
 */
class BackoffPolicy {
public:
    struct Options {
        Milliseconds base{1000};
        Milliseconds ceiling{300000};
        double jitter{0.2};             ///< Fraction of the nominal delay, 0..1
    };

    explicit BackoffPolicy(Options options, uint64_t seed = std::random_device{}());

    /**
     * @brief Delay before retry attempt `attempt` (0-based)
     */
    Milliseconds delay(uint32_t attempt);

    Milliseconds nominal(uint32_t attempt) const;

    const Options& options() const { return options_; }

private:
    Options options_;
    std::mt19937_64 rng_;
};

} // namespace fidasrelay
