/**
 * @file test_backoff_policy.cpp
 * @brief Exponential backoff bounds, monotonicity and determinism
 */

#include "fidasrelay/uplink/backoff_policy.hpp"

#include <cassert>
#include <iostream>

using namespace fidasrelay;

int main() {
    std::cout << "=== BackoffPolicy Tests ===\n\n";

    // Test 1: Nominal doubling up to the ceiling
    {
        std::cout << "Test 1: Nominal schedule\n";
        BackoffPolicy policy({.base = Milliseconds(100), .ceiling = Milliseconds(1000), .jitter = 0.0}, 1);

        assert(policy.nominal(0) == Milliseconds(100));
        assert(policy.nominal(1) == Milliseconds(200));
        assert(policy.nominal(2) == Milliseconds(400));
        assert(policy.nominal(3) == Milliseconds(800));
        assert(policy.nominal(4) == Milliseconds(1000));
        assert(policy.nominal(200) == Milliseconds(1000));   // no overflow

        assert(policy.delay(0) == Milliseconds(100));
        assert(policy.delay(3) == Milliseconds(800));

        std::cout << "  PASS: base * 2^k clamped to ceiling\n\n";
    }

    // Test 2: Jittered delays never decrease and never exceed the ceiling
    {
        std::cout << "Test 2: Monotonic with jitter\n";
        for (uint64_t seed = 0; seed < 50; ++seed) {
            BackoffPolicy policy({.base = Milliseconds(50), .ceiling = Milliseconds(5000), .jitter = 1.0}, seed);
            Milliseconds previous(0);
            for (uint32_t attempt = 0; attempt < 20; ++attempt) {
                Milliseconds d = policy.delay(attempt);
                assert(d >= previous);
                assert(d >= policy.nominal(attempt));
                assert(d <= Milliseconds(5000));
                previous = d;
            }
            assert(previous == Milliseconds(5000));
        }
        std::cout << "  PASS: Non-decreasing up to the ceiling\n\n";
    }

    // Test 3: Same seed, same schedule
    {
        std::cout << "Test 3: Injectable seed\n";
        BackoffPolicy::Options options{.base = Milliseconds(100), .ceiling = Milliseconds(60000), .jitter = 0.5};
        BackoffPolicy a(options, 42);
        BackoffPolicy b(options, 42);
        for (uint32_t attempt = 0; attempt < 10; ++attempt) {
            assert(a.delay(attempt) == b.delay(attempt));
        }
        std::cout << "  PASS: Deterministic for a fixed seed\n\n";
    }

    // Test 4: Out-of-range options are clamped
    {
        std::cout << "Test 4: Option clamping\n";
        BackoffPolicy policy({.base = Milliseconds(500), .ceiling = Milliseconds(100), .jitter = 7.0}, 3);
        assert(policy.options().ceiling == Milliseconds(500));
        assert(policy.options().jitter == 1.0);
        assert(policy.delay(0) == Milliseconds(500));
        assert(policy.delay(5) == Milliseconds(500));

        BackoffPolicy negative({.base = Milliseconds(10), .ceiling = Milliseconds(100), .jitter = -1.0}, 3);
        assert(negative.options().jitter == 0.0);
        assert(negative.delay(1) == Milliseconds(20));
        std::cout << "  PASS: Jitter in [0, 1], ceiling >= base\n\n";
    }

    std::cout << "=== All BackoffPolicy Tests Passed! ===\n";
    return 0;
}
