#pragma once

#include "fidasrelay/threading.hpp"

#include <atomic>
#include <chrono>

namespace fidasrelay {

/**
 * @brief One-shot stop request shared between the controller and the pump
 *
 * The pump sleeps through wait_for() between ticks and during backoff; a
 * request() wakes it immediately.
 */
class StopSignal {
public:
    void request() {
        {
            Lock lock(mutex_);
            requested_.store(true);
        }
        cv_.notify_all();
    }

    bool requested() const { return requested_.load(); }

    /**
     * @brief Sleep for rel_time unless a stop is requested first
     * @return true if a stop was requested
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& rel_time) {
        UniqueLock lock(mutex_);
        return cv_.wait_for(lock, rel_time, [this] { return requested_.load(); });
    }

private:
    Mutex mutex_;
    ConditionVariable cv_;
    std::atomic<bool> requested_{false};
};

} // namespace fidasrelay
