/**
 * @file pump.hpp
 * @brief Scheduling loop: read -> enqueue -> drain-and-upload -> acknowledge
 *
 * The pump is a small state machine driven by one thread. Every store,
 * reader and uploader call happens on that thread, so none of them needs
 * locking. A stop request is honoured between steps: the current step (one
 * append, or one send plus its acknowledge) always completes.
 *
 *   Idle --tick--> Polling --appended--> Uploading --accepted, backlog--> Uploading
 *                     |                      |  --accepted, drained--> Idle
 *                     +--no data--> Idle     |  --retryable--> BackingOff --> Uploading
 *                                            |  --rejected (dead-lettered)--> Idle
 *   any --stop--> ShuttingDown
 *
 * A poll tick that falls due while backing off is still served
 * (BackingOff -> Polling), so an unreachable endpoint does not pause
 * acquisition; the store's capacity ceiling bounds the backlog instead.
 * While the reader reports has_more(), Polling repeats without waiting for
 * a tick so that a restart with old instrument data catches up.
 */

#pragma once

#include "fidasrelay/instrument/instrument_reader.hpp"
#include "fidasrelay/lifecycle/stop_signal.hpp"
#include "fidasrelay/platform/timestamp.hpp"
#include "fidasrelay/store/sample_store.hpp"
#include "fidasrelay/uplink/backoff_policy.hpp"
#include "fidasrelay/uplink/uploader.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fidasrelay {

enum class PumpState {
    Idle,
    Polling,
    Uploading,
    BackingOff,
    ShuttingDown
};

constexpr const char* to_string(PumpState state) {
    switch (state) {
        case PumpState::Idle:         return "Idle";
        case PumpState::Polling:      return "Polling";
        case PumpState::Uploading:    return "Uploading";
        case PumpState::BackingOff:   return "BackingOff";
        case PumpState::ShuttingDown: return "ShuttingDown";
    }
    return "Invalid";
}

/// Why run() returned
enum class PumpExit {
    Stopped,        ///< Stop requested
    StoreFailure    ///< Store reported IOFailure, durability lost
};

struct PumpConfig {
    Milliseconds poll_interval{60000};
    std::size_t max_batch_size{100};
    BackoffPolicy::Options backoff{};
    std::optional<uint64_t> backoff_seed;   ///< Fixed seed for reproducible jitter
    uint32_t stats_interval_ticks{60};      ///< 0 = only log at shutdown
};

/**
 * @brief Counters for everything the pump absorbs instead of failing
 */
struct PumpStats {
    uint64_t ticks{0};
    uint64_t reads_ok{0};
    uint64_t reads_unavailable{0};
    uint64_t reads_no_data{0};
    uint64_t protocol_errors{0};
    uint64_t store_full{0};
    uint64_t out_of_order{0};
    uint64_t measurements_appended{0};
    uint64_t batches_sent{0};
    uint64_t measurements_delivered{0};
    uint64_t upload_failures{0};
    uint64_t backoff_cycles{0};
    uint64_t batches_rejected{0};
    uint64_t measurements_rejected{0};
};

class Pump {
public:
    Pump(PumpConfig config,
         SampleStore& store,
         InstrumentReader& reader,
         Uploader& uploader,
         StopSignal& stop);

    Pump(const Pump&) = delete;
    Pump& operator=(const Pump&) = delete;

    /**
     * @brief Run the state machine until ShuttingDown
     */
    PumpExit run();

    /**
     * @brief Execute one state and return the next one
     */
    PumpState step(PumpState state);

    /// Only safe to read from another thread after run() returned
    const PumpStats& stats() const { return stats_; }

    void log_stats() const;

private:
    PumpState idle();
    PumpState polling();
    PumpState uploading();
    PumpState backing_off();

    PumpState store_failure(StoreError error, const char* operation);
    PumpState after_read_failure();
    bool tick_due(Timestamp now) const;
    void advance_tick(Timestamp now);

    PumpConfig config_;
    SampleStore& store_;
    InstrumentReader& reader_;
    Uploader& uploader_;
    StopSignal& stop_;
    BackoffPolicy backoff_;

    PumpStats stats_;
    std::optional<Measurement> held_;   ///< Read but not yet appended (store was full)
    Timestamp next_tick_{0};            ///< Monotonic; 0 = tick immediately
    Timestamp retry_at_{0};             ///< Monotonic; 0 = no backoff in progress
    uint32_t attempt_{0};
    bool store_failed_{false};
};

} // namespace fidasrelay
