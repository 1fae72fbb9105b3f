#include "fidasrelay/pump/pump.hpp"

#include <rfl.hpp>
#include <rfl/json.hpp>

#include <algorithm>
#include <span>
#include <utility>
#include <iostream>

namespace fidasrelay {

Pump::Pump(PumpConfig config,
           SampleStore& store,
           InstrumentReader& reader,
           Uploader& uploader,
           StopSignal& stop)
    : config_(std::move(config))
    , store_(store)
    , reader_(reader)
    , uploader_(uploader)
    , stop_(stop)
    , backoff_(config_.backoff_seed
                   ? BackoffPolicy(config_.backoff, *config_.backoff_seed)
                   : BackoffPolicy(config_.backoff)) {
    if (config_.max_batch_size == 0) {
        config_.max_batch_size = 1;
    }
}

PumpExit Pump::run() {
    std::cout << "[Pump] Started: poll_interval=" << config_.poll_interval.count() << "ms"
              << ", max_batch_size=" << config_.max_batch_size
              << ", backlog=" << store_.pending_count() << "\n";

    PumpState state = PumpState::Idle;
    while (state != PumpState::ShuttingDown) {
        state = step(state);
    }

    log_stats();
    if (store_failed_) {
        std::cerr << "[Pump] Stopped after store failure\n";
        return PumpExit::StoreFailure;
    }
    std::cout << "[Pump] Stopped, " << store_.pending_count() << " measurement(s) pending\n";
    return PumpExit::Stopped;
}

PumpState Pump::step(PumpState state) {
    if (store_failed_ || stop_.requested()) {
        return PumpState::ShuttingDown;
    }
    switch (state) {
        case PumpState::Idle:         return idle();
        case PumpState::Polling:      return polling();
        case PumpState::Uploading:    return uploading();
        case PumpState::BackingOff:   return backing_off();
        case PumpState::ShuttingDown: return PumpState::ShuttingDown;
    }
    return PumpState::ShuttingDown;
}

void Pump::log_stats() const {
    std::cout << "[Pump] Stats: " << rfl::json::write(stats_) << "\n";
}

// ============================================================================
// States
// ============================================================================

PumpState Pump::idle() {
    Timestamp now = Time::monotonic_now();
    if (!tick_due(now)) {
        if (stop_.wait_for(Nanoseconds(next_tick_ - now))) {
            return PumpState::ShuttingDown;
        }
        now = Time::monotonic_now();
        if (!tick_due(now)) {
            return PumpState::Idle;     // Spurious early wakeup
        }
    }
    advance_tick(now);
    return PumpState::Polling;
}

PumpState Pump::polling() {
    Measurement measurement;
    if (held_) {
        measurement = *held_;
    } else {
        auto read = reader_.read();
        if (!read) {
            switch (read.error()) {
                case ReadError::TransientUnavailable:
                    ++stats_.reads_unavailable;
                    std::cerr << "[Pump] Instrument unavailable, retrying next tick\n";
                    break;
                case ReadError::ProtocolError:
                    ++stats_.protocol_errors;
                    std::cerr << "[Pump] Instrument protocol error, record skipped\n";
                    break;
                case ReadError::NoNewData:
                    ++stats_.reads_no_data;
                    break;
            }
            return after_read_failure();
        }
        ++stats_.reads_ok;
        measurement = std::move(*read);
    }

    auto appended = store_.append(measurement);
    if (appended) {
        if (held_) {
            std::cout << "[Pump] Store has room again, held measurement seq="
                      << measurement.sequence_number << " enqueued\n";
            held_.reset();
        }
        ++stats_.measurements_appended;
        if (reader_.has_more() && store_.pending_count() < config_.max_batch_size) {
            return PumpState::Polling;      // Catching up, fill a batch first
        }
        return PumpState::Uploading;
    }

    switch (appended.error()) {
        case StoreError::StoreFull:
            ++stats_.store_full;
            if (!held_) {
                std::cerr << "[Pump] Store full (" << store_.pending_count() << "/"
                          << store_.capacity() << "), holding seq="
                          << measurement.sequence_number << "\n";
                held_ = std::move(measurement);
            }
            return PumpState::Uploading;
        case StoreError::OutOfOrder:
            ++stats_.out_of_order;
            std::cerr << "[Pump] Dropping out-of-order measurement seq="
                      << measurement.sequence_number << " (last="
                      << store_.last_sequence_number() << ")\n";
            held_.reset();
            return after_read_failure();
        case StoreError::IOFailure:
            break;
    }
    return store_failure(appended.error(), "append");
}

PumpState Pump::uploading() {
    Timestamp now = Time::monotonic_now();
    if (retry_at_ != 0) {
        if (now < retry_at_) {
            return PumpState::BackingOff;   // Came here from a poll during backoff
        }
        retry_at_ = 0;
    }

    Batch batch = store_.peek_batch(config_.max_batch_size);
    if (batch.empty()) {
        return PumpState::Idle;
    }

    DeliveryReceipt receipt = uploader_.send(batch);
    ++stats_.batches_sent;

    std::size_t accepted = std::min(receipt.accepted_count, batch.size());
    if (accepted > 0) {
        auto acked = store_.acknowledge(batch[accepted - 1].sequence_number);
        if (!acked) {
            return store_failure(acked.error(), "acknowledge");
        }
        stats_.measurements_delivered += accepted;
    }

    if (accepted == batch.size()) {
        attempt_ = 0;
        if (store_.pending_count() > 0 && !tick_due(Time::monotonic_now())) {
            return PumpState::Uploading;
        }
        if (held_ || (store_.pending_count() == 0 && reader_.has_more())) {
            return PumpState::Polling;      // Room again for the held measurement, or catching up
        }
        return PumpState::Idle;
    }

    // A success that covers only a prefix leaves the rest to be retried
    const UploadError cause = receipt.failure.value_or(UploadError::ServerError);
    if (receipt.ok()) {
        std::cerr << "[Pump] Endpoint accepted " << accepted << " of " << batch.size()
                  << " measurement(s) without reporting a failure\n";
    }
    ++stats_.upload_failures;

    if (is_retryable(cause)) {
        std::cerr << "[Pump] Upload of " << (batch.size() - accepted) << " measurement(s) failed: "
                  << to_string(cause);
        if (!receipt.detail.empty()) {
            std::cerr << " (" << receipt.detail << ")";
        }
        std::cerr << "\n";
        return PumpState::BackingOff;
    }

    // Permanently rejected: dead-letter the rest of the batch and move on
    std::span<const Measurement> rejected(batch.data() + accepted, batch.size() - accepted);
    auto quarantined = store_.quarantine(rejected, cause, receipt.detail);
    if (!quarantined) {
        return store_failure(quarantined.error(), "quarantine");
    }
    auto acked = store_.acknowledge(rejected.back().sequence_number);
    if (!acked) {
        return store_failure(acked.error(), "acknowledge");
    }
    ++stats_.batches_rejected;
    stats_.measurements_rejected += rejected.size();
    attempt_ = 0;
    return held_ ? PumpState::Polling : PumpState::Idle;
}

PumpState Pump::backing_off() {
    Timestamp now = Time::monotonic_now();
    if (retry_at_ == 0) {
        Milliseconds delay = backoff_.delay(attempt_);
        ++attempt_;
        ++stats_.backoff_cycles;
        retry_at_ = now + Time::to_nanoseconds(delay);
        std::cerr << "[Pump] Backing off " << delay.count() << "ms (attempt " << attempt_ << ")\n";
    }

    Timestamp wake_at = std::min(retry_at_, next_tick_);
    if (wake_at > now && stop_.wait_for(Nanoseconds(wake_at - now))) {
        return PumpState::ShuttingDown;
    }

    now = Time::monotonic_now();
    if (now >= retry_at_) {
        retry_at_ = 0;
        return PumpState::Uploading;
    }
    if (tick_due(now)) {
        advance_tick(now);
        return PumpState::Polling;
    }
    return PumpState::BackingOff;
}

// ============================================================================
// Helpers
// ============================================================================

PumpState Pump::store_failure(StoreError error, const char* operation) {
    std::cerr << "[Pump] Store " << operation << " failed: " << to_string(error)
              << ", shutting down\n";
    store_failed_ = true;
    return PumpState::ShuttingDown;
}

PumpState Pump::after_read_failure() {
    if (store_.pending_count() > 0) {
        return PumpState::Uploading;
    }
    return reader_.has_more() ? PumpState::Polling : PumpState::Idle;
}

bool Pump::tick_due(Timestamp now) const {
    return next_tick_ == 0 || now >= next_tick_;
}

void Pump::advance_tick(Timestamp now) {
    const Timestamp interval = Time::to_nanoseconds(config_.poll_interval);
    // Fixed cadence; ticks missed during a long upload are skipped, not replayed
    next_tick_ = (next_tick_ == 0 || next_tick_ + interval <= now) ? now + interval
                                                                   : next_tick_ + interval;
    ++stats_.ticks;
    if (config_.stats_interval_ticks != 0 && stats_.ticks % config_.stats_interval_ticks == 0) {
        log_stats();
    }
}

} // namespace fidasrelay
