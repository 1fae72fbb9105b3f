#pragma once

#include "fidasrelay/measurement.hpp"
#include "fidasrelay/result.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fidasrelay {

/**
 * @brief Persistent part of the store state (meta.json)
 */
struct StoreMeta {
    uint64_t last_acknowledged{0};
    uint64_t last_sequence{0};          ///< Highest sequence number ever appended
    uint64_t last_wall_time_ns{0};      ///< Acquisition time of the newest appended measurement
};

/**
 * @brief One dead-letter line in rejected.jsonl
 */
struct RejectedRecord {
    uint64_t sequence_number;
    std::string sensor_id;
    std::string ts;
    std::string cause;
    std::string detail;
    std::string rejected_at;            ///< Host wall clock when dead-lettered
    std::map<std::string, std::optional<double>> readings;
};

/**
 * @brief Durable FIFO of measurements awaiting delivery
 *
 * Directory layout:
 * - pending.log    append-only journal, one checksummed frame per measurement
 * - meta.json      last acknowledged / last appended, replaced atomically
 * - rejected.jsonl dead-letter records for permanently rejected measurements
 *
 * append() and acknowledge() are durable before they return success, and a
 * crash at any point reopens to the state before or after the interrupted
 * write. The store is owned by the pump thread and is not thread-safe.
 *
 * Example:
 * @code
 * SampleStore store({.directory = "/var/lib/fidasrelay", .capacity = 1000});
 * if (!store.open()) { return 1; }
 * store.append(m);
 * auto batch = store.peek_batch(100);
 * store.acknowledge(batch.back().sequence_number);
 * @endcode
 */
class SampleStore {
public:
    struct Options {
        std::string directory;
        std::size_t capacity{100000};        ///< Pending ceiling, append fails with StoreFull beyond it
        std::size_t compact_threshold{512};  ///< Acknowledged frames tolerated in the journal
    };

    explicit SampleStore(Options options);
    ~SampleStore();

    SampleStore(const SampleStore&) = delete;
    SampleStore& operator=(const SampleStore&) = delete;

    /**
     * @brief Create the directory if needed and replay the on-disk backlog
     *
     * A torn frame at the end of the journal is truncated away.
     */
    Result<void, StoreError> open();

    /**
     * @brief Flush metadata, compact and close the journal
     */
    Result<void, StoreError> close();

    bool is_open() const { return journal_fd_ >= 0; }

    Result<void, StoreError> append(const Measurement& measurement);

    /**
     * @brief Oldest pending measurements, in acquisition order
     */
    Batch peek_batch(std::size_t max_count) const;

    /**
     * @brief Drop every pending measurement with sequence_number <= up_to
     *
     * Idempotent: acknowledging an already acknowledged range is a no-op.
     */
    Result<void, StoreError> acknowledge(uint64_t up_to_sequence_number);

    /**
     * @brief Durably record measurements that will never be delivered
     *
     * Does not remove them; the caller acknowledges afterwards.
     */
    Result<void, StoreError> quarantine(std::span<const Measurement> batch,
                                        UploadError cause,
                                        const std::string& detail);

    std::size_t pending_count() const { return pending_.size(); }
    std::size_t capacity() const { return options_.capacity; }

    uint64_t last_sequence_number() const { return meta_.last_sequence; }
    uint64_t last_acknowledged() const { return meta_.last_acknowledged; }
    Timestamp last_wall_time_ns() const { return meta_.last_wall_time_ns; }

private:
    Result<void, StoreError> load_meta();
    Result<void, StoreError> write_meta(const StoreMeta& meta);
    Result<void, StoreError> replay();
    Result<void, StoreError> compact();
    bool open_journal();

    std::string journal_path() const;
    std::string meta_path() const;
    std::string rejected_path() const;

    Options options_;
    StoreMeta meta_;
    std::deque<Measurement> pending_;
    int journal_fd_{-1};
    uint64_t journal_size_{0};
    std::size_t acked_frames_{0};   ///< Acknowledged frames still present in the journal
};

} // namespace fidasrelay
