#pragma once

#include "fidasrelay/measurement.hpp"
#include "fidasrelay/result.hpp"

namespace fidasrelay {

using ReadResult = Result<Measurement, ReadError>;

/**
 * @brief Instrument link capability
 *
 * read() is called on every scheduling tick, and again without waiting for
 * the next tick while has_more() reports buffered data (catch-up after a
 * restart or outage). All calls come from the pump thread.
 * Implementations assign sequence_number from their own counter, which
 * must continue from the store's last sequence number after a restart.
 * A read must return within a bounded time.
 */
class InstrumentReader {
public:
    virtual ~InstrumentReader() = default;

    virtual ReadResult read() = 0;

    /// More data can be returned immediately, without waiting for a tick
    virtual bool has_more() const { return false; }
};

} // namespace fidasrelay
