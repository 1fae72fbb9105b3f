#pragma once

#include <stdexcept>
#include <string>

namespace fidasrelay {

// ============================================================================
// Error Types
// ============================================================================

/// Instrument read failures. None of them is fatal to the process.
enum class ReadError {
    TransientUnavailable,   ///< Instrument not answering, retry next tick
    ProtocolError,          ///< Malformed response, skipped and counted
    NoNewData               ///< Instrument answered, nothing newer than the cursor
};

enum class StoreError {
    StoreFull,      ///< Pending backlog reached the capacity ceiling
    IOFailure,      ///< Durability can no longer be guaranteed (fatal)
    OutOfOrder      ///< Sequence number not greater than the last appended one
};

enum class UploadError {
    NetworkUnreachable,
    Timeout,
    ServerRejected,     ///< Content rejected, never retried
    ServerError
};

constexpr const char* to_string(ReadError error) {
    switch (error) {
        case ReadError::TransientUnavailable: return "Instrument temporarily unavailable";
        case ReadError::ProtocolError:        return "Instrument protocol error";
        case ReadError::NoNewData:            return "No new data";
    }
    return "Unknown error";
}

constexpr const char* to_string(StoreError error) {
    switch (error) {
        case StoreError::StoreFull:  return "Sample store full";
        case StoreError::IOFailure:  return "Sample store I/O failure";
        case StoreError::OutOfOrder: return "Sequence number out of order";
    }
    return "Unknown error";
}

constexpr const char* to_string(UploadError error) {
    switch (error) {
        case UploadError::NetworkUnreachable: return "Network unreachable";
        case UploadError::Timeout:            return "Operation timed out";
        case UploadError::ServerRejected:     return "Server rejected batch";
        case UploadError::ServerError:        return "Server error";
    }
    return "Unknown error";
}

/// Retryable upload failures drive the backoff state
constexpr bool is_retryable(UploadError error) {
    return error != UploadError::ServerRejected;
}

/// Thrown for invalid or unreadable configuration; maps to exit code 1
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("configuration error: " + what) {}
};

} // namespace fidasrelay
