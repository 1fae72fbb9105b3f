#pragma once

#include "errors.hpp"
#include "platform/timestamp.hpp"

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sertial/sertial.hpp>
#include <sertial/containers/fixed_vector.hpp>
#include <sertial/containers/fixed_string.hpp>

namespace fidasrelay {

constexpr std::size_t MAX_METRICS = 16;

// ============================================================================
// Measurement (journal record, serialized with SeRTial)
// ============================================================================

/// One named reading. has_value == false keeps the slot for a missing reading.
struct MetricValue {
    sertial::fixed_string<16> name;
    double value;
    bool has_value;
};

// Must stay an aggregate for reflection (no constructors!)
struct Measurement {
    uint64_t sequence_number;
    Timestamp wall_time_ns;     ///< Acquisition instant, UTC
    Timestamp monotonic_ns;     ///< Host monotonic clock at acquisition
    sertial::fixed_string<32> sensor_id;
    sertial::fixed_vector<MetricValue, MAX_METRICS> values;  ///< Acquisition column order
};

/**
 * @brief Append or overwrite a named reading
 * @return false if the measurement already holds MAX_METRICS readings
 */
inline bool set_value(Measurement& m, std::string_view name, std::optional<double> value) {
    for (std::size_t i = 0; i < m.values.size(); ++i) {
        if (name == std::string_view(m.values[i].name)) {
            m.values[i].value = value.value_or(0.0);
            m.values[i].has_value = value.has_value();
            return true;
        }
    }
    if (m.values.size() >= MAX_METRICS) {
        return false;
    }
    MetricValue mv{};
    mv.name = sertial::fixed_string<16>(name);
    mv.value = value.value_or(0.0);
    mv.has_value = value.has_value();
    m.values.push_back(mv);
    return true;
}

inline std::optional<double> get_value(const Measurement& m, std::string_view name) {
    for (std::size_t i = 0; i < m.values.size(); ++i) {
        if (name == std::string_view(m.values[i].name)) {
            if (!m.values[i].has_value) {
                return std::nullopt;
            }
            return m.values[i].value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Delivery Receipt
// ============================================================================

/**
 * @brief Outcome of one Uploader::send call
 *
 * The accepted set is always a prefix of the batch: the first
 * accepted_count measurements. A failure describes the remainder.
 */
struct DeliveryReceipt {
    std::size_t accepted_count{0};
    std::optional<UploadError> failure;
    std::string detail;

    static DeliveryReceipt accepted(std::size_t count) {
        return DeliveryReceipt{.accepted_count = count, .failure = std::nullopt, .detail = {}};
    }

    static DeliveryReceipt failed(UploadError error, std::string detail = {}, std::size_t accepted = 0) {
        return DeliveryReceipt{.accepted_count = accepted, .failure = error, .detail = std::move(detail)};
    }

    bool ok() const { return !failure.has_value(); }
};

using Batch = std::vector<Measurement>;

} // namespace fidasrelay
