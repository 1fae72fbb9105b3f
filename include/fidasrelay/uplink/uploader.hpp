#pragma once

#include "fidasrelay/measurement.hpp"

#include <span>

namespace fidasrelay {

/**
 * @brief Upload endpoint capability
 *
 * send() transmits one ordered batch and reports what happened. It never
 * touches the sample store. The receipt's accepted set is the whole batch
 * or a strict prefix of it, and every call is bounded by a timeout.
 */
class Uploader {
public:
    virtual ~Uploader() = default;

    virtual DeliveryReceipt send(std::span<const Measurement> batch) = 0;
};

} // namespace fidasrelay
