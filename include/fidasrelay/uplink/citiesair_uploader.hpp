#pragma once

#include "fidasrelay/uplink/uploader.hpp"
#include "fidasrelay/platform/timestamp.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace fidasrelay {

/**
 * @brief One element of the CITIESair measurement array
 */
struct CitiesAirRecord {
    std::string ts;                 ///< ISO-8601 with the instrument's UTC offset
    std::optional<double> t;        ///< Temperature
    std::optional<double> h;        ///< Relative humidity
    std::optional<int64_t> p;       ///< Pressure in Pa
    std::optional<double> p1;
    std::optional<double> p25;
    std::optional<double> p10;
};

CitiesAirRecord to_citiesair_record(const Measurement& measurement, int utc_offset_hours);

/**
 * @brief JSON array body for a batch; missing readings are written as null
 */
std::string build_payload(std::span<const Measurement> batch, int utc_offset_hours);

/**
 * @brief Map an HTTP status to an upload failure
 * @return std::nullopt if the status accepts the whole batch
 */
std::optional<UploadError> classify_http_status(long status);

/**
 * @brief Posts batches to the CITIESair ingestion endpoint over libcurl
 *
 * Keeps one easy handle so the connection is reused between batches.
 * Not thread-safe; used from the pump thread only.
 */
class CitiesAirUploader : public Uploader {
public:
    struct Options {
        std::string url;
        std::string auth_header{"Authorization"};
        std::string auth_scheme{"Bearer"};     ///< Prepended to credentials, may be empty
        std::string credentials;               ///< Resolved secret, empty = no auth header
        Milliseconds timeout{30000};           ///< Whole request, connect included
        int utc_offset_hours{0};
    };

    explicit CitiesAirUploader(Options options);
    ~CitiesAirUploader() override;

    CitiesAirUploader(const CitiesAirUploader&) = delete;
    CitiesAirUploader& operator=(const CitiesAirUploader&) = delete;

    DeliveryReceipt send(std::span<const Measurement> batch) override;

private:
    struct CurlHandle;

    Options options_;
    std::unique_ptr<CurlHandle> curl_;
};

} // namespace fidasrelay
