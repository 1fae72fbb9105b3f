#include "fidasrelay/uplink/citiesair_uploader.hpp"

#include <rfl.hpp>
#include <rfl/json.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace fidasrelay {

namespace {

constexpr std::size_t MAX_DETAIL = 512;

std::once_flag g_curl_init;

void ensure_curl_initialized() {
    std::call_once(g_curl_init, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

size_t collect_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    const size_t n = size * nmemb;
    if (body->size() < MAX_DETAIL) {
        body->append(data, std::min(n, MAX_DETAIL - body->size()));
    }
    return n;
}

template<typename T>
rfl::Generic to_generic(const std::optional<T>& value) {
    if (!value) {
        return rfl::Generic(std::nullopt);
    }
    return rfl::Generic(*value);
}

/// Frees the header list however send() returns
struct HeaderList {
    curl_slist* list{nullptr};
    ~HeaderList() { curl_slist_free_all(list); }

    bool append(const std::string& header) {
        curl_slist* next = curl_slist_append(list, header.c_str());
        if (next == nullptr) {
            return false;
        }
        list = next;
        return true;
    }
};

} // namespace

// ============================================================================
// Payload and status mapping
// ============================================================================

CitiesAirRecord to_citiesair_record(const Measurement& measurement, int utc_offset_hours) {
    CitiesAirRecord record;
    record.ts = Time::to_iso8601(measurement.wall_time_ns, utc_offset_hours);
    record.t = get_value(measurement, "T");
    record.h = get_value(measurement, "rH");
    if (auto hpa = get_value(measurement, "p")) {
        // Pa, ties to even
        record.p = static_cast<int64_t>(std::nearbyint(*hpa * 100.0));
    }
    record.p1 = get_value(measurement, "PM1");
    record.p25 = get_value(measurement, "PM2.5");
    record.p10 = get_value(measurement, "PM10");
    return record;
}

std::string build_payload(std::span<const Measurement> batch, int utc_offset_hours) {
    rfl::Generic::Array array;
    array.reserve(batch.size());
    for (const auto& m : batch) {
        const CitiesAirRecord r = to_citiesair_record(m, utc_offset_hours);
        rfl::Generic::Object obj;
        obj["ts"] = rfl::Generic(r.ts);
        obj["t"] = to_generic(r.t);
        obj["h"] = to_generic(r.h);
        obj["p"] = to_generic(r.p);
        obj["p1"] = to_generic(r.p1);
        obj["p25"] = to_generic(r.p25);
        obj["p10"] = to_generic(r.p10);
        array.emplace_back(std::move(obj));
    }
    return rfl::json::write(rfl::Generic(std::move(array)));
}

std::optional<UploadError> classify_http_status(long status) {
    switch (status) {
        case 200: case 201: case 202: case 204: case 207:
            return std::nullopt;
        case 400: case 409: case 413: case 415: case 422:
            return UploadError::ServerRejected;
        case 408:
            return UploadError::Timeout;
        default:
            // Auth, rate limiting and server faults: content is not at fault
            return UploadError::ServerError;
    }
}

// ============================================================================
// CitiesAirUploader
// ============================================================================

struct CitiesAirUploader::CurlHandle {
    CURL* easy{nullptr};
    char error[CURL_ERROR_SIZE]{};

    CurlHandle() : easy(curl_easy_init()) {
        if (easy == nullptr) {
            throw std::runtime_error("curl_easy_init failed");
        }
    }
    ~CurlHandle() { curl_easy_cleanup(easy); }
};

CitiesAirUploader::CitiesAirUploader(Options options)
    : options_(std::move(options)) {
    ensure_curl_initialized();
    curl_ = std::make_unique<CurlHandle>();
    if (options_.credentials.empty()) {
        std::cerr << "[CitiesAirUploader] No credentials configured, sending without "
                  << options_.auth_header << " header\n";
    }
    std::cout << "[CitiesAirUploader] Endpoint " << options_.url
              << ", timeout " << options_.timeout.count() << "ms\n";
}

CitiesAirUploader::~CitiesAirUploader() = default;

DeliveryReceipt CitiesAirUploader::send(std::span<const Measurement> batch) {
    if (batch.empty()) {
        return DeliveryReceipt::accepted(0);
    }

    const std::string body = build_payload(batch, options_.utc_offset_hours);

    HeaderList headers;
    bool headers_ok = headers.append("Content-Type: application/json");
    if (!options_.credentials.empty()) {
        std::string value = options_.auth_scheme.empty()
                                ? options_.credentials
                                : options_.auth_scheme + " " + options_.credentials;
        headers_ok = headers_ok && headers.append(options_.auth_header + ": " + value);
    }
    if (!headers_ok) {
        return DeliveryReceipt::failed(UploadError::NetworkUnreachable, "cannot allocate request headers");
    }

    std::string response;
    CURL* easy = curl_->easy;
    curl_->error[0] = '\0';
    const long timeout_ms = static_cast<long>(options_.timeout.count());

    curl_easy_reset(easy);
    curl_easy_setopt(easy, CURLOPT_URL, options_.url.c_str());
    curl_easy_setopt(easy, CURLOPT_POST, 1L);
    curl_easy_setopt(easy, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_USERAGENT, "fidasrelay");
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, curl_->error);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &response);

    const CURLcode rc = curl_easy_perform(easy);
    if (rc != CURLE_OK) {
        std::string detail = curl_->error[0] != '\0' ? curl_->error : curl_easy_strerror(rc);
        const UploadError error = rc == CURLE_OPERATION_TIMEDOUT ? UploadError::Timeout
                                                                 : UploadError::NetworkUnreachable;
        std::cerr << "[CitiesAirUploader] " << to_string(error) << ": " << detail << "\n";
        return DeliveryReceipt::failed(error, std::move(detail));
    }

    long status = 0;
    curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);

    if (auto error = classify_http_status(status)) {
        std::string detail = "HTTP " + std::to_string(status);
        if (!response.empty()) {
            detail += ": " + response;
        }
        std::cerr << "[CitiesAirUploader] Batch of " << batch.size() << " not accepted, "
                  << detail << "\n";
        return DeliveryReceipt::failed(*error, std::move(detail));
    }

    std::cout << "[CitiesAirUploader] Delivered " << batch.size() << " measurement(s), seq "
              << batch.front().sequence_number << ".." << batch.back().sequence_number
              << " (HTTP " << status << ")\n";
    return DeliveryReceipt::accepted(batch.size());
}

} // namespace fidasrelay
