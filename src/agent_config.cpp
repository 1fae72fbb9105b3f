#include "fidasrelay/agent_config.hpp"
#include "fidasrelay/errors.hpp"

#include <rfl/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fidasrelay {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

bool is_http_url(const std::string& url) {
    return url.starts_with("http://") || url.starts_with("https://");
}

} // namespace

AgentConfig parse_agent_config(const std::string& json) {
    AgentConfig config;
    try {
        config = rfl::json::read<AgentConfig>(json).value();
    } catch (const std::exception& e) {
        throw ConfigError(e.what());
    }
    validate(config);
    return config;
}

AgentConfig load_agent_config(const std::string& path) {
    if (!path.ends_with(".json")) {
        throw ConfigError("only JSON config files are supported (got: " + path + ")");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ConfigError("cannot read " + path);
    }
    AgentConfig config;
    try {
        config = rfl::json::load<AgentConfig>(path).value();
    } catch (const std::exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
    validate(config);
    return config;
}

void validate(const AgentConfig& config) {
    const BackoffSettings& backoff = config.backoff.value();

    require(!config.name.value().empty(), "name must not be empty");
    require(config.poll_interval_ms.value() > 0, "poll_interval_ms must be positive");
    require(config.max_batch_size.value() > 0, "max_batch_size must be positive");
    require(backoff.base_ms.value() > 0, "backoff.base_ms must be positive");
    require(backoff.ceiling_ms.value() >= backoff.base_ms.value(),
            "backoff.ceiling_ms must not be below backoff.base_ms");
    require(backoff.jitter.value() >= 0.0 && backoff.jitter.value() <= 1.0,
            "backoff.jitter must be within [0, 1]");
    require(!config.store.directory.empty(), "store.directory is required");
    require(config.store.capacity.value() > 0, "store.capacity must be positive");
    require(config.store.compact_threshold.value() > 0, "store.compact_threshold must be positive");
    require(is_http_url(config.endpoint.url), "endpoint.url must be an http(s) URL");
    require(!config.endpoint.auth_header.value().empty(), "endpoint.auth_header must not be empty");
    require(!config.instrument.export_dir.empty(), "instrument.export_dir is required");
    require(config.instrument.utc_offset_hours.value() >= -12 &&
            config.instrument.utc_offset_hours.value() <= 14,
            "instrument.utc_offset_hours must be within [-12, 14]");
    require(config.instrument.max_buffered_rows.value() > 0,
            "instrument.max_buffered_rows must be positive");
    require(config.network_timeout_ms.value() > 0, "network_timeout_ms must be positive");
    require(config.shutdown_grace_ms.value() > 0, "shutdown_grace_ms must be positive");

    if (config.shutdown_grace_ms.value() < config.network_timeout_ms.value()) {
        std::cerr << "[" << config.name.value() << "] Warning: shutdown_grace_ms ("
                  << config.shutdown_grace_ms.value() << ") is shorter than network_timeout_ms ("
                  << config.network_timeout_ms.value() << "), a stop during an upload may be forced\n";
    }
}

PumpConfig to_pump_config(const AgentConfig& config) {
    const BackoffSettings& backoff = config.backoff.value();
    PumpConfig pump;
    pump.poll_interval = Milliseconds(config.poll_interval_ms.value());
    pump.max_batch_size = config.max_batch_size.value();
    pump.backoff = BackoffPolicy::Options{
        .base = Milliseconds(backoff.base_ms.value()),
        .ceiling = Milliseconds(backoff.ceiling_ms.value()),
        .jitter = backoff.jitter.value()
    };
    pump.stats_interval_ticks = config.stats_interval_ticks.value();
    return pump;
}

SampleStore::Options to_store_options(const AgentConfig& config) {
    return SampleStore::Options{
        .directory = config.store.directory,
        .capacity = config.store.capacity.value(),
        .compact_threshold = config.store.compact_threshold.value()
    };
}

FidasExportReader::Options to_reader_options(const AgentConfig& config) {
    return FidasExportReader::Options{
        .export_dir = config.instrument.export_dir,
        .sensor_id = config.instrument.sensor_id.value(),
        .utc_offset_hours = config.instrument.utc_offset_hours.value(),
        .max_buffered_rows = config.instrument.max_buffered_rows.value()
    };
}

CitiesAirUploader::Options to_uploader_options(const AgentConfig& config) {
    CitiesAirUploader::Options options;
    options.url = config.endpoint.url;
    options.auth_header = config.endpoint.auth_header.value();
    options.auth_scheme = config.endpoint.auth_scheme.value();
    options.timeout = Milliseconds(config.network_timeout_ms.value());
    options.utc_offset_hours = config.instrument.utc_offset_hours.value();

    const std::string& variable = config.endpoint.credentials_env.value();
    if (!variable.empty()) {
        const char* secret = std::getenv(variable.c_str());
        if (secret == nullptr || *secret == '\0') {
            throw ConfigError("environment variable " + variable + " (endpoint.credentials_env) is not set");
        }
        options.credentials = secret;
    }
    return options;
}

} // namespace fidasrelay
