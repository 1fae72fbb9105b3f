#pragma once

#include "fidasrelay/instrument/fidas_export_reader.hpp"
#include "fidasrelay/pump/pump.hpp"
#include "fidasrelay/store/sample_store.hpp"
#include "fidasrelay/uplink/citiesair_uploader.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

#include <rfl.hpp>

namespace fidasrelay {

// ============================================================================
// Agent Configuration (JSON, loaded with reflect-cpp)
// ============================================================================

constexpr uint64_t DEFAULT_POLL_INTERVAL_MS = 60000;
constexpr std::size_t DEFAULT_MAX_BATCH_SIZE = 100;
constexpr uint64_t DEFAULT_NETWORK_TIMEOUT_MS = 30000;
constexpr uint64_t DEFAULT_SHUTDOWN_GRACE_MS = 35000;  // One full network timeout plus margin

struct BackoffSettings {
    rfl::DefaultVal<uint64_t> base_ms = 1000;
    rfl::DefaultVal<uint64_t> ceiling_ms = 300000;
    rfl::DefaultVal<double> jitter = 0.2;
};

struct StoreSettings {
    std::string directory;
    rfl::DefaultVal<std::size_t> capacity = 100000;
    rfl::DefaultVal<std::size_t> compact_threshold = 512;
};

struct EndpointSettings {
    std::string url;
    // Name of the environment variable holding the API key, empty = no auth
    rfl::DefaultVal<std::string> credentials_env = std::string("CITIESAIR_API_KEY");
    rfl::DefaultVal<std::string> auth_header = std::string("Authorization");
    rfl::DefaultVal<std::string> auth_scheme = std::string("Bearer");
};

struct InstrumentSettings {
    std::string export_dir;
    rfl::DefaultVal<std::string> sensor_id = std::string();   // Empty: from export file name
    rfl::DefaultVal<int> utc_offset_hours = 0;
    // Rows held in memory while catching up on a backlog
    rfl::DefaultVal<std::size_t> max_buffered_rows = 1000;
};

struct AgentConfig {
    rfl::DefaultVal<std::string> name = std::string("fidasrelay");

    rfl::DefaultVal<uint64_t> poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
    rfl::DefaultVal<std::size_t> max_batch_size = DEFAULT_MAX_BATCH_SIZE;
    rfl::DefaultVal<BackoffSettings> backoff = BackoffSettings{};

    StoreSettings store;
    EndpointSettings endpoint;
    InstrumentSettings instrument;

    rfl::DefaultVal<uint64_t> network_timeout_ms = DEFAULT_NETWORK_TIMEOUT_MS;
    rfl::DefaultVal<uint64_t> shutdown_grace_ms = DEFAULT_SHUTDOWN_GRACE_MS;
    rfl::DefaultVal<uint32_t> stats_interval_ticks = 60;
};

/**
 * @brief Parse and validate a JSON document
 * @throws ConfigError
 */
AgentConfig parse_agent_config(const std::string& json);

/**
 * @brief Load and validate a JSON config file
 * @throws ConfigError
 */
AgentConfig load_agent_config(const std::string& path);

/**
 * @brief Check ranges and required values
 * @throws ConfigError naming the first offending field
 */
void validate(const AgentConfig& config);

PumpConfig to_pump_config(const AgentConfig& config);
SampleStore::Options to_store_options(const AgentConfig& config);
FidasExportReader::Options to_reader_options(const AgentConfig& config);

/**
 * @brief Uploader options with the credentials resolved from the environment
 * @throws ConfigError if the named environment variable is not set
 */
CitiesAirUploader::Options to_uploader_options(const AgentConfig& config);

} // namespace fidasrelay
