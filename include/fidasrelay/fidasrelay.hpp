#pragma once

/**
 * @file fidasrelay.hpp
 * @brief Main FidasRelay header - everything needed to assemble a relay
 *
 * Data flow:
 *   InstrumentReader -> SampleStore (durable) -> Uploader -> acknowledge
 * driven by a Pump on one thread, started and stopped by a
 * LifecycleController.
 */

#include "fidasrelay/errors.hpp"
#include "fidasrelay/result.hpp"
#include "fidasrelay/measurement.hpp"
#include "fidasrelay/platform/timestamp.hpp"
#include "fidasrelay/store/sample_store.hpp"
#include "fidasrelay/instrument/instrument_reader.hpp"
#include "fidasrelay/instrument/fidas_export_reader.hpp"
#include "fidasrelay/uplink/uploader.hpp"
#include "fidasrelay/uplink/backoff_policy.hpp"
#include "fidasrelay/uplink/citiesair_uploader.hpp"
#include "fidasrelay/pump/pump.hpp"
#include "fidasrelay/lifecycle/stop_signal.hpp"
#include "fidasrelay/lifecycle/lifecycle_controller.hpp"
#include "fidasrelay/agent_config.hpp"

/**
 * @namespace fidasrelay
 * @brief Store-and-forward relay for Fidas dust monitor measurements
 */
