#pragma once

#include <fidasrelay/fidasrelay.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <atomic>
#include <string>

namespace fidasrelay {

// Global flag for signal handling
inline std::atomic<bool> g_shutdown_requested{false};

/**
 * @brief Signal handler for graceful shutdown
 *
 * Handles SIGINT and SIGTERM by setting shutdown flag.
 */
inline void signal_handler(int /*signal*/) {
    g_shutdown_requested.store(true);
}

/**
 * @brief Run the relay until a signal arrives or the pump gives up
 *
 * Process-level concerns only: signals, store open/close, wiring and
 * exit codes. Scheduling lives in Pump, threading in LifecycleController.
 *
 * @return Exit code (0 = stopped, 1 = store or startup failure)
 *
 * @note If the shutdown grace period expires while an upload is still in
 *       flight, the process leaves through std::_Exit(0) so no destructor
 *       runs underneath the detached pump thread. Everything acknowledged is
 *       already durable, the rest is replayed on the next start.
 */
inline int run_agent(const AgentConfig& config) {
    const std::string& name = config.name.value();
    const Milliseconds grace(config.shutdown_grace_ms.value());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[" << name << "] Starting (store=" << config.store.directory
              << ", exports=" << config.instrument.export_dir << ")\n";

    SampleStore store(to_store_options(config));
    auto opened = store.open();
    if (!opened) {
        std::cerr << "[" << name << "] ERROR: cannot open sample store: "
                  << to_string(opened.error()) << "\n";
        return 1;
    }

    FidasExportReader reader(to_reader_options(config),
                             store.last_sequence_number(),
                             store.last_wall_time_ns());
    CitiesAirUploader uploader(to_uploader_options(config));

    StopSignal stop;
    Pump pump(to_pump_config(config), store, reader, uploader, stop);
    LifecycleController controller(pump, stop);
    controller.start();
    std::cout << "[" << name << "] Running (SIGINT/SIGTERM to stop)...\n";

    // Wait for shutdown signal or for the pump to end on its own
    while (!g_shutdown_requested.load() && !controller.wait_for_finish(Milliseconds(100))) {
    }

    if (g_shutdown_requested.load()) {
        std::cout << "[" << name << "] Shutdown requested\n";
    }
    if (!controller.stop(grace)) {
        std::cerr << "[" << name << "] Grace period of " << grace.count()
                  << "ms expired, exiting with upload in flight\n";
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(0);
    }

    const bool store_failed = controller.exit_reason() == PumpExit::StoreFailure;
    if (!store_failed) {
        auto closed = store.close();
        if (!closed) {
            std::cerr << "[" << name << "] ERROR: closing sample store: "
                      << to_string(closed.error()) << "\n";
            return 1;
        }
    }
    if (store_failed) {
        std::cerr << "[" << name << "] Stopped after sample store failure\n";
        return 1;
    }
    std::cout << "[" << name << "] Stopped successfully\n";
    return 0;
}

/**
 * @brief Main entry point with argc/argv handling
 *
 * Expects exactly one argument, the JSON configuration file.
 *
 * @return Exit code (0 = stopped, 1 = configuration, store or unexpected error)
 */
inline int agent_main(int argc, char** argv) {
    try {
        if (argc != 2) {
            std::cerr << "ERROR: Configuration file required\n";
            std::cerr << "Usage: " << argv[0] << " <config.json>\n";
            return 1;
        }
        AgentConfig config = load_agent_config(argv[1]);
        return run_agent(config);

    } catch (const ConfigError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Fatal error: unknown exception\n";
        return 1;
    }
}

} // namespace fidasrelay

/**
 * @brief Macro for the relay binary's main()
 *
 * Example:
 * @code
 * FIDASRELAY_AGENT_MAIN()
 * @endcode
 */
#define FIDASRELAY_AGENT_MAIN() \
    int main(int argc, char** argv) { \
        return fidasrelay::agent_main(argc, argv); \
    }
