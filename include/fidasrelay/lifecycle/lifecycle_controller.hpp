#pragma once

#include "fidasrelay/lifecycle/stop_signal.hpp"
#include "fidasrelay/platform/timestamp.hpp"
#include "fidasrelay/pump/pump.hpp"
#include "fidasrelay/threading.hpp"

#include <memory>
#include <optional>

namespace fidasrelay {

/**
 * @brief Runs the pump on its own thread and stops it within a grace period
 *
 * Usage:
 *   LifecycleController controller(pump, stop);
 *   controller.start();
 *   ...
 *   if (!controller.stop(Milliseconds(10000))) {
 *       // Pump still inside an upload; thread was detached
 *   }
 *
 * A detached pump thread keeps the completion state alive on its own, so the
 * controller may be destroyed first. The Pump and everything it references
 * must outlive the detached thread; the agent exits the process instead.
 */
class LifecycleController {
public:
    LifecycleController(Pump& pump, StopSignal& stop);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    /**
     * @brief Spawn the pump thread (no-op if already started)
     */
    void start();

    /**
     * @brief Request stop and wait up to grace for the pump to finish
     *
     * @return true if the pump finished and was joined, false if the grace
     *         period expired and the thread was detached
     */
    bool stop(Milliseconds grace);

    /**
     * @brief Block until the pump finishes on its own or timeout elapses
     * @return true if the pump has finished
     */
    bool wait_for_finish(Milliseconds timeout);

    bool running() const { return started_ && !finished(); }
    bool finished() const;

    /// Set once the pump thread has returned
    std::optional<PumpExit> exit_reason() const;

private:
    /// Shared with the pump thread so a detached run never touches the controller
    struct Completion {
        Mutex mutex;
        ConditionVariable cv;
        bool done{false};
        std::optional<PumpExit> exit;
    };

    Pump& pump_;
    StopSignal& stop_;
    Thread thread_{ThreadConfig{.name = "fidasrelay-pump"}};
    bool started_{false};
    std::shared_ptr<Completion> completion_;
};

} // namespace fidasrelay
