#include "fidasrelay/lifecycle/lifecycle_controller.hpp"

#include <exception>
#include <iostream>

namespace fidasrelay {

LifecycleController::LifecycleController(Pump& pump, StopSignal& stop)
    : pump_(pump)
    , stop_(stop)
    , completion_(std::make_shared<Completion>()) {
}

LifecycleController::~LifecycleController() {
    if (started_ && thread_.joinable()) {
        stop_.request();
        thread_.join();
    }
}

void LifecycleController::start() {
    if (started_) {
        return;
    }
    started_ = true;
    thread_.start([&pump = pump_, completion = completion_] {
        PumpExit reason = PumpExit::StoreFailure;
        try {
            reason = pump.run();
        } catch (const std::exception& e) {
            std::cerr << "[Lifecycle] Pump terminated by exception: " << e.what() << "\n";
        }
        Lock lock(completion->mutex);
        completion->done = true;
        completion->exit = reason;
        completion->cv.notify_all();
    });
    std::cout << "[Lifecycle] Pump thread started\n";
}

bool LifecycleController::stop(Milliseconds grace) {
    if (!started_) {
        return true;
    }
    std::cout << "[Lifecycle] Stop requested, grace " << grace.count() << "ms\n";
    stop_.request();

    if (!wait_for_finish(grace)) {
        std::cerr << "[Lifecycle] Pump did not finish within " << grace.count()
                  << "ms, detaching\n";
        thread_.detach();
        return false;
    }
    thread_.join();
    std::cout << "[Lifecycle] Pump stopped\n";
    return true;
}

bool LifecycleController::wait_for_finish(Milliseconds timeout) {
    Completion& c = *completion_;
    UniqueLock lock(c.mutex);
    return c.cv.wait_for(lock, timeout, [&c] { return c.done; });
}

bool LifecycleController::finished() const {
    Lock lock(completion_->mutex);
    return completion_->done;
}

std::optional<PumpExit> LifecycleController::exit_reason() const {
    Lock lock(completion_->mutex);
    return completion_->exit;
}

} // namespace fidasrelay
