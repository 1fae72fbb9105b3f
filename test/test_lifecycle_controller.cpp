/**
 * @file test_lifecycle_controller.cpp
 * @brief Pump thread start/stop and completion reporting
 */

#include "fidasrelay/lifecycle/lifecycle_controller.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace fidasrelay;
using namespace fidasrelay::test;

namespace {

PumpConfig slow_ticks() {
    PumpConfig config;
    config.poll_interval = Milliseconds(3600000);
    config.stats_interval_ticks = 0;
    config.backoff_seed = 1;
    return config;
}

} // namespace

int main() {
    std::cout << "=== LifecycleController Tests ===\n\n";

    // Test 1: stop() without start()
    {
        std::cout << "Test 1: Stop before start\n";
        TempDir dir;
        SampleStore store({.directory = dir.path()});
        FakeReader reader;
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(slow_ticks(), store, reader, uploader, stop);
        LifecycleController controller(pump, stop);

        assert(!controller.running());
        assert(controller.stop(Milliseconds(10)));
        assert(!controller.exit_reason().has_value());
        std::cout << "  PASS: Nothing to stop\n\n";
    }

    // Test 2: start() twice runs one pump
    {
        std::cout << "Test 2: Idempotent start\n";
        TempDir dir;
        SampleStore store({.directory = dir.path()});
        assert(store.open());
        FakeReader reader;
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(slow_ticks(), store, reader, uploader, stop);
        LifecycleController controller(pump, stop);

        controller.start();
        controller.start();
        assert(eventually([&] { return reader.calls >= 1; }));
        assert(controller.running());

        assert(controller.stop(Milliseconds(5000)));
        assert(controller.finished());
        assert(!controller.running());
        assert(reader.calls == 1);
        assert(controller.exit_reason() == PumpExit::Stopped);
        std::cout << "  PASS: One pump thread, clean stop\n\n";
    }

    // Test 3: Pump ending on its own is visible without stop()
    {
        std::cout << "Test 3: Pump exits by itself\n";
        TempDir dir;
        SampleStore store({.directory = dir.path()});    // not opened
        FakeReader reader(1);
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(slow_ticks(), store, reader, uploader, stop);
        LifecycleController controller(pump, stop);

        controller.start();
        assert(controller.wait_for_finish(Milliseconds(5000)));
        assert(controller.finished());
        assert(controller.exit_reason() == PumpExit::StoreFailure);
        assert(controller.stop(Milliseconds(100)));
        std::cout << "  PASS: finished() and exit_reason() report the failure\n\n";
    }

    // Test 4: StopSignal wakes a waiter early
    {
        std::cout << "Test 4: StopSignal wait\n";
        StopSignal signal;
        assert(!signal.wait_for(Milliseconds(5)));
        signal.request();
        assert(signal.requested());
        const Timestamp before = Time::monotonic_now();
        assert(signal.wait_for(Milliseconds(60000)));
        assert(Time::monotonic_now() - before < Time::to_nanoseconds(Milliseconds(1000)));
        std::cout << "  PASS: Requested stop returns immediately\n\n";
    }

    // Test 5: Controller destroyed while a detached pump is still sending
    {
        std::cout << "Test 5: Controller gone before the pump\n";
        // Pump and collaborators outlive the detached thread, as in the agent
        TempDir* dir = new TempDir;
        SampleStore* store = new SampleStore({.directory = dir->path()});
        assert(store->open());
        FakeReader* reader = new FakeReader(1);
        FakeUploader* uploader = new FakeUploader;
        uploader->block_sends();
        StopSignal* stop = new StopSignal;
        Pump* pump = new Pump(slow_ticks(), *store, *reader, *uploader, *stop);
        {
            LifecycleController controller(*pump, *stop);
            controller.start();
            assert(uploader->wait_in_flight(Milliseconds(5000)));
            assert(!controller.stop(Milliseconds(20)));
            assert(!controller.finished());
        }
        uploader->release();
        assert(eventually([&] { return uploader->accepted_total() == 1; }));
        std::cout << "  PASS: Detached pump completes after its controller is destroyed\n\n";
    }

    std::cout << "=== All LifecycleController Tests Passed! ===\n";
    return 0;
}
