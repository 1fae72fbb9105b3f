/**
 * @file test_pump.cpp
 * @brief Pump state machine: read -> enqueue -> upload -> acknowledge
 *
 * Most tests drive Pump::step() directly so the sequence of states is
 * deterministic; the stop-during-upload tests run the pump on its
 * LifecycleController thread.
 *
 * Validates:
 * - Batch delivery and acknowledge (no loss, no duplicates)
 * - Retry with backoff after retryable failures
 * - StoreFull handling with a held measurement
 * - Bounded stop while a send is in flight
 * - Dead-lettering of rejected batches
 * - Short success receipts retry the unaccepted remainder
 * - Absorbed read errors, restart drain, fatal store failure
 */

#include "fidasrelay/lifecycle/lifecycle_controller.hpp"
#include "fidasrelay/pump/pump.hpp"
#include "test_support.hpp"

#include <cassert>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

using namespace fidasrelay;
using namespace fidasrelay::test;

namespace {

PumpConfig test_config(Milliseconds poll_interval = Milliseconds(3600000), std::size_t max_batch = 10) {
    PumpConfig config;
    config.poll_interval = poll_interval;
    config.max_batch_size = max_batch;
    config.backoff = BackoffPolicy::Options{.base = Milliseconds(5), .ceiling = Milliseconds(50), .jitter = 0.0};
    config.backoff_seed = 7;
    config.stats_interval_ticks = 0;
    return config;
}

SampleStore::Options store_options(const TempDir& dir, std::size_t capacity = 1000) {
    return SampleStore::Options{.directory = dir.sub("store"), .capacity = capacity, .compact_threshold = 16};
}

/// Step the pump until done() holds; the pump must get there within max_steps
PumpState drive(Pump& pump, PumpState state, const std::function<bool()>& done, int max_steps = 200) {
    while (!done() && max_steps-- > 0) {
        state = pump.step(state);
        assert(state != PumpState::ShuttingDown);
    }
    assert(done());
    return state;
}

} // namespace

int main() {
    std::cout << "=== Pump Tests ===\n\n";

    // Test 1: Five measurements delivered in one batch
    {
        std::cout << "Test 1: Single batch delivery\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(5);
        reader.burst = true;
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return uploader.accepted_total() == 5; });

        auto batches = uploader.batches();
        assert(batches.size() == 1);
        assert((sequences(batches[0]) == std::vector<uint64_t>{1, 2, 3, 4, 5}));
        assert(store.pending_count() == 0);
        assert(store.last_acknowledged() == 5);
        assert(pump.stats().measurements_appended == 5);
        assert(pump.stats().measurements_delivered == 5);

        std::cout << "  PASS: 1..5 accepted, backlog empty\n\n";
    }

    // Test 2: Two timeouts, then success
    {
        std::cout << "Test 2: Retry with backoff\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(3);
        reader.burst = true;
        FakeUploader uploader;
        uploader.push_failure(UploadError::Timeout, 2);
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return uploader.accepted_total() == 3; });

        assert((sequences(uploader.last_accepted()) == std::vector<uint64_t>{1, 2, 3}));
        auto batches = uploader.batches();
        assert(batches.size() == 3);
        for (const auto& batch : batches) {
            assert((sequences(batch) == std::vector<uint64_t>{1, 2, 3}));
        }
        assert(pump.stats().backoff_cycles == 2);
        assert(pump.stats().upload_failures == 2);
        assert(store.pending_count() == 0);

        std::cout << "  PASS: Receipt accepts {1,2,3} after two backoff cycles\n\n";
    }

    // Test 3: Store full while the endpoint is unreachable
    {
        std::cout << "Test 3: StoreFull with held measurement\n";
        TempDir dir;
        SampleStore store(store_options(dir, 2));
        assert(store.open());
        FakeReader reader(3);
        reader.burst = true;
        FakeUploader uploader;
        uploader.push_failure(UploadError::NetworkUnreachable);
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        PumpState state = drive(pump, PumpState::Idle, [&] { return pump.stats().store_full == 1; });
        assert(store.pending_count() == 2);
        assert((sequences(store.peek_batch(10)) == std::vector<uint64_t>{1, 2}));
        assert(reader.delivered == 3);

        // Endpoint recovers: backlog drains, then the held one is appended and sent
        drive(pump, state, [&] { return uploader.accepted_total() == 3; });
        auto batches = uploader.batches();
        assert(batches.size() == 3);
        assert((sequences(batches[0]) == std::vector<uint64_t>{1, 2}));
        assert((sequences(batches[1]) == std::vector<uint64_t>{1, 2}));
        assert((sequences(batches[2]) == std::vector<uint64_t>{3}));
        assert(reader.delivered == 3);            // held, not re-read
        assert(pump.stats().store_full == 1);
        assert(pump.stats().measurements_appended == 3);
        assert(store.pending_count() == 0);

        std::cout << "  PASS: Third append fails StoreFull, nothing lost\n\n";
    }

    // Test 4: Stop while a send is in flight
    {
        std::cout << "Test 4: Stop during in-flight upload\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(2);
        reader.burst = true;
        FakeUploader uploader;
        uploader.block_sends();
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);
        LifecycleController controller(pump, stop);

        controller.start();
        assert(uploader.wait_in_flight(Milliseconds(5000)));

        std::thread releaser([&uploader] {
            Time::sleep(Milliseconds(100));
            uploader.release();
        });
        const bool clean = controller.stop(Milliseconds(5000));
        releaser.join();

        assert(clean);
        assert(controller.finished());
        assert(controller.exit_reason() == PumpExit::Stopped);
        assert(uploader.calls() == 1);
        assert(store.pending_count() == 0);      // the in-flight send was acknowledged whole
        assert(store.last_acknowledged() == 2);

        std::cout << "  PASS: Pump waited for the send, then exited\n\n";
    }

    // Test 5: Grace period expires
    {
        std::cout << "Test 5: Grace period expiry\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(1);
        FakeUploader uploader;
        uploader.block_sends();
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);
        {
            LifecycleController controller(pump, stop);
            controller.start();
            assert(uploader.wait_in_flight(Milliseconds(5000)));

            const bool clean = controller.stop(Milliseconds(50));
            assert(!clean);
            assert(!controller.finished());

            uploader.release();
            assert(controller.wait_for_finish(Milliseconds(5000)));
            assert(controller.exit_reason() == PumpExit::Stopped);
        }
        assert(store.pending_count() == 0);
        std::cout << "  PASS: stop() reports false, pump still completes its step\n\n";
    }

    // Test 6: Rejected remainder is dead-lettered and acknowledged
    {
        std::cout << "Test 6: ServerRejected\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(3);
        reader.burst = true;
        FakeUploader uploader;
        uploader.push([](std::span<const Measurement>) {
            return DeliveryReceipt::failed(UploadError::ServerRejected, "HTTP 422", 1);
        });
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return pump.stats().batches_rejected == 1; });

        assert(uploader.calls() == 1);           // never retried
        assert(store.pending_count() == 0);
        assert(store.last_acknowledged() == 3);
        assert(pump.stats().measurements_delivered == 1);
        assert(pump.stats().measurements_rejected == 2);
        assert(pump.stats().backoff_cycles == 0);

        std::ifstream in(dir.sub("store") + "/rejected.jsonl");
        std::string dead((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(dead.find("\"sequence_number\":1,") == std::string::npos);
        assert(dead.find("\"sequence_number\":2,") != std::string::npos);
        assert(dead.find("\"sequence_number\":3,") != std::string::npos);

        std::cout << "  PASS: Accepted prefix acknowledged, remainder quarantined\n\n";
    }

    // Test 7: Partial acceptance resumes after the accepted prefix
    {
        std::cout << "Test 7: Partial acceptance\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(3);
        reader.burst = true;
        FakeUploader uploader;
        uploader.push([](std::span<const Measurement>) {
            return DeliveryReceipt::failed(UploadError::ServerError, "HTTP 503", 2);
        });
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return store.pending_count() == 0 && uploader.calls() == 2; });

        auto batches = uploader.batches();
        assert((sequences(batches[0]) == std::vector<uint64_t>{1, 2, 3}));
        assert((sequences(batches[1]) == std::vector<uint64_t>{3}));
        assert(pump.stats().measurements_delivered == 3);
        assert(pump.stats().backoff_cycles == 1);

        std::cout << "  PASS: Only the unaccepted suffix is resent\n\n";
    }

    // Test 8: Batch size limit
    {
        std::cout << "Test 8: max_batch_size\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(5);
        reader.burst = true;
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(test_config(Milliseconds(3600000), 2), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return uploader.accepted_total() == 5; });

        auto batches = uploader.batches();
        assert(batches.size() == 3);
        assert((sequences(batches[0]) == std::vector<uint64_t>{1, 2}));
        assert((sequences(batches[1]) == std::vector<uint64_t>{3, 4}));
        assert((sequences(batches[2]) == std::vector<uint64_t>{5}));

        std::cout << "  PASS: Batches never exceed the limit\n\n";
    }

    // Test 9: Read errors are absorbed and counted
    {
        std::cout << "Test 9: Read errors\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader;
        reader.push(ReadError::TransientUnavailable);
        reader.push(ReadError::ProtocolError);
        reader.push(make_measurement(1));
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(test_config(Milliseconds(1)), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return uploader.accepted_total() == 1; });

        assert(pump.stats().reads_unavailable == 1);
        assert(pump.stats().protocol_errors == 1);
        assert(pump.stats().reads_ok == 1);
        assert(pump.stats().ticks >= 3);

        std::cout << "  PASS: Pump keeps running through instrument errors\n\n";
    }

    // Test 10: Restart drains the backlog while the instrument is silent
    {
        std::cout << "Test 10: Restart with backlog\n";
        TempDir dir;
        {
            SampleStore store(store_options(dir));
            assert(store.open());
            for (uint64_t seq = 1; seq <= 4; ++seq) {
                assert(store.append(make_measurement(seq)));
            }
        }
        SampleStore store(store_options(dir));
        assert(store.open());
        assert(store.pending_count() == 4);
        FakeReader reader;                       // NoNewData forever
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return uploader.accepted_total() == 4; });

        assert((sequences(uploader.last_accepted()) == std::vector<uint64_t>{1, 2, 3, 4}));
        assert(pump.stats().reads_no_data == 1);
        assert(store.pending_count() == 0);

        std::cout << "  PASS: Replayed backlog delivered once, in order\n\n";
    }

    // Test 11: Store failure ends the pump
    {
        std::cout << "Test 11: IOFailure is fatal\n";
        TempDir dir;
        SampleStore store(store_options(dir));      // never opened: every write fails
        FakeReader reader(1);
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        assert(pump.run() == PumpExit::StoreFailure);
        assert(uploader.calls() == 0);

        std::cout << "  PASS: run() returns StoreFailure\n\n";
    }

    // Test 12: Stop wakes an idle pump
    {
        std::cout << "Test 12: Stop while idle\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader;
        FakeUploader uploader;
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);   // one-hour ticks
        LifecycleController controller(pump, stop);

        controller.start();
        assert(eventually([&] { return reader.calls >= 1; }));
        const Timestamp before = Time::monotonic_now();
        assert(controller.stop(Milliseconds(5000)));
        assert(Time::monotonic_now() - before < Time::to_nanoseconds(Milliseconds(1000)));
        assert(controller.exit_reason() == PumpExit::Stopped);

        std::cout << "  PASS: Idle wait cancelled immediately\n\n";
    }

    // Test 13: Success receipt that covers only part of the batch
    {
        std::cout << "Test 13: Short success receipt\n";
        TempDir dir;
        SampleStore store(store_options(dir));
        assert(store.open());
        FakeReader reader(3);
        reader.burst = true;
        FakeUploader uploader;
        uploader.push([](std::span<const Measurement>) {
            return DeliveryReceipt::accepted(1);
        });
        StopSignal stop;
        Pump pump(test_config(), store, reader, uploader, stop);

        drive(pump, PumpState::Idle, [&] { return store.pending_count() == 0 && uploader.calls() == 2; });

        auto batches = uploader.batches();
        assert((sequences(batches[0]) == std::vector<uint64_t>{1, 2, 3}));
        assert((sequences(batches[1]) == std::vector<uint64_t>{2, 3}));
        assert(store.last_acknowledged() == 3);
        assert(pump.stats().measurements_delivered == 3);
        assert(pump.stats().upload_failures == 1);
        assert(pump.stats().backoff_cycles == 1);

        std::cout << "  PASS: Unaccepted remainder stays pending and is retried\n\n";
    }

    std::cout << "=== All Pump Tests Passed! ===\n";
    return 0;
}
