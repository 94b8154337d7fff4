// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "acquisition_loop.h"

#include "../mocks/fake_data_source.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include <catch2/catch_all.hpp>

using namespace rocketscope;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

// ============================================================================
// Interval
// ============================================================================

TEST_CASE("AcquisitionLoop clamps its interval", "[acquisition]") {
    SampleQueue queue;

    AcquisitionLoop fast(queue, 1ms);
    REQUIRE(fast.interval() == AcquisitionLoop::MIN_INTERVAL);

    AcquisitionLoop slow(queue, 500ms);
    REQUIRE(slow.interval() == AcquisitionLoop::MAX_INTERVAL);

    AcquisitionLoop normal(queue, 30ms);
    REQUIRE(normal.interval() == 30ms);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("AcquisitionLoop rejects a null source", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue);
    REQUIRE_FALSE(loop.start(nullptr));
    REQUIRE_FALSE(loop.is_running());
}

TEST_CASE("AcquisitionLoop connects then delivers samples in order", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue, 20ms);
    auto source = std::make_shared<FakeDataSource>();
    source->push_sequence(5);

    std::atomic<int> callbacks{0};
    std::atomic<bool> success{false};
    REQUIRE(loop.start(source, [&](const ConnectResult& r) {
        success = r.success;
        callbacks++;
    }));

    REQUIRE(wait_until([&] { return loop.samples_acquired() == 5; }));
    loop.stop();

    REQUIRE(callbacks == 1);
    REQUIRE(success);
    REQUIRE(source->connect_calls == 1);
    REQUIRE_FALSE(loop.is_running());

    auto batch = queue.drain_all();
    REQUIRE(batch.size() == 5);
    for (size_t i = 0; i < batch.size(); ++i) {
        REQUIRE(*batch[i].flight_time == static_cast<double>(i + 1));
    }
}

TEST_CASE("AcquisitionLoop skips reads that produce nothing", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue, 20ms);
    auto source = std::make_shared<FakeDataSource>();

    REQUIRE(loop.start(source));
    REQUIRE(wait_until([&] { return source->read_calls >= 3; }));
    loop.stop();

    REQUIRE(queue.empty());
    REQUIRE(loop.samples_acquired() == 0);
}

TEST_CASE("AcquisitionLoop exits after a failed connect", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue);
    auto source = std::make_shared<FakeDataSource>(false, "Port busy");

    std::string message;
    std::atomic<bool> reported{false};
    REQUIRE(loop.start(source, [&](const ConnectResult& r) {
        message = r.message;
        reported = true;
    }));

    REQUIRE(wait_until([&] { return !loop.is_running(); }));
    REQUIRE(reported);
    REQUIRE(message == "Port busy");
    REQUIRE(source->read_calls == 0);

    // A fresh start after the self-terminated thread is allowed
    auto good = std::make_shared<FakeDataSource>();
    good->push_sequence(2);
    REQUIRE(loop.start(good));
    REQUIRE(loop.is_running());
    REQUIRE(wait_until([&] { return loop.samples_acquired() == 2; }));
    loop.stop();
}

TEST_CASE("AcquisitionLoop restarts repeatedly after failed connects", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue);

    for (int attempt = 0; attempt < 3; ++attempt) {
        auto bad = std::make_shared<FakeDataSource>(false, "No route");
        REQUIRE(loop.start(bad));
        REQUIRE(wait_until([&] { return !loop.is_running(); }));
        REQUIRE(bad->connect_calls == 1);
    }
}

TEST_CASE("AcquisitionLoop reports success for an already connected source", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue);
    auto source = std::make_shared<FakeDataSource>();
    REQUIRE(source->connect().success);

    std::atomic<bool> success{false};
    REQUIRE(loop.start(source, [&](const ConnectResult& r) { success = r.success; }));
    REQUIRE(wait_until([&] { return success.load(); }));
    loop.stop();

    REQUIRE(source->connect_calls == 1);
}

TEST_CASE("AcquisitionLoop refuses a second start while running", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue);
    auto source = std::make_shared<FakeDataSource>();

    REQUIRE(loop.start(source));
    REQUIRE_FALSE(loop.start(source));
    loop.stop();
}

TEST_CASE("AcquisitionLoop survives read exceptions", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue, 20ms);
    auto source = std::make_shared<FakeDataSource>();
    source->throw_on_read = true;

    REQUIRE(loop.start(source));
    REQUIRE(wait_until([&] { return loop.read_errors() >= 2; }));
    REQUIRE(loop.is_running());

    source->throw_on_read = false;
    source->push_sequence(1);
    REQUIRE(wait_until([&] { return loop.samples_acquired() == 1; }));
    loop.stop();
}

TEST_CASE("AcquisitionLoop stop returns promptly and is repeatable", "[acquisition]") {
    SampleQueue queue;
    AcquisitionLoop loop(queue, 50ms);
    auto source = std::make_shared<FakeDataSource>();

    REQUIRE(loop.start(source));
    REQUIRE(wait_until([&] { return source->read_calls >= 1; }));

    auto before = std::chrono::steady_clock::now();
    loop.stop();
    auto took = std::chrono::steady_clock::now() - before;

    REQUIRE(took < 500ms);
    REQUIRE_FALSE(loop.is_running());
    loop.stop();
}
