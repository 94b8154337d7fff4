// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file acquisition_loop.h
 * @brief Background thread polling a DataSource into the SampleQueue
 *
 * One loop runs per active connection. The thread optionally performs the
 * (blocking) connect() first, so the UI thread never waits on a serial settle
 * delay or a TCP connect timeout.
 *
 * Usage:
 *   AcquisitionLoop loop(queue);
 *   loop.start(source, [](const ConnectResult& r) { ... });   // from UI thread
 *   // ... samples appear in queue at ~20 Hz ...
 *   loop.stop();            // joins the thread
 *   source->disconnect();   // only after stop()
 */

#include "data_source.h"
#include "sample_queue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace rocketscope {

class AcquisitionLoop {
  public:
    using ConnectCallback = std::function<void(const ConnectResult&)>;

    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{50};
    static constexpr std::chrono::milliseconds MIN_INTERVAL{20};
    static constexpr std::chrono::milliseconds MAX_INTERVAL{50};

    /**
     * @param queue    Destination for samples (must outlive the loop)
     * @param interval Pause between reads, clamped to [MIN_INTERVAL, MAX_INTERVAL]
     */
    explicit AcquisitionLoop(SampleQueue& queue,
                             std::chrono::milliseconds interval = DEFAULT_INTERVAL);
    ~AcquisitionLoop();

    // Non-copyable, non-movable
    AcquisitionLoop(const AcquisitionLoop&) = delete;
    AcquisitionLoop& operator=(const AcquisitionLoop&) = delete;
    AcquisitionLoop(AcquisitionLoop&&) = delete;
    AcquisitionLoop& operator=(AcquisitionLoop&&) = delete;

    /**
     * @brief Start polling on a new thread
     *
     * If the source is not connected yet, the thread calls connect() first and
     * reports the result through on_connect (invoked on the worker thread).
     * A failed connect ends the thread. Already-connected sources are reported
     * as success without reconnecting.
     *
     * @return false if the loop is already running or source is null
     */
    bool start(std::shared_ptr<DataSource> source, ConnectCallback on_connect = {});

    /**
     * @brief Signal the thread and join it. Safe to call multiple times.
     *
     * Returns within one interval plus any read or connect already in flight.
     */
    void stop();

    /// True between start() and the thread exiting (stop or failed connect)
    bool is_running() const;

    std::chrono::milliseconds interval() const {
        return interval_;
    }

    /// Samples pushed to the queue since start()
    uint64_t samples_acquired() const {
        return samples_acquired_.load();
    }

    /// Exceptions caught around read_data() since start()
    uint64_t read_errors() const {
        return read_errors_.load();
    }

  private:
    void run(std::shared_ptr<DataSource> source, ConnectCallback on_connect);

    /// Sleep for one interval unless stop() is called; false when stopping
    bool wait_interval();

    SampleQueue& queue_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::atomic<bool> running_{false};   // cleared by stop()
    std::atomic<bool> active_{false};    // true while the thread body executes
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    std::atomic<uint64_t> samples_acquired_{0};
    std::atomic<uint64_t> read_errors_{0};
};

} // namespace rocketscope
