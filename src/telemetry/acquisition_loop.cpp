// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "acquisition_loop.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rocketscope {

AcquisitionLoop::AcquisitionLoop(SampleQueue& queue, std::chrono::milliseconds interval)
    : queue_(queue), interval_(std::clamp(interval, MIN_INTERVAL, MAX_INTERVAL)) {
    if (interval_ != interval) {
        spdlog::warn("[AcquisitionLoop] Interval {}ms out of range, using {}ms", interval.count(),
                     interval_.count());
    }
}

AcquisitionLoop::~AcquisitionLoop() {
    stop();
}

bool AcquisitionLoop::start(std::shared_ptr<DataSource> source, ConnectCallback on_connect) {
    if (!source) {
        spdlog::error("[AcquisitionLoop] start() called without a source");
        return false;
    }
    if (active_.load()) {
        spdlog::warn("[AcquisitionLoop] start() called while already running");
        return false;
    }

    // A previous thread that exited on its own (failed connect) still needs joining
    if (thread_.joinable()) {
        thread_.join();
    }

    samples_acquired_.store(0);
    read_errors_.store(0);

    running_.store(true);
    active_.store(true);
    thread_ = std::thread(&AcquisitionLoop::run, this, std::move(source), std::move(on_connect));

    spdlog::debug("[AcquisitionLoop] Started ({}ms interval)", interval_.count());
    return true;
}

void AcquisitionLoop::stop() {
    {
        // Store under the lock so the waiting thread cannot miss the wakeup
        std::lock_guard<std::mutex> lock(cv_mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        spdlog::debug("[AcquisitionLoop] Stopping...");
        thread_.join();
        spdlog::debug("[AcquisitionLoop] Stopped after {} samples", samples_acquired_.load());
    }
}

bool AcquisitionLoop::is_running() const {
    return active_.load();
}

bool AcquisitionLoop::wait_interval() {
    std::unique_lock<std::mutex> lock(cv_mutex_);
    return !cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
}

void AcquisitionLoop::run(std::shared_ptr<DataSource> source, ConnectCallback on_connect) {
    spdlog::debug("[AcquisitionLoop] Thread started for {}", source->name());

    if (!source->is_connected()) {
        ConnectResult result = source->connect();
        if (on_connect) {
            on_connect(result);
        }
        if (!result.success) {
            spdlog::debug("[AcquisitionLoop] Connect failed, thread exiting");
            running_.store(false);
            active_.store(false);
            return;
        }
    } else if (on_connect) {
        on_connect({true, "Connected to " + source->name()});
    }

    while (running_.load()) {
        try {
            if (auto sample = source->read_data()) {
                queue_.put(std::move(*sample));
                samples_acquired_++;
            }
        } catch (const std::exception& e) {
            read_errors_++;
            spdlog::warn("[AcquisitionLoop] Read error from {}: {}", source->name(), e.what());
        }

        if (!wait_interval()) {
            break;
        }
    }

    spdlog::debug("[AcquisitionLoop] Thread exiting ({} samples, {} errors)",
                  samples_acquired_.load(), read_errors_.load());
    active_.store(false);
}

} // namespace rocketscope
