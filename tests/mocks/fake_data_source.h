// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef FAKE_DATA_SOURCE_H
#define FAKE_DATA_SOURCE_H

/**
 * @file fake_data_source.h
 * @brief Scripted DataSource for AcquisitionLoop / ConnectionManager tests
 *
 * Returns queued samples one per read_data() call, then nullopt. Connect
 * outcome, connect latency and read exceptions are configurable.
 */

#include "data_source.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>

class FakeDataSource : public rocketscope::DataSource {
  public:
    explicit FakeDataSource(bool connect_ok = true, std::string message = "Fake connected")
        : connect_ok_(connect_ok), message_(std::move(message)) {}

    rocketscope::ConnectResult connect() override {
        connect_calls++;
        if (connect_delay.count() > 0) {
            std::this_thread::sleep_for(connect_delay);
        }
        connected_.store(connect_ok_);
        return {connect_ok_, message_};
    }

    void disconnect() override {
        disconnect_calls++;
        connected_.store(false);
    }

    std::optional<rocketscope::TelemetrySample> read_data() override {
        read_calls++;
        if (throw_on_read.load()) {
            throw std::runtime_error("scripted read failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_.load() || script_.empty()) {
            return std::nullopt;
        }
        auto sample = script_.front();
        script_.pop_front();
        return sample;
    }

    bool is_connected() const override {
        return connected_.load();
    }
    std::string name() const override {
        return "Fake";
    }
    rocketscope::SourceType type() const override {
        return rocketscope::SourceType::Simulator;
    }

    void push(rocketscope::TelemetrySample sample) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(sample));
    }

    /// Queue n samples with flight_time 1..n and altitude 10*i
    void push_sequence(int n) {
        for (int i = 1; i <= n; ++i) {
            rocketscope::TelemetrySample s;
            s.flight_time = static_cast<double>(i);
            s.altitude = 10.0 * i;
            push(s);
        }
    }

    std::atomic<int> connect_calls{0};
    std::atomic<int> disconnect_calls{0};
    std::atomic<int> read_calls{0};
    std::atomic<bool> throw_on_read{false};
    std::chrono::milliseconds connect_delay{0};

  private:
    bool connect_ok_;
    std::string message_;
    std::atomic<bool> connected_{false};
    std::mutex mutex_;
    std::deque<rocketscope::TelemetrySample> script_;
};

#endif // FAKE_DATA_SOURCE_H
