// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file connection_manager.h
 * @brief Owns the active DataSource and its AcquisitionLoop
 *
 * Lives on the UI thread. connect() returns immediately; the blocking part of
 * opening the link runs on the acquisition thread and the outcome is collected
 * later with take_connect_result() (typically from an LVGL timer).
 *
 * State machine:
 * @code
 *   Disconnected --connect()--> Connecting --ok--> Connected
 *                                          \--fail--> Failed
 *   any --disconnect()--> Disconnected
 * @endcode
 */

#include "acquisition_loop.h"
#include "data_source.h"
#include "sample_queue.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace rocketscope {

enum class ConnectionState { Disconnected, Connecting, Connected, Failed };

const char* connection_state_to_string(ConnectionState state);

class ConnectionManager {
  public:
    /// Creates a source for a config; replaceable in tests
    using SourceFactory = std::function<std::shared_ptr<DataSource>(const SourceConfig&)>;

    /// Called on the UI thread when a new connection starts (clears chart history)
    using ResetHook = std::function<void()>;

    ConnectionManager(SampleQueue& queue, std::chrono::milliseconds interval,
                      SourceFactory factory = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_reset_hook(ResetHook hook) {
        reset_hook_ = std::move(hook);
    }

    /**
     * @brief Start connecting to a new source
     *
     * Any active connection is fully torn down first. Returns false only when
     * the source could not even be created (result is available immediately).
     */
    bool connect(const SourceConfig& config);

    /// Stop acquisition, then close the source. Idempotent.
    void disconnect();

    /**
     * @brief Collect the outcome of the last connect() once
     *
     * Also advances the state to Connected or Failed.
     * @return nullopt while connecting or when already taken
     */
    std::optional<ConnectResult> take_connect_result();

    ConnectionState state() const {
        return state_;
    }

    bool is_connected() const {
        return state_ == ConnectionState::Connected;
    }

    /// Active source (null when disconnected)
    std::shared_ptr<DataSource> source() const {
        return source_;
    }

    const AcquisitionLoop& acquisition() const {
        return loop_;
    }

  private:
    void post_result(const ConnectResult& result);

    SampleQueue& queue_;
    AcquisitionLoop loop_;
    SourceFactory factory_;
    ResetHook reset_hook_;

    std::shared_ptr<DataSource> source_;
    ConnectionState state_ = ConnectionState::Disconnected;

    // Written by the acquisition thread, read by the UI thread
    std::mutex result_mutex_;
    std::optional<ConnectResult> pending_result_;
};

} // namespace rocketscope
