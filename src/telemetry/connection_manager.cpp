// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_manager.h"

#include <spdlog/spdlog.h>

namespace rocketscope {

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Failed:
        return "Failed";
    }
    return "Unknown";
}

ConnectionManager::ConnectionManager(SampleQueue& queue, std::chrono::milliseconds interval,
                                     SourceFactory factory)
    : queue_(queue), loop_(queue, interval), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const SourceConfig& config) -> std::shared_ptr<DataSource> {
            return DataSource::create(config);
        };
    }
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

bool ConnectionManager::connect(const SourceConfig& config) {
    disconnect();

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        pending_result_.reset();
    }

    source_ = factory_(config);
    if (!source_) {
        spdlog::error("[ConnectionManager] No source available for type '{}'",
                      source_type_to_string(config.type));
        post_result({false, std::string("Source type '") + source_type_to_string(config.type) +
                                "' is not available"});
        state_ = ConnectionState::Connecting;
        return false;
    }

    // Fresh connection, fresh history
    queue_.clear();
    if (reset_hook_) {
        reset_hook_();
    }

    spdlog::info("[ConnectionManager] Connecting to {}", source_->name());
    state_ = ConnectionState::Connecting;

    if (!loop_.start(source_, [this](const ConnectResult& r) { post_result(r); })) {
        post_result({false, "Acquisition could not be started"});
    }
    return true;
}

void ConnectionManager::disconnect() {
    // Thread first: nothing may touch the source concurrently with disconnect()
    loop_.stop();

    if (source_) {
        spdlog::info("[ConnectionManager] Disconnecting from {}", source_->name());
        source_->disconnect();
        source_.reset();
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        pending_result_.reset();
    }
    state_ = ConnectionState::Disconnected;
}

std::optional<ConnectResult> ConnectionManager::take_connect_result() {
    std::optional<ConnectResult> result;
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        result.swap(pending_result_);
    }
    if (!result || state_ != ConnectionState::Connecting) {
        return std::nullopt;
    }

    if (result->success) {
        state_ = ConnectionState::Connected;
        spdlog::info("[ConnectionManager] {}", result->message);
    } else {
        state_ = ConnectionState::Failed;
        spdlog::warn("[ConnectionManager] Connection failed: {}", result->message);
        // Thread has exited on its own; release the handle
        loop_.stop();
        if (source_) {
            source_->disconnect();
            source_.reset();
        }
    }
    return result;
}

void ConnectionManager::post_result(const ConnectResult& result) {
    std::lock_guard<std::mutex> lock(result_mutex_);
    pending_result_ = result;
}

} // namespace rocketscope
