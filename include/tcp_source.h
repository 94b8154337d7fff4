// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "data_source.h"
#include "telemetry_payload.h"

#include <atomic>
#include <string>

namespace rocketscope {

/**
 * @brief Telemetry streamed by a TCP server (ground station bridge, ESP32, ...)
 *
 * connect() blocks for at most connect_timeout_ms. Each read_data() waits up to
 * read_timeout_ms for bytes; a timeout simply means "no sample this time".
 * When the peer closes the connection the source stays "connected" from the
 * UI's point of view but returns no data until the user disconnects.
 */
class TcpSource : public DataSource {
  public:
    explicit TcpSource(TcpSettings settings);
    ~TcpSource() override;

    TcpSource(const TcpSource&) = delete;
    TcpSource& operator=(const TcpSource&) = delete;

    ConnectResult connect() override;
    void disconnect() override;
    std::optional<TelemetrySample> read_data() override;
    bool is_connected() const override {
        return connected_.load();
    }
    std::string name() const override;
    SourceType type() const override {
        return SourceType::Tcp;
    }

    /// True once the server has closed its end
    bool peer_closed() const {
        return peer_closed_.load();
    }

    /// Count of records rejected by the parser since connect()
    size_t parse_errors() const {
        return parse_errors_;
    }

  private:
    void receive();

    TcpSettings settings_;
    int sockfd_ = -1;
    std::atomic<bool> connected_{false};
    std::atomic<bool> peer_closed_{false};
    LineAssembler lines_;
    size_t parse_errors_ = 0;
    size_t read_errors_ = 0;
};

} // namespace rocketscope
