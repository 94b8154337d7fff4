// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "data_source.h"
#include "telemetry_payload.h"

#include <atomic>
#include <string>
#include <vector>

namespace rocketscope {

/**
 * @brief Telemetry over a serial/USB-CDC link
 *
 * The device is opened raw 8N1 without flow control and with exclusive access.
 * Many boards reset when the port opens, so connect() waits settle_ms before
 * reporting success. read_data() never blocks: it drains whatever bytes are
 * waiting and returns at most one parsed record per call.
 */
class SerialSource : public DataSource {
  public:
    explicit SerialSource(SerialSettings settings);
    ~SerialSource() override;

    SerialSource(const SerialSource&) = delete;
    SerialSource& operator=(const SerialSource&) = delete;

    ConnectResult connect() override;
    void disconnect() override;
    std::optional<TelemetrySample> read_data() override;
    bool is_connected() const override {
        return connected_.load();
    }
    std::string name() const override;
    SourceType type() const override {
        return SourceType::Serial;
    }

    /// Count of records rejected by the parser since connect()
    size_t parse_errors() const {
        return parse_errors_;
    }

  private:
    void drain_port();

    SerialSettings settings_;
    int fd_ = -1;
    std::atomic<bool> connected_{false};
    LineAssembler lines_;
    size_t parse_errors_ = 0;
    size_t read_errors_ = 0;
};

/**
 * @brief Candidate serial devices for the port picker
 *
 * Scans /dev for USB serial adapters (ttyUSB*, ttyACM*, cu.*) and on-board
 * UARTs that have a driver bound (ttyS* with /sys/class/tty/<name>/device).
 * Sorted by name; empty if /dev cannot be read.
 */
std::vector<std::string> list_serial_ports();

} // namespace rocketscope
