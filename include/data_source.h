// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file data_source.h
 * @brief Telemetry acquisition contract shared by the simulator, serial and TCP sources
 *
 * Exactly one DataSource is live at a time. After connect() succeeds, the
 * source is only touched by the acquisition thread until that thread has been
 * stopped; disconnect() is then called from the controlling thread.
 *
 * Usage:
 * @code
 *   auto source = DataSource::create(config);
 *   auto result = source->connect();
 *   if (!result.success) { show_error(result.message); return; }
 *   while (running) {
 *       if (auto sample = source->read_data()) { queue.put(*sample); }
 *   }
 *   source->disconnect();
 * @endcode
 */

#include "telemetry_sample.h"

#include <array>
#include <memory>
#include <optional>
#include <string>

namespace rocketscope {

enum class SourceType { Simulator, Serial, Tcp };

const char* source_type_to_string(SourceType type);

/// Accepts "simulator"/"serial"/"tcp" (case-insensitive); nullopt otherwise
std::optional<SourceType> source_type_from_string(const std::string& name);

/// Baud rates offered for serial links
constexpr std::array<int, 4> SUPPORTED_BAUD_RATES = {9600, 38400, 57600, 115200};

bool is_supported_baud_rate(int baud);

struct SerialSettings {
    std::string port = "/dev/ttyUSB0";
    int baud = 9600;
    int settle_ms = 2000; ///< Delay after open before reading (boards reset on open)
};

struct TcpSettings {
    std::string host = "192.168.1.100";
    int port = 5000;
    int connect_timeout_ms = 5000;
    int read_timeout_ms = 100;
};

struct SimulatorSettings {
    bool noise = true;
    std::optional<unsigned int> seed; ///< Fixed RNG seed (random_device when unset)
};

/// Everything needed to construct any source variant
struct SourceConfig {
    SourceType type = SourceType::Simulator;
    SimulatorSettings simulator;
    SerialSettings serial;
    TcpSettings tcp;
};

/// Outcome of DataSource::connect()
struct ConnectResult {
    bool success = false;
    std::string message; ///< User-facing text, also for failures
};

class DataSource {
  public:
    virtual ~DataSource() = default;

    /**
     * @brief Open the underlying link
     *
     * May block (serial settle delay, TCP connect timeout). On failure no
     * handle is retained and is_connected() stays false.
     */
    virtual ConnectResult connect() = 0;

    /// Release the link. Idempotent; never throws.
    virtual void disconnect() = 0;

    /**
     * @brief Fetch the next sample if one is available
     *
     * Returns within a short bounded time. Read and parse failures are logged
     * and reported as nullopt. Always nullopt while disconnected.
     */
    virtual std::optional<TelemetrySample> read_data() = 0;

    virtual bool is_connected() const = 0;

    /// Human-readable identity for logs and the status line
    virtual std::string name() const = 0;

    virtual SourceType type() const = 0;

    /// Create the variant selected by config.type
    static std::unique_ptr<DataSource> create(const SourceConfig& config);

    /// Whether the variant is usable on this platform/build
    static bool is_available(SourceType type);
};

} // namespace rocketscope
