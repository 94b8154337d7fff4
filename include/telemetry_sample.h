// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file telemetry_sample.h
 * @brief One reading of rocket flight telemetry plus metric/phase metadata
 *
 * A TelemetrySample is produced by exactly one DataSource::read_data() call and
 * is passed by value afterwards. Every field is optional: the simulator fills
 * all of them, serial/TCP payloads only carry what the sender put on the wire.
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace rocketscope {

/// Plottable measurements. Order matches the data cards and chart drop-downs.
enum class Metric { Altitude = 0, Velocity, Acceleration, Temperature, Pressure };

constexpr size_t METRIC_COUNT = 5;

constexpr std::array<Metric, METRIC_COUNT> ALL_METRICS = {
    Metric::Altitude, Metric::Velocity, Metric::Acceleration, Metric::Temperature,
    Metric::Pressure};

/// Stage of the simulated flight profile
enum class FlightPhase { PreLaunch, PoweredAscent, Coasting, Apogee, Descent, Landed };

/// Payload key ("altitude", "velocity", ...)
const char* metric_key(Metric metric);

/// Card title ("Altitude")
const char* metric_display_name(Metric metric);

/// Unit suffix ("m", "m/s", ...)
const char* metric_unit(Metric metric);

/// Chart axis caption ("Altitude (m)")
const char* metric_axis_caption(Metric metric);

/// Reverse of metric_key(); nullopt for unknown keys
std::optional<Metric> metric_from_key(const std::string& key);

/// Display label ("Powered Ascent")
const char* flight_phase_name(FlightPhase phase);

struct TelemetrySample {
    std::optional<std::string> timestamp; ///< Wall clock, "HH:MM:SS.mmm"
    std::optional<double> flight_time;    ///< Seconds since launch sequence start
    std::optional<std::string> phase;     ///< Flight phase label
    std::optional<double> altitude;       ///< m
    std::optional<double> velocity;       ///< m/s
    std::optional<double> acceleration;   ///< m/s²
    std::optional<double> temperature;    ///< °C
    std::optional<double> pressure;       ///< kPa

    /// Value of a metric field (nullopt when the sender omitted it)
    std::optional<double> get(Metric metric) const;

    /// Set a metric field
    void set(Metric metric, double value);

    /// True if at least one of the five metrics is present
    bool has_any_metric() const;
};

} // namespace rocketscope
