// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "telemetry_sample.h"

namespace rocketscope {

namespace {

struct MetricInfo {
    const char* key;
    const char* display_name;
    const char* unit;
    const char* axis_caption;
};

constexpr MetricInfo METRIC_INFO[METRIC_COUNT] = {
    {"altitude", "Altitude", "m", "Altitude (m)"},
    {"velocity", "Velocity", "m/s", "Velocity (m/s)"},
    {"acceleration", "Acceleration", "m/s²", "Acceleration (m/s²)"},
    {"temperature", "Temperature", "°C", "Temperature (°C)"},
    {"pressure", "Pressure", "kPa", "Pressure (kPa)"},
};

const MetricInfo& info(Metric metric) {
    return METRIC_INFO[static_cast<size_t>(metric)];
}

} // namespace

const char* metric_key(Metric metric) {
    return info(metric).key;
}

const char* metric_display_name(Metric metric) {
    return info(metric).display_name;
}

const char* metric_unit(Metric metric) {
    return info(metric).unit;
}

const char* metric_axis_caption(Metric metric) {
    return info(metric).axis_caption;
}

std::optional<Metric> metric_from_key(const std::string& key) {
    for (Metric m : ALL_METRICS) {
        if (key == metric_key(m)) {
            return m;
        }
    }
    return std::nullopt;
}

const char* flight_phase_name(FlightPhase phase) {
    switch (phase) {
    case FlightPhase::PreLaunch:
        return "Pre-Launch";
    case FlightPhase::PoweredAscent:
        return "Powered Ascent";
    case FlightPhase::Coasting:
        return "Coasting";
    case FlightPhase::Apogee:
        return "Apogee";
    case FlightPhase::Descent:
        return "Descent";
    case FlightPhase::Landed:
        return "Landed";
    }
    return "Unknown";
}

std::optional<double> TelemetrySample::get(Metric metric) const {
    switch (metric) {
    case Metric::Altitude:
        return altitude;
    case Metric::Velocity:
        return velocity;
    case Metric::Acceleration:
        return acceleration;
    case Metric::Temperature:
        return temperature;
    case Metric::Pressure:
        return pressure;
    }
    return std::nullopt;
}

void TelemetrySample::set(Metric metric, double value) {
    switch (metric) {
    case Metric::Altitude:
        altitude = value;
        break;
    case Metric::Velocity:
        velocity = value;
        break;
    case Metric::Acceleration:
        acceleration = value;
        break;
    case Metric::Temperature:
        temperature = value;
        break;
    case Metric::Pressure:
        pressure = value;
        break;
    }
}

bool TelemetrySample::has_any_metric() const {
    return altitude || velocity || acceleration || temperature || pressure;
}

} // namespace rocketscope
