// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "simulator_source.h"

#include "format_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace rocketscope {

namespace {

constexpr double BURN_DURATION = SimulatorSource::BURNOUT_TIME - SimulatorSource::IGNITION_TIME;
constexpr double COAST_DURATION = SimulatorSource::APOGEE_TIME - SimulatorSource::BURNOUT_TIME;

// Ascent end state
constexpr double BURNOUT_VELOCITY = SimulatorSource::GRAVITY * BURN_DURATION;
constexpr double BURNOUT_ALTITUDE =
    0.5 * SimulatorSource::GRAVITY * BURN_DURATION * BURN_DURATION;

constexpr double SEA_LEVEL_TEMP_C = 20.0;
constexpr double LAPSE_RATE_C_PER_M = 0.0065;
constexpr double SEA_LEVEL_PRESSURE_KPA = 101.325;
constexpr double SCALE_HEIGHT_M = 8500.0;

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

SimulatorSource::SimulatorSource(const SimulatorSettings& settings)
    : noise_enabled_(settings.noise),
      rng_(settings.seed ? *settings.seed : std::random_device{}()) {}

ConnectResult SimulatorSource::connect() {
    ticks_ = 0;
    connected_.store(true);
    spdlog::info("[SimulatorSource] Started (noise {})", noise_enabled_ ? "on" : "off");
    return {true, "Simulator started"};
}

void SimulatorSource::disconnect() {
    if (connected_.exchange(false)) {
        spdlog::info("[SimulatorSource] Stopped at t={:.1f}s", flight_time());
    }
}

double SimulatorSource::flight_time() const {
    return static_cast<double>(ticks_) * TIME_STEP;
}

FlightPhase SimulatorSource::phase_at(double t) {
    if (t < IGNITION_TIME) {
        return FlightPhase::PreLaunch;
    }
    if (t < BURNOUT_TIME) {
        return FlightPhase::PoweredAscent;
    }
    if (t < APOGEE_TIME) {
        return FlightPhase::Coasting;
    }
    if (t < DESCENT_TIME) {
        return FlightPhase::Apogee;
    }
    if (t < LANDING_TIME) {
        return FlightPhase::Descent;
    }
    return FlightPhase::Landed;
}

double SimulatorSource::apogee_altitude() {
    return BURNOUT_ALTITUDE + BURNOUT_VELOCITY * COAST_DURATION -
           0.5 * COAST_DECELERATION * COAST_DURATION * COAST_DURATION;
}

double SimulatorSource::nominal_altitude(double t) {
    switch (phase_at(t)) {
    case FlightPhase::PoweredAscent: {
        double dt = t - IGNITION_TIME;
        return 0.5 * GRAVITY * dt * dt;
    }
    case FlightPhase::Coasting: {
        double dt = t - BURNOUT_TIME;
        return BURNOUT_ALTITUDE + BURNOUT_VELOCITY * dt - 0.5 * COAST_DECELERATION * dt * dt;
    }
    case FlightPhase::Apogee:
        return apogee_altitude();
    case FlightPhase::Descent:
        return apogee_altitude() - DESCENT_RATE * (t - DESCENT_TIME);
    case FlightPhase::PreLaunch:
    case FlightPhase::Landed:
        break;
    }
    return 0.0;
}

double SimulatorSource::noise(double amplitude) {
    if (!noise_enabled_) {
        return 0.0;
    }
    std::uniform_real_distribution<double> dist(-amplitude, amplitude);
    return dist(rng_);
}

std::optional<TelemetrySample> SimulatorSource::read_data() {
    if (!connected_.load()) {
        return std::nullopt;
    }

    ticks_++;
    const double t = flight_time();
    const FlightPhase phase = phase_at(t);

    double velocity = 0.0;
    double acceleration = 0.0;

    switch (phase) {
    case FlightPhase::PoweredAscent:
        velocity = GRAVITY * (t - IGNITION_TIME);
        acceleration = GRAVITY + noise(0.5);
        break;
    case FlightPhase::Coasting:
        velocity = BURNOUT_VELOCITY - COAST_DECELERATION * (t - BURNOUT_TIME);
        acceleration = -COAST_DECELERATION + noise(0.2);
        break;
    case FlightPhase::Descent:
        velocity = -DESCENT_RATE;
        acceleration = -1.0 + noise(0.1);
        break;
    case FlightPhase::PreLaunch:
    case FlightPhase::Apogee:
    case FlightPhase::Landed:
        break;
    }

    const double altitude = std::max(0.0, nominal_altitude(t) + noise(2.0));

    TelemetrySample sample;
    sample.timestamp = fmt::wall_clock_timestamp();
    sample.flight_time = round2(t);
    sample.phase = flight_phase_name(phase);
    sample.altitude = round2(altitude);
    sample.velocity = round2(velocity);
    sample.acceleration = round2(acceleration);
    sample.temperature = round2(SEA_LEVEL_TEMP_C - altitude * LAPSE_RATE_C_PER_M + noise(1.0));
    sample.pressure =
        round2(SEA_LEVEL_PRESSURE_KPA * std::exp(-altitude / SCALE_HEIGHT_M) + noise(0.1));
    return sample;
}

} // namespace rocketscope
