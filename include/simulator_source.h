// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "data_source.h"

#include <atomic>
#include <cstdint>
#include <random>

namespace rocketscope {

/**
 * @brief Synthetic flight profile
 *
 * Each read_data() advances flight time by TIME_STEP and evaluates a closed-form
 * piecewise profile:
 *
 * | t (s)     | Phase          | Motion                                   |
 * |-----------|----------------|------------------------------------------|
 * | < 2       | Pre-Launch     | at rest                                  |
 * | 2 .. 15   | Powered Ascent | constant g acceleration                  |
 * | 15 .. 25  | Coasting       | decelerating at 3 m/s²                   |
 * | 25 .. 27  | Apogee         | held at peak                             |
 * | 27 .. 50  | Descent        | -5 m/s under parachute                   |
 * | >= 50     | Landed         | at rest                                  |
 *
 * Noise can be disabled for deterministic output.
 */
class SimulatorSource : public DataSource {
  public:
    static constexpr double TIME_STEP = 0.1;
    static constexpr double GRAVITY = 9.8;
    static constexpr double IGNITION_TIME = 2.0;
    static constexpr double BURNOUT_TIME = 15.0;
    static constexpr double APOGEE_TIME = 25.0;
    static constexpr double DESCENT_TIME = 27.0;
    static constexpr double LANDING_TIME = 50.0;
    static constexpr double COAST_DECELERATION = 3.0;
    static constexpr double DESCENT_RATE = 5.0;

    explicit SimulatorSource(const SimulatorSettings& settings = {});

    ConnectResult connect() override;
    void disconnect() override;
    std::optional<TelemetrySample> read_data() override;
    bool is_connected() const override {
        return connected_.load();
    }
    std::string name() const override {
        return "Simulator";
    }
    SourceType type() const override {
        return SourceType::Simulator;
    }

    /// Current simulated flight time (seconds)
    double flight_time() const;

    /// Phase for a given flight time
    static FlightPhase phase_at(double t);

    /// Noise-free altitude for a given flight time
    static double nominal_altitude(double t);

    /// Altitude held during the apogee phase
    static double apogee_altitude();

  private:
    double noise(double amplitude);

    bool noise_enabled_;
    std::atomic<bool> connected_{false};
    std::uint64_t ticks_ = 0;
    std::mt19937 rng_;
};

} // namespace rocketscope
