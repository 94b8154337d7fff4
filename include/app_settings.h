// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"
#include "data_source.h"
#include "telemetry_sample.h"

#include <string>
#include <vector>

namespace rocketscope {

/**
 * @brief Typed view of the config document for one session
 *
 * Values are validated on load; out-of-range entries fall back to defaults
 * (or are clamped) with a warning.
 */
struct AppSettings {
    SourceConfig source;
    int acquisition_interval_ms = 50;
    int render_period_ms = 50;
    size_t history_capacity = 500;
    std::vector<Metric> charts = {Metric::Altitude, Metric::Velocity};
    size_t log_lines = 5;
    int display_width = 1200;
    int display_height = 800;
    std::string log_level = "info";
};

/// Build settings from a loaded config
AppSettings load_app_settings(const Config& config);

/// Store connection parameters chosen in the UI (caller saves)
void store_source_config(Config& config, const SourceConfig& source);

} // namespace rocketscope
