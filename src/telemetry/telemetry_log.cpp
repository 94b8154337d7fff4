// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "telemetry_log.h"

#include "format_utils.h"

#include <algorithm>

namespace rocketscope {

TelemetryLog::TelemetryLog(size_t max_lines) : max_lines_(std::max<size_t>(max_lines, 1)) {}

void TelemetryLog::append(std::string line) {
    lines_.push_back(std::move(line));
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
}

std::string TelemetryLog::format_line(const TelemetrySample& sample) {
    const std::string ts = sample.timestamp ? *sample.timestamp : fmt::wall_clock_timestamp();
    const std::string phase = sample.phase ? *sample.phase : "--";

    return "[" + ts + "] ALT:" + fmt::reading(sample.altitude.value_or(0.0)) +
           "m VEL:" + fmt::reading(sample.velocity.value_or(0.0)) + "m/s " + phase;
}

void TelemetryLog::clear() {
    lines_.clear();
}

std::string TelemetryLog::text() const {
    std::string out;
    for (const auto& line : lines_) {
        if (!out.empty()) {
            out += '\n';
        }
        out += line;
    }
    return out;
}

} // namespace rocketscope
