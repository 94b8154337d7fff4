// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace rocketscope::fmt {

namespace {

/// Magnitudes at or above this switch to scientific notation
constexpr double FIXED_POINT_LIMIT = 1e9;

} // namespace

std::string wall_clock_timestamp() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t secs = system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&secs, &local);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(ms));
    return std::string(buf);
}

std::string reading(std::optional<double> value) {
    if (!value || !std::isfinite(*value)) {
        return "--";
    }
    char buf[32];
    reading_to_buffer(buf, sizeof(buf), *value);
    return std::string(buf);
}

int axis_decimals(double range) {
    range = std::fabs(range);
    if (range >= 10.0) {
        return 0;
    }
    if (range >= 1.0) {
        return 1;
    }
    return 2;
}

std::string axis_value(double value, int decimals) {
    decimals = std::clamp(decimals, 0, 6);

    // Avoid "-0" for values that round to zero
    double scale = std::pow(10.0, decimals);
    if (std::round(value * scale) == 0.0) {
        value = 0.0;
    }

    char buf[48];
    if (std::fabs(value) >= FIXED_POINT_LIMIT) {
        std::snprintf(buf, sizeof(buf), "%.3g", value);
    } else {
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    }
    return std::string(buf);
}

size_t reading_to_buffer(char* buf, size_t buf_size, double value) {
    if (buf == nullptr || buf_size == 0) {
        return 0;
    }
    if (std::round(value * 10.0) == 0.0) {
        value = 0.0;
    }
    const char* format = std::fabs(value) >= FIXED_POINT_LIMIT ? "%.3g" : "%.1f";
    int written = std::snprintf(buf, buf_size, format, value);
    if (written <= 0 || static_cast<size_t>(written) >= buf_size) {
        // Never show a truncated number
        std::snprintf(buf, buf_size, "%s", buf_size > 2 ? "--" : "");
        return buf_size > 2 ? 2 : 0;
    }
    return static_cast<size_t>(written);
}

} // namespace rocketscope::fmt
