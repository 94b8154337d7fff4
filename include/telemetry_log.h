// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "telemetry_sample.h"

#include <deque>
#include <string>

namespace rocketscope {

/**
 * @brief Rolling text log of recent samples
 *
 * Holds at most max_lines entries; the oldest line is dropped first.
 */
class TelemetryLog {
  public:
    static constexpr size_t DEFAULT_MAX_LINES = 5;

    explicit TelemetryLog(size_t max_lines = DEFAULT_MAX_LINES);

    /// Append a preformatted line
    void append(std::string line);

    /**
     * @brief Format a sample as "[ts] ALT:<alt>m VEL:<vel>m/s <phase>"
     *
     * Missing altitude/velocity print as 0.0, a missing phase as "--" and a
     * missing timestamp as the current local time.
     */
    static std::string format_line(const TelemetrySample& sample);

    void clear();

    /// Lines joined with '\n', oldest first
    std::string text() const;

    const std::deque<std::string>& lines() const {
        return lines_;
    }

    size_t max_lines() const {
        return max_lines_;
    }

  private:
    size_t max_lines_;
    std::deque<std::string> lines_;
};

} // namespace rocketscope
