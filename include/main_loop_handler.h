// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main_loop_handler.h
 * @brief Frame bookkeeping for the LVGL loop: --timeout and rate reports
 *
 * Pure tick arithmetic (no LVGL calls), fed lv_tick_get() once per frame.
 * uint32_t subtraction keeps it correct across tick wraparound.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace rocketscope::application {

/**
 * @brief Tracks loop ticks for the auto-quit timeout and rate reporting
 *
 * Pure bookkeeping on caller-supplied ticks; no LVGL dependency.
 */
class MainLoopHandler {
  public:
    struct Config {
        // Auto-quit timeout (0 = disabled)
        int timeout_sec{0};

        // Rate report interval (0 = disabled)
        uint32_t stats_interval_ms{0};
    };

    struct RateReport {
        uint32_t frames{0};
        uint64_t samples{0};
        float elapsed_sec{0.0f};
        float fps{0.0f};
        float samples_per_sec{0.0f};
    };

    /**
     * @brief Initialize with configuration and start tick
     *
     * @param config Configuration settings
     * @param start_tick_ms Current tick when main loop starts
     */
    void init(const Config& config, uint32_t start_tick_ms);

    /**
     * @brief Process a loop iteration
     *
     * @param current_tick_ms Current tick in milliseconds
     * @param samples_consumed Samples the dashboard consumed in this iteration
     */
    void on_frame(uint32_t current_tick_ms, size_t samples_consumed = 0);

    /**
     * @brief Check if auto-quit timeout has elapsed
     */
    bool should_quit() const;

    uint32_t elapsed_ms() const;

    bool stats_should_report() const;

    /**
     * @brief Get and consume the rate report (resets counters)
     */
    RateReport take_stats_report();

  private:
    Config m_config;
    uint32_t m_start_tick{0};
    uint32_t m_current_tick{0};

    uint32_t m_frame_count{0};
    uint64_t m_sample_count{0};
    uint32_t m_last_report{0};
};

} // namespace rocketscope::application
