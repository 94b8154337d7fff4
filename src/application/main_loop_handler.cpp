// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "main_loop_handler.h"

namespace rocketscope::application {

void MainLoopHandler::init(const Config& config, uint32_t start_tick_ms) {
    m_config = config;
    m_start_tick = start_tick_ms;
    m_current_tick = start_tick_ms;

    m_frame_count = 0;
    m_sample_count = 0;
    m_last_report = start_tick_ms;
}

void MainLoopHandler::on_frame(uint32_t current_tick_ms, size_t samples_consumed) {
    m_current_tick = current_tick_ms;
    m_frame_count++;
    m_sample_count += samples_consumed;
}

bool MainLoopHandler::should_quit() const {
    if (m_config.timeout_sec <= 0) {
        return false;
    }
    uint32_t timeout_ms = static_cast<uint32_t>(m_config.timeout_sec) * 1000U;
    return elapsed_ms() >= timeout_ms;
}

uint32_t MainLoopHandler::elapsed_ms() const {
    return m_current_tick - m_start_tick;
}

bool MainLoopHandler::stats_should_report() const {
    if (m_config.stats_interval_ms == 0) {
        return false;
    }
    return (m_current_tick - m_last_report) >= m_config.stats_interval_ms;
}

MainLoopHandler::RateReport MainLoopHandler::take_stats_report() {
    RateReport report;
    report.frames = m_frame_count;
    report.samples = m_sample_count;

    uint32_t elapsed = m_current_tick - m_last_report;
    report.elapsed_sec = elapsed / 1000.0f;
    if (report.elapsed_sec > 0) {
        report.fps = m_frame_count / report.elapsed_sec;
        report.samples_per_sec = static_cast<float>(m_sample_count) / report.elapsed_sec;
    }

    m_frame_count = 0;
    m_sample_count = 0;
    m_last_report = m_current_tick;
    return report;
}

} // namespace rocketscope::application
