// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file telemetry_dashboard.h
 * @brief UI-thread side of the pipeline: queue -> history -> displays and charts
 *
 * The dashboard owns no widgets. Everything visible goes through TelemetryView,
 * which the LVGL screen implements and tests replace with a recorder.
 */

#include "chart_renderer.h"
#include "history_buffer.h"
#include "sample_queue.h"
#include "telemetry_log.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rocketscope {

/**
 * @brief Widget seam for the dashboard
 *
 * All calls happen on the UI thread.
 */
class TelemetryView {
  public:
    virtual ~TelemetryView() = default;

    /// Card text for one metric (already formatted)
    virtual void show_metric(Metric metric, const std::string& text) = 0;
    virtual void show_flight_time(const std::string& text) = 0;
    virtual void show_phase(const std::string& text) = 0;

    /// Full log text (newline separated, oldest first)
    virtual void show_log(const std::string& text) = 0;

    /// Current drawable size of a chart area, {width, height} in pixels
    virtual std::pair<int, int> chart_viewport(size_t chart) = 0;

    /// Replace a chart's content (empty list clears it)
    virtual void show_chart(size_t chart, std::vector<chart::DrawPrimitive> primitives) = 0;
};

struct DashboardSettings {
    size_t history_capacity = HistoryBuffer::DEFAULT_CAPACITY;
    size_t log_lines = TelemetryLog::DEFAULT_MAX_LINES;
    std::vector<Metric> charts = {Metric::Altitude, Metric::Velocity};
    chart::ChartStyle chart_style;
};

class TelemetryDashboard {
  public:
    TelemetryDashboard(SampleQueue& queue, TelemetryView& view, DashboardSettings settings = {});

    /**
     * @brief One render-loop iteration
     *
     * Drains the queue, records every sample, refreshes the text displays and
     * log per sample, then redraws each chart once for the whole batch.
     *
     * @return Number of samples consumed (0 = nothing changed, no redraw)
     */
    size_t tick();

    /// Select the metric a chart plots and redraw it immediately
    void set_chart_metric(size_t chart, Metric metric);

    Metric chart_metric(size_t chart) const;

    size_t chart_count() const {
        return charts_.size();
    }

    /// Redraw every chart from the current history
    void redraw_charts();

    /// Redraw one chart at its current viewport size (after a resize)
    void redraw_chart(size_t chart);

    /// Forget history, log and the fallback time origin (new connection)
    void reset();

    /// Append a non-sample line to the log ("Connected: ...")
    void log_event(const std::string& message);

    const HistoryBuffer& history() const {
        return history_;
    }

    const TelemetryLog& log() const {
        return log_;
    }

    uint64_t samples_processed() const {
        return samples_processed_;
    }

  private:
    void apply(const TelemetrySample& sample);

    /// Seconds since the first sample of this connection
    double elapsed_seconds();

    SampleQueue& queue_;
    TelemetryView& view_;
    HistoryBuffer history_;
    TelemetryLog log_;
    std::vector<Metric> charts_;
    chart::ChartStyle chart_style_;

    std::optional<std::chrono::steady_clock::time_point> first_sample_at_;
    uint64_t samples_processed_ = 0;
};

} // namespace rocketscope
