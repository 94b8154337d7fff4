// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "telemetry_dashboard.h"

#include "format_utils.h"

#include <spdlog/spdlog.h>

namespace rocketscope {

TelemetryDashboard::TelemetryDashboard(SampleQueue& queue, TelemetryView& view,
                                       DashboardSettings settings)
    : queue_(queue), view_(view), history_(settings.history_capacity), log_(settings.log_lines),
      charts_(std::move(settings.charts)), chart_style_(settings.chart_style) {}

size_t TelemetryDashboard::tick() {
    std::vector<TelemetrySample> batch = queue_.drain_all();
    if (batch.empty()) {
        return 0;
    }

    for (const auto& sample : batch) {
        apply(sample);
    }
    view_.show_log(log_.text());
    redraw_charts();

    samples_processed_ += batch.size();
    spdlog::trace("[TelemetryDashboard] Processed {} samples (history {})", batch.size(),
                  history_.size());
    return batch.size();
}

void TelemetryDashboard::apply(const TelemetrySample& sample) {
    history_.append(sample, elapsed_seconds());

    // Cards keep their last value when a field is absent
    for (Metric m : ALL_METRICS) {
        if (auto v = sample.get(m)) {
            view_.show_metric(m, fmt::reading(v));
        }
    }
    if (sample.flight_time) {
        view_.show_flight_time(fmt::reading(sample.flight_time));
    }
    if (sample.phase) {
        view_.show_phase("Phase: " + *sample.phase);
    }

    log_.append(TelemetryLog::format_line(sample));
}

double TelemetryDashboard::elapsed_seconds() {
    auto now = std::chrono::steady_clock::now();
    if (!first_sample_at_) {
        first_sample_at_ = now;
    }
    return std::chrono::duration<double>(now - *first_sample_at_).count();
}

void TelemetryDashboard::set_chart_metric(size_t chart, Metric metric) {
    if (chart >= charts_.size()) {
        spdlog::warn("[TelemetryDashboard] No chart at index {}", chart);
        return;
    }
    charts_[chart] = metric;
    spdlog::debug("[TelemetryDashboard] Chart {} now plots {}", chart, metric_key(metric));
    redraw_chart(chart);
}

Metric TelemetryDashboard::chart_metric(size_t chart) const {
    return charts_.at(chart);
}

void TelemetryDashboard::redraw_charts() {
    for (size_t i = 0; i < charts_.size(); ++i) {
        redraw_chart(i);
    }
}

void TelemetryDashboard::redraw_chart(size_t chart) {
    if (chart >= charts_.size()) {
        return;
    }
    auto [width, height] = view_.chart_viewport(chart);
    view_.show_chart(chart, chart::render_chart(charts_[chart], history_.times(),
                                                history_.values(charts_[chart]), width, height,
                                                chart_style_));
}

void TelemetryDashboard::reset() {
    history_.clear();
    log_.clear();
    first_sample_at_.reset();
    samples_processed_ = 0;
    view_.show_log("");
    redraw_charts();
    spdlog::debug("[TelemetryDashboard] Reset");
}

void TelemetryDashboard::log_event(const std::string& message) {
    log_.append("[" + fmt::wall_clock_timestamp() + "] " + message);
    view_.show_log(log_.text());
}

} // namespace rocketscope
