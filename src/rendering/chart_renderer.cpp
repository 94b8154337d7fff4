// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_renderer.h"

#include "format_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace rocketscope::chart {

namespace {

struct Range {
    double min = 0.0;
    double max = 0.0;

    double span() const {
        return max - min;
    }
};

/// Degenerate ranges become a unit range centered on the value
Range fit_range(double lo, double hi) {
    if (hi == lo) {
        return {lo - 0.5, hi + 0.5};
    }
    return {lo, hi};
}

DrawPrimitive make_line(float x0, float y0, float x1, float y1, uint32_t color, int width,
                        bool dashed = false) {
    DrawPrimitive p;
    p.kind = PrimitiveKind::Line;
    p.points = {{x0, y0}, {x1, y1}};
    p.color = color;
    p.width = width;
    p.dashed = dashed;
    return p;
}

DrawPrimitive make_text(float x, float y, std::string text, uint32_t color, TextAnchor anchor) {
    DrawPrimitive p;
    p.kind = PrimitiveKind::Text;
    p.points = {{x, y}};
    p.color = color;
    p.text = std::move(text);
    p.anchor = anchor;
    return p;
}

} // namespace

std::vector<DrawPrimitive> render_chart(Metric metric, const std::vector<double>& times,
                                        const std::vector<double>& values, int width, int height,
                                        const ChartStyle& style) {
    std::vector<DrawPrimitive> out;

    if (width < style.min_viewport || height < style.min_viewport) {
        return out;
    }

    // Collect plottable pairs (both coordinates present)
    const size_t n = std::min(times.size(), values.size());
    std::vector<std::pair<double, double>> pts;
    pts.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (std::isfinite(times[i]) && std::isfinite(values[i])) {
            pts.emplace_back(times[i], values[i]);
        }
    }
    if (pts.size() < 2) {
        return out;
    }

    auto [min_x_it, max_x_it] = std::minmax_element(
        pts.begin(), pts.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    auto [min_y_it, max_y_it] = std::minmax_element(
        pts.begin(), pts.end(), [](const auto& a, const auto& b) { return a.second < b.second; });

    const Range rx = fit_range(min_x_it->first, max_x_it->first);
    const Range ry = fit_range(min_y_it->second, max_y_it->second);

    const float pad = static_cast<float>(style.padding);
    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    const float graph_w = w - 2.0f * pad;
    const float graph_h = h - 2.0f * pad;

    // Axes: x along the bottom, y on the left
    out.push_back(make_line(pad, h - pad, w - pad, h - pad, style.axis_color, style.axis_width));
    out.push_back(make_line(pad, pad, pad, h - pad, style.axis_color, style.axis_width));

    // Horizontal grid with value labels, max at the top
    if (style.grid_lines >= 2) {
        const int steps = style.grid_lines - 1;
        const int decimals = fmt::axis_decimals(ry.span());
        for (int i = 0; i < style.grid_lines; ++i) {
            float y = pad + graph_h * static_cast<float>(i) / static_cast<float>(steps);
            double value = ry.max - ry.span() * static_cast<double>(i) / steps;
            out.push_back(make_line(pad, y, w - pad, y, style.grid_color, 1, true));
            out.push_back(make_text(pad - static_cast<float>(style.label_gap), y,
                                    fmt::axis_value(value, decimals), style.label_color,
                                    TextAnchor::End));
        }
    }

    // Data polyline
    DrawPrimitive line;
    line.kind = PrimitiveKind::Polyline;
    line.color = style.line_color;
    line.width = style.line_width;
    line.points.reserve(pts.size());
    for (const auto& [t, v] : pts) {
        float x = pad + static_cast<float>((t - rx.min) / rx.span()) * graph_w;
        float y = h - pad - static_cast<float>((v - ry.min) / ry.span()) * graph_h;
        line.points.push_back({x, y});
    }
    out.push_back(std::move(line));

    // Captions
    out.push_back(make_text(w / 2.0f, h - static_cast<float>(style.caption_offset),
                            style.x_caption, style.caption_color, TextAnchor::Center));
    out.push_back(make_text(pad, pad / 2.0f, metric_axis_caption(metric), style.caption_color,
                            TextAnchor::Start));

    spdlog::trace("[ChartRenderer] {} points, y=[{:.2f}, {:.2f}], {} primitives", pts.size(),
                  ry.min, ry.max, out.size());
    return out;
}

} // namespace rocketscope::chart
