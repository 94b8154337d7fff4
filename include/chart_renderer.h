// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file chart_renderer.h
 * @brief Live line chart as a list of toolkit-independent draw primitives
 *
 * render_chart() is a pure function of its inputs: scale is recomputed from the
 * visible window on every call, so the chart always auto-fits (and jitters a
 * little as data arrives, which is fine for a live monitor).
 *
 * Layout (padding P on every side):
 * @code
 *   caption (top-left)
 *   max  ┤- - - - - - - - - - - - - -    <- grid line 0
 *        │        ____/
 *        ┤- - - -/- - - - - - - - - -
 *        │   ___/
 *   min  ┤__/- - - - - - - - - - - - -    <- grid line 4
 *        └──────────────────────────
 *               Flight Time (s)
 * @endcode
 */

#include "telemetry_sample.h"

#include <cstdint>
#include <string>
#include <vector>

namespace rocketscope::chart {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

enum class PrimitiveKind { Line, Polyline, Text };

/// Horizontal alignment of text relative to its anchor point
enum class TextAnchor { Start, Center, End };

struct DrawPrimitive {
    PrimitiveKind kind = PrimitiveKind::Line;
    std::vector<Point> points; ///< Line: 2 points, Polyline: N, Text: anchor point
    uint32_t color = 0xFFFFFF; ///< 0xRRGGBB
    int width = 1;
    bool dashed = false;
    std::string text;
    TextAnchor anchor = TextAnchor::Start;
};

struct ChartStyle {
    int padding = 40;
    int grid_lines = 5;
    int label_gap = 5;       ///< Space between grid labels and the y axis
    int caption_offset = 10; ///< Baseline of the x caption above the bottom edge
    int min_viewport = 10;   ///< Smaller viewports render nothing

    uint32_t axis_color = 0x444444;
    int axis_width = 2;
    uint32_t grid_color = 0x222222;
    uint32_t label_color = 0x666666;
    uint32_t line_color = 0x00FF88;
    int line_width = 2;
    uint32_t caption_color = 0x888888;

    const char* x_caption = "Flight Time (s)";
};

/**
 * @brief Render one metric against time
 *
 * Points are the index-aligned (time, value) pairs where both are finite.
 *
 * @param metric Plotted metric (selects the axis caption)
 * @param times  Time coordinates, oldest first
 * @param values Metric values aligned with times (NaN gaps are skipped)
 * @param width  Viewport width in pixels
 * @param height Viewport height in pixels
 * @param style  Colors and spacing
 * @return Draw list; empty when fewer than 2 points or the viewport is too small
 */
std::vector<DrawPrimitive> render_chart(Metric metric, const std::vector<double>& times,
                                        const std::vector<double>& values, int width, int height,
                                        const ChartStyle& style = {});

} // namespace rocketscope::chart
