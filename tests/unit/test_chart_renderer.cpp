// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_renderer.h"

#include <cmath>
#include <limits>

#include <catch2/catch_all.hpp>

using namespace rocketscope;
using namespace rocketscope::chart;
using Catch::Approx;

namespace {

constexpr int WIDTH = 400;
constexpr int HEIGHT = 300;
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

const DrawPrimitive& find_polyline(const std::vector<DrawPrimitive>& prims) {
    for (const auto& p : prims) {
        if (p.kind == PrimitiveKind::Polyline) {
            return p;
        }
    }
    FAIL("no polyline in draw list");
    return prims.front();
}

std::vector<std::string> grid_labels(const std::vector<DrawPrimitive>& prims) {
    std::vector<std::string> labels;
    for (const auto& p : prims) {
        if (p.kind == PrimitiveKind::Text && p.anchor == TextAnchor::End) {
            labels.push_back(p.text);
        }
    }
    return labels;
}

} // namespace

// ============================================================================
// Degenerate input
// ============================================================================

TEST_CASE("Chart renders nothing with fewer than two points", "[chart]") {
    REQUIRE(render_chart(Metric::Altitude, {}, {}, WIDTH, HEIGHT).empty());
    REQUIRE(render_chart(Metric::Altitude, {1.0}, {5.0}, WIDTH, HEIGHT).empty());
}

TEST_CASE("Chart renders nothing in a tiny viewport", "[chart]") {
    std::vector<double> t{0, 1, 2};
    std::vector<double> v{0, 1, 2};
    REQUIRE(render_chart(Metric::Altitude, t, v, 9, HEIGHT).empty());
    REQUIRE(render_chart(Metric::Altitude, t, v, WIDTH, 5).empty());
    REQUIRE_FALSE(render_chart(Metric::Altitude, t, v, 10, 10).empty());
}

TEST_CASE("Chart counts only points present in both series", "[chart]") {
    std::vector<double> t{0, 1, 2};
    std::vector<double> v{NaN, NaN, 3.0};
    REQUIRE(render_chart(Metric::Velocity, t, v, WIDTH, HEIGHT).empty());
}

// ============================================================================
// Layout
// ============================================================================

TEST_CASE("Chart primitive order is axes, grid, data, captions", "[chart]") {
    std::vector<double> t{0, 1, 2, 3};
    std::vector<double> v{0, 10, 25, 40};
    auto prims = render_chart(Metric::Altitude, t, v, WIDTH, HEIGHT);

    // 2 axes + 5 * (grid line + label) + polyline + 2 captions
    REQUIRE(prims.size() == 15);

    SECTION("axes") {
        REQUIRE(prims[0].kind == PrimitiveKind::Line);
        REQUIRE(prims[0].points[0].x == Approx(40));
        REQUIRE(prims[0].points[0].y == Approx(260));
        REQUIRE(prims[0].points[1].x == Approx(360));
        REQUIRE(prims[0].points[1].y == Approx(260));

        REQUIRE(prims[1].kind == PrimitiveKind::Line);
        REQUIRE(prims[1].points[0].x == Approx(40));
        REQUIRE(prims[1].points[0].y == Approx(40));
        REQUIRE(prims[1].points[1].y == Approx(260));
        REQUIRE_FALSE(prims[0].dashed);
    }

    SECTION("grid lines are dashed and paired with labels") {
        for (int i = 0; i < 5; ++i) {
            const auto& line = prims[2 + i * 2];
            const auto& label = prims[3 + i * 2];
            REQUIRE(line.kind == PrimitiveKind::Line);
            REQUIRE(line.dashed);
            REQUIRE(line.points[0].y == Approx(40 + 55 * i));
            REQUIRE(label.kind == PrimitiveKind::Text);
            REQUIRE(label.anchor == TextAnchor::End);
            REQUIRE(label.points[0].x == Approx(35));
            REQUIRE(label.points[0].y == Approx(line.points[0].y));
        }
    }

    SECTION("captions") {
        const auto& x_caption = prims[13];
        REQUIRE(x_caption.kind == PrimitiveKind::Text);
        REQUIRE(x_caption.text == "Flight Time (s)");
        REQUIRE(x_caption.anchor == TextAnchor::Center);
        REQUIRE(x_caption.points[0].x == Approx(200));
        REQUIRE(x_caption.points[0].y == Approx(290));

        const auto& y_caption = prims[14];
        REQUIRE(y_caption.text == "Altitude (m)");
        REQUIRE(y_caption.anchor == TextAnchor::Start);
        REQUIRE(y_caption.points[0].x == Approx(40));
        REQUIRE(y_caption.points[0].y == Approx(20));
    }
}

TEST_CASE("Chart grid labels run from max to min", "[chart]") {
    std::vector<double> t{0, 1, 2};
    std::vector<double> v{0, 20, 40};
    auto labels = grid_labels(render_chart(Metric::Altitude, t, v, WIDTH, HEIGHT));
    REQUIRE(labels == std::vector<std::string>{"40", "30", "20", "10", "0"});
}

TEST_CASE("Chart grid labels use more decimals for small ranges", "[chart]") {
    std::vector<double> t{0, 1};
    std::vector<double> v{1.0, 1.4};
    auto labels = grid_labels(render_chart(Metric::Pressure, t, v, WIDTH, HEIGHT));
    REQUIRE(labels.front() == "1.40");
    REQUIRE(labels.back() == "1.00");
}

TEST_CASE("Chart polyline maps data into the padded area", "[chart]") {
    std::vector<double> t{0, 1, 2, 3};
    std::vector<double> v{0, 10, 20, 40};
    const auto& line = find_polyline(render_chart(Metric::Altitude, t, v, WIDTH, HEIGHT));

    REQUIRE(line.points.size() == 4);
    // Oldest point bottom-left, newest top-right
    REQUIRE(line.points.front().x == Approx(40));
    REQUIRE(line.points.front().y == Approx(260));
    REQUIRE(line.points.back().x == Approx(360));
    REQUIRE(line.points.back().y == Approx(40));
    // t=1 -> a third of the way across, v=10 -> a quarter of the way up
    REQUIRE(line.points[1].x == Approx(40 + 320.0 / 3.0));
    REQUIRE(line.points[1].y == Approx(260 - 55));
    REQUIRE(line.color == 0x00FF88);
    REQUIRE(line.width == 2);
}

TEST_CASE("Chart skips gaps instead of plotting zero", "[chart]") {
    std::vector<double> t{0, 1, 2};
    std::vector<double> v{10, NaN, 20};
    const auto& line = find_polyline(render_chart(Metric::Velocity, t, v, WIDTH, HEIGHT));

    REQUIRE(line.points.size() == 2);
    REQUIRE(line.points[0].y == Approx(260));
    REQUIRE(line.points[1].y == Approx(40));
}

TEST_CASE("Chart centers a constant series", "[chart]") {
    std::vector<double> t{0, 1, 2};
    std::vector<double> v{5, 5, 5};
    auto prims = render_chart(Metric::Temperature, t, v, WIDTH, HEIGHT);
    const auto& line = find_polyline(prims);

    for (const auto& p : line.points) {
        REQUIRE(std::isfinite(p.y));
        REQUIRE(p.y == Approx(HEIGHT / 2.0));
    }

    auto labels = grid_labels(prims);
    REQUIRE(labels.front() == "5.5");
    REQUIRE(labels.back() == "4.5");
}

TEST_CASE("Chart handles identical timestamps", "[chart]") {
    std::vector<double> t{3, 3};
    std::vector<double> v{1, 2};
    const auto& line = find_polyline(render_chart(Metric::Altitude, t, v, WIDTH, HEIGHT));
    for (const auto& p : line.points) {
        REQUIRE(p.x == Approx(WIDTH / 2.0));
    }
}

TEST_CASE("Chart y caption follows the metric", "[chart]") {
    std::vector<double> t{0, 1};
    std::vector<double> v{0, 1};
    REQUIRE(render_chart(Metric::Velocity, t, v, WIDTH, HEIGHT).back().text == "Velocity (m/s)");
    REQUIRE(render_chart(Metric::Pressure, t, v, WIDTH, HEIGHT).back().text == "Pressure (kPa)");
}
