// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_telemetry_pipeline.cpp
 * @brief Simulator -> acquisition thread -> queue -> dashboard, end to end
 */

#include "connection_manager.h"
#include "telemetry_dashboard.h"

#include <chrono>
#include <cmath>
#include <thread>

#include <catch2/catch_all.hpp>

using namespace rocketscope;
using namespace std::chrono_literals;

namespace {

class CountingView : public TelemetryView {
  public:
    void show_metric(Metric metric, const std::string& text) override {
        if (metric == Metric::Altitude) {
            altitude = text;
        }
    }
    void show_flight_time(const std::string& text) override {
        flight_time = text;
    }
    void show_phase(const std::string& text) override {
        phase = text;
    }
    void show_log(const std::string& text) override {
        log = text;
    }
    std::pair<int, int> chart_viewport(size_t) override {
        return {600, 250};
    }
    void show_chart(size_t, std::vector<chart::DrawPrimitive> primitives) override {
        last_chart_size = primitives.size();
    }

    std::string altitude = "--";
    std::string flight_time = "--";
    std::string phase;
    std::string log;
    size_t last_chart_size = 0;
};

} // namespace

TEST_CASE("Simulated flight reaches the dashboard", "[pipeline][slow]") {
    SampleQueue queue;
    CountingView view;
    TelemetryDashboard dash(queue, view);
    ConnectionManager mgr(queue, 20ms);
    mgr.set_reset_hook([&dash]() { dash.reset(); });

    SourceConfig config;
    config.type = SourceType::Simulator;
    config.simulator.seed = 42;
    REQUIRE(mgr.connect(config));

    // Render loop at roughly 20 Hz
    auto deadline = std::chrono::steady_clock::now() + 3000ms;
    while (dash.samples_processed() < 10 && std::chrono::steady_clock::now() < deadline) {
        if (auto r = mgr.take_connect_result()) {
            REQUIRE(r->success);
            dash.log_event("Connected: " + r->message);
        }
        dash.tick();
        std::this_thread::sleep_for(50ms);
    }
    mgr.disconnect();
    dash.tick();

    REQUIRE(mgr.state() == ConnectionState::Disconnected);
    REQUIRE(dash.samples_processed() >= 10);
    REQUIRE(view.phase.rfind("Phase: ", 0) == 0);
    REQUIRE(view.flight_time != "--");
    REQUIRE(view.last_chart_size == 15);
    REQUIRE(dash.log().lines().size() == 5);

    // Sample times advance by 0.1 s
    auto times = dash.history().times();
    for (size_t i = 1; i < times.size(); ++i) {
        REQUIRE(std::fabs(times[i] - times[i - 1] - 0.1) < 1e-6);
    }
}
