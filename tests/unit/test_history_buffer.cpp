// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "history_buffer.h"

#include <cmath>

#include <catch2/catch_all.hpp>

using namespace rocketscope;
using Catch::Approx;

namespace {

TelemetrySample sample_at(double t, double altitude) {
    TelemetrySample s;
    s.flight_time = t;
    s.altitude = altitude;
    return s;
}

} // namespace

// ============================================================================
// RingBuffer
// ============================================================================

TEST_CASE("RingBuffer keeps insertion order until full", "[history]") {
    RingBuffer ring(4);
    ring.push(1.0);
    ring.push(2.0);
    ring.push(3.0);

    REQUIRE(ring.size() == 3);
    REQUIRE(ring.to_vector() == std::vector<double>{1.0, 2.0, 3.0});
}

TEST_CASE("RingBuffer evicts the oldest entry when full", "[history]") {
    RingBuffer ring(3);
    for (int i = 1; i <= 5; ++i) {
        ring.push(i);
    }
    REQUIRE(ring.size() == 3);
    REQUIRE(ring.at(0) == 3.0);
    REQUIRE(ring.to_vector() == std::vector<double>{3.0, 4.0, 5.0});
}

TEST_CASE("RingBuffer zero capacity is treated as one", "[history]") {
    RingBuffer ring(0);
    ring.push(7.0);
    ring.push(8.0);
    REQUIRE(ring.capacity() == 1);
    REQUIRE(ring.to_vector() == std::vector<double>{8.0});
}

// ============================================================================
// HistoryBuffer
// ============================================================================

TEST_CASE("HistoryBuffer defaults to 500 entries", "[history]") {
    HistoryBuffer history;
    REQUIRE(history.capacity() == 500);
    REQUIRE(history.empty());
}

TEST_CASE("HistoryBuffer retains only the newest 500 of 600 samples", "[history]") {
    HistoryBuffer history;
    for (int i = 1; i <= 600; ++i) {
        REQUIRE(history.append(sample_at(i * 0.1, i), 0.0));
    }

    REQUIRE(history.size() == 500);
    auto times = history.times();
    auto altitudes = history.values(Metric::Altitude);
    REQUIRE(times.size() == 500);
    REQUIRE(altitudes.size() == 500);
    REQUIRE(times.front() == Approx(10.1));
    REQUIRE(times.back() == Approx(60.0));
    REQUIRE(altitudes.front() == Approx(101.0));
    REQUIRE(altitudes.back() == Approx(600.0));
}

TEST_CASE("HistoryBuffer rings stay the same length", "[history]") {
    HistoryBuffer history(10);
    TelemetrySample partial;
    partial.flight_time = 1.0;
    partial.velocity = 5.0;
    history.append(partial, 0.0);
    history.append(sample_at(2.0, 20.0), 0.0);

    for (Metric m : ALL_METRICS) {
        REQUIRE(history.values(m).size() == history.times().size());
    }
}

TEST_CASE("HistoryBuffer stores absent metrics as gaps", "[history]") {
    HistoryBuffer history(10);
    TelemetrySample s;
    s.flight_time = 1.0;
    s.velocity = 5.0;
    history.append(s, 0.0);

    REQUIRE(std::isnan(history.values(Metric::Altitude)[0]));
    REQUIRE_FALSE(history.value_at(Metric::Altitude, 0).has_value());
    REQUIRE(*history.value_at(Metric::Velocity, 0) == Approx(5.0));
}

TEST_CASE("HistoryBuffer uses fallback time when flight_time is absent", "[history]") {
    HistoryBuffer history(10);
    TelemetrySample s;
    s.altitude = 3.0;
    REQUIRE(history.append(s, 12.5));
    REQUIRE(history.times()[0] == Approx(12.5));
}

TEST_CASE("HistoryBuffer ignores samples without metric or time", "[history]") {
    HistoryBuffer history(10);
    TelemetrySample s;
    s.phase = "Landed";
    s.timestamp = "12:00:00.000";
    REQUIRE_FALSE(history.append(s, 1.0));
    REQUIRE(history.empty());
}

TEST_CASE("HistoryBuffer clear empties every ring", "[history]") {
    HistoryBuffer history(10);
    history.append(sample_at(1.0, 1.0), 0.0);
    history.clear();
    REQUIRE(history.empty());
    REQUIRE(history.values(Metric::Altitude).empty());
    REQUIRE(history.capacity() == 10);
}
