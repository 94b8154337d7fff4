// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"

#include <cmath>
#include <limits>

#include <catch2/catch_all.hpp>

using namespace rocketscope;

TEST_CASE("reading uses one decimal", "[format]") {
    REQUIRE(fmt::reading(512.44) == "512.4");
    REQUIRE(fmt::reading(0.0) == "0.0");
    REQUIRE(fmt::reading(-9.81) == "-9.8");
}

TEST_CASE("reading shows placeholder for missing values", "[format]") {
    REQUIRE(fmt::reading(std::nullopt) == "--");
    REQUIRE(fmt::reading(std::numeric_limits<double>::quiet_NaN()) == "--");
    REQUIRE(fmt::reading(std::numeric_limits<double>::infinity()) == "--");
}

TEST_CASE("reading never prints negative zero", "[format]") {
    REQUIRE(fmt::reading(-0.01) == "0.0");
}

TEST_CASE("reading_to_buffer matches reading", "[format]") {
    char buf[16];
    REQUIRE(fmt::reading_to_buffer(buf, sizeof(buf), 127.45) == std::string(buf).size());
    REQUIRE(std::string(buf) == fmt::reading(127.45));
    REQUIRE(fmt::reading_to_buffer(nullptr, 16, 1.0) == 0);
}

TEST_CASE("axis_decimals by range", "[format]") {
    REQUIRE(fmt::axis_decimals(2000.0) == 0);
    REQUIRE(fmt::axis_decimals(10.0) == 0);
    REQUIRE(fmt::axis_decimals(9.9) == 1);
    REQUIRE(fmt::axis_decimals(1.0) == 1);
    REQUIRE(fmt::axis_decimals(0.5) == 2);
}

TEST_CASE("axis_value formats and avoids -0", "[format]") {
    REQUIRE(fmt::axis_value(1952.1, 0) == "1952");
    REQUIRE(fmt::axis_value(1.25, 2) == "1.25");
    REQUIRE(fmt::axis_value(-0.001, 1) == "0.0");
}

TEST_CASE("wall_clock_timestamp has millisecond layout", "[format]") {
    std::string ts = fmt::wall_clock_timestamp();
    REQUIRE(ts.size() == 12);
    REQUIRE(ts[2] == ':');
    REQUIRE(ts[5] == ':');
    REQUIRE(ts[8] == '.');
}

TEST_CASE("reading switches to scientific notation for huge values", "[format]") {
    REQUIRE(fmt::reading(1e300) == "1e+300");
    REQUIRE(fmt::reading(-2.5e12) == "-2.5e+12");
    REQUIRE(fmt::reading(999999999.0) == "999999999.0");
    REQUIRE(fmt::reading(1e9) == "1e+09");
}

TEST_CASE("reading_to_buffer never leaves a truncated number", "[format]") {
    char small[6];
    REQUIRE(fmt::reading_to_buffer(small, sizeof(small), 123456.7) == 2);
    REQUIRE(std::string(small) == "--");
}

TEST_CASE("axis_value uses scientific notation for huge values", "[format]") {
    REQUIRE(fmt::axis_value(1e300, 0) == "1e+300");
}
