// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tcp_source.h"

#include "../mocks/mock_telemetry_server.h"

#include <chrono>
#include <thread>

#include <catch2/catch_all.hpp>

using namespace rocketscope;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {

TcpSettings loopback(int port) {
    TcpSettings s;
    s.host = "127.0.0.1";
    s.port = port;
    s.connect_timeout_ms = 1000;
    s.read_timeout_ms = 20;
    return s;
}

std::optional<TelemetrySample> read_within(DataSource& source,
                                           std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto s = source.read_data()) {
            return s;
        }
    }
    return std::nullopt;
}

/// Server with one connected TcpSource
struct ConnectedFixture {
    ConnectedFixture() {
        port = server.start();
        REQUIRE(port > 0);
        source = std::make_unique<TcpSource>(loopback(port));
        REQUIRE(source->connect().success);
        REQUIRE(server.wait_for_clients(1));
    }

    MockTelemetryServer server;
    int port = -1;
    std::unique_ptr<TcpSource> source;
};

} // namespace

// ============================================================================
// Connect
// ============================================================================

TEST_CASE("TcpSource rejects invalid ports", "[tcp]") {
    TcpSource zero(loopback(0));
    REQUIRE_FALSE(zero.connect().success);

    TcpSource high(loopback(70000));
    auto r = high.connect();
    REQUIRE_FALSE(r.success);
    REQUIRE(r.message.find("Invalid TCP port") != std::string::npos);
}

TEST_CASE("TcpSource reports a refused connection", "[tcp]") {
    // Grab a free port, then close the server so nothing listens there
    int port;
    {
        MockTelemetryServer server;
        port = server.start();
        REQUIRE(port > 0);
        server.stop();
    }

    TcpSource source(loopback(port));
    auto r = source.connect();
    REQUIRE_FALSE(r.success);
    REQUIRE(r.message.find("127.0.0.1:" + std::to_string(port)) != std::string::npos);
    REQUIRE_FALSE(source.is_connected());
}

TEST_CASE("TcpSource reports an unresolvable host", "[tcp]") {
    TcpSettings settings = loopback(5000);
    settings.host = "rocketscope-no-such-host.invalid";
    TcpSource source(settings);

    auto r = source.connect();
    REQUIRE_FALSE(r.success);
    REQUIRE(r.message == "Cannot resolve host rocketscope-no-such-host.invalid");
    REQUIRE_FALSE(source.is_connected());
}

TEST_CASE("TcpSource gives up on an unreachable host within the timeout", "[tcp][slow]") {
    // Non-routable address: either times out or fails fast with no route
    TcpSettings settings = loopback(5000);
    settings.host = "10.255.255.1";
    settings.connect_timeout_ms = 200;
    TcpSource source(settings);

    auto before = std::chrono::steady_clock::now();
    auto r = source.connect();
    auto took = std::chrono::steady_clock::now() - before;

    REQUIRE_FALSE(r.success);
    REQUIRE(r.message.find("Failed to connect to 10.255.255.1:5000") != std::string::npos);
    REQUIRE(took < 2000ms);
    REQUIRE_FALSE(source.is_connected());
}

TEST_CASE("TcpSource name shows the endpoint", "[tcp]") {
    TcpSource source(loopback(5000));
    REQUIRE(source.name() == "TCP 127.0.0.1:5000");
    REQUIRE(source.type() == SourceType::Tcp);
    REQUIRE_FALSE(source.read_data().has_value());
}

// ============================================================================
// Streaming
// ============================================================================

TEST_CASE_METHOD(ConnectedFixture, "TcpSource receives records", "[tcp]") {
    server.send_record({{"altitude", 1952.1}, {"flight_time", 15.0}, {"phase", "Apogee"}});

    auto sample = read_within(*source);
    REQUIRE(sample.has_value());
    REQUIRE(*sample->altitude == Approx(1952.1));
    REQUIRE(*sample->flight_time == Approx(15.0));
    REQUIRE(*sample->phase == "Apogee");
}

TEST_CASE_METHOD(ConnectedFixture, "TcpSource reassembles records split across packets",
                 "[tcp]") {
    server.send_raw("{\"velocity\": ");
    std::this_thread::sleep_for(30ms);
    REQUIRE_FALSE(source->read_data().has_value());

    server.send_raw("-12.5}\n{\"velocity\": -13.0}\n");
    auto first = read_within(*source);
    auto second = read_within(*source);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first->velocity == Approx(-12.5));
    REQUIRE(*second->velocity == Approx(-13.0));
}

TEST_CASE_METHOD(ConnectedFixture, "TcpSource skips malformed records", "[tcp]") {
    server.send_raw("not json\n[1,2]\n{\"temperature\": 15}\n");

    auto sample = read_within(*source);
    REQUIRE(sample.has_value());
    REQUIRE(*sample->temperature == Approx(15.0));
    REQUIRE(source->parse_errors() == 2);
}

TEST_CASE_METHOD(ConnectedFixture, "TcpSource read times out without data", "[tcp]") {
    auto before = std::chrono::steady_clock::now();
    REQUIRE_FALSE(source->read_data().has_value());
    REQUIRE(std::chrono::steady_clock::now() - before < 500ms);
    REQUIRE(source->is_connected());
}

TEST_CASE_METHOD(ConnectedFixture, "TcpSource stays connected after the peer closes", "[tcp]") {
    server.disconnect_all();

    auto deadline = std::chrono::steady_clock::now() + 2000ms;
    while (!source->peer_closed() && std::chrono::steady_clock::now() < deadline) {
        REQUIRE_FALSE(source->read_data().has_value());
    }
    REQUIRE(source->peer_closed());
    REQUIRE(source->is_connected());
    REQUIRE_FALSE(source->read_data().has_value());

    source->disconnect();
    REQUIRE_FALSE(source->is_connected());
}
