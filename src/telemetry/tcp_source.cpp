// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tcp_source.h"

#include "hv/herr.h"
#include "hv/hsocket.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

namespace rocketscope {

namespace {

constexpr size_t LOUD_ERROR_LIMIT = 3;
constexpr size_t RECV_CHUNK = 1024;

} // namespace

TcpSource::TcpSource(TcpSettings settings) : settings_(std::move(settings)) {}

TcpSource::~TcpSource() {
    disconnect();
}

std::string TcpSource::name() const {
    return "TCP " + settings_.host + ":" + std::to_string(settings_.port);
}

ConnectResult TcpSource::connect() {
    const std::string endpoint = settings_.host + ":" + std::to_string(settings_.port);

    if (connected_.load()) {
        return {true, "Already connected to " + endpoint};
    }
    if (settings_.port <= 0 || settings_.port > 65535) {
        return {false, "Invalid TCP port " + std::to_string(settings_.port)};
    }
    if (settings_.host.empty()) {
        return {false, "No host given"};
    }

    spdlog::info("[TcpSource] Connecting to {} (timeout {}ms)", endpoint,
                 settings_.connect_timeout_ms);

    // Resolve separately: a getaddrinfo failure code is not an errno
    sockaddr_u addr;
    std::memset(&addr, 0, sizeof(addr));
    if (ResolveAddr(settings_.host.c_str(), &addr) != 0) {
        spdlog::warn("[TcpSource] Cannot resolve host {}", settings_.host);
        return {false, "Cannot resolve host " + settings_.host};
    }

    // libhv returns a negative error code (errno or hv error) on failure
    int fd = ConnectTimeout(settings_.host.c_str(), settings_.port, settings_.connect_timeout_ms);
    if (fd < 0) {
        const char* reason = hv_strerror(-fd);
        spdlog::warn("[TcpSource] Connect to {} failed: {}", endpoint, reason);
        return {false, "Failed to connect to " + endpoint + ": " + reason};
    }

    if (so_rcvtimeo(fd, settings_.read_timeout_ms) != 0) {
        int err = errno;
        closesocket(fd);
        spdlog::warn("[TcpSource] Cannot set receive timeout: {}", strerror(err));
        return {false, "Failed to configure socket: " + std::string(strerror(err))};
    }

    sockfd_ = fd;
    lines_.clear();
    parse_errors_ = 0;
    read_errors_ = 0;
    peer_closed_.store(false);
    connected_.store(true);

    spdlog::info("[TcpSource] Connected to {}", endpoint);
    return {true, "Connected to " + endpoint};
}

void TcpSource::disconnect() {
    if (sockfd_ >= 0) {
        closesocket(sockfd_);
        sockfd_ = -1;
        spdlog::info("[TcpSource] Closed connection to {}:{}", settings_.host, settings_.port);
    }
    connected_.store(false);
    lines_.clear();
}

void TcpSource::receive() {
    char buf[RECV_CHUNK];
    ssize_t n = recv(sockfd_, buf, sizeof(buf), 0);
    if (n > 0) {
        lines_.feed(buf, static_cast<size_t>(n));
        return;
    }

    if (n == 0) {
        peer_closed_.store(true);
        spdlog::warn("[TcpSource] {}:{} closed the connection", settings_.host, settings_.port);
        return;
    }

    int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
        return; // receive timeout: no data this time
    }

    read_errors_++;
    if (read_errors_ <= LOUD_ERROR_LIMIT) {
        spdlog::warn("[TcpSource] Receive error: {}", strerror(err));
    } else {
        spdlog::debug("[TcpSource] Receive error: {}", strerror(err));
    }
    if (err == ECONNRESET || err == ENOTCONN || err == EPIPE) {
        peer_closed_.store(true);
    }
}

std::optional<TelemetrySample> TcpSource::read_data() {
    if (!connected_.load() || sockfd_ < 0) {
        return std::nullopt;
    }

    if (lines_.pending_lines() == 0 && !peer_closed_.load()) {
        receive();
    }

    while (auto line = lines_.next_line()) {
        std::string error;
        if (auto sample = parse_telemetry_payload(*line, &error)) {
            return sample;
        }
        parse_errors_++;
        if (parse_errors_ <= LOUD_ERROR_LIMIT) {
            spdlog::warn("[TcpSource] Malformed record ({}): {}", error, line->substr(0, 80));
        } else {
            spdlog::debug("[TcpSource] Malformed record ({})", error);
        }
    }
    return std::nullopt;
}

} // namespace rocketscope
