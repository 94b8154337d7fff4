// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "serial_source.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#ifdef ROCKETSCOPE_HAS_SERIAL
#include <fcntl.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace rocketscope {

namespace {

// Per-connection error logging: the first few at warn, the rest at debug so a
// chattering link cannot flood the log.
constexpr size_t LOUD_ERROR_LIMIT = 3;

#ifdef ROCKETSCOPE_HAS_SERIAL
bool baud_to_speed(int baud, speed_t& out) {
    switch (baud) {
    case 9600:
        out = B9600;
        return true;
    case 38400:
        out = B38400;
        return true;
    case 57600:
        out = B57600;
        return true;
    case 115200:
        out = B115200;
        return true;
    default:
        return false;
    }
}
#endif

} // namespace

SerialSource::SerialSource(SerialSettings settings) : settings_(std::move(settings)) {}

SerialSource::~SerialSource() {
    disconnect();
}

std::string SerialSource::name() const {
    return "Serial " + settings_.port + " @ " + std::to_string(settings_.baud);
}

ConnectResult SerialSource::connect() {
#ifdef ROCKETSCOPE_HAS_SERIAL
    if (connected_.load()) {
        return {true, "Already connected to " + settings_.port};
    }

    speed_t speed;
    if (!baud_to_speed(settings_.baud, speed)) {
        spdlog::warn("[SerialSource] Unsupported baud rate {}", settings_.baud);
        return {false, "Unsupported baud rate " + std::to_string(settings_.baud)};
    }

    int fd = open(settings_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        spdlog::warn("[SerialSource] Failed to open {}: {}", settings_.port, strerror(err));
        return {false, "Failed to open " + settings_.port + ": " + strerror(err)};
    }

    // Refuse ports another process is already reading
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        spdlog::warn("[SerialSource] {} is locked by another process", settings_.port);
        return {false, "Port " + settings_.port + " is busy: " + strerror(err)};
    }
    if (ioctl(fd, TIOCEXCL) != 0) {
        spdlog::debug("[SerialSource] TIOCEXCL not supported on {}: {}", settings_.port,
                      strerror(errno));
    }

    struct termios tty;
    std::memset(&tty, 0, sizeof(tty));
    if (tcgetattr(fd, &tty) != 0) {
        int err = errno;
        close(fd);
        spdlog::warn("[SerialSource] tcgetattr failed on {}: {}", settings_.port, strerror(err));
        return {false, "Cannot configure " + settings_.port + ": " + strerror(err)};
    }

    cfsetospeed(&tty, speed);
    cfsetispeed(&tty, speed);

    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= CS8;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cflag |= CREAD | CLOCAL;

    tty.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
    tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL);
    tty.c_oflag &= ~OPOST;

    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        int err = errno;
        close(fd);
        spdlog::warn("[SerialSource] tcsetattr failed on {}: {}", settings_.port, strerror(err));
        return {false, "Cannot configure " + settings_.port + ": " + strerror(err)};
    }

    tcflush(fd, TCIOFLUSH);

    if (settings_.settle_ms > 0) {
        spdlog::debug("[SerialSource] Waiting {}ms for {} to settle", settings_.settle_ms,
                      settings_.port);
        std::this_thread::sleep_for(std::chrono::milliseconds(settings_.settle_ms));
    }

    fd_ = fd;
    lines_.clear();
    parse_errors_ = 0;
    read_errors_ = 0;
    connected_.store(true);

    spdlog::info("[SerialSource] Opened {} at {} baud", settings_.port, settings_.baud);
    return {true, "Connected to " + settings_.port};
#else
    spdlog::warn("[SerialSource] Serial support not compiled in");
    return {false, "Serial ports are not supported in this build"};
#endif
}

void SerialSource::disconnect() {
#ifdef ROCKETSCOPE_HAS_SERIAL
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
        spdlog::info("[SerialSource] Closed {}", settings_.port);
    }
#endif
    connected_.store(false);
    lines_.clear();
}

void SerialSource::drain_port() {
#ifdef ROCKETSCOPE_HAS_SERIAL
    char buf[512];
    for (;;) {
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n > 0) {
            lines_.feed(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }

        int err = errno;
        read_errors_++;
        if (read_errors_ <= LOUD_ERROR_LIMIT) {
            spdlog::warn("[SerialSource] Read error on {}: {}", settings_.port, strerror(err));
        } else {
            spdlog::debug("[SerialSource] Read error on {}: {}", settings_.port, strerror(err));
        }
        return;
    }
#endif
}

std::optional<TelemetrySample> SerialSource::read_data() {
    if (!connected_.load() || fd_ < 0) {
        return std::nullopt;
    }

    if (lines_.pending_lines() == 0) {
        drain_port();
    }

    while (auto line = lines_.next_line()) {
        std::string error;
        if (auto sample = parse_telemetry_payload(*line, &error)) {
            return sample;
        }
        parse_errors_++;
        if (parse_errors_ <= LOUD_ERROR_LIMIT) {
            spdlog::warn("[SerialSource] Malformed record ({}): {}", error, line->substr(0, 80));
        } else {
            spdlog::debug("[SerialSource] Malformed record ({})", error);
        }
    }
    return std::nullopt;
}

std::vector<std::string> list_serial_ports() {
    namespace fs = std::filesystem;

    std::vector<std::string> ports;
    std::error_code ec;
    fs::directory_iterator it("/dev", ec);
    if (ec) {
        spdlog::debug("[SerialSource] Cannot list /dev: {}", ec.message());
        return ports;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        bool candidate = name.rfind("ttyUSB", 0) == 0 || name.rfind("ttyACM", 0) == 0 ||
                         name.rfind("cu.", 0) == 0;
        if (!candidate && name.rfind("ttyS", 0) == 0) {
            // Most ttyS nodes are placeholders without hardware behind them
            candidate = fs::exists("/sys/class/tty/" + name + "/device", ec);
        }
        if (candidate) {
            ports.push_back(entry.path().string());
        }
    }

    std::sort(ports.begin(), ports.end());
    return ports;
}

} // namespace rocketscope
