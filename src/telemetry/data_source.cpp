// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "data_source.h"

#include "serial_source.h"
#include "simulator_source.h"
#include "tcp_source.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace rocketscope {

const char* source_type_to_string(SourceType type) {
    switch (type) {
    case SourceType::Simulator:
        return "simulator";
    case SourceType::Serial:
        return "serial";
    case SourceType::Tcp:
        return "tcp";
    }
    return "unknown";
}

std::optional<SourceType> source_type_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "simulator" || lower == "sim") {
        return SourceType::Simulator;
    }
    if (lower == "serial") {
        return SourceType::Serial;
    }
    if (lower == "tcp" || lower == "socket") {
        return SourceType::Tcp;
    }
    return std::nullopt;
}

bool is_supported_baud_rate(int baud) {
    return std::find(SUPPORTED_BAUD_RATES.begin(), SUPPORTED_BAUD_RATES.end(), baud) !=
           SUPPORTED_BAUD_RATES.end();
}

std::unique_ptr<DataSource> DataSource::create(const SourceConfig& config) {
    switch (config.type) {
    case SourceType::Simulator:
        return std::make_unique<SimulatorSource>(config.simulator);
    case SourceType::Serial:
        return std::make_unique<SerialSource>(config.serial);
    case SourceType::Tcp:
        return std::make_unique<TcpSource>(config.tcp);
    }

    spdlog::error("[DataSource] Unknown source type {}", static_cast<int>(config.type));
    return nullptr;
}

bool DataSource::is_available(SourceType type) {
    switch (type) {
    case SourceType::Simulator:
    case SourceType::Tcp:
        return true;
    case SourceType::Serial:
#ifdef ROCKETSCOPE_HAS_SERIAL
        return true;
#else
        return false;
#endif
    }
    return false;
}

} // namespace rocketscope
