// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace rocketscope {
namespace logging {

namespace {
constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum level_from_verbosity(int verbosity,
                                               spdlog::level::level_enum fallback) {
    switch (verbosity) {
    case 0:
        return fallback;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

void init_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!config.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rocketscope", sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("[Logging] Cannot open log file {}: {}", config.file_path, file_error);
    }
    spdlog::debug("[Logging] Level {}", spdlog::level::to_string_view(config.level));
}

} // namespace logging
} // namespace rocketscope
