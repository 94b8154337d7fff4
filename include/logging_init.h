// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup for the application and LVGL log routing
 */

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace rocketscope {
namespace logging {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file_path;           ///< Empty = console only
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
 *
 * @return nullopt for unknown names
 */
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

/**
 * @brief Level for a -v count: 0 = fallback, 1 = info, 2 = debug, 3+ = trace
 */
spdlog::level::level_enum level_from_verbosity(int verbosity,
                                               spdlog::level::level_enum fallback);

/**
 * @brief Install the default logger
 *
 * Colored console sink plus, when file_path is set, a rotating file sink.
 * A file sink that cannot be created is reported and skipped.
 */
void init_logging(const LogConfig& config);

/**
 * @brief Register the custom LVGL log handler
 *
 * Call after init_logging(). LVGL levels map onto spdlog levels
 * (TRACE->trace, INFO->info, WARN->warn, ERROR/USER->error).
 */
void register_lvgl_log_handler();

} // namespace logging
} // namespace rocketscope
