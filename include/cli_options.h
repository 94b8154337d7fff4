// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "data_source.h"

#include <optional>
#include <string>

namespace rocketscope {

/**
 * @brief Command-line overrides for one session
 *
 * Unset optionals leave the config value in place. Nothing here is saved.
 */
struct CliOptions {
    std::optional<SourceType> source;
    std::optional<std::string> serial_port;
    std::optional<int> baud;
    std::optional<std::string> host;
    std::optional<int> tcp_port;
    std::string config_path;
    std::string log_file;
    bool connect_on_start = false;
    int timeout_sec = 0;
    int verbosity = 0;
    bool show_help = false;
};

struct CliParseResult {
    bool ok = false;
    CliOptions options;
    std::string error; ///< Set when ok is false
};

/**
 * @brief Parse argv (getopt_long; resets getopt state so it can be called repeatedly)
 */
CliParseResult parse_cli_options(int argc, char** argv);

/// Usage text for --help and parse errors
std::string cli_usage(const char* program);

/// Apply the overrides to a source config
void apply_cli_overrides(const CliOptions& options, SourceConfig& source);

} // namespace rocketscope
