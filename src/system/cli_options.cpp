// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_options.h"

#include <getopt.h>

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace rocketscope {

namespace {

enum LongOnly : int {
    OPT_SERIAL_PORT = 1000,
    OPT_BAUD,
    OPT_HOST,
    OPT_TCP_PORT,
    OPT_CONNECT,
    OPT_TIMEOUT,
    OPT_LOG_FILE,
};

std::optional<int> parse_int(const char* text) {
    if (!text || *text == '\0') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

CliParseResult fail(std::string message) {
    CliParseResult r;
    r.ok = false;
    r.error = std::move(message);
    return r;
}

} // namespace

CliParseResult parse_cli_options(int argc, char** argv) {
    static const struct option long_options[] = {
        {"source", required_argument, nullptr, 's'},
        {"serial-port", required_argument, nullptr, OPT_SERIAL_PORT},
        {"baud", required_argument, nullptr, OPT_BAUD},
        {"host", required_argument, nullptr, OPT_HOST},
        {"tcp-port", required_argument, nullptr, OPT_TCP_PORT},
        {"config", required_argument, nullptr, 'c'},
        {"connect", no_argument, nullptr, OPT_CONNECT},
        {"timeout", required_argument, nullptr, OPT_TIMEOUT},
        {"log-file", required_argument, nullptr, OPT_LOG_FILE},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    CliOptions opts;

    // glibc: optind = 0 forces a full reinitialization
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":s:c:vh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 's': {
            auto type = source_type_from_string(optarg);
            if (!type) {
                return fail(std::string("Unknown source '") + optarg +
                            "' (expected simulator, serial or tcp)");
            }
            opts.source = *type;
            break;
        }
        case OPT_SERIAL_PORT:
            opts.serial_port = optarg;
            break;
        case OPT_BAUD: {
            auto baud = parse_int(optarg);
            if (!baud || !is_supported_baud_rate(*baud)) {
                return fail(std::string("Unsupported baud rate '") + optarg + "'");
            }
            opts.baud = *baud;
            break;
        }
        case OPT_HOST:
            opts.host = optarg;
            break;
        case OPT_TCP_PORT: {
            auto port = parse_int(optarg);
            if (!port || *port < 1 || *port > 65535) {
                return fail(std::string("Invalid TCP port '") + optarg + "'");
            }
            opts.tcp_port = *port;
            break;
        }
        case 'c':
            opts.config_path = optarg;
            break;
        case OPT_CONNECT:
            opts.connect_on_start = true;
            break;
        case OPT_TIMEOUT: {
            auto seconds = parse_int(optarg);
            if (!seconds || *seconds < 0) {
                return fail(std::string("Invalid timeout '") + optarg + "'");
            }
            opts.timeout_sec = *seconds;
            break;
        }
        case OPT_LOG_FILE:
            opts.log_file = optarg;
            break;
        case 'v':
            opts.verbosity++;
            break;
        case 'h':
            opts.show_help = true;
            break;
        case ':':
            return fail(std::string("Missing value for ") + argv[optind - 1]);
        default:
            return fail(std::string("Unknown option ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        return fail(std::string("Unexpected argument '") + argv[optind] + "'");
    }

    CliParseResult r;
    r.ok = true;
    r.options = std::move(opts);
    return r;
}

std::string cli_usage(const char* program) {
    std::string usage = "Usage: ";
    usage += program ? program : "rocketscope";
    usage += " [options]\n"
             "\n"
             "Options:\n"
             "  -s, --source TYPE       Data source: simulator, serial or tcp\n"
             "      --serial-port PATH  Serial device (e.g. /dev/ttyUSB0)\n"
             "      --baud N            Serial baud rate (9600, 38400, 57600, 115200)\n"
             "      --host HOST         TCP host\n"
             "      --tcp-port N        TCP port (1-65535)\n"
             "  -c, --config FILE       Config file (default: rocketscopeconfig.json)\n"
             "      --connect           Connect on startup\n"
             "      --timeout SEC       Quit after SEC seconds\n"
             "      --log-file FILE     Also log to a rotating file\n"
             "  -v, --verbose           Increase verbosity (-v info, -vv debug, -vvv trace)\n"
             "  -h, --help              Show this help\n";
    return usage;
}

void apply_cli_overrides(const CliOptions& options, SourceConfig& source) {
    if (options.source) {
        source.type = *options.source;
    }
    if (options.serial_port) {
        source.serial.port = *options.serial_port;
    }
    if (options.baud) {
        source.serial.baud = *options.baud;
    }
    if (options.host) {
        source.tcp.host = *options.host;
    }
    if (options.tcp_port) {
        source.tcp.port = *options.tcp_port;
    }
}

} // namespace rocketscope
