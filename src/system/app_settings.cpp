// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_settings.h"

#include <algorithm>

namespace rocketscope {

namespace {

int positive_or(const Config& config, const std::string& pointer, int fallback) {
    int value = config.get<int>(pointer, fallback);
    if (value <= 0) {
        spdlog::warn("[AppSettings] {} must be positive (got {}), using {}", pointer, value,
                     fallback);
        return fallback;
    }
    return value;
}

} // namespace

AppSettings load_app_settings(const Config& config) {
    AppSettings s;

    auto type_name = config.get<std::string>("/source/type", "simulator");
    if (auto type = source_type_from_string(type_name)) {
        s.source.type = *type;
    } else {
        spdlog::warn("[AppSettings] Unknown source type '{}', using simulator", type_name);
    }

    auto& serial = s.source.serial;
    serial.port = config.get<std::string>("/source/serial/port", serial.port);
    serial.baud = config.get<int>("/source/serial/baud", serial.baud);
    if (!is_supported_baud_rate(serial.baud)) {
        spdlog::warn("[AppSettings] Unsupported baud rate {}, using 9600", serial.baud);
        serial.baud = 9600;
    }
    serial.settle_ms = std::max(0, config.get<int>("/source/serial/settle_ms", serial.settle_ms));

    auto& tcp = s.source.tcp;
    tcp.host = config.get<std::string>("/source/tcp/host", tcp.host);
    tcp.port = config.get<int>("/source/tcp/port", tcp.port);
    tcp.connect_timeout_ms =
        positive_or(config, "/source/tcp/connect_timeout_ms", tcp.connect_timeout_ms);
    tcp.read_timeout_ms = positive_or(config, "/source/tcp/read_timeout_ms", tcp.read_timeout_ms);

    int interval = config.get<int>("/acquisition/interval_ms", s.acquisition_interval_ms);
    s.acquisition_interval_ms = std::clamp(interval, 20, 50);
    if (interval != s.acquisition_interval_ms) {
        spdlog::warn("[AppSettings] acquisition interval {}ms clamped to {}ms", interval,
                     s.acquisition_interval_ms);
    }

    s.render_period_ms = positive_or(config, "/render/period_ms", s.render_period_ms);
    s.history_capacity = static_cast<size_t>(
        positive_or(config, "/history/capacity", static_cast<int>(s.history_capacity)));
    s.log_lines =
        static_cast<size_t>(positive_or(config, "/log/max_lines", static_cast<int>(s.log_lines)));
    s.display_width = positive_or(config, "/display/width", s.display_width);
    s.display_height = positive_or(config, "/display/height", s.display_height);
    s.log_level = config.get<std::string>("/log_level", s.log_level);

    auto chart_keys = config.get<std::vector<std::string>>("/charts", {});
    if (!chart_keys.empty()) {
        std::vector<Metric> charts;
        for (const auto& key : chart_keys) {
            if (auto m = metric_from_key(key)) {
                charts.push_back(*m);
            } else {
                spdlog::warn("[AppSettings] Unknown chart metric '{}' ignored", key);
            }
        }
        if (!charts.empty()) {
            s.charts = std::move(charts);
        }
    }

    return s;
}

void store_source_config(Config& config, const SourceConfig& source) {
    config.set<std::string>("/source/type", source_type_to_string(source.type));
    config.set<std::string>("/source/serial/port", source.serial.port);
    config.set<int>("/source/serial/baud", source.serial.baud);
    config.set<std::string>("/source/tcp/host", source.tcp.host);
    config.set<int>("/source/tcp/port", source.tcp.port);
}

} // namespace rocketscope
