// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <filesystem>
#include <fstream>

namespace rocketscope {

Config* Config::get_instance() {
    static Config instance;
    return &instance;
}

Config::Config() : data_(default_document()) {}

json Config::default_document() {
    return json{
        {"source",
         {{"type", "simulator"},
          {"serial", {{"port", "/dev/ttyUSB0"}, {"baud", 9600}, {"settle_ms", 2000}}},
          {"tcp",
           {{"host", "192.168.1.100"},
            {"port", 5000},
            {"connect_timeout_ms", 5000},
            {"read_timeout_ms", 100}}}}},
        {"acquisition", {{"interval_ms", 50}}},
        {"render", {{"period_ms", 50}}},
        {"history", {{"capacity", 500}}},
        {"charts", json::array({"altitude", "velocity"})},
        {"log", {{"max_lines", 5}}},
        {"display", {{"width", 1200}, {"height", 800}}},
        {"log_level", "info"},
    };
}

bool Config::init(const std::string& path) {
    path_ = path;
    data_ = default_document();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("[Config] {} not found, writing defaults", path_);
        return save();
    }

    std::ifstream in(path_);
    if (!in) {
        spdlog::warn("[Config] Cannot open {}, using defaults", path_);
        return false;
    }

    try {
        json loaded = json::parse(in);
        if (!loaded.is_object()) {
            spdlog::warn("[Config] {} is not a JSON object, using defaults", path_);
            return false;
        }
        // Keys missing from the file keep their defaults
        data_.merge_patch(loaded);
    } catch (const json::parse_error& e) {
        spdlog::warn("[Config] Failed to parse {}: {}", path_, e.what());
        return false;
    }

    spdlog::debug("[Config] Loaded {}", path_);
    return true;
}

bool Config::exists(const std::string& pointer) const {
    try {
        return data_.contains(json::json_pointer(pointer));
    } catch (const json::exception& e) {
        spdlog::warn("[Config] Bad pointer {}: {}", pointer, e.what());
        return false;
    }
}

bool Config::save() {
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        spdlog::error("[Config] Cannot write {}", path_);
        return false;
    }
    out << data_.dump(2) << '\n';
    if (!out) {
        spdlog::error("[Config] Write to {} failed", path_);
        return false;
    }
    spdlog::debug("[Config] Saved {}", path_);
    return true;
}

void Config::reset_to_defaults() {
    data_ = default_document();
}

} // namespace rocketscope
