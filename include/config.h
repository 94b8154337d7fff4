// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file config.h
 * @brief Persistent JSON settings addressed by JSON pointer ("/source/tcp/host")
 *
 * Single instance, UI thread only. Reads never throw: a missing key or a value
 * of the wrong type yields the caller's default.
 */

#include <spdlog/spdlog.h>

#include <string>

#include "hv/json.hpp"

namespace rocketscope {

using json = nlohmann::json;

class Config {
  public:
    static constexpr const char* DEFAULT_PATH = "rocketscopeconfig.json";

    static Config* get_instance();

    /**
     * @brief Load the config file, creating it with defaults if missing
     *
     * A file that cannot be parsed is left untouched and defaults are used
     * for this session.
     *
     * @return false if the file existed but could not be read or parsed
     */
    bool init(const std::string& path = DEFAULT_PATH);

    /// Value at a JSON pointer, or default_value if missing or mistyped
    template <typename T> T get(const std::string& pointer, const T& default_value) const {
        try {
            json::json_pointer ptr(pointer);
            if (!data_.contains(ptr)) {
                return default_value;
            }
            return data_.at(ptr).get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Bad value at {}: {}", pointer, e.what());
            return default_value;
        }
    }

    /// Set a value (intermediate objects are created). Call save() to persist.
    template <typename T> void set(const std::string& pointer, const T& value) {
        try {
            data_[json::json_pointer(pointer)] = value;
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Cannot set {}: {}", pointer, e.what());
        }
    }

    bool exists(const std::string& pointer) const;

    /// Write the document back to its file
    bool save();

    /// Replace the document with built-in defaults (not saved)
    void reset_to_defaults();

    const std::string& path() const {
        return path_;
    }

    static json default_document();

  private:
    Config();

    std::string path_ = DEFAULT_PATH;
    json data_;
};

} // namespace rocketscope
