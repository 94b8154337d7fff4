// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <lvgl.h>

#include <string>

namespace rocketscope {
namespace logging {

namespace {

void lvgl_log_callback(lv_log_level_t level, const char* buf) {
    std::string msg(buf ? buf : "");
    // LVGL terminates every message with a newline
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }

    switch (level) {
    case LV_LOG_LEVEL_TRACE:
        spdlog::trace("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_INFO:
        spdlog::info("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_WARN:
        spdlog::warn("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_ERROR:
    case LV_LOG_LEVEL_USER:
    default:
        spdlog::error("[LVGL] {}", msg);
        break;
    }
}

} // namespace

void register_lvgl_log_handler() {
    lv_log_register_print_cb(lvgl_log_callback);
    spdlog::debug("[Logging] LVGL log output routed to spdlog");
}

} // namespace logging
} // namespace rocketscope
