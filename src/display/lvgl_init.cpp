// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_init.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace rocketscope {

namespace {

uint32_t monotonic_ms() {
    using namespace std::chrono;
    return static_cast<uint32_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

bool init_lvgl(int width, int height, LvglContext& ctx) {
    lv_init();
    lv_tick_set_cb(monotonic_ms);

    ctx.backend = DisplayBackend::create_auto();
    if (!ctx.backend) {
        spdlog::error("[LVGL] No display backend available");
        lv_deinit();
        return false;
    }

    spdlog::info("[LVGL] Using display backend: {}", ctx.backend->name());

    ctx.display = ctx.backend->create_display(width, height);
    if (!ctx.display) {
        spdlog::error("[LVGL] Failed to create display");
        ctx.backend.reset();
        lv_deinit();
        return false;
    }

    ctx.pointer = ctx.backend->create_input_pointer();
    if (!ctx.pointer) {
        // Monitoring still works without input; connecting needs --connect
        spdlog::warn("[LVGL] No pointer input device created - touch/mouse disabled");
    }

    ctx.keyboard = ctx.backend->create_input_keyboard();
    if (ctx.keyboard) {
        lv_group_t* input_group = lv_group_create();
        lv_group_set_default(input_group);
        lv_indev_set_group(ctx.keyboard, input_group);
        spdlog::debug("[LVGL] Physical keyboard input enabled");
    }

    spdlog::debug("[LVGL] Initialized: {}x{}", width, height);
    return true;
}

void deinit_lvgl(LvglContext& ctx) {
    ctx.display = nullptr;
    ctx.pointer = nullptr;
    ctx.keyboard = nullptr;
    lv_deinit();
    ctx.backend.reset();
}

} // namespace rocketscope
