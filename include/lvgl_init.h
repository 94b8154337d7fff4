// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "display_backend.h"

#include <lvgl.h>

#include <memory>

namespace rocketscope {

/// Everything init_lvgl() created; released by deinit_lvgl()
struct LvglContext {
    std::unique_ptr<DisplayBackend> backend;
    lv_display_t* display = nullptr;
    lv_indev_t* pointer = nullptr;
    lv_indev_t* keyboard = nullptr;
};

/**
 * @brief Initialize LVGL, the display backend and input devices
 *
 * @return false if no display could be created (LVGL is deinitialized again)
 */
bool init_lvgl(int width, int height, LvglContext& ctx);

void deinit_lvgl(LvglContext& ctx);

} // namespace rocketscope
