// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// RocketScope - Display Backend Factory Implementation

#include "display_backend.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace rocketscope {

const char* display_backend_type_to_string(DisplayBackendType type) {
    switch (type) {
    case DisplayBackendType::AUTO:
        return "auto";
    case DisplayBackendType::SDL:
        return "sdl";
    case DisplayBackendType::FBDEV:
        return "fbdev";
    }
    return "unknown";
}

// ============================================================================
// SDL
// ============================================================================

#ifdef ROCKETSCOPE_DISPLAY_SDL

bool DisplayBackendSDL::is_available() const {
    // SDL needs a windowing system
    return std::getenv("DISPLAY") != nullptr || std::getenv("WAYLAND_DISPLAY") != nullptr;
}

lv_display_t* DisplayBackendSDL::create_display(int width, int height) {
    display_ = lv_sdl_window_create(width, height);
    if (!display_) {
        spdlog::error("[DisplayBackend] Failed to create SDL window {}x{}", width, height);
        return nullptr;
    }
    lv_sdl_window_set_title(display_, "RocketScope Telemetry");
    return display_;
}

lv_indev_t* DisplayBackendSDL::create_input_pointer() {
    return lv_sdl_mouse_create();
}

lv_indev_t* DisplayBackendSDL::create_input_keyboard() {
    return lv_sdl_keyboard_create();
}

#endif // ROCKETSCOPE_DISPLAY_SDL

// ============================================================================
// Framebuffer
// ============================================================================

#ifdef ROCKETSCOPE_DISPLAY_FBDEV

DisplayBackendFbdev::DisplayBackendFbdev() : DisplayBackendFbdev("/dev/fb0", "") {}

DisplayBackendFbdev::DisplayBackendFbdev(std::string fb_device, std::string touch_device)
    : fb_device_(std::move(fb_device)), touch_device_(std::move(touch_device)) {
    if (touch_device_.empty()) {
        const char* env = std::getenv("ROCKETSCOPE_TOUCH_DEVICE");
        touch_device_ = env ? env : "/dev/input/event0";
    }
}

bool DisplayBackendFbdev::is_available() const {
    return access(fb_device_.c_str(), R_OK | W_OK) == 0;
}

lv_display_t* DisplayBackendFbdev::create_display(int width, int height) {
    display_ = lv_linux_fbdev_create();
    if (!display_) {
        spdlog::error("[DisplayBackend] Failed to create framebuffer display");
        return nullptr;
    }
    lv_linux_fbdev_set_file(display_, fb_device_.c_str());
    spdlog::debug("[DisplayBackend] Framebuffer {} (requested {}x{}, native {}x{})", fb_device_,
                  width, height, lv_display_get_horizontal_resolution(display_),
                  lv_display_get_vertical_resolution(display_));
    return display_;
}

lv_indev_t* DisplayBackendFbdev::create_input_pointer() {
    if (access(touch_device_.c_str(), R_OK) != 0) {
        spdlog::warn("[DisplayBackend] Touch device {} not readable", touch_device_);
        return nullptr;
    }
    lv_indev_t* indev = lv_evdev_create(LV_INDEV_TYPE_POINTER, touch_device_.c_str());
    if (indev && display_) {
        lv_indev_set_display(indev, display_);
    }
    return indev;
}

#endif // ROCKETSCOPE_DISPLAY_FBDEV

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<DisplayBackend> DisplayBackend::create(DisplayBackendType type) {
    switch (type) {
#ifdef ROCKETSCOPE_DISPLAY_SDL
    case DisplayBackendType::SDL:
        return std::make_unique<DisplayBackendSDL>();
#endif

#ifdef ROCKETSCOPE_DISPLAY_FBDEV
    case DisplayBackendType::FBDEV:
        return std::make_unique<DisplayBackendFbdev>();
#endif

    case DisplayBackendType::AUTO:
        return create_auto();

    default:
        spdlog::error("[DisplayBackend] Type {} not compiled in",
                      display_backend_type_to_string(type));
        return nullptr;
    }
}

std::unique_ptr<DisplayBackend> DisplayBackend::create_auto() {
    const char* backend_env = std::getenv("ROCKETSCOPE_DISPLAY_BACKEND");
    if (backend_env != nullptr) {
        spdlog::info("[DisplayBackend] ROCKETSCOPE_DISPLAY_BACKEND={} - using forced backend",
                     backend_env);

        std::unique_ptr<DisplayBackend> forced;
        if (strcmp(backend_env, "sdl") == 0) {
            forced = create(DisplayBackendType::SDL);
        } else if (strcmp(backend_env, "fbdev") == 0 || strcmp(backend_env, "fb") == 0) {
            forced = create(DisplayBackendType::FBDEV);
        } else {
            spdlog::warn("[DisplayBackend] Unknown ROCKETSCOPE_DISPLAY_BACKEND value: {}",
                         backend_env);
        }
        if (forced && forced->is_available()) {
            return forced;
        }
        if (forced) {
            spdlog::warn("[DisplayBackend] {} backend forced but not available", forced->name());
        }
        // Fall through to auto-detection
    }

#ifdef ROCKETSCOPE_DISPLAY_FBDEV
    {
        auto backend = std::make_unique<DisplayBackendFbdev>();
        if (backend->is_available()) {
            spdlog::info("[DisplayBackend] Auto-detected: Framebuffer");
            return backend;
        }
        spdlog::debug("[DisplayBackend] Framebuffer backend not available");
    }
#endif

#ifdef ROCKETSCOPE_DISPLAY_SDL
    {
        auto backend = std::make_unique<DisplayBackendSDL>();
        if (backend->is_available()) {
            spdlog::info("[DisplayBackend] Auto-detected: SDL");
            return backend;
        }
        spdlog::debug("[DisplayBackend] SDL backend not available");
    }
#endif

    spdlog::error("[DisplayBackend] No display backend available!");
    spdlog::error("[DisplayBackend] Compiled backends: "
#ifdef ROCKETSCOPE_DISPLAY_SDL
                  "SDL "
#endif
#ifdef ROCKETSCOPE_DISPLAY_FBDEV
                  "FBDEV "
#endif
    );
    return nullptr;
}

} // namespace rocketscope
