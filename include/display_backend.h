// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// RocketScope - Display Backend Abstraction
//
// Wraps LVGL's built-in display drivers so the rest of the UI does not care
// whether it runs in an SDL window on a desktop or on a Linux framebuffer.

#pragma once

#include <lvgl.h>

#include <memory>
#include <string>

namespace rocketscope {

enum class DisplayBackendType {
    AUTO,  ///< Pick the first available backend
    SDL,   ///< Desktop window (development, ground station laptop)
    FBDEV, ///< Linux framebuffer + evdev touch (embedded)
};

const char* display_backend_type_to_string(DisplayBackendType type);

/**
 * @brief Creates the LVGL display and input devices for one platform
 *
 * The backend must outlive the display it created.
 */
class DisplayBackend {
  public:
    virtual ~DisplayBackend() = default;

    virtual lv_display_t* create_display(int width, int height) = 0;

    /// Mouse or touchscreen; nullptr if none is available
    virtual lv_indev_t* create_input_pointer() = 0;

    /// Physical keyboard; nullptr when the backend has none
    virtual lv_indev_t* create_input_keyboard() {
        return nullptr;
    }

    virtual DisplayBackendType type() const = 0;
    virtual const char* name() const = 0;
    virtual bool is_available() const = 0;

    /// Create a specific backend (nullptr if not compiled in)
    static std::unique_ptr<DisplayBackend> create(DisplayBackendType type);

    /**
     * @brief Pick a backend automatically
     *
     * ROCKETSCOPE_DISPLAY_BACKEND=sdl|fbdev forces a choice; otherwise the
     * framebuffer is preferred when present, then SDL.
     */
    static std::unique_ptr<DisplayBackend> create_auto();
};

#ifdef ROCKETSCOPE_DISPLAY_SDL
class DisplayBackendSDL : public DisplayBackend {
  public:
    lv_display_t* create_display(int width, int height) override;
    lv_indev_t* create_input_pointer() override;
    lv_indev_t* create_input_keyboard() override;

    DisplayBackendType type() const override {
        return DisplayBackendType::SDL;
    }
    const char* name() const override {
        return "SDL";
    }
    bool is_available() const override;

  private:
    lv_display_t* display_ = nullptr;
};
#endif

#ifdef ROCKETSCOPE_DISPLAY_FBDEV
class DisplayBackendFbdev : public DisplayBackend {
  public:
    DisplayBackendFbdev();
    DisplayBackendFbdev(std::string fb_device, std::string touch_device);

    lv_display_t* create_display(int width, int height) override;
    lv_indev_t* create_input_pointer() override;

    DisplayBackendType type() const override {
        return DisplayBackendType::FBDEV;
    }
    const char* name() const override {
        return "Linux Framebuffer";
    }
    bool is_available() const override;

  private:
    std::string fb_device_;
    std::string touch_device_;
    lv_display_t* display_ = nullptr;
};
#endif

} // namespace rocketscope
