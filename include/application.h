// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file application.h
 * @brief Process lifecycle: config, logging, LVGL, pipeline wiring, main loop
 */

#pragma once

#include "app_settings.h"
#include "cli_options.h"
#include "connection_manager.h"
#include "lvgl_init.h"
#include "main_loop_handler.h"
#include "sample_queue.h"
#include "telemetry_dashboard.h"
#include "ui_telemetry_screen.h"

#include <lvgl.h>

#include <memory>

namespace rocketscope::application {

class Application {
  public:
    Application() = default;
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /// Run until the window closes, SIGINT/SIGTERM or --timeout; returns exit code
    int run(int argc, char** argv);

  private:
    bool init(const CliOptions& options);
    void create_ui();
    void main_loop();
    void shutdown();

    void connect(const SourceConfig& config);
    void disconnect();
    void poll_connection();

    static void render_timer_cb(lv_timer_t* timer);

    AppSettings settings_;
    CliOptions options_;

    LvglContext lvgl_;
    bool lvgl_ready_ = false;

    SampleQueue queue_;
    std::unique_ptr<ConnectionManager> connection_;
    std::unique_ptr<ui::TelemetryScreen> screen_;
    std::unique_ptr<TelemetryDashboard> dashboard_;
    lv_timer_t* render_timer_ = nullptr;

    MainLoopHandler loop_handler_;
    size_t samples_since_frame_ = 0;
};

} // namespace rocketscope::application
