// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include "config.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <thread>

namespace rocketscope::application {

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

constexpr uint32_t STATS_INTERVAL_MS = 5000;
constexpr auto IDLE_SLEEP_MAX = std::chrono::milliseconds(5);

} // namespace

Application::~Application() {
    shutdown();
}

int Application::run(int argc, char** argv) {
    CliParseResult parsed = parse_cli_options(argc, argv);
    if (!parsed.ok) {
        std::fprintf(stderr, "%s\n\n%s", parsed.error.c_str(),
                     cli_usage(argc > 0 ? argv[0] : nullptr).c_str());
        return 2;
    }
    if (parsed.options.show_help) {
        std::fputs(cli_usage(argc > 0 ? argv[0] : nullptr).c_str(), stdout);
        return 0;
    }
    options_ = parsed.options;

    if (!init(options_)) {
        shutdown();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    main_loop();
    shutdown();
    return 0;
}

bool Application::init(const CliOptions& options) {
    // Console logging first so config problems are visible
    logging::LogConfig log_config;
    log_config.level = logging::level_from_verbosity(options.verbosity, spdlog::level::info);
    log_config.file_path = options.log_file;
    logging::init_logging(log_config);

    Config* config = Config::get_instance();
    if (!config->init(options.config_path.empty() ? Config::DEFAULT_PATH : options.config_path)) {
        spdlog::warn("[Application] Continuing with default settings");
    }
    settings_ = load_app_settings(*config);
    apply_cli_overrides(options, settings_.source);

    // Precedence: -v flags, then ROCKETSCOPE_LOG_LEVEL, then config
    if (options.verbosity == 0) {
        std::string level_name = settings_.log_level;
        if (const char* env = std::getenv("ROCKETSCOPE_LOG_LEVEL")) {
            level_name = env;
        }
        if (auto level = logging::parse_level(level_name)) {
            spdlog::set_level(*level);
        } else {
            spdlog::warn("[Application] Unknown log level '{}'", level_name);
        }
    }

    spdlog::info("[Application] RocketScope starting (source: {})",
                 source_type_to_string(settings_.source.type));

    if (!init_lvgl(settings_.display_width, settings_.display_height, lvgl_)) {
        spdlog::error("[Application] Display initialization failed");
        return false;
    }
    lvgl_ready_ = true;
    logging::register_lvgl_log_handler();

    connection_ = std::make_unique<ConnectionManager>(
        queue_, std::chrono::milliseconds(settings_.acquisition_interval_ms));
    create_ui();

    MainLoopHandler::Config loop_config;
    loop_config.timeout_sec = options.timeout_sec;
    loop_config.stats_interval_ms =
        spdlog::get_level() <= spdlog::level::debug ? STATS_INTERVAL_MS : 0;
    loop_handler_.init(loop_config, lv_tick_get());

    if (options.connect_on_start) {
        connect(settings_.source);
    }
    return true;
}

void Application::create_ui() {
    screen_ = std::make_unique<ui::TelemetryScreen>(lv_screen_active(), settings_.source,
                                                    settings_.charts);

    DashboardSettings dashboard_settings;
    dashboard_settings.history_capacity = settings_.history_capacity;
    dashboard_settings.log_lines = settings_.log_lines;
    dashboard_settings.charts = settings_.charts;
    dashboard_ = std::make_unique<TelemetryDashboard>(queue_, *screen_, dashboard_settings);

    ui::TelemetryScreen::Handlers handlers;
    handlers.on_connect = [this](const SourceConfig& config) { connect(config); };
    handlers.on_disconnect = [this]() { disconnect(); };
    handlers.on_chart_metric = [this](size_t chart, Metric metric) {
        dashboard_->set_chart_metric(chart, metric);
    };
    handlers.on_chart_resized = [this](size_t chart) { dashboard_->redraw_chart(chart); };
    screen_->set_handlers(std::move(handlers));

    connection_->set_reset_hook([this]() { dashboard_->reset(); });

    render_timer_ = lv_timer_create(render_timer_cb,
                                    static_cast<uint32_t>(settings_.render_period_ms), this);
}

void Application::connect(const SourceConfig& config) {
    // Remember what the user picked for next time
    Config* cfg = Config::get_instance();
    store_source_config(*cfg, config);
    if (!cfg->save()) {
        spdlog::warn("[Application] Connection settings not saved to {}", cfg->path());
    }

    connection_->connect(config);
    screen_->set_connection_state(connection_->state());
    // Creation failures are reported at once; everything else arrives via poll_connection()
    poll_connection();
}

void Application::disconnect() {
    connection_->disconnect();
    screen_->set_connection_state(connection_->state());
    dashboard_->log_event("Disconnected");
}

void Application::poll_connection() {
    auto result = connection_->take_connect_result();
    if (!result) {
        return;
    }

    screen_->set_connection_state(connection_->state());
    if (result->success) {
        dashboard_->log_event("Connected: " + result->message);
    } else {
        screen_->show_error("Connection Error", result->message);
    }
}

void Application::render_timer_cb(lv_timer_t* timer) {
    auto* self = static_cast<Application*>(lv_timer_get_user_data(timer));
    self->poll_connection();
    self->samples_since_frame_ += self->dashboard_->tick();
}

void Application::main_loop() {
    spdlog::debug("[Application] Entering main loop");

    while (!g_shutdown.load()) {
        uint32_t idle_ms = lv_timer_handler();

        loop_handler_.on_frame(lv_tick_get(), samples_since_frame_);
        samples_since_frame_ = 0;

        if (loop_handler_.should_quit()) {
            spdlog::info("[Application] Timeout reached after {} ms", loop_handler_.elapsed_ms());
            break;
        }
        if (loop_handler_.stats_should_report()) {
            auto report = loop_handler_.take_stats_report();
            spdlog::debug("[Application] {:.1f} fps, {:.1f} samples/s over {:.1f}s", report.fps,
                          report.samples_per_sec, report.elapsed_sec);
        }

        auto sleep = std::min(std::chrono::milliseconds(idle_ms), IDLE_SLEEP_MAX);
        std::this_thread::sleep_for(sleep);
    }

    spdlog::debug("[Application] Main loop exited");
}

void Application::shutdown() {
    // Acquisition thread must be joined before anything it touches goes away
    if (connection_) {
        connection_->disconnect();
        connection_.reset();
    }

    if (render_timer_) {
        lv_timer_delete(render_timer_);
        render_timer_ = nullptr;
    }
    dashboard_.reset();
    screen_.reset();

    if (lvgl_ready_) {
        deinit_lvgl(lvgl_);
        lvgl_ready_ = false;
        spdlog::info("[Application] Shut down");
    }
}

} // namespace rocketscope::application
