// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file ui_telemetry_screen.h
 * @brief The single RocketScope screen: connection bar, data cards, charts, log
 *
 * Layout:
 * @code
 *   ┌────────────────────────────────────────────────────────────────┐
 *   │ ROCKET TELEMETRY  [Source v] [params...] [Connect]             │
 *   │ ● DISCONNECTED                 Phase: --                       │
 *   ├──────────────┬─────────────────────────────────────────────────┤
 *   │ Altitude     │ Y-Axis [altitude v]                             │
 *   │ Velocity     │ chart 0                                         │
 *   │ Acceleration ├─────────────────────────────────────────────────┤
 *   │ Temperature  │ Y-Axis [velocity v]                             │
 *   │ Pressure     │ chart 1                                         │
 *   │ Flight Time  │                                                 │
 *   ├──────────────┴─────────────────────────────────────────────────┤
 *   │ TELEMETRY LOG                                                  │
 *   └────────────────────────────────────────────────────────────────┘
 * @endcode
 *
 * Every widget is an explicit member created in the constructor. UI thread only.
 */

#include "connection_manager.h"
#include "data_source.h"
#include "telemetry_dashboard.h"
#include "ui_chart_view.h"

#include <lvgl.h>

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rocketscope::ui {

class TelemetryScreen : public TelemetryView {
  public:
    struct Handlers {
        std::function<void(const SourceConfig&)> on_connect;
        std::function<void()> on_disconnect;
        std::function<void(size_t chart, Metric metric)> on_chart_metric;
        std::function<void(size_t chart)> on_chart_resized;
    };

    /**
     * @param screen   LVGL screen to build on
     * @param initial  Connection parameters shown at start
     * @param charts   Initial metric per chart
     */
    TelemetryScreen(lv_obj_t* screen, const SourceConfig& initial,
                    const std::vector<Metric>& charts);
    ~TelemetryScreen() override;

    TelemetryScreen(const TelemetryScreen&) = delete;
    TelemetryScreen& operator=(const TelemetryScreen&) = delete;

    void set_handlers(Handlers handlers) {
        handlers_ = std::move(handlers);
    }

    /// Connection parameters as currently entered
    SourceConfig source_config() const;

    /// Status line, connect button label and parameter lock
    void set_connection_state(ConnectionState state);

    /// Modal error dialog
    void show_error(const std::string& title, const std::string& message);

    // TelemetryView
    void show_metric(Metric metric, const std::string& text) override;
    void show_flight_time(const std::string& text) override;
    void show_phase(const std::string& text) override;
    void show_log(const std::string& text) override;
    std::pair<int, int> chart_viewport(size_t chart) override;
    void show_chart(size_t chart, std::vector<chart::DrawPrimitive> primitives) override;

  private:
    struct Card {
        lv_obj_t* container = nullptr;
        lv_obj_t* value = nullptr;
    };

    struct ChartPanel {
        lv_obj_t* container = nullptr;
        lv_obj_t* metric_dropdown = nullptr;
        std::unique_ptr<ChartView> view;
    };

    void create_header(lv_obj_t* parent);
    void create_cards(lv_obj_t* parent);
    void create_charts(lv_obj_t* parent, const std::vector<Metric>& charts);
    void create_log(lv_obj_t* parent);
    Card create_card(lv_obj_t* parent, const char* title, const char* unit);
    lv_obj_t* create_text_input(lv_obj_t* parent, const char* text, int width, bool numeric);

    void update_param_visibility();
    void refresh_serial_ports();

    static void on_source_changed(lv_event_t* e);
    static void on_connect_clicked(lv_event_t* e);
    static void on_chart_metric_changed(lv_event_t* e);
    static void on_textarea_focus(lv_event_t* e);
    static void on_keyboard_done(lv_event_t* e);

    lv_obj_t* screen_;
    SourceConfig defaults_;
    Handlers handlers_;
    ConnectionState state_ = ConnectionState::Disconnected;

    // Header
    lv_obj_t* source_dropdown_ = nullptr;
    lv_obj_t* serial_params_ = nullptr;
    lv_obj_t* serial_port_dropdown_ = nullptr;
    lv_obj_t* baud_dropdown_ = nullptr;
    lv_obj_t* tcp_params_ = nullptr;
    lv_obj_t* tcp_host_input_ = nullptr;
    lv_obj_t* tcp_port_input_ = nullptr;
    lv_obj_t* connect_btn_ = nullptr;
    lv_obj_t* connect_btn_label_ = nullptr;
    lv_obj_t* status_label_ = nullptr;
    lv_obj_t* phase_label_ = nullptr;

    // Body
    std::array<Card, METRIC_COUNT> metric_cards_;
    Card flight_time_card_;
    std::vector<ChartPanel> charts_;
    lv_obj_t* log_label_ = nullptr;
    lv_obj_t* keyboard_ = nullptr;

    std::vector<std::string> serial_ports_;
};

} // namespace rocketscope::ui
