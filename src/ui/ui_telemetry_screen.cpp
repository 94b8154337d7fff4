// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_telemetry_screen.h"

#include "serial_source.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

namespace rocketscope::ui {

namespace {

constexpr uint32_t COLOR_BACKGROUND = 0x0A0E27;
constexpr uint32_t COLOR_PANEL = 0x1A1F3A;
constexpr uint32_t COLOR_ACCENT = 0x00FF88;
constexpr uint32_t COLOR_TEXT = 0xFFFFFF;
constexpr uint32_t COLOR_MUTED = 0x888888;
constexpr uint32_t COLOR_UNIT = 0x666666;
constexpr uint32_t COLOR_PHASE = 0xFFAA00;
constexpr uint32_t COLOR_CONNECTED = 0x00FF00;
constexpr uint32_t COLOR_DISCONNECTED = 0xFF4444;
constexpr uint32_t COLOR_CONNECTING = 0xFFAA00;
constexpr uint32_t COLOR_BTN_CONNECT = 0x00AA44;
constexpr uint32_t COLOR_BTN_DISCONNECT = 0xAA0000;

constexpr int CARD_COLUMN_WIDTH = 300;
constexpr int GAP = 8;

/// Dropdown index order matches SourceType
constexpr const char* SOURCE_OPTIONS = "Simulator\nSerial Port\nTCP Socket";

constexpr const char* METRIC_OPTIONS = "altitude\nvelocity\nacceleration\ntemperature\npressure";

void style_panel(lv_obj_t* obj) {
    lv_obj_set_style_bg_color(obj, lv_color_hex(COLOR_PANEL), 0);
    lv_obj_set_style_bg_opa(obj, LV_OPA_COVER, 0);
    lv_obj_set_style_border_width(obj, 1, 0);
    lv_obj_set_style_border_color(obj, lv_color_hex(0x2A3050), 0);
    lv_obj_set_style_radius(obj, 4, 0);
    lv_obj_set_style_pad_all(obj, GAP, 0);
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
}

lv_obj_t* create_row(lv_obj_t* parent) {
    lv_obj_t* row = lv_obj_create(parent);
    lv_obj_remove_style_all(row);
    lv_obj_set_size(row, LV_SIZE_CONTENT, LV_SIZE_CONTENT);
    lv_obj_set_flex_flow(row, LV_FLEX_FLOW_ROW);
    lv_obj_set_flex_align(row, LV_FLEX_ALIGN_START, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER);
    lv_obj_set_style_pad_column(row, GAP, 0);
    return row;
}

lv_obj_t* create_label(lv_obj_t* parent, const char* text, uint32_t color) {
    lv_obj_t* label = lv_label_create(parent);
    lv_label_set_text(label, text);
    lv_obj_set_style_text_color(label, lv_color_hex(color), 0);
    return label;
}

std::string join_options(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += '\n';
        }
        out += item;
    }
    return out;
}

} // namespace

TelemetryScreen::TelemetryScreen(lv_obj_t* screen, const SourceConfig& initial,
                                 const std::vector<Metric>& charts)
    : screen_(screen), defaults_(initial) {
    lv_obj_set_style_bg_color(screen_, lv_color_hex(COLOR_BACKGROUND), 0);
    lv_obj_set_style_bg_opa(screen_, LV_OPA_COVER, 0);
    lv_obj_set_flex_flow(screen_, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_style_pad_all(screen_, GAP / 2, 0);
    lv_obj_set_style_pad_row(screen_, GAP / 2, 0);
    lv_obj_remove_flag(screen_, LV_OBJ_FLAG_SCROLLABLE);

    create_header(screen_);

    lv_obj_t* body = lv_obj_create(screen_);
    lv_obj_remove_style_all(body);
    lv_obj_set_width(body, LV_PCT(100));
    lv_obj_set_flex_grow(body, 1);
    lv_obj_set_flex_flow(body, LV_FLEX_FLOW_ROW);
    lv_obj_set_style_pad_column(body, GAP, 0);

    create_cards(body);
    create_charts(body, charts);
    create_log(screen_);

    keyboard_ = lv_keyboard_create(screen_);
    lv_obj_add_flag(keyboard_, LV_OBJ_FLAG_HIDDEN | LV_OBJ_FLAG_FLOATING);
    lv_obj_align(keyboard_, LV_ALIGN_BOTTOM_MID, 0, 0);
    lv_obj_add_event_cb(keyboard_, on_keyboard_done, LV_EVENT_READY, this);
    lv_obj_add_event_cb(keyboard_, on_keyboard_done, LV_EVENT_CANCEL, this);

    lv_dropdown_set_selected(source_dropdown_, static_cast<uint32_t>(initial.type));
    update_param_visibility();
    set_connection_state(ConnectionState::Disconnected);

    spdlog::debug("[TelemetryScreen] Created with {} chart(s)", charts_.size());
}

TelemetryScreen::~TelemetryScreen() {
    // Widgets are owned by the LVGL screen; only the custom draw objects need detaching
    charts_.clear();
}

// ============================================================================
// Construction
// ============================================================================

void TelemetryScreen::create_header(lv_obj_t* parent) {
    lv_obj_t* header = lv_obj_create(parent);
    style_panel(header);
    lv_obj_set_size(header, LV_PCT(100), LV_SIZE_CONTENT);
    lv_obj_set_flex_flow(header, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_style_pad_row(header, GAP, 0);

    lv_obj_t* controls = create_row(header);

    lv_obj_t* title = create_label(controls, "ROCKET TELEMETRY", COLOR_ACCENT);
    lv_obj_set_style_pad_right(title, 2 * GAP, 0);

    create_label(controls, "Source:", COLOR_TEXT);
    source_dropdown_ = lv_dropdown_create(controls);
    lv_dropdown_set_options(source_dropdown_, SOURCE_OPTIONS);
    lv_obj_set_width(source_dropdown_, 160);
    lv_obj_add_event_cb(source_dropdown_, on_source_changed, LV_EVENT_VALUE_CHANGED, this);

    // Serial parameters
    serial_params_ = create_row(controls);
    create_label(serial_params_, "Port:", COLOR_TEXT);
    serial_port_dropdown_ = lv_dropdown_create(serial_params_);
    lv_obj_set_width(serial_port_dropdown_, 200);
    refresh_serial_ports();
    create_label(serial_params_, "Baud:", COLOR_TEXT);
    baud_dropdown_ = lv_dropdown_create(serial_params_);
    lv_obj_set_width(baud_dropdown_, 110);
    std::string bauds;
    uint32_t baud_index = 0;
    for (size_t i = 0; i < SUPPORTED_BAUD_RATES.size(); ++i) {
        if (!bauds.empty()) {
            bauds += '\n';
        }
        bauds += std::to_string(SUPPORTED_BAUD_RATES[i]);
        if (SUPPORTED_BAUD_RATES[i] == defaults_.serial.baud) {
            baud_index = static_cast<uint32_t>(i);
        }
    }
    lv_dropdown_set_options(baud_dropdown_, bauds.c_str());
    lv_dropdown_set_selected(baud_dropdown_, baud_index);

    // TCP parameters
    tcp_params_ = create_row(controls);
    create_label(tcp_params_, "Host:", COLOR_TEXT);
    tcp_host_input_ = create_text_input(tcp_params_, defaults_.tcp.host.c_str(), 170, false);
    create_label(tcp_params_, "Port:", COLOR_TEXT);
    tcp_port_input_ =
        create_text_input(tcp_params_, std::to_string(defaults_.tcp.port).c_str(), 80, true);

    connect_btn_ = lv_button_create(controls);
    lv_obj_set_width(connect_btn_, 130);
    connect_btn_label_ = lv_label_create(connect_btn_);
    lv_obj_center(connect_btn_label_);
    lv_obj_add_event_cb(connect_btn_, on_connect_clicked, LV_EVENT_CLICKED, this);

    lv_obj_t* status_row = create_row(header);
    lv_obj_set_style_pad_column(status_row, 6 * GAP, 0);
    status_label_ = create_label(status_row, "", COLOR_DISCONNECTED);
    phase_label_ = create_label(status_row, "Phase: --", COLOR_PHASE);
}

TelemetryScreen::Card TelemetryScreen::create_card(lv_obj_t* parent, const char* title,
                                                   const char* unit) {
    Card card;
    card.container = lv_obj_create(parent);
    style_panel(card.container);
    lv_obj_set_width(card.container, LV_PCT(100));
    lv_obj_set_flex_grow(card.container, 1);
    lv_obj_set_flex_flow(card.container, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_flex_align(card.container, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER,
                          LV_FLEX_ALIGN_CENTER);
    lv_obj_set_style_pad_row(card.container, 2, 0);

    create_label(card.container, title, COLOR_MUTED);
    card.value = create_label(card.container, "--", COLOR_ACCENT);
#if LV_FONT_MONTSERRAT_28
    lv_obj_set_style_text_font(card.value, &lv_font_montserrat_28, 0);
#endif
    create_label(card.container, unit, COLOR_UNIT);
    return card;
}

void TelemetryScreen::create_cards(lv_obj_t* parent) {
    lv_obj_t* column = lv_obj_create(parent);
    lv_obj_remove_style_all(column);
    lv_obj_set_size(column, CARD_COLUMN_WIDTH, LV_PCT(100));
    lv_obj_set_flex_flow(column, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_style_pad_row(column, GAP / 2, 0);

    for (Metric m : ALL_METRICS) {
        metric_cards_[static_cast<size_t>(m)] =
            create_card(column, metric_display_name(m), metric_unit(m));
    }
    flight_time_card_ = create_card(column, "Flight Time", "s");
}

void TelemetryScreen::create_charts(lv_obj_t* parent, const std::vector<Metric>& charts) {
    lv_obj_t* column = lv_obj_create(parent);
    lv_obj_remove_style_all(column);
    lv_obj_set_height(column, LV_PCT(100));
    lv_obj_set_flex_grow(column, 1);
    lv_obj_set_flex_flow(column, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_style_pad_row(column, GAP, 0);

    charts_.reserve(charts.size());
    for (Metric metric : charts) {
        ChartPanel panel;
        panel.container = lv_obj_create(column);
        style_panel(panel.container);
        lv_obj_set_width(panel.container, LV_PCT(100));
        lv_obj_set_flex_grow(panel.container, 1);
        lv_obj_set_flex_flow(panel.container, LV_FLEX_FLOW_COLUMN);
        lv_obj_set_style_pad_row(panel.container, GAP / 2, 0);

        lv_obj_t* controls = create_row(panel.container);
        create_label(controls, "Y-Axis:", COLOR_TEXT);
        panel.metric_dropdown = lv_dropdown_create(controls);
        lv_dropdown_set_options(panel.metric_dropdown, METRIC_OPTIONS);
        lv_dropdown_set_selected(panel.metric_dropdown, static_cast<uint32_t>(metric));
        lv_obj_set_width(panel.metric_dropdown, 160);
        lv_obj_add_event_cb(panel.metric_dropdown, on_chart_metric_changed,
                            LV_EVENT_VALUE_CHANGED, this);

        panel.view = std::make_unique<ChartView>(panel.container);
        lv_obj_set_width(panel.view->obj(), LV_PCT(100));
        lv_obj_set_flex_grow(panel.view->obj(), 1);
        size_t index = charts_.size();
        panel.view->set_resize_handler([this, index]() {
            if (handlers_.on_chart_resized) {
                handlers_.on_chart_resized(index);
            }
        });

        charts_.push_back(std::move(panel));
    }
}

void TelemetryScreen::create_log(lv_obj_t* parent) {
    lv_obj_t* panel = lv_obj_create(parent);
    style_panel(panel);
    lv_obj_set_size(panel, LV_PCT(100), LV_SIZE_CONTENT);
    lv_obj_set_flex_flow(panel, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_style_pad_row(panel, 2, 0);

    create_label(panel, "TELEMETRY LOG", COLOR_ACCENT);
    log_label_ = create_label(panel, "", COLOR_ACCENT);
    lv_obj_set_width(log_label_, LV_PCT(100));
    lv_label_set_long_mode(log_label_, LV_LABEL_LONG_CLIP);
}

lv_obj_t* TelemetryScreen::create_text_input(lv_obj_t* parent, const char* text, int width,
                                             bool numeric) {
    lv_obj_t* ta = lv_textarea_create(parent);
    lv_textarea_set_one_line(ta, true);
    lv_textarea_set_text(ta, text);
    lv_obj_set_width(ta, width);
    if (numeric) {
        lv_textarea_set_accepted_chars(ta, "0123456789");
        lv_textarea_set_max_length(ta, 5);
    }
    lv_obj_add_event_cb(ta, on_textarea_focus, LV_EVENT_FOCUSED, this);
    lv_obj_add_event_cb(ta, on_textarea_focus, LV_EVENT_DEFOCUSED, this);
    return ta;
}

void TelemetryScreen::refresh_serial_ports() {
    serial_ports_ = list_serial_ports();
    if (std::find(serial_ports_.begin(), serial_ports_.end(), defaults_.serial.port) ==
        serial_ports_.end()) {
        serial_ports_.insert(serial_ports_.begin(), defaults_.serial.port);
    }

    lv_dropdown_set_options(serial_port_dropdown_, join_options(serial_ports_).c_str());
    auto it = std::find(serial_ports_.begin(), serial_ports_.end(), defaults_.serial.port);
    lv_dropdown_set_selected(serial_port_dropdown_,
                             static_cast<uint32_t>(it - serial_ports_.begin()));
    spdlog::debug("[TelemetryScreen] {} serial port(s) listed", serial_ports_.size());
}

// ============================================================================
// State
// ============================================================================

SourceConfig TelemetryScreen::source_config() const {
    SourceConfig config = defaults_;

    uint32_t type_index = lv_dropdown_get_selected(source_dropdown_);
    config.type = static_cast<SourceType>(std::min<uint32_t>(type_index, 2));

    uint32_t port_index = lv_dropdown_get_selected(serial_port_dropdown_);
    if (port_index < serial_ports_.size()) {
        config.serial.port = serial_ports_[port_index];
    }
    uint32_t baud_index = lv_dropdown_get_selected(baud_dropdown_);
    if (baud_index < SUPPORTED_BAUD_RATES.size()) {
        config.serial.baud = SUPPORTED_BAUD_RATES[baud_index];
    }

    config.tcp.host = lv_textarea_get_text(tcp_host_input_);
    // Out-of-range or empty ports are rejected by TcpSource::connect()
    config.tcp.port = std::atoi(lv_textarea_get_text(tcp_port_input_));

    return config;
}

void TelemetryScreen::update_param_visibility() {
    auto type = static_cast<SourceType>(lv_dropdown_get_selected(source_dropdown_));

    if (type == SourceType::Serial) {
        lv_obj_remove_flag(serial_params_, LV_OBJ_FLAG_HIDDEN);
    } else {
        lv_obj_add_flag(serial_params_, LV_OBJ_FLAG_HIDDEN);
    }
    if (type == SourceType::Tcp) {
        lv_obj_remove_flag(tcp_params_, LV_OBJ_FLAG_HIDDEN);
    } else {
        lv_obj_add_flag(tcp_params_, LV_OBJ_FLAG_HIDDEN);
    }
}

void TelemetryScreen::set_connection_state(ConnectionState state) {
    state_ = state;

    const bool busy = state == ConnectionState::Connecting || state == ConnectionState::Connected;
    uint32_t status_color = COLOR_DISCONNECTED;
    const char* status_text = "● DISCONNECTED";
    switch (state) {
    case ConnectionState::Connecting:
        status_color = COLOR_CONNECTING;
        status_text = "● CONNECTING...";
        break;
    case ConnectionState::Connected:
        status_color = COLOR_CONNECTED;
        status_text = "● CONNECTED";
        break;
    case ConnectionState::Failed:
        status_text = "● CONNECTION FAILED";
        break;
    case ConnectionState::Disconnected:
        break;
    }

    lv_label_set_text(status_label_, status_text);
    lv_obj_set_style_text_color(status_label_, lv_color_hex(status_color), 0);

    lv_label_set_text(connect_btn_label_, busy ? "Disconnect" : "Connect");
    lv_obj_set_style_bg_color(connect_btn_,
                              lv_color_hex(busy ? COLOR_BTN_DISCONNECT : COLOR_BTN_CONNECT), 0);

    // Parameters are locked while a source is live
    for (lv_obj_t* obj : {source_dropdown_, serial_port_dropdown_, baud_dropdown_,
                          tcp_host_input_, tcp_port_input_}) {
        if (busy) {
            lv_obj_add_state(obj, LV_STATE_DISABLED);
        } else {
            lv_obj_remove_state(obj, LV_STATE_DISABLED);
        }
    }
}

void TelemetryScreen::show_error(const std::string& title, const std::string& message) {
    lv_obj_t* mbox = lv_msgbox_create(nullptr);
    lv_msgbox_add_title(mbox, title.c_str());
    lv_msgbox_add_text(mbox, message.c_str());
    lv_msgbox_add_close_button(mbox);
}

// ============================================================================
// TelemetryView
// ============================================================================

void TelemetryScreen::show_metric(Metric metric, const std::string& text) {
    lv_label_set_text(metric_cards_[static_cast<size_t>(metric)].value, text.c_str());
}

void TelemetryScreen::show_flight_time(const std::string& text) {
    lv_label_set_text(flight_time_card_.value, text.c_str());
}

void TelemetryScreen::show_phase(const std::string& text) {
    lv_label_set_text(phase_label_, text.c_str());
}

void TelemetryScreen::show_log(const std::string& text) {
    lv_label_set_text(log_label_, text.c_str());
}

std::pair<int, int> TelemetryScreen::chart_viewport(size_t chart) {
    if (chart >= charts_.size()) {
        return {0, 0};
    }
    return charts_[chart].view->viewport();
}

void TelemetryScreen::show_chart(size_t chart, std::vector<chart::DrawPrimitive> primitives) {
    if (chart < charts_.size()) {
        charts_[chart].view->set_primitives(std::move(primitives));
    }
}

// ============================================================================
// Event callbacks
// ============================================================================

void TelemetryScreen::on_source_changed(lv_event_t* e) {
    auto* self = static_cast<TelemetryScreen*>(lv_event_get_user_data(e));
    self->update_param_visibility();
    if (self->source_config().type == SourceType::Serial) {
        self->refresh_serial_ports();
    }
}

void TelemetryScreen::on_connect_clicked(lv_event_t* e) {
    auto* self = static_cast<TelemetryScreen*>(lv_event_get_user_data(e));
    const bool busy = self->state_ == ConnectionState::Connecting ||
                      self->state_ == ConnectionState::Connected;

    if (busy) {
        if (self->handlers_.on_disconnect) {
            self->handlers_.on_disconnect();
        }
    } else if (self->handlers_.on_connect) {
        self->handlers_.on_connect(self->source_config());
    }
}

void TelemetryScreen::on_chart_metric_changed(lv_event_t* e) {
    auto* self = static_cast<TelemetryScreen*>(lv_event_get_user_data(e));
    auto* dropdown = static_cast<lv_obj_t*>(lv_event_get_target(e));

    for (size_t i = 0; i < self->charts_.size(); ++i) {
        if (self->charts_[i].metric_dropdown == dropdown) {
            uint32_t index = lv_dropdown_get_selected(dropdown);
            if (index < METRIC_COUNT && self->handlers_.on_chart_metric) {
                self->handlers_.on_chart_metric(i, ALL_METRICS[index]);
            }
            return;
        }
    }
}

void TelemetryScreen::on_textarea_focus(lv_event_t* e) {
    auto* self = static_cast<TelemetryScreen*>(lv_event_get_user_data(e));
    auto* ta = static_cast<lv_obj_t*>(lv_event_get_target(e));

    if (lv_event_get_code(e) == LV_EVENT_FOCUSED) {
        lv_keyboard_set_mode(self->keyboard_, ta == self->tcp_port_input_
                                                  ? LV_KEYBOARD_MODE_NUMBER
                                                  : LV_KEYBOARD_MODE_TEXT_LOWER);
        lv_keyboard_set_textarea(self->keyboard_, ta);
        lv_obj_remove_flag(self->keyboard_, LV_OBJ_FLAG_HIDDEN);
    } else {
        lv_keyboard_set_textarea(self->keyboard_, nullptr);
        lv_obj_add_flag(self->keyboard_, LV_OBJ_FLAG_HIDDEN);
    }
}

void TelemetryScreen::on_keyboard_done(lv_event_t* e) {
    auto* self = static_cast<TelemetryScreen*>(lv_event_get_user_data(e));
    lv_keyboard_set_textarea(self->keyboard_, nullptr);
    lv_obj_add_flag(self->keyboard_, LV_OBJ_FLAG_HIDDEN);
}

} // namespace rocketscope::ui
