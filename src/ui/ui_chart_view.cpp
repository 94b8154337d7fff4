// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_chart_view.h"

#include <spdlog/spdlog.h>

namespace rocketscope::ui {

namespace {

constexpr uint32_t CHART_BG_COLOR = 0x0A0E27;
constexpr int DASH_LENGTH = 4;

void draw_segment(lv_layer_t* layer, const lv_area_t& origin, const chart::Point& a,
                  const chart::Point& b, const chart::DrawPrimitive& p) {
    lv_draw_line_dsc_t dsc;
    lv_draw_line_dsc_init(&dsc);
    dsc.color = lv_color_hex(p.color);
    dsc.width = p.width;
    dsc.round_start = p.kind == chart::PrimitiveKind::Polyline;
    dsc.round_end = p.kind == chart::PrimitiveKind::Polyline;
    if (p.dashed) {
        dsc.dash_width = DASH_LENGTH;
        dsc.dash_gap = DASH_LENGTH;
    }
    dsc.p1.x = origin.x1 + static_cast<lv_value_precise_t>(a.x);
    dsc.p1.y = origin.y1 + static_cast<lv_value_precise_t>(a.y);
    dsc.p2.x = origin.x1 + static_cast<lv_value_precise_t>(b.x);
    dsc.p2.y = origin.y1 + static_cast<lv_value_precise_t>(b.y);
    lv_draw_line(layer, &dsc);
}

void draw_text(lv_layer_t* layer, const lv_area_t& origin, const chart::DrawPrimitive& p) {
    if (p.points.empty() || p.text.empty()) {
        return;
    }

    lv_draw_label_dsc_t dsc;
    lv_draw_label_dsc_init(&dsc);
    dsc.color = lv_color_hex(p.color);
    dsc.font = LV_FONT_DEFAULT;
    dsc.text = p.text.c_str();

    lv_point_t size;
    lv_text_get_size(&size, dsc.text, dsc.font, 0, 0, LV_COORD_MAX, LV_TEXT_FLAG_NONE);

    // Anchor point: horizontal per anchor, vertically centered
    int32_t x = origin.x1 + static_cast<int32_t>(p.points[0].x);
    int32_t y = origin.y1 + static_cast<int32_t>(p.points[0].y) - size.y / 2;
    switch (p.anchor) {
    case chart::TextAnchor::Start:
        break;
    case chart::TextAnchor::Center:
        x -= size.x / 2;
        break;
    case chart::TextAnchor::End:
        x -= size.x;
        break;
    }

    lv_area_t area = {x, y, x + size.x, y + size.y};
    lv_draw_label(layer, &dsc, &area);
}

} // namespace

ChartView::ChartView(lv_obj_t* parent) {
    obj_ = lv_obj_create(parent);
    lv_obj_remove_flag(obj_, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_set_style_bg_color(obj_, lv_color_hex(CHART_BG_COLOR), 0);
    lv_obj_set_style_bg_opa(obj_, LV_OPA_COVER, 0);
    lv_obj_set_style_border_width(obj_, 0, 0);
    lv_obj_set_style_radius(obj_, 0, 0);
    lv_obj_set_style_pad_all(obj_, 0, 0);

    lv_obj_add_event_cb(obj_, draw_cb, LV_EVENT_DRAW_MAIN, this);
    lv_obj_add_event_cb(obj_, delete_cb, LV_EVENT_DELETE, this);
    lv_obj_add_event_cb(obj_, size_changed_cb, LV_EVENT_SIZE_CHANGED, this);
}

ChartView::~ChartView() {
    if (obj_) {
        lv_obj_remove_event_cb_with_user_data(obj_, draw_cb, this);
        lv_obj_remove_event_cb_with_user_data(obj_, delete_cb, this);
        lv_obj_remove_event_cb_with_user_data(obj_, size_changed_cb, this);
    }
}

void ChartView::set_primitives(std::vector<chart::DrawPrimitive> primitives) {
    primitives_ = std::move(primitives);
    if (obj_) {
        lv_obj_invalidate(obj_);
    }
}

std::pair<int, int> ChartView::viewport() const {
    if (!obj_) {
        return {0, 0};
    }
    return {static_cast<int>(lv_obj_get_content_width(obj_)),
            static_cast<int>(lv_obj_get_content_height(obj_))};
}

void ChartView::size_changed_cb(lv_event_t* e) {
    auto* self = static_cast<ChartView*>(lv_event_get_user_data(e));
    if (self && self->on_resize_) {
        self->on_resize_();
    }
}

void ChartView::draw_cb(lv_event_t* e) {
    auto* self = static_cast<ChartView*>(lv_event_get_user_data(e));
    lv_layer_t* layer = lv_event_get_layer(e);
    if (self && layer) {
        self->draw(layer);
    }
}

void ChartView::delete_cb(lv_event_t* e) {
    auto* self = static_cast<ChartView*>(lv_event_get_user_data(e));
    if (self) {
        self->obj_ = nullptr;
    }
}

void ChartView::draw(lv_layer_t* layer) {
    lv_area_t origin;
    lv_obj_get_content_coords(obj_, &origin);

    for (const auto& p : primitives_) {
        switch (p.kind) {
        case chart::PrimitiveKind::Line:
        case chart::PrimitiveKind::Polyline:
            for (size_t i = 1; i < p.points.size(); ++i) {
                draw_segment(layer, origin, p.points[i - 1], p.points[i], p);
            }
            break;
        case chart::PrimitiveKind::Text:
            draw_text(layer, origin, p);
            break;
        }
    }
}

} // namespace rocketscope::ui
