// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_renderer.h"

#include <lvgl.h>

#include <functional>
#include <utility>
#include <vector>

namespace rocketscope::ui {

/**
 * @brief LVGL object that paints a chart::DrawPrimitive list
 *
 * Primitive coordinates are relative to the object's content area. The list is
 * replaced wholesale by set_primitives(), which invalidates the object; drawing
 * happens in the next LVGL refresh (LV_EVENT_DRAW_MAIN).
 *
 * The LVGL object is a child of parent and is deleted with it; the ChartView
 * must outlive it or be destroyed first (the destructor detaches the callback).
 */
class ChartView {
  public:
    explicit ChartView(lv_obj_t* parent);
    ~ChartView();

    ChartView(const ChartView&) = delete;
    ChartView& operator=(const ChartView&) = delete;

    lv_obj_t* obj() const {
        return obj_;
    }

    void set_primitives(std::vector<chart::DrawPrimitive> primitives);

    /// Drawable content size {width, height}
    std::pair<int, int> viewport() const;

    /// Called after LVGL resizes the object; primitives must be re-rendered
    void set_resize_handler(std::function<void()> handler) {
        on_resize_ = std::move(handler);
    }

  private:
    static void draw_cb(lv_event_t* e);
    static void delete_cb(lv_event_t* e);
    static void size_changed_cb(lv_event_t* e);

    void draw(lv_layer_t* layer);

    lv_obj_t* obj_ = nullptr;
    std::vector<chart::DrawPrimitive> primitives_;
    std::function<void()> on_resize_;
};

} // namespace rocketscope::ui
