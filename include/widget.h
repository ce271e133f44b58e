// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "seek_arc_frame.h"
#include "seek_arc_types.h"

#include <nlohmann/json.hpp>

/**
 * @file widget.h
 * @brief Capability interface for toolkit-independent widgets
 *
 * A Widget owns its state and geometry but no toolkit object. The host (the LVGL
 * binding in ui_seek_arc.cpp, or a test) pushes layout, input and redraw ticks into it:
 *
 *   host                       widget
 *   ----                       ------
 *   size request     ------>   measure()
 *   size / padding   ------>   layout()
 *   pointer events   ------>   handle_input()   (true = gesture consumed)
 *   draw callback    ------>   draw(renderer)   (true = schedule another frame)
 *   teardown         <------   save_state()
 *   recreate         ------>   restore_state()
 */

namespace arcseek {

class Widget {
  public:
    virtual ~Widget() = default;

    /**
     * @brief Resolve the widget size against parent constraints
     */
    [[nodiscard]] virtual Size measure(const MeasureSpec& width, const MeasureSpec& height) const = 0;

    /**
     * @brief Apply the final size and content padding
     */
    virtual void layout(const Size& size, const Padding& padding) = 0;

    /**
     * @brief Advance animation state and paint one frame
     * @return true if another frame is needed
     */
    virtual bool draw(ArcRenderer& renderer) = 0;

    /**
     * @brief Process a pointer event in widget-local coordinates
     * @return true if the event belongs to an accepted gesture
     */
    virtual bool handle_input(const InputEvent& event) = 0;

    /**
     * @brief Serializable instance state
     */
    [[nodiscard]] virtual nlohmann::json save_state() const = 0;

    /**
     * @brief Restore instance state produced by save_state()
     * @return false (state untouched) if the JSON is not a valid state object
     */
    virtual bool restore_state(const nlohmann::json& state) = 0;
};

} // namespace arcseek
