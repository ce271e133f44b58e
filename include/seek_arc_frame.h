// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "seek_arc_types.h"

/**
 * @file seek_arc_frame.h
 * @brief Immutable render description of one seek arc frame
 *
 * SeekArc::draw() computes a SeekArcFrame from its current state and hands it to an
 * ArcRenderer. Renderers never reach back into the widget, so the same frame can be
 * drawn by LVGL, recorded by a test, or dumped for debugging.
 */

namespace arcseek {

/// Default thumb fill (light grey orb)
constexpr Argb DEFAULT_THUMB_COLOR = 0xFFECECEC;

struct SeekArcFrame {
    /// Integer pixel bounds, x2/y2 exclusive
    struct Area {
        int32_t x1 = 0;
        int32_t y1 = 0;
        int32_t x2 = 0;
        int32_t y2 = 0;
    };

    /// Arc segment on the drawing ellipse, angles in absolute degrees clockwise from 3 o'clock
    struct Arc {
        float start_angle = 0.0f;
        float sweep_angle = 0.0f;
        Argb color = 0;
    };

    struct Thumb {
        bool visible = true;
        Point center;
        float radius = 0.0f;
        Area bounds;
        Argb color = DEFAULT_THUMB_COLOR;
    };

    RectF draw_rect;
    float stroke_width = 0.0f;
    Arc sweep;
    Arc progress;
    Thumb thumb;
    bool enabled = true;
    bool pressed = false;
    bool animating = false;

    /// Nothing to draw until the widget has been laid out with a usable size
    [[nodiscard]] bool is_empty() const {
        return draw_rect.is_empty();
    }

    /// True when draw_rect is (within a pixel) a square, so the arc is a circle
    [[nodiscard]] bool is_circular() const {
        float diff = draw_rect.width() - draw_rect.height();
        return diff < 1.0f && diff > -1.0f;
    }
};

/**
 * @brief Backend that paints a SeekArcFrame
 */
class ArcRenderer {
  public:
    virtual ~ArcRenderer() = default;

    virtual void render(const SeekArcFrame& frame) = 0;
};

} // namespace arcseek
