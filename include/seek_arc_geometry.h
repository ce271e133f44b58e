// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "seek_arc_types.h"

/**
 * @file seek_arc_geometry.h
 * @brief Angle, ellipse and progress-step math for the seek arc
 *
 * Angles are in degrees, clockwise from the 3 o'clock position (screen Y grows down),
 * and relative to start_angle unless stated otherwise. The arc is drawn on the ellipse
 * inscribed in draw_rect; the touch orbit extends touch_radius beyond it on both sides.
 *
 * All operations are pure with respect to the stored geometry.
 */

namespace arcseek {

/**
 * @brief Normalize an angle into [0, 360)
 */
float normalize_angle(float degrees);

class SeekArcGeometry {
  public:
    SeekArcGeometry() = default;

    void set_draw_rect(const RectF& rect, float padding_left, float padding_top) {
        draw_rect_ = rect;
        padding_left_ = padding_left;
        padding_top_ = padding_top;
    }
    void set_start_angle(float degrees) {
        start_angle_ = normalize_angle(degrees);
    }
    void set_sweep_angle(float degrees) {
        sweep_angle_ = normalize_angle(degrees);
    }
    void set_range(int min, int max) {
        min_ = min;
        max_ = max;
    }
    void set_touch_radius(float radius) {
        touch_radius_ = radius;
    }
    void set_touch_inside(bool touch_inside) {
        touch_inside_ = touch_inside;
    }

    [[nodiscard]] const RectF& draw_rect() const {
        return draw_rect_;
    }
    [[nodiscard]] float start_angle() const {
        return start_angle_;
    }
    [[nodiscard]] float sweep_angle() const {
        return sweep_angle_;
    }
    [[nodiscard]] float touch_radius() const {
        return touch_radius_;
    }
    [[nodiscard]] bool touch_inside() const {
        return touch_inside_;
    }

    /**
     * @brief Point on the drawing ellipse at an angle relative to start_angle
     *
     * x = a*cos(t + start) + cx, y = b*sin(t + start) + cy, rounded half-up to pixels.
     */
    Point point_on_ellipse(float angle) const;

    /**
     * @brief Angle of (x, y) around the ellipse center, relative to start_angle
     * @return Angle in [0, 360)
     */
    float angle_of(float x, float y) const;

    /**
     * @brief Ellipse membership relative to the ellipse center: x²/a² + y²/b² <= 1
     */
    static bool inside_ellipse(float x, float y, float a, float b);

    /**
     * @brief True if (x, y) is inside the responsive orbit
     *
     * The outer ellipse spans the padded content box. Unless touch_inside is set, the
     * inner ellipse (outer shrunk by twice the touch radius) is excluded, leaving only
     * the annulus the arc is drawn in.
     */
    bool inside_orbit(float x, float y) const;

    /**
     * @brief True if (x, y) is within touch_radius of a point
     */
    bool near_point(float x, float y, const Point& p) const;

    /**
     * @brief Progress step (0-based, relative to min) nearest to an angle
     *
     * Wraps modulo (steps + 1) so an angle at the very end of a full sweep maps back
     * onto step 0. Returns 0 for a degenerate range or a zero sweep.
     */
    int step_from_angle(float angle) const;

    /**
     * @brief Angle of a progress step (0-based, relative to min)
     */
    float step_angle_from_step(int step) const;

    /**
     * @brief Quantize an angle to the angle of its nearest step
     */
    float step_angle_from_angle(float angle) const;

  private:
    RectF draw_rect_;
    float padding_left_ = 0.0f;
    float padding_top_ = 0.0f;
    float start_angle_ = 0.0f;
    float sweep_angle_ = 0.0f;
    int min_ = 0;
    int max_ = 100;
    float touch_radius_ = 0.0f;
    bool touch_inside_ = true;
};

} // namespace arcseek
