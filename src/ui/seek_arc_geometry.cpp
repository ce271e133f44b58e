// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seek_arc_geometry.h"

#include <cmath>

namespace arcseek {

namespace {

constexpr double DEG_TO_RAD = M_PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / M_PI;

} // namespace

float normalize_angle(float degrees) {
    return std::fmod(360.0f + std::fmod(degrees, 360.0f), 360.0f);
}

Point SeekArcGeometry::point_on_ellipse(float angle) const {
    // x = a cos(t), y = b sin(t)
    double t = (static_cast<double>(angle) + start_angle_) * DEG_TO_RAD;
    double x = draw_rect_.width() / 2.0 * std::cos(t) + draw_rect_.center_x();
    double y = draw_rect_.height() / 2.0 * std::sin(t) + draw_rect_.center_y();

    return {static_cast<int32_t>(std::floor(x + 0.5)), static_cast<int32_t>(std::floor(y + 0.5))};
}

float SeekArcGeometry::angle_of(float x, float y) const {
    double axis_x = x - draw_rect_.center_x();
    double axis_y = y - draw_rect_.center_y();

    double angle = std::atan2(axis_y, axis_x) * RAD_TO_DEG - start_angle_;
    return normalize_angle(static_cast<float>(angle));
}

bool SeekArcGeometry::inside_ellipse(float x, float y, float a, float b) {
    // 1 >= x²/a² + y²/b²
    return 1.0f >= (x * x) / (a * a) + (y * y) / (b * b);
}

bool SeekArcGeometry::inside_orbit(float x, float y) const {
    float axis_x = x - draw_rect_.center_x();
    float axis_y = y - draw_rect_.center_y();
    float a = draw_rect_.center_x() - padding_left_;
    float b = draw_rect_.center_y() - padding_top_;

    bool outer = inside_ellipse(axis_x, axis_y, a, b);
    bool inner = inside_ellipse(axis_x, axis_y, a - touch_radius_ * 2, b - touch_radius_ * 2);

    return outer && !(inner && !touch_inside_);
}

bool SeekArcGeometry::near_point(float x, float y, const Point& p) const {
    return inside_ellipse(x - static_cast<float>(p.x), y - static_cast<float>(p.y), touch_radius_,
                          touch_radius_);
}

int SeekArcGeometry::step_from_angle(float angle) const {
    int steps = max_ - min_;
    if (steps <= 0 || sweep_angle_ <= 0.0f)
        return 0;

    float rise = sweep_angle_ / static_cast<float>(steps);
    float step = std::fmod((angle + rise / 2) / rise, static_cast<float>(steps + 1));

    return step < 0.0f ? 0 : static_cast<int>(step);
}

float SeekArcGeometry::step_angle_from_step(int step) const {
    int steps = max_ - min_;
    if (steps <= 0)
        return 0.0f;

    return sweep_angle_ / static_cast<float>(steps) * static_cast<float>(step);
}

float SeekArcGeometry::step_angle_from_angle(float angle) const {
    return step_angle_from_step(step_from_angle(angle));
}

} // namespace arcseek
