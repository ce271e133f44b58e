// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seek_arc.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace arcseek {

SeekArc::SeekArc(SeekArcScroller::Clock clock) : scroller_(std::move(clock)) {
    geometry_.set_start_angle(DEFAULT_START_ANGLE);
    geometry_.set_sweep_angle(DEFAULT_SWEEP_ANGLE);
    geometry_.set_range(min_, max_);
    geometry_.set_touch_inside(DEFAULT_TOUCH_INSIDE);

    // Start at rest on the initial progress
    scroller_.set_final(angle_to_fixed(geometry_.step_angle_from_step(progress_ - min_)));
    scroller_.abort_animation();

    update_drawable_state();
}

// ============================================================================
// Widget
// ============================================================================

Size SeekArc::measure(const MeasureSpec& width, const MeasureSpec& height) const {
    return {resolve_measure(width, default_size_.width),
            resolve_measure(height, default_size_.height)};
}

void SeekArc::layout(const Size& size, const Padding& padding) {
    size_ = size;
    padding_ = padding;
    update_drawable_state();
}

bool SeekArc::draw(ArcRenderer& renderer) {
    bool scrolling = scroller_.compute_offset();
    float angle = progress_angle();

    if (scrolling) {
        progress_ = geometry_.step_from_angle(angle) + min_;
        notify_progress_changed();
    }

    // Listener may have changed state; re-read the angle it left behind
    renderer.render(build_frame(progress_angle(), scrolling));
    return scrolling;
}

bool SeekArc::handle_input(const InputEvent& event) {
    switch (event.action) {
    case InputAction::Press:
        if (!enabled_)
            return false;
        return start_scroll(event.x, event.y);

    case InputAction::Move:
        if (!scrolling_)
            return false;
        return update_scroll(event.x, event.y);

    case InputAction::Release:
    case InputAction::Cancel:
        if (!scrolling_)
            return false;
        finish_scroll();
        return true;
    }
    return false;
}

nlohmann::json SeekArc::save_state() const {
    return snapshot().to_json();
}

bool SeekArc::restore_state(const nlohmann::json& state) {
    auto snap = SeekArcSnapshot::from_json(state);
    if (!snap)
        return false;

    restore(*snap);
    return true;
}

// ============================================================================
// Instance state
// ============================================================================

SeekArcSnapshot SeekArc::snapshot() const {
    return SeekArcSnapshot{scroller_.final_value()};
}

void SeekArc::restore(const SeekArcSnapshot& snapshot) {
    // The sweep may have changed since the snapshot was taken. Inside the sweep the raw
    // angle is kept so a Drift position survives exactly.
    const auto sweep_fp = static_cast<int32_t>(
        std::lround(geometry_.sweep_angle() * SeekArcSnapshot::ANGLE_MULTIPLIER));
    int32_t angle_fp = std::clamp(snapshot.progress_angle_fp, int32_t{0}, sweep_fp);
    if (angle_fp != snapshot.progress_angle_fp) {
        spdlog::debug("[SeekArc] Snapshot angle {:.2f} outside sweep {:.2f}, clamped",
                      snapshot.progress_angle(), geometry_.sweep_angle());
    }

    float angle = static_cast<float>(angle_fp) / SeekArcSnapshot::ANGLE_MULTIPLIER;
    int step = geometry_.step_from_angle(angle);
    progress_ = std::clamp(step + min_, min_, max_);
    last_update_ = progress_;

    scroller_.set_final(angle_fp);
    scroller_.abort_animation();

    spdlog::debug("[SeekArc] Restored angle {:.2f} -> progress {}", angle, progress_);

    request_invalidate();
    notify_progress_changed();
}

// ============================================================================
// Range
// ============================================================================

void SeekArc::set_min(int min) {
    min_ = min < 0 ? 0 : std::min(min, max_);
    geometry_.set_range(min_, max_);
    set_progress(progress_);
}

void SeekArc::set_max(int max) {
    max_ = std::max(max, min_);
    geometry_.set_range(min_, max_);
    set_progress(progress_);
}

void SeekArc::set_progress(int progress, bool animate) {
    progress_ = std::clamp(progress, min_, max_);
    int32_t target = angle_to_fixed(geometry_.step_angle_from_step(progress_ - min_));

    if (animate) {
        scroller_.compute_offset();
        scroller_.start_scroll(scroller_.current(), target - scroller_.current());
    } else {
        scroller_.set_final(target);
    }

    update_drawable_state();
}

// ============================================================================
// Geometry
// ============================================================================

void SeekArc::set_start_angle(float degrees) {
    geometry_.set_start_angle(degrees);
    update_drawable_state();
}

void SeekArc::set_sweep_angle(float degrees) {
    geometry_.set_sweep_angle(degrees);
    set_progress(progress_);
}

void SeekArc::set_stroke_width(float px) {
    stroke_width_ = std::max(px, 0.0f);
    update_drawable_state();
}

void SeekArc::set_thumb_radius(float px) {
    thumb_radius_ = std::max(px, 0.0f);
    update_drawable_state();
}

void SeekArc::set_touch_inside(bool touch_inside) {
    geometry_.set_touch_inside(touch_inside);
}

// ============================================================================
// Appearance
// ============================================================================

void SeekArc::set_sweep_color(Argb color) {
    sweep_color_ = color;
    update_drawable_state();
}

void SeekArc::set_progress_color(Argb color) {
    set_progress_color(ColorStateList::value_of(color));
}

void SeekArc::set_progress_color(const ColorStateList& colors) {
    progress_color_ = colors;
    update_drawable_state();
}

void SeekArc::set_thumb_visible(bool visible) {
    thumb_visible_ = visible;
    update_drawable_state();
}

void SeekArc::set_default_size(Size size) {
    default_size_ = size;
}

// ============================================================================
// Behavior
// ============================================================================

void SeekArc::set_scroll_mode(ScrollMode mode) {
    scroll_mode_ = mode;

    // Home the angle onto a step
    if (scroll_mode_ == ScrollMode::Gravity) {
        set_progress(progress_, true);
    } else if (scroll_mode_ == ScrollMode::Snap) {
        set_progress(progress_);
    }
}

void SeekArc::set_enabled(bool enabled) {
    if (enabled_ == enabled)
        return;

    enabled_ = enabled;
    spdlog::trace("[SeekArc] {}", enabled ? "enabled" : "disabled");
    update_drawable_state();
}

// ============================================================================
// Gesture
// ============================================================================

bool SeekArc::start_scroll(float x, float y) {
    last_update_ = -1;

    bool start = geometry_.near_point(x, y, start_orb_);
    bool end = geometry_.near_point(x, y, end_orb_);
    bool orbit = geometry_.inside_orbit(x, y) &&
                 (geometry_.touch_inside() || angle_of(x, y) < geometry_.sweep_angle() + 1);

    // Endpoints stay grabbable even when they poke out of the orbit
    if (!orbit && !start && !end) {
        spdlog::trace("[SeekArc] Press at ({:.0f}, {:.0f}) outside orbit", x, y);
        return false;
    }

    scrolling_ = true;
    pressed_ = true;

    if (!update_scroll(x, y)) {
        scrolling_ = false;
        pressed_ = false;
        return false;
    }

    spdlog::debug("[SeekArc] Gesture started at ({:.0f}, {:.0f})", x, y);
    return true;
}

bool SeekArc::update_scroll(float x, float y) {
    float sweep = geometry_.sweep_angle();
    float angle = angle_of(x, y);
    bool thumb = geometry_.near_point(x, y, point_at(progress_angle()));

    // Divide the gap after the sweep between its two ends
    if (angle > sweep && !thumb && clamp_eligible(x, y)) {
        angle = angle > 360.0f - ((360.0f - sweep) / 2) ? 0.0f : sweep;
    }

    if (angle < sweep + 1) {
        if (scroller_.compute_offset()) {
            scroller_.force_finished(true);
        }

        if (notify_progress_changing(geometry_.step_from_angle(angle) + min_)) {
            switch (scroll_mode_) {
            case ScrollMode::Drift:
                scroller_.start_scroll(scroller_.current(),
                                       angle_to_fixed(angle) - scroller_.current());
                break;
            case ScrollMode::Gravity:
                scroller_.start_scroll(scroller_.current(),
                                       angle_to_fixed(geometry_.step_angle_from_angle(angle)) -
                                           scroller_.current());
                break;
            case ScrollMode::Snap:
                scroller_.set_final(angle_to_fixed(geometry_.step_angle_from_angle(angle)));
                break;
            }
        }

        request_invalidate();
        return true;
    }

    // Out of band: hold the thumb where it is
    if (scroller_.is_finished()) {
        scroller_.set_final(scroller_.current());
    }

    return geometry_.touch_inside() || thumb;
}

void SeekArc::finish_scroll() {
    scrolling_ = false;
    pressed_ = false;

    spdlog::debug("[SeekArc] Gesture finished at progress {}", progress_);

    request_invalidate();
    notify_progress_changed();
}

// ============================================================================
// Internals
// ============================================================================

void SeekArc::update_drawable_state() {
    float touch_radius = std::max(thumb_radius_, stroke_width_ / 2);

    RectF rect;
    rect.x1 = touch_radius + static_cast<float>(padding_.left);
    rect.y1 = touch_radius + static_cast<float>(padding_.top);
    rect.x2 = static_cast<float>(size_.width) - touch_radius - static_cast<float>(padding_.right);
    rect.y2 =
        static_cast<float>(size_.height) - touch_radius - static_cast<float>(padding_.bottom);

    geometry_.set_draw_rect(rect, static_cast<float>(padding_.left),
                            static_cast<float>(padding_.top));
    geometry_.set_touch_radius(touch_radius);

    start_orb_ = geometry_.point_on_ellipse(0.0f);
    end_orb_ = geometry_.point_on_ellipse(geometry_.sweep_angle());

    request_invalidate();
}

void SeekArc::request_invalidate() {
    if (invalidate_cb_) {
        invalidate_cb_();
    }
}

bool SeekArc::notify_progress_changing(int progress) {
    if (listener_) {
        return listener_->on_progress_changing(*this, progress);
    }
    return true;
}

void SeekArc::notify_progress_changed() {
    bool finished = !pressed_ && scroller_.is_finished();

    // Skip repeats, but always deliver the final update
    if (listener_ && (progress_ != last_update_ || finished)) {
        last_update_ = progress_;
        listener_->on_progress_changed(*this, progress_, finished);
    }
}

bool SeekArc::clamp_eligible(float x, float y) const {
    return geometry_.touch_inside() || geometry_.inside_orbit(x, y) ||
           geometry_.near_point(x, y, start_orb_) || geometry_.near_point(x, y, end_orb_);
}

int32_t SeekArc::angle_to_fixed(float angle) const {
    return static_cast<int32_t>(angle * ANGLE_MULTIPLIER);
}

SeekArcFrame SeekArc::build_frame(float angle, bool animating) const {
    SeekArcFrame frame;
    frame.draw_rect = geometry_.draw_rect();
    frame.stroke_width = stroke_width_;
    frame.enabled = enabled_;
    frame.pressed = pressed_;
    frame.animating = animating;

    frame.sweep.start_angle = geometry_.start_angle();
    frame.sweep.sweep_angle = geometry_.sweep_angle();
    frame.sweep.color = sweep_color_;

    frame.progress.start_angle = geometry_.start_angle();
    frame.progress.sweep_angle = angle;
    frame.progress.color = progress_color_.for_state(enabled_, pressed_);

    Point center = geometry_.point_on_ellipse(angle);
    auto radius = static_cast<int32_t>(thumb_radius_);
    frame.thumb.visible = thumb_visible_;
    frame.thumb.center = center;
    frame.thumb.radius = thumb_radius_;
    frame.thumb.bounds = {center.x - radius, center.y - radius, center.x + radius,
                          center.y + radius};

    return frame;
}

} // namespace arcseek
