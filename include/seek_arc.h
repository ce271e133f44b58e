// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "seek_arc_frame.h"
#include "seek_arc_geometry.h"
#include "seek_arc_scroller.h"
#include "seek_arc_snapshot.h"
#include "seek_arc_types.h"
#include "widget.h"

#include <functional>
#include <utility>

/**
 * @file seek_arc.h
 * @brief Circular seek bar: a slider whose track is an elliptical arc
 *
 * The arc starts at start_angle and runs clockwise for sweep_angle degrees. Dragging
 * along it moves the thumb and maps the touch angle onto an integer progress in
 * [min, max]. How the displayed angle follows the finger depends on ScrollMode:
 *
 *   Drift    smooth animation to the raw touch angle
 *   Gravity  animation to the nearest progress step
 *   Snap     jump to the nearest progress step
 *
 * Gesture flow:
 * @code
 *   Idle --press in orbit / on an endpoint--> Scrolling --release/cancel--> Idle
 *                                               |  ^
 *                                               +--+ move: on_progress_changing() gate,
 *                                                          animator retarget
 * @endcode
 *
 * Progress is derived from the animated angle on every draw, so listeners see
 * on_progress_changed() while the thumb is still moving (finished=false) and once more
 * when the finger is up and the animation has landed (finished=true).
 *
 * SeekArc has no toolkit dependency. ui_seek_arc.h hosts it inside an lv_obj_t.
 */

namespace arcseek {

class SeekArc;

/**
 * @brief Receives progress notifications from a SeekArc
 *
 * The listener is borrowed; it must outlive the arc or be cleared with
 * set_listener(nullptr).
 */
class SeekArcListener {
  public:
    virtual ~SeekArcListener() = default;

    /**
     * @brief Called during a drag before a new step is committed
     * @return false to veto the change (the gesture continues)
     */
    virtual bool on_progress_changing(SeekArc& arc, int progress) {
        (void)arc;
        (void)progress;
        return true;
    }

    /**
     * @brief Called when the displayed progress changes, and on release
     * @param finished true once the finger is up and the thumb has settled
     */
    virtual void on_progress_changed(SeekArc& arc, int progress, bool finished) = 0;
};

class SeekArc : public Widget {
  public:
    static constexpr int32_t ANGLE_MULTIPLIER = SeekArcSnapshot::ANGLE_MULTIPLIER;

    static constexpr int DEFAULT_MIN = 0;
    static constexpr int DEFAULT_MAX = 100;
    static constexpr int DEFAULT_PROGRESS = 0;
    static constexpr float DEFAULT_START_ANGLE = 90.0f;
    static constexpr float DEFAULT_SWEEP_ANGLE = 359.9f;
    static constexpr float DEFAULT_STROKE_WIDTH = 14.0f;
    static constexpr float DEFAULT_THUMB_RADIUS = 12.0f;
    static constexpr int32_t DEFAULT_SIZE = 256;
    static constexpr ScrollMode DEFAULT_SCROLL_MODE = ScrollMode::Drift;
    static constexpr bool DEFAULT_TOUCH_INSIDE = true;

    static constexpr Argb DEFAULT_SWEEP_COLOR = 0x1F000000;
    static constexpr Argb DEFAULT_PROGRESS_COLOR = 0x1F000000;
    static constexpr Argb DEFAULT_PRESSED_COLOR = 0xFF2196F3;
    static constexpr Argb DEFAULT_DISABLED_COLOR = 0x00000000;

    /**
     * @param clock Millisecond tick source for animations (LVGL tick when empty)
     */
    explicit SeekArc(SeekArcScroller::Clock clock = {});

    SeekArc(const SeekArc&) = delete;
    SeekArc& operator=(const SeekArc&) = delete;

    // ========== Widget ==========

    [[nodiscard]] Size measure(const MeasureSpec& width, const MeasureSpec& height) const override;
    void layout(const Size& size, const Padding& padding) override;
    bool draw(ArcRenderer& renderer) override;
    bool handle_input(const InputEvent& event) override;
    [[nodiscard]] nlohmann::json save_state() const override;
    bool restore_state(const nlohmann::json& state) override;

    // ========== Instance state ==========

    [[nodiscard]] SeekArcSnapshot snapshot() const;

    /**
     * @brief Restore the animator target and progress from a snapshot
     *
     * Jumps without animation and notifies on_progress_changed(finished=true).
     */
    void restore(const SeekArcSnapshot& snapshot);

    // ========== Range ==========

    /// Clamped to [0, max]; progress is re-clamped
    void set_min(int min);
    /// Clamped to >= min; progress is re-clamped
    void set_max(int max);
    /// Clamped to [min, max]
    void set_progress(int progress, bool animate = false);

    [[nodiscard]] int min() const {
        return min_;
    }
    [[nodiscard]] int max() const {
        return max_;
    }
    [[nodiscard]] int progress() const {
        return progress_;
    }

    // ========== Geometry ==========

    void set_start_angle(float degrees);
    /// Normalized into [0, 360); progress is re-targeted
    void set_sweep_angle(float degrees);
    void set_stroke_width(float px);
    void set_thumb_radius(float px);
    void set_touch_inside(bool touch_inside);

    [[nodiscard]] float start_angle() const {
        return geometry_.start_angle();
    }
    [[nodiscard]] float sweep_angle() const {
        return geometry_.sweep_angle();
    }
    [[nodiscard]] float stroke_width() const {
        return stroke_width_;
    }
    [[nodiscard]] float thumb_radius() const {
        return thumb_radius_;
    }
    [[nodiscard]] float touch_radius() const {
        return geometry_.touch_radius();
    }
    [[nodiscard]] bool touch_inside() const {
        return geometry_.touch_inside();
    }
    [[nodiscard]] const SeekArcGeometry& geometry() const {
        return geometry_;
    }

    /// Point on the arc ellipse at an angle relative to start_angle
    [[nodiscard]] Point point_at(float angle) const {
        return geometry_.point_on_ellipse(angle);
    }

    /// Angle of (x, y) relative to start_angle, in [0, 360)
    [[nodiscard]] float angle_of(float x, float y) const {
        return geometry_.angle_of(x, y);
    }

    [[nodiscard]] bool is_inside_orbit(float x, float y) const {
        return geometry_.inside_orbit(x, y);
    }

    // ========== Appearance ==========

    void set_sweep_color(Argb color);
    void set_progress_color(Argb color);
    void set_progress_color(const ColorStateList& colors);
    void set_thumb_visible(bool visible);
    void set_default_size(Size size);

    [[nodiscard]] Argb sweep_color() const {
        return sweep_color_;
    }
    [[nodiscard]] const ColorStateList& progress_color() const {
        return progress_color_;
    }
    [[nodiscard]] bool thumb_visible() const {
        return thumb_visible_;
    }

    // ========== Behavior ==========

    /// Gravity re-homes progress with animation, Snap without
    void set_scroll_mode(ScrollMode mode);
    void set_enabled(bool enabled);

    [[nodiscard]] ScrollMode scroll_mode() const {
        return scroll_mode_;
    }
    [[nodiscard]] bool is_enabled() const {
        return enabled_;
    }
    [[nodiscard]] bool is_pressed() const {
        return pressed_;
    }
    [[nodiscard]] bool is_scrolling() const {
        return scrolling_;
    }
    [[nodiscard]] bool is_animating() const {
        return !scroller_.is_finished();
    }

    /// Displayed angle (relative to start_angle) as of the last animator poll
    [[nodiscard]] float progress_angle() const {
        return static_cast<float>(scroller_.current()) / ANGLE_MULTIPLIER;
    }

    /// Angle the animator is heading to
    [[nodiscard]] float target_angle() const {
        return static_cast<float>(scroller_.final_value()) / ANGLE_MULTIPLIER;
    }

    // ========== Hooks ==========

    void set_listener(SeekArcListener* listener) {
        listener_ = listener;
    }
    [[nodiscard]] SeekArcListener* listener() const {
        return listener_;
    }

    /// Called whenever the arc needs repainting
    void set_invalidate_callback(std::function<void()> cb) {
        invalidate_cb_ = std::move(cb);
    }

    // ========== Gesture ==========

    /**
     * @brief Begin a gesture at (x, y)
     * @return false if the point is outside the orbit and away from both endpoints
     */
    bool start_scroll(float x, float y);

    /**
     * @brief Follow the finger to (x, y)
     * @return false if the point falls outside the usable sweep and is neither on the
     *         thumb nor allowed by touch_inside
     */
    bool update_scroll(float x, float y);

    /**
     * @brief End the gesture and notify listeners
     */
    void finish_scroll();

  private:
    void update_drawable_state();
    void request_invalidate();
    bool notify_progress_changing(int progress);
    void notify_progress_changed();
    bool clamp_eligible(float x, float y) const;
    int32_t angle_to_fixed(float angle) const;
    SeekArcFrame build_frame(float angle, bool animating) const;

    SeekArcGeometry geometry_;
    SeekArcScroller scroller_;

    int min_ = DEFAULT_MIN;
    int max_ = DEFAULT_MAX;
    int progress_ = DEFAULT_PROGRESS;
    int last_update_ = -1;

    float stroke_width_ = DEFAULT_STROKE_WIDTH;
    float thumb_radius_ = DEFAULT_THUMB_RADIUS;
    Argb sweep_color_ = DEFAULT_SWEEP_COLOR;
    ColorStateList progress_color_{DEFAULT_PROGRESS_COLOR, DEFAULT_PRESSED_COLOR,
                                   DEFAULT_DISABLED_COLOR};
    bool thumb_visible_ = true;

    ScrollMode scroll_mode_ = DEFAULT_SCROLL_MODE;
    bool enabled_ = true;
    bool pressed_ = false;
    bool scrolling_ = false;

    Size size_;
    Padding padding_;
    Size default_size_{DEFAULT_SIZE, DEFAULT_SIZE};
    Point start_orb_;
    Point end_orb_;

    SeekArcListener* listener_ = nullptr;
    std::function<void()> invalidate_cb_;
};

} // namespace arcseek
