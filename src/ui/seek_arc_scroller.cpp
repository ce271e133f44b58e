// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seek_arc_scroller.h"

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace arcseek {

namespace {

// Control points of lv_anim_path_ease_out (cubic-bezier(0, 0, 0.58, 1))
constexpr int32_t EASE_OUT_X1 = 0;
constexpr int32_t EASE_OUT_Y1 = 0;
constexpr int32_t EASE_OUT_X2 = static_cast<int32_t>(0.58 * LV_BEZIER_VAL_MAX);
constexpr int32_t EASE_OUT_Y2 = LV_BEZIER_VAL_MAX;

} // namespace

SeekArcScroller::SeekArcScroller(Clock clock) : clock_(std::move(clock)) {}

uint32_t SeekArcScroller::now() const {
    return clock_ ? clock_() : lv_tick_get();
}

void SeekArcScroller::start_scroll(int32_t start, int32_t delta, uint32_t duration_ms) {
    finished_ = false;
    duration_ = duration_ms;
    start_time_ = now();
    start_ = start;
    final_ = start + delta;
    delta_ = delta;
    current_ = start;

    spdlog::trace("[SeekArcScroller] start {} -> {} ({}ms)", start_, final_, duration_);
}

void SeekArcScroller::set_final(int32_t value) {
    final_ = value;
    delta_ = final_ - start_;
    duration_ = 0;
    finished_ = false;
}

void SeekArcScroller::force_finished(bool finished) {
    finished_ = finished;
}

void SeekArcScroller::abort_animation() {
    current_ = final_;
    finished_ = true;
}

bool SeekArcScroller::compute_offset() {
    if (finished_)
        return false;

    // Unsigned subtraction stays correct across tick wrap-around
    uint32_t elapsed = now() - start_time_;

    if (elapsed < duration_) {
        int32_t t = static_cast<int32_t>(static_cast<int64_t>(elapsed) * LV_BEZIER_VAL_MAX /
                                         static_cast<int64_t>(duration_));
        int32_t eased = lv_cubic_bezier(t, EASE_OUT_X1, EASE_OUT_Y1, EASE_OUT_X2, EASE_OUT_Y2);

        int64_t offset = static_cast<int64_t>(delta_) * eased;
        // Round half away from zero
        offset = offset >= 0 ? (offset + LV_BEZIER_VAL_MAX / 2) / LV_BEZIER_VAL_MAX
                             : (offset - LV_BEZIER_VAL_MAX / 2) / LV_BEZIER_VAL_MAX;
        current_ = start_ + static_cast<int32_t>(offset);
    } else {
        current_ = final_;
        finished_ = true;
    }

    return true;
}

} // namespace arcseek
