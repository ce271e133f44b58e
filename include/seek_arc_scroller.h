// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>

/**
 * @file seek_arc_scroller.h
 * @brief Deferred-value animator polled once per frame
 *
 * Moves an integer (the seek arc uses angle × 100) from a start value toward a final
 * value over a fixed duration. Nothing runs on its own: the owner polls
 * compute_offset() from its draw callback and keeps requesting frames while it
 * returns true.
 *
 * Usage:
 * @code{.cpp}
 *   SeekArcScroller scroller;
 *   scroller.start_scroll(scroller.current(), target - scroller.current());
 *
 *   // in the draw callback
 *   if (scroller.compute_offset()) {
 *       draw_at(scroller.current());
 *       request_another_frame();
 *   }
 * @endcode
 */

namespace arcseek {

class SeekArcScroller {
  public:
    /// Millisecond tick source (lv_tick_get() when empty)
    using Clock = std::function<uint32_t()>;

    static constexpr uint32_t DEFAULT_DURATION_MS = 250;

    explicit SeekArcScroller(Clock clock = {});

    /**
     * @brief Start animating from start to start + delta
     */
    void start_scroll(int32_t start, int32_t delta, uint32_t duration_ms = DEFAULT_DURATION_MS);

    /**
     * @brief Retarget without animating
     *
     * The value lands on the next compute_offset() call, which returns true once so the
     * owner picks up the change.
     */
    void set_final(int32_t value);

    /**
     * @brief Force the finished flag without moving current()
     */
    void force_finished(bool finished);

    /**
     * @brief Stop immediately with current() at the final value
     */
    void abort_animation();

    /**
     * @brief Advance current() to the present time
     * @return true while the value is moving, including the poll that lands on the target
     */
    bool compute_offset();

    [[nodiscard]] int32_t current() const {
        return current_;
    }
    [[nodiscard]] int32_t final_value() const {
        return final_;
    }
    [[nodiscard]] bool is_finished() const {
        return finished_;
    }
    [[nodiscard]] uint32_t duration() const {
        return duration_;
    }

  private:
    uint32_t now() const;

    Clock clock_;
    int32_t start_ = 0;
    int32_t final_ = 0;
    int32_t delta_ = 0;
    int32_t current_ = 0;
    uint32_t start_time_ = 0;
    uint32_t duration_ = 0;
    bool finished_ = true;
};

} // namespace arcseek
