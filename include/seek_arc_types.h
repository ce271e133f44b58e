// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

/**
 * @file seek_arc_types.h
 * @brief Value types shared by the seek arc core, its renderer and the LVGL binding
 *
 * Nothing in here depends on LVGL. Colors are packed ARGB (0xAARRGGBB) so the core
 * can resolve state colors without a toolkit; the binding converts them to lv_color_t.
 */

namespace arcseek {

/// Packed 0xAARRGGBB color
using Argb = uint32_t;

struct Point {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const Point& o) const {
        return x == o.x && y == o.y;
    }
    bool operator!=(const Point& o) const {
        return !(*this == o);
    }
};

struct Size {
    int32_t width = 0;
    int32_t height = 0;
};

struct Padding {
    int32_t left = 0;
    int32_t top = 0;
    int32_t right = 0;
    int32_t bottom = 0;
};

/**
 * @brief Floating point rectangle (x1,y1 inclusive top-left, x2,y2 bottom-right)
 */
struct RectF {
    float x1 = 0.0f;
    float y1 = 0.0f;
    float x2 = 0.0f;
    float y2 = 0.0f;

    float width() const {
        return x2 - x1;
    }
    float height() const {
        return y2 - y1;
    }
    float center_x() const {
        return (x1 + x2) * 0.5f;
    }
    float center_y() const {
        return (y1 + y2) * 0.5f;
    }
    bool is_empty() const {
        return x2 <= x1 || y2 <= y1;
    }
};

/**
 * @brief Policy for turning a raw touch angle into the animated progress angle
 *
 * Values match the XML/JSON enumeration order (drift=0, gravity=1, snap=2).
 */
enum class ScrollMode {
    Drift = 0,   ///< Follow the raw touch angle smoothly
    Gravity = 1, ///< Animate toward the nearest step angle
    Snap = 2,    ///< Jump to the nearest step angle
};

/// Parse "drift" / "gravity" / "snap" (also accepts "0"/"1"/"2")
std::optional<ScrollMode> parse_scroll_mode(std::string_view str);

const char* scroll_mode_name(ScrollMode mode);

/**
 * @brief Parent constraint for one axis during measurement
 */
enum class MeasureMode { Exactly, AtMost, Unspecified };

struct MeasureSpec {
    MeasureMode mode = MeasureMode::Unspecified;
    int32_t size = 0;

    static MeasureSpec exactly(int32_t size) {
        return {MeasureMode::Exactly, size};
    }
    static MeasureSpec at_most(int32_t size) {
        return {MeasureMode::AtMost, size};
    }
    static MeasureSpec unspecified() {
        return {MeasureMode::Unspecified, 0};
    }
};

/**
 * @brief Resolve one axis of a measurement against the widget's preferred size
 */
int32_t resolve_measure(const MeasureSpec& spec, int32_t default_size);

enum class InputAction { Press, Move, Release, Cancel };

/**
 * @brief Pointer event in widget-local coordinates
 */
struct InputEvent {
    InputAction action = InputAction::Press;
    float x = 0.0f;
    float y = 0.0f;
};

/**
 * @brief Progress color per widget state
 *
 * Resolution order: disabled, then pressed, then normal.
 */
struct ColorStateList {
    Argb normal = 0;
    Argb pressed = 0;
    Argb disabled = 0;

    static ColorStateList value_of(Argb color) {
        return {color, color, color};
    }

    Argb for_state(bool enabled, bool is_pressed) const {
        if (!enabled)
            return disabled;
        if (is_pressed)
            return pressed;
        return normal;
    }

    bool operator==(const ColorStateList& o) const {
        return normal == o.normal && pressed == o.pressed && disabled == o.disabled;
    }
};

} // namespace arcseek
