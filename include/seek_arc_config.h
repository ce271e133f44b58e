// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "seek_arc.h"
#include "seek_arc_types.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace arcseek {

/**
 * @brief Construction-time seek arc settings
 *
 * Mirrors the "seek_arc" section of the application config and the attributes of
 * the <ui_seek_arc> XML widget. Lengths are in density-independent pixels (dp) and
 * are converted by the host when applied.
 *
 * JSON:
 * ```json
 * {
 *   "min": 0, "max": 100, "progress": 0,
 *   "start_angle": 90, "sweep_angle": 359.9,
 *   "stroke_width": 14, "thumb_radius": 12,
 *   "sweep_color": "#1F000000",
 *   "progress_color": { "normal": "#1F000000", "pressed": "#2196F3", "disabled": "#00000000" },
 *   "thumb": "default",
 *   "scroll_mode": "drift",
 *   "touch_inside": true,
 *   "enabled": true
 * }
 * ```
 * Missing keys keep their defaults; invalid values log a warning and keep theirs.
 */
struct SeekArcConfig {
    static constexpr const char* THUMB_DEFAULT = "default";
    static constexpr const char* THUMB_NONE = "none";

    /// dp -> px conversion (lv_dpx in LVGL); identity when empty
    using DpToPx = std::function<int32_t(int32_t)>;

    int min = SeekArc::DEFAULT_MIN;
    int max = SeekArc::DEFAULT_MAX;
    int progress = SeekArc::DEFAULT_PROGRESS;
    float start_angle = SeekArc::DEFAULT_START_ANGLE;
    float sweep_angle = SeekArc::DEFAULT_SWEEP_ANGLE;
    float stroke_width = SeekArc::DEFAULT_STROKE_WIDTH;
    float thumb_radius = SeekArc::DEFAULT_THUMB_RADIUS;
    Argb sweep_color = SeekArc::DEFAULT_SWEEP_COLOR;
    ColorStateList progress_color{SeekArc::DEFAULT_PROGRESS_COLOR, SeekArc::DEFAULT_PRESSED_COLOR,
                                  SeekArc::DEFAULT_DISABLED_COLOR};
    /// "default", "none", or an image path for the binding to load
    std::string thumb = THUMB_DEFAULT;
    ScrollMode scroll_mode = SeekArc::DEFAULT_SCROLL_MODE;
    bool touch_inside = SeekArc::DEFAULT_TOUCH_INSIDE;
    bool enabled = true;

    static SeekArcConfig from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Push every setting into an arc
     *
     * Range is applied before progress so the progress clamp sees the final range.
     * The thumb image (if any) is left to the host; only visibility is applied here.
     */
    void apply(SeekArc& arc, const DpToPx& dp_to_px = {}) const;

    [[nodiscard]] bool thumb_hidden() const {
        return thumb == THUMB_NONE;
    }

    /// Image path when thumb names one
    [[nodiscard]] std::optional<std::string> thumb_image() const;
};

/**
 * @brief Parse "#RRGGBB", "#AARRGGBB" (leading '#' optional) or "0x..." into ARGB
 *
 * Six-digit forms are opaque.
 */
std::optional<Argb> parse_color(std::string_view str);

/**
 * @brief Parse a JSON color: string (see above) or integer ARGB
 */
std::optional<Argb> parse_color(const nlohmann::json& j);

/// "#AARRGGBB"
std::string format_color(Argb color);

} // namespace arcseek
