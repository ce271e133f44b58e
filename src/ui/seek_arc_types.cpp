// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seek_arc_types.h"

#include <algorithm>

namespace arcseek {

std::optional<ScrollMode> parse_scroll_mode(std::string_view str) {
    if (str == "drift" || str == "0")
        return ScrollMode::Drift;
    if (str == "gravity" || str == "1")
        return ScrollMode::Gravity;
    if (str == "snap" || str == "2")
        return ScrollMode::Snap;
    return std::nullopt;
}

const char* scroll_mode_name(ScrollMode mode) {
    switch (mode) {
    case ScrollMode::Drift:
        return "drift";
    case ScrollMode::Gravity:
        return "gravity";
    case ScrollMode::Snap:
        return "snap";
    }
    return "unknown";
}

int32_t resolve_measure(const MeasureSpec& spec, int32_t default_size) {
    switch (spec.mode) {
    case MeasureMode::Exactly:
        return spec.size;
    case MeasureMode::AtMost:
        return std::min(spec.size, default_size);
    case MeasureMode::Unspecified:
    default:
        return default_size;
    }
}

} // namespace arcseek
