// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seek_arc_config.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdio>
#include <type_traits>

namespace arcseek {

using json = nlohmann::json;

namespace {

/// Read j[key] into out if present and convertible; warn and keep out otherwise
template <typename T> void read_value(const json& j, const char* key, T& out) {
    if (!j.contains(key))
        return;

    const auto& value = j[key];
    bool ok = false;
    if constexpr (std::is_same_v<T, bool>) {
        ok = value.is_boolean();
    } else if constexpr (std::is_integral_v<T>) {
        ok = value.is_number_integer();
    } else if constexpr (std::is_floating_point_v<T>) {
        ok = value.is_number();
    } else {
        ok = value.is_string();
    }

    if (!ok) {
        spdlog::warn("[SeekArcConfig] Invalid '{}': {} - keeping default", key, value.dump());
        return;
    }
    out = value.get<T>();
}

void read_color(const json& j, const char* key, Argb& out) {
    if (!j.contains(key))
        return;

    auto color = parse_color(j[key]);
    if (!color) {
        spdlog::warn("[SeekArcConfig] Invalid color '{}': {} - keeping default", key,
                     j[key].dump());
        return;
    }
    out = *color;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Argb> parse_color(std::string_view str) {
    if (!str.empty() && str.front() == '#') {
        str.remove_prefix(1);
    } else if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        str.remove_prefix(2);
    }

    if (str.size() != 6 && str.size() != 8)
        return std::nullopt;

    Argb value = 0;
    for (char c : str) {
        int digit = hex_digit(c);
        if (digit < 0)
            return std::nullopt;
        value = (value << 4) | static_cast<Argb>(digit);
    }

    if (str.size() == 6) {
        value |= 0xFF000000u;
    }
    return value;
}

std::optional<Argb> parse_color(const json& j) {
    if (j.is_string())
        return parse_color(std::string_view(j.get_ref<const std::string&>()));
    if (j.is_number_unsigned())
        return static_cast<Argb>(j.get<uint64_t>());
    if (j.is_number_integer() && j.get<int64_t>() >= 0)
        return static_cast<Argb>(j.get<int64_t>());
    return std::nullopt;
}

std::string format_color(Argb color) {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%08X", color);
    return buf;
}

SeekArcConfig SeekArcConfig::from_json(const json& j) {
    SeekArcConfig config;

    if (j.is_null())
        return config;

    if (!j.is_object()) {
        spdlog::warn("[SeekArcConfig] Expected an object, got {} - using defaults", j.type_name());
        return config;
    }

    read_value(j, "min", config.min);
    read_value(j, "max", config.max);
    read_value(j, "progress", config.progress);
    read_value(j, "start_angle", config.start_angle);
    read_value(j, "sweep_angle", config.sweep_angle);
    read_value(j, "stroke_width", config.stroke_width);
    read_value(j, "thumb_radius", config.thumb_radius);
    read_value(j, "thumb", config.thumb);
    read_value(j, "touch_inside", config.touch_inside);
    read_value(j, "enabled", config.enabled);
    read_color(j, "sweep_color", config.sweep_color);

    if (j.contains("progress_color")) {
        const auto& pc = j["progress_color"];
        if (pc.is_object()) {
            read_color(pc, "normal", config.progress_color.normal);
            read_color(pc, "pressed", config.progress_color.pressed);
            read_color(pc, "disabled", config.progress_color.disabled);
        } else if (auto color = parse_color(pc)) {
            config.progress_color = ColorStateList::value_of(*color);
        } else {
            spdlog::warn("[SeekArcConfig] Invalid 'progress_color': {} - keeping default",
                         pc.dump());
        }
    }

    if (j.contains("scroll_mode")) {
        const auto& sm = j["scroll_mode"];
        std::optional<ScrollMode> mode;
        if (sm.is_string()) {
            mode = parse_scroll_mode(sm.get<std::string>());
        } else if (sm.is_number_integer()) {
            mode = parse_scroll_mode(std::to_string(sm.get<int>()));
        }
        if (mode) {
            config.scroll_mode = *mode;
        } else {
            spdlog::warn("[SeekArcConfig] Invalid 'scroll_mode': {} - keeping {}", sm.dump(),
                         scroll_mode_name(config.scroll_mode));
        }
    }

    if (config.stroke_width < 0.0f) {
        spdlog::warn("[SeekArcConfig] Negative stroke_width {} - using 0", config.stroke_width);
        config.stroke_width = 0.0f;
    }
    if (config.thumb_radius < 0.0f) {
        spdlog::warn("[SeekArcConfig] Negative thumb_radius {} - using 0", config.thumb_radius);
        config.thumb_radius = 0.0f;
    }

    return config;
}

json SeekArcConfig::to_json() const {
    return {{"min", min},
            {"max", max},
            {"progress", progress},
            {"start_angle", start_angle},
            {"sweep_angle", sweep_angle},
            {"stroke_width", stroke_width},
            {"thumb_radius", thumb_radius},
            {"sweep_color", format_color(sweep_color)},
            {"progress_color",
             {{"normal", format_color(progress_color.normal)},
              {"pressed", format_color(progress_color.pressed)},
              {"disabled", format_color(progress_color.disabled)}}},
            {"thumb", thumb},
            {"scroll_mode", scroll_mode_name(scroll_mode)},
            {"touch_inside", touch_inside},
            {"enabled", enabled}};
}

std::optional<std::string> SeekArcConfig::thumb_image() const {
    if (thumb.empty() || thumb == THUMB_DEFAULT || thumb == THUMB_NONE)
        return std::nullopt;
    return thumb;
}

void SeekArcConfig::apply(SeekArc& arc, const DpToPx& dp_to_px) const {
    auto to_px = [&dp_to_px](float dp) {
        if (!dp_to_px)
            return dp;
        return static_cast<float>(dp_to_px(static_cast<int32_t>(std::lround(dp))));
    };

    arc.set_max(max);
    arc.set_min(min);
    arc.set_max(max);
    arc.set_start_angle(start_angle);
    arc.set_sweep_angle(sweep_angle);
    arc.set_stroke_width(to_px(stroke_width));
    arc.set_thumb_radius(to_px(thumb_radius));
    arc.set_sweep_color(sweep_color);
    arc.set_progress_color(progress_color);
    arc.set_thumb_visible(!thumb_hidden());
    arc.set_touch_inside(touch_inside);
    arc.set_scroll_mode(scroll_mode);
    arc.set_progress(progress);
    arc.set_enabled(enabled);

    spdlog::debug("[SeekArcConfig] Applied range [{}, {}] progress {} sweep {:.1f} mode {}",
                  arc.min(), arc.max(), arc.progress(), arc.sweep_angle(),
                  scroll_mode_name(arc.scroll_mode()));
}

} // namespace arcseek
