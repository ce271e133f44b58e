// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_seek_arc.h"

#include "lvgl/lvgl.h"
#include "lvgl/src/xml/lv_xml.h"
#include "lvgl/src/xml/lv_xml_parser.h"
#include "lvgl/src/xml/lv_xml_utils.h"
#include "lvgl/src/xml/lv_xml_widget.h"
#include "lvgl/src/xml/parsers/lv_xml_obj_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

using namespace arcseek;

namespace {

// Elliptical arcs are approximated with one line segment per this many degrees
constexpr float ELLIPSE_SEGMENT_DEG = 3.0f;

// Default thumb drop shadow (dp)
constexpr int32_t THUMB_SHADOW_WIDTH = 2;
constexpr int32_t THUMB_SHADOW_OFFSET_Y = 1;
constexpr lv_opa_t THUMB_SHADOW_OPA = 0x30;

/**
 * @brief Per-object state, owned through lv_obj user data
 */
struct SeekArcData {
    SeekArc arc;

    // Thumb image: either a caller-owned source or a path we keep alive
    const void* thumb_src = nullptr;
    std::string thumb_path;
    bool thumb_src_failed = false;

    bool in_draw = false;
    bool redraw_pending = false;

    // Scroll chain flags removed while a gesture owns the pointer
    bool chain_suspended = false;
    bool chain_hor = false;
    bool chain_ver = false;
};

void seek_arc_event_cb(lv_event_t* e);

lv_color_t to_lv_color(Argb color) {
    return lv_color_hex(color & 0x00FFFFFF);
}

lv_opa_t to_lv_opa(Argb color) {
    return static_cast<lv_opa_t>(color >> 24);
}

int32_t dp_to_px(int32_t dp) {
    return lv_dpx(dp);
}

bool is_seek_arc(lv_obj_t* obj) {
    uint32_t count = lv_obj_get_event_count(obj);
    for (uint32_t i = 0; i < count; i++) {
        lv_event_dsc_t* dsc = lv_obj_get_event_dsc(obj, i);
        if (dsc && lv_event_dsc_get_cb(dsc) == seek_arc_event_cb) {
            return true;
        }
    }
    return false;
}

SeekArcData* get_data(lv_obj_t* obj) {
    if (!obj || !is_seek_arc(obj))
        return nullptr;
    return static_cast<SeekArcData*>(lv_obj_get_user_data(obj));
}

// ============================================================================
// Rendering
// ============================================================================

/**
 * @brief Paints a SeekArcFrame into an LVGL layer
 *
 * Frame coordinates are widget-local; the renderer offsets them by the object's
 * absolute coordinates.
 *
 * lv_draw_arc() radius is the OUTER edge of the stroke, while the frame describes the
 * ellipse the stroke is centered on, so the radius gets half a stroke added.
 */
class LvglArcRenderer : public ArcRenderer {
  public:
    LvglArcRenderer(lv_layer_t* layer, const lv_area_t& coords, SeekArcData& data)
        : layer_(layer), coords_(coords), data_(data) {}

    void render(const SeekArcFrame& frame) override {
        if (frame.is_empty())
            return;

        draw_arc(frame, frame.sweep);
        draw_arc(frame, frame.progress);

        if (frame.thumb.visible) {
            draw_thumb(frame);
        }
    }

  private:
    void draw_arc(const SeekArcFrame& frame, const SeekArcFrame::Arc& arc) {
        if (arc.sweep_angle <= 0.0f || frame.stroke_width <= 0.0f ||
            to_lv_opa(arc.color) == LV_OPA_TRANSP)
            return;

        if (frame.is_circular()) {
            draw_circular_arc(frame, arc);
        } else {
            draw_elliptical_arc(frame, arc);
        }
    }

    void draw_circular_arc(const SeekArcFrame& frame, const SeekArcFrame::Arc& arc) {
        const RectF& rect = frame.draw_rect;

        lv_draw_arc_dsc_t dsc;
        lv_draw_arc_dsc_init(&dsc);
        dsc.color = to_lv_color(arc.color);
        dsc.opa = to_lv_opa(arc.color);
        dsc.width = static_cast<int32_t>(std::lround(frame.stroke_width));
        dsc.rounded = 1;
        dsc.center.x = coords_.x1 + static_cast<int32_t>(std::lround(rect.center_x()));
        dsc.center.y = coords_.y1 + static_cast<int32_t>(std::lround(rect.center_y()));
        dsc.radius =
            static_cast<uint16_t>(std::lround(rect.width() / 2.0f + frame.stroke_width / 2.0f));
        dsc.start_angle = static_cast<lv_value_precise_t>(arc.start_angle);
        dsc.end_angle =
            static_cast<lv_value_precise_t>(std::fmod(arc.start_angle + arc.sweep_angle, 360.0f));
        lv_draw_arc(layer_, &dsc);
    }

    void draw_elliptical_arc(const SeekArcFrame& frame, const SeekArcFrame::Arc& arc) {
        const RectF& rect = frame.draw_rect;
        float a = rect.width() / 2.0f;
        float b = rect.height() / 2.0f;
        float cx = static_cast<float>(coords_.x1) + rect.center_x();
        float cy = static_cast<float>(coords_.y1) + rect.center_y();

        lv_draw_line_dsc_t dsc;
        lv_draw_line_dsc_init(&dsc);
        dsc.color = to_lv_color(arc.color);
        dsc.opa = to_lv_opa(arc.color);
        dsc.width = static_cast<int32_t>(std::lround(frame.stroke_width));
        dsc.round_start = true;
        dsc.round_end = true;

        int segments = std::max(2, static_cast<int>(std::ceil(arc.sweep_angle / ELLIPSE_SEGMENT_DEG)));

        auto point_at = [&](float degrees) {
            float t = degrees * static_cast<float>(M_PI) / 180.0f;
            lv_point_precise_t p;
            p.x = static_cast<lv_value_precise_t>(cx + a * std::cos(t));
            p.y = static_cast<lv_value_precise_t>(cy + b * std::sin(t));
            return p;
        };

        lv_point_precise_t prev = point_at(arc.start_angle);
        for (int i = 1; i <= segments; i++) {
            lv_point_precise_t next =
                point_at(arc.start_angle + arc.sweep_angle * static_cast<float>(i) / segments);
            dsc.p1 = prev;
            dsc.p2 = next;
            lv_draw_line(layer_, &dsc);
            prev = next;
        }
    }

    void draw_thumb(const SeekArcFrame& frame) {
        const SeekArcFrame::Thumb& thumb = frame.thumb;

        if (data_.thumb_src && !data_.thumb_src_failed && draw_thumb_image(thumb))
            return;

        lv_area_t area;
        area.x1 = coords_.x1 + thumb.bounds.x1;
        area.y1 = coords_.y1 + thumb.bounds.y1;
        area.x2 = coords_.x1 + thumb.bounds.x2 - 1;
        area.y2 = coords_.y1 + thumb.bounds.y2 - 1;
        if (area.x2 < area.x1 || area.y2 < area.y1)
            return;

        lv_draw_rect_dsc_t dsc;
        lv_draw_rect_dsc_init(&dsc);
        dsc.radius = LV_RADIUS_CIRCLE;
        dsc.bg_color = to_lv_color(thumb.color);
        dsc.bg_opa = to_lv_opa(thumb.color);
        dsc.border_width = 0;
        dsc.shadow_width = lv_dpx(THUMB_SHADOW_WIDTH);
        dsc.shadow_offset_y = lv_dpx(THUMB_SHADOW_OFFSET_Y);
        dsc.shadow_color = lv_color_black();
        dsc.shadow_opa = THUMB_SHADOW_OPA;
        lv_draw_rect(layer_, &dsc, &area);
    }

    bool draw_thumb_image(const SeekArcFrame::Thumb& thumb) {
        lv_image_header_t header;
        if (lv_image_decoder_get_info(data_.thumb_src, &header) != LV_RESULT_OK) {
            spdlog::warn("[SeekArc] Thumb image can't be decoded, using default thumb");
            data_.thumb_src_failed = true;
            return false;
        }

        // Center the image on the thumb position at its natural size
        lv_area_t area;
        area.x1 = coords_.x1 + thumb.center.x - static_cast<int32_t>(header.w) / 2;
        area.y1 = coords_.y1 + thumb.center.y - static_cast<int32_t>(header.h) / 2;
        area.x2 = area.x1 + static_cast<int32_t>(header.w) - 1;
        area.y2 = area.y1 + static_cast<int32_t>(header.h) - 1;

        lv_draw_image_dsc_t dsc;
        lv_draw_image_dsc_init(&dsc);
        dsc.src = data_.thumb_src;
        dsc.header = header;
        lv_draw_image(layer_, &dsc, &area);
        return true;
    }

    lv_layer_t* layer_;
    lv_area_t coords_;
    SeekArcData& data_;
};

// ============================================================================
// Redraw scheduling
// ============================================================================

void seek_arc_async_redraw(void* user_data) {
    auto* obj = static_cast<lv_obj_t*>(user_data);
    // Widget may have been deleted before the callback ran
    if (!lv_obj_is_valid(obj))
        return;

    SeekArcData* data = get_data(obj);
    if (data) {
        data->redraw_pending = false;
    }
    lv_obj_invalidate(obj);
}

void schedule_async_redraw(lv_obj_t* obj, SeekArcData* data) {
    if (data->redraw_pending)
        return;

    if (lv_async_call(seek_arc_async_redraw, obj) == LV_RESULT_OK) {
        data->redraw_pending = true;
    } else {
        spdlog::warn("[SeekArc] Failed to schedule redraw");
    }
}

// Invalidating during the render phase trips LVGL asserts, so defer while drawing
void request_redraw(lv_obj_t* obj) {
    SeekArcData* data = get_data(obj);
    if (!data)
        return;

    if (data->in_draw) {
        schedule_async_redraw(obj, data);
    } else {
        lv_obj_invalidate(obj);
    }
}

// ============================================================================
// Event handling
// ============================================================================

void relayout(lv_obj_t* obj, SeekArcData* data) {
    Size size{lv_obj_get_width(obj), lv_obj_get_height(obj)};
    Padding padding{lv_obj_get_style_pad_left(obj, LV_PART_MAIN),
                    lv_obj_get_style_pad_top(obj, LV_PART_MAIN),
                    lv_obj_get_style_pad_right(obj, LV_PART_MAIN),
                    lv_obj_get_style_pad_bottom(obj, LV_PART_MAIN)};
    data->arc.layout(size, padding);
}

InputEvent make_input(lv_obj_t* obj, InputAction action) {
    lv_point_t point = {0, 0};
    lv_indev_t* indev = lv_indev_active();
    if (indev) {
        lv_indev_get_point(indev, &point);
    }

    // Convert screen coordinates to local widget coordinates
    lv_area_t coords;
    lv_obj_get_coords(obj, &coords);

    InputEvent event;
    event.action = action;
    event.x = static_cast<float>(point.x - coords.x1);
    event.y = static_cast<float>(point.y - coords.y1);
    return event;
}

// Keep scrollable parents from stealing an accepted drag
void suspend_scroll_chain(lv_obj_t* obj, SeekArcData* data) {
    if (data->chain_suspended)
        return;

    data->chain_hor = lv_obj_has_flag(obj, LV_OBJ_FLAG_SCROLL_CHAIN_HOR);
    data->chain_ver = lv_obj_has_flag(obj, LV_OBJ_FLAG_SCROLL_CHAIN_VER);
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLL_CHAIN);
    data->chain_suspended = true;
}

void restore_scroll_chain(lv_obj_t* obj, SeekArcData* data) {
    if (!data->chain_suspended)
        return;

    if (data->chain_hor)
        lv_obj_add_flag(obj, LV_OBJ_FLAG_SCROLL_CHAIN_HOR);
    if (data->chain_ver)
        lv_obj_add_flag(obj, LV_OBJ_FLAG_SCROLL_CHAIN_VER);
    data->chain_suspended = false;
}

void handle_delete(lv_obj_t* obj) {
    lv_async_call_cancel(seek_arc_async_redraw, obj);

    // Transfer ownership to unique_ptr for RAII cleanup
    std::unique_ptr<SeekArcData> data(static_cast<SeekArcData*>(lv_obj_get_user_data(obj)));
    lv_obj_set_user_data(obj, nullptr);

    if (data) {
        data->arc.set_invalidate_callback(nullptr);
        spdlog::trace("[SeekArc] Widget deleted");
    }
}

void seek_arc_event_cb(lv_event_t* e) {
    lv_event_code_t code = lv_event_get_code(e);
    lv_obj_t* obj = lv_event_get_current_target_obj(e);

    if (code == LV_EVENT_DELETE) {
        handle_delete(obj);
        return;
    }

    auto* data = static_cast<SeekArcData*>(lv_obj_get_user_data(obj));
    if (!data)
        return;

    switch (code) {
    case LV_EVENT_DRAW_MAIN: {
        lv_layer_t* layer = lv_event_get_layer(e);
        lv_area_t coords;
        lv_obj_get_coords(obj, &coords);

        LvglArcRenderer renderer(layer, coords, *data);
        data->in_draw = true;
        bool animating = data->arc.draw(renderer);
        data->in_draw = false;

        if (animating) {
            schedule_async_redraw(obj, data);
        }
        break;
    }

    case LV_EVENT_PRESSED:
        if (data->arc.handle_input(make_input(obj, InputAction::Press))) {
            suspend_scroll_chain(obj, data);
        }
        break;

    case LV_EVENT_PRESSING:
        data->arc.handle_input(make_input(obj, InputAction::Move));
        break;

    case LV_EVENT_RELEASED:
        data->arc.handle_input(make_input(obj, InputAction::Release));
        restore_scroll_chain(obj, data);
        break;

    case LV_EVENT_PRESS_LOST:
        data->arc.handle_input(make_input(obj, InputAction::Cancel));
        restore_scroll_chain(obj, data);
        break;

    case LV_EVENT_SIZE_CHANGED:
    case LV_EVENT_STYLE_CHANGED:
        relayout(obj, data);
        break;

    case LV_EVENT_GET_SELF_SIZE: {
        auto* self_size = static_cast<lv_point_t*>(lv_event_get_param(e));
        Size size = data->arc.measure(MeasureSpec::unspecified(), MeasureSpec::unspecified());
        self_size->x = LV_MAX(self_size->x, size.width);
        self_size->y = LV_MAX(self_size->y, size.height);
        break;
    }

    case LV_EVENT_STATE_CHANGED: {
        bool enabled = !lv_obj_has_state(obj, LV_STATE_DISABLED);
        if (enabled != data->arc.is_enabled()) {
            if (!enabled && data->arc.is_scrolling()) {
                data->arc.handle_input(make_input(obj, InputAction::Cancel));
                restore_scroll_chain(obj, data);
            }
            data->arc.set_enabled(enabled);
        }
        break;
    }

    default:
        break;
    }
}

// ============================================================================
// XML widget handlers
// ============================================================================

void* ui_seek_arc_xml_create(lv_xml_parser_state_t* state, const char** attrs) {
    LV_UNUSED(attrs);

    void* parent = lv_xml_state_get_parent(state);
    return ui_seek_arc_create(static_cast<lv_obj_t*>(parent));
}

void ui_seek_arc_xml_apply(lv_xml_parser_state_t* state, const char** attrs) {
    void* item = lv_xml_state_get_item(state);
    lv_obj_t* obj = static_cast<lv_obj_t*>(item);

    if (!get_data(obj))
        return;

    // Apply standard obj properties
    lv_xml_obj_apply(state, attrs);

    // Collect first, apply once: range and colors must not depend on attribute order
    SeekArcConfig config;
    std::optional<Argb> progress_color;
    std::optional<Argb> pressed_color;
    std::optional<Argb> disabled_color;
    const void* thumb_src = nullptr;

    auto color_attr = [](const char* name, const char* value) -> std::optional<Argb> {
        auto color = parse_color(std::string_view(value));
        if (!color) {
            spdlog::warn("[SeekArc] Invalid {}=\"{}\"", name, value);
        }
        return color;
    };

    for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
        const char* name = attrs[i];
        const char* value = attrs[i + 1];

        if (strcmp(name, "min") == 0) {
            config.min = lv_xml_atoi(value);
        } else if (strcmp(name, "max") == 0) {
            config.max = lv_xml_atoi(value);
        } else if (strcmp(name, "progress") == 0) {
            config.progress = lv_xml_atoi(value);
        } else if (strcmp(name, "start_angle") == 0) {
            config.start_angle = std::strtof(value, nullptr);
        } else if (strcmp(name, "sweep_angle") == 0) {
            config.sweep_angle = std::strtof(value, nullptr);
        } else if (strcmp(name, "stroke_width") == 0) {
            config.stroke_width = std::max(0.0f, std::strtof(value, nullptr));
        } else if (strcmp(name, "thumb_radius") == 0) {
            config.thumb_radius = std::max(0.0f, std::strtof(value, nullptr));
        } else if (strcmp(name, "sweep_color") == 0) {
            if (auto color = color_attr(name, value))
                config.sweep_color = *color;
        } else if (strcmp(name, "progress_color") == 0) {
            progress_color = color_attr(name, value);
        } else if (strcmp(name, "progress_color_pressed") == 0) {
            pressed_color = color_attr(name, value);
        } else if (strcmp(name, "progress_color_disabled") == 0) {
            disabled_color = color_attr(name, value);
        } else if (strcmp(name, "thumb_src") == 0) {
            thumb_src = lv_xml_get_image(&state->scope, value);
            if (!thumb_src) {
                spdlog::warn("[SeekArc] Image '{}' not found for thumb_src", value);
            }
        } else if (strcmp(name, "thumb_visible") == 0) {
            config.thumb =
                lv_xml_to_bool(value) ? SeekArcConfig::THUMB_DEFAULT : SeekArcConfig::THUMB_NONE;
        } else if (strcmp(name, "scroll_mode") == 0) {
            if (auto mode = parse_scroll_mode(value)) {
                config.scroll_mode = *mode;
            } else {
                spdlog::warn("[SeekArc] Invalid scroll_mode=\"{}\"", value);
            }
        } else if (strcmp(name, "touch_inside") == 0) {
            config.touch_inside = lv_xml_to_bool(value);
        } else if (strcmp(name, "enabled") == 0) {
            config.enabled = lv_xml_to_bool(value);
        }
    }

    if (progress_color) {
        config.progress_color = ColorStateList::value_of(*progress_color);
    }
    if (pressed_color) {
        config.progress_color.pressed = *pressed_color;
    }
    if (disabled_color) {
        config.progress_color.disabled = *disabled_color;
    }

    ui_seek_arc_apply_config(obj, config);
    if (thumb_src) {
        ui_seek_arc_set_thumb_src(obj, thumb_src);
    }

    spdlog::debug("[SeekArc] Applied XML (range=[{}, {}], progress={}, sweep={:.1f}, mode={})",
                  config.min, config.max, config.progress, config.sweep_angle,
                  scroll_mode_name(config.scroll_mode));
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

void ui_seek_arc_register() {
    lv_xml_register_widget("ui_seek_arc", ui_seek_arc_xml_create, ui_seek_arc_xml_apply);
    spdlog::trace("[SeekArc] Registered <ui_seek_arc> widget");
}

lv_obj_t* ui_seek_arc_create(lv_obj_t* parent) {
    lv_obj_t* obj = lv_obj_create(parent);
    if (!obj) {
        spdlog::error("[SeekArc] Failed to create object");
        return nullptr;
    }

    auto data_ptr = std::make_unique<SeekArcData>();
    SeekArc& arc = data_ptr->arc;
    arc.set_default_size({lv_dpx(SeekArc::DEFAULT_SIZE), lv_dpx(SeekArc::DEFAULT_SIZE)});
    // Defaults are in dp; scale them for this display
    SeekArcConfig{}.apply(arc, dp_to_px);
    arc.set_invalidate_callback([obj]() { request_redraw(obj); });

    // Transfer ownership to LVGL widget
    lv_obj_set_user_data(obj, data_ptr.release());

    // Configure object appearance
    lv_obj_set_style_bg_opa(obj, LV_OPA_TRANSP, 0);
    lv_obj_set_style_border_width(obj, 0, 0);
    lv_obj_set_style_pad_all(obj, 0, 0);
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_add_flag(obj, LV_OBJ_FLAG_CLICKABLE);
    lv_obj_set_size(obj, LV_SIZE_CONTENT, LV_SIZE_CONTENT);

    lv_obj_add_event_cb(obj, seek_arc_event_cb, LV_EVENT_ALL, nullptr);

    relayout(obj, static_cast<SeekArcData*>(lv_obj_get_user_data(obj)));

    spdlog::debug("[SeekArc] Widget created");
    return obj;
}

SeekArc* ui_seek_arc_get(lv_obj_t* obj) {
    SeekArcData* data = get_data(obj);
    return data ? &data->arc : nullptr;
}

void ui_seek_arc_apply_config(lv_obj_t* obj, const SeekArcConfig& config) {
    SeekArcData* data = get_data(obj);
    if (!data)
        return;

    config.apply(data->arc, dp_to_px);

    if (auto path = config.thumb_image()) {
        data->thumb_path = *path;
        data->thumb_src = data->thumb_path.c_str();
    } else {
        data->thumb_path.clear();
        data->thumb_src = nullptr;
    }
    data->thumb_src_failed = false;

    ui_seek_arc_set_enabled(obj, config.enabled);
}

void ui_seek_arc_set_listener(lv_obj_t* obj, SeekArcListener* listener) {
    SeekArcData* data = get_data(obj);
    if (!data)
        return;
    data->arc.set_listener(listener);
}

void ui_seek_arc_set_progress(lv_obj_t* obj, int progress, bool animate) {
    SeekArcData* data = get_data(obj);
    if (!data)
        return;
    data->arc.set_progress(progress, animate);
}

int ui_seek_arc_get_progress(lv_obj_t* obj) {
    SeekArcData* data = get_data(obj);
    return data ? data->arc.progress() : 0;
}

void ui_seek_arc_set_enabled(lv_obj_t* obj, bool enabled) {
    SeekArcData* data = get_data(obj);
    if (!data)
        return;

    // Updating the model first makes the STATE_CHANGED handler a no-op
    data->arc.set_enabled(enabled);
    if (enabled) {
        lv_obj_remove_state(obj, LV_STATE_DISABLED);
    } else {
        lv_obj_add_state(obj, LV_STATE_DISABLED);
    }
}

void ui_seek_arc_set_thumb_src(lv_obj_t* obj, const void* src) {
    SeekArcData* data = get_data(obj);
    if (!data)
        return;

    data->thumb_path.clear();
    data->thumb_src = src;
    data->thumb_src_failed = false;
    request_redraw(obj);
}

void ui_seek_arc_set_thumb_visible(lv_obj_t* obj, bool visible) {
    SeekArcData* data = get_data(obj);
    if (!data)
        return;
    data->arc.set_thumb_visible(visible);
}
