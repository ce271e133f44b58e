// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lvgl/lvgl.h"
#include "seek_arc.h"
#include "seek_arc_config.h"

/**
 * @file ui_seek_arc.h
 * @brief LVGL host for the SeekArc widget
 *
 * Wraps an arcseek::SeekArc in a plain lv_obj_t. The object owns the arc (freed on
 * LV_EVENT_DELETE) and forwards size, padding, pointer and draw events into it.
 *
 * Usage in XML:
 * ```xml
 * <ui_seek_arc name="volume" width="240" height="240"
 *              min="0" max="100" progress="30"
 *              start_angle="135" sweep_angle="270"
 *              stroke_width="14" thumb_radius="12"
 *              sweep_color="#1F000000" progress_color="#2196F3"
 *              progress_color_pressed="#1976D2" progress_color_disabled="#00000000"
 *              scroll_mode="gravity" touch_inside="false" enabled="true"/>
 * ```
 * stroke_width and thumb_radius are in dp (scaled with lv_dpx()), like the JSON config.
 * thumb_src names a registered XML image; thumb_visible="false" hides the thumb.
 *
 * Listener callbacks run on the LVGL thread, and on_progress_changed() is usually
 * called from inside the draw callback. Do not invalidate or resize other objects
 * from it directly; defer with lv_async_call().
 *
 * @see ui_seek_arc_register() to register the widget
 */

/**
 * @brief Register the ui_seek_arc widget for XML creation
 *
 * Call once during initialization before loading XML that uses this widget.
 */
void ui_seek_arc_register();

/**
 * @brief Create a seek arc with default settings
 * @param parent Parent object
 * @return The new object, or nullptr on allocation failure
 */
lv_obj_t* ui_seek_arc_create(lv_obj_t* parent);

/**
 * @brief Access the widget model behind a seek arc object
 * @return nullptr if obj is not a seek arc
 */
arcseek::SeekArc* ui_seek_arc_get(lv_obj_t* obj);

/**
 * @brief Apply a full configuration (lengths converted with lv_dpx)
 *
 * A thumb image path in config.thumb is passed to lv_draw_image() as-is, so it must
 * be in a form the LVGL image decoders accept (e.g. "A:/path/thumb.png").
 */
void ui_seek_arc_apply_config(lv_obj_t* obj, const arcseek::SeekArcConfig& config);

/**
 * @brief Set the progress listener (borrowed; nullptr to clear)
 */
void ui_seek_arc_set_listener(lv_obj_t* obj, arcseek::SeekArcListener* listener);

void ui_seek_arc_set_progress(lv_obj_t* obj, int progress, bool animate);
int ui_seek_arc_get_progress(lv_obj_t* obj);

/**
 * @brief Enable or disable input; mirrored to LV_STATE_DISABLED
 */
void ui_seek_arc_set_enabled(lv_obj_t* obj, bool enabled);

/**
 * @brief Replace the default thumb orb with an LVGL image source
 * @param src Image descriptor or path (must stay valid); nullptr restores the orb
 */
void ui_seek_arc_set_thumb_src(lv_obj_t* obj, const void* src);

void ui_seek_arc_set_thumb_visible(lv_obj_t* obj, bool visible);
