// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_seek_arc.h"

#include "arcseek_version.h"
#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "lvgl/lvgl.h"
#include "seek_arc_config.h"

#include <spdlog/spdlog.h>

#include <SDL.h>
#include <cstdio>
#include <string>

using namespace arcseek;

namespace {

/**
 * @brief Mirrors the arc's progress into a label
 *
 * on_progress_changed() runs inside the arc's draw callback, so the label text is
 * updated from an async call instead.
 */
class ProgressLabel : public SeekArcListener {
  public:
    explicit ProgressLabel(lv_obj_t* label) : label_(label) {}

    ~ProgressLabel() override {
        lv_async_call_cancel(update_cb, this);
    }

    void on_progress_changed(SeekArc& arc, int progress, bool finished) override {
        (void)arc;
        progress_ = progress;
        if (finished) {
            spdlog::info("[Demo] Progress settled at {}", progress);
        }
        if (!update_pending_ && lv_async_call(update_cb, this) == LV_RESULT_OK) {
            update_pending_ = true;
        }
    }

  private:
    static void update_cb(void* user_data) {
        auto* self = static_cast<ProgressLabel*>(user_data);
        self->update_pending_ = false;
        if (lv_obj_is_valid(self->label_)) {
            lv_label_set_text_fmt(self->label_, "%d", self->progress_);
        }
    }

    lv_obj_t* label_;
    int progress_ = 0;
    bool update_pending_ = false;
};

} // anonymous namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.exit_requested ? 0 : 1;
    }

    Config* config = Config::get_instance();
    config->init(args.config_path);

    // CLI overrides config file
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config->get<std::string>("/log_level", "info"));
    log_config.target = logging::parse_log_target(
        args.log_dest.empty() ? config->get<std::string>("/log_dest", "auto") : args.log_dest);
    log_config.file_path =
        args.log_file.empty() ? config->get<std::string>("/log_file", "") : args.log_file;
    logging::init(log_config);

    spdlog::info("[Demo] arcseek-demo {} starting", ARCSEEK_VERSION);

    int width = args.screen_width > 0
                    ? args.screen_width
                    : config->get<int>("/display/width", Config::DEFAULT_DISPLAY_WIDTH);
    int height = args.screen_height > 0
                     ? args.screen_height
                     : config->get<int>("/display/height", Config::DEFAULT_DISPLAY_HEIGHT);

    // Initialize LVGL + SDL
    lv_init();
    lv_display_t* display = lv_sdl_window_create(width, height);
    if (!display) {
        spdlog::error("[Demo] Failed to create {}x{} SDL window", width, height);
        lv_deinit();
        return 1;
    }
    lv_sdl_mouse_create();

    ui_seek_arc_register();

    lv_obj_t* screen = lv_screen_active();

    SeekArcConfig arc_config =
        SeekArcConfig::from_json(config->get<json>("/seek_arc", json::object()));
    if (args.scroll_mode) {
        arc_config.scroll_mode = *args.scroll_mode;
    }

    lv_obj_t* arc_obj = ui_seek_arc_create(screen);
    if (!arc_obj) {
        lv_deinit();
        return 1;
    }
    ui_seek_arc_apply_config(arc_obj, arc_config);
    int32_t side = LV_MIN(width, height) * 4 / 5;
    lv_obj_set_size(arc_obj, side, side);
    lv_obj_center(arc_obj);

    lv_obj_t* label = lv_label_create(screen);
    lv_label_set_text_fmt(label, "%d", ui_seek_arc_get_progress(arc_obj));
    lv_obj_center(label);

    ProgressLabel listener(label);
    SeekArc* arc = ui_seek_arc_get(arc_obj);
    arc->set_listener(&listener);

    // Restore last session's position once the arc has its final size
    lv_obj_update_layout(screen);
    json saved = config->get<json>("/state/seek_arc", json());
    if (!saved.is_null() && !arc->restore_state(saved)) {
        spdlog::warn("[Demo] Ignoring unusable saved state");
    }

    spdlog::info("[Demo] {}x{} window, mode={}, range=[{}, {}]", width, height,
                 scroll_mode_name(arc->scroll_mode()), arc->min(), arc->max());

    // Main loop - let LVGL's SDL driver handle all events
    uint32_t start_time = lv_tick_get();
    while (lv_display_get_next(NULL)) {
        // Auto-quit timeout
        if (args.timeout_sec > 0 &&
            lv_tick_elaps(start_time) >= static_cast<uint32_t>(args.timeout_sec) * 1000U) {
            spdlog::info("[Demo] Timeout reached ({} seconds)", args.timeout_sec);
            break;
        }

        lv_timer_handler();
        SDL_Delay(5);
    }

    config->set<json>("/state/seek_arc", arc->save_state());
    if (!config->save()) {
        spdlog::warn("[Demo] State not saved");
    }

    arc->set_listener(nullptr);
    lv_deinit();
    spdlog::info("[Demo] Exiting");
    return 0;
}
