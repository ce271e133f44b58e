// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "seek_arc_config.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace arcseek {

Config* Config::instance{NULL};

Config::Config() {}

Config* Config::get_instance() {
    if (instance == NULL) {
        instance = new Config();
    }
    return instance;
}

json Config::default_config() {
    return {{"log_level", "info"},
            {"log_dest", "auto"},
            {"log_file", ""},
            {"display", {{"width", DEFAULT_DISPLAY_WIDTH}, {"height", DEFAULT_DISPLAY_HEIGHT}}},
            {"seek_arc", SeekArcConfig{}.to_json()},
            {"state", json::object()}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool write_back = true;

    if (stat(config_path.c_str(), &buffer) == 0) {
        // Load existing config
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
        } catch (const json::parse_error& e) {
            spdlog::warn("[Config] Failed to parse {}: {} - using defaults", config_path,
                         e.what());
            data = default_config();
            // Keep the broken file for the user to inspect
            write_back = false;
        }
    } else {
        // Create default config
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = default_config();
    }

    if (!data.is_object()) {
        spdlog::warn("[Config] {} is not a JSON object - using defaults", config_path);
        data = default_config();
        write_back = false;
    }

    // Fill in any missing top-level sections
    json defaults = default_config();
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key()) || data[it.key()].is_null()) {
            spdlog::debug("[Config] Adding missing section '{}'", it.key());
            data[it.key()] = it.value();
        }
    }

    if (write_back) {
        // Save updated config with any new defaults
        std::ofstream o(config_path);
        if (o.is_open()) {
            o << std::setw(2) << data << std::endl;
        } else {
            spdlog::warn("[Config] Could not write defaults to {}", config_path);
        }
    }

    spdlog::debug("[Config] Initialized: display={}x{}, log_level={}",
                  get<int>("/display/width", DEFAULT_DISPLAY_WIDTH),
                  get<int>("/display/height", DEFAULT_DISPLAY_HEIGHT),
                  get<std::string>("/log_level", "info"));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::debug("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::debug("[Config] Config saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace arcseek
