// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __ARCSEEK_CONFIG_H__
#define __ARCSEEK_CONFIG_H__

#include <nlohmann/json.hpp>

#include <string>

namespace arcseek {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Layout:
 * ```json
 * {
 *   "log_level": "info",
 *   "log_dest": "auto",
 *   "log_file": "",
 *   "display": { "width": 480, "height": 480 },
 *   "seek_arc": { ...SeekArcConfig... },
 *   "state": { "seek_arc": { "progress_angle": 0 } }
 * }
 * ```
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/arcseek.json");
 *
 * // Get with default fallback
 * int width = cfg->get<int>("/display/width", 480);
 *
 * // Set and save
 * cfg->set<std::string>("/log_level", "debug");
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    static constexpr int DEFAULT_DISPLAY_WIDTH = 480;
    static constexpr int DEFAULT_DISPLAY_HEIGHT = 480;

    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file and fills in any missing sections with defaults.
     * Creates the file if it doesn't exist. A file that fails to parse is
     * logged and replaced by defaults in memory (it is not overwritten until
     * save() is called).
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/display/width")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found or of the wrong type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value that
     * can't be converted to T.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/display/width")
     * @param default_value Fallback value
     * @return Configuration value or default_value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr) || data[ptr].is_null()) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception&) {
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     *
     * @return The value that was set
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Get JSON sub-object at path
     *
     * Returns mutable reference to JSON object for complex operations.
     * A missing path is created as null.
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Writes in-memory config to disk with pretty formatting.
     *
     * @return true on success, false (logged) if the file couldn't be written
     */
    bool save();

    /**
     * @brief Get configuration file path
     */
    std::string get_path();

    /**
     * @brief Default configuration document
     */
    static json default_config();

    /**
     * @brief Get singleton instance
     */
    static Config* get_instance();
};

} // namespace arcseek

#endif // __ARCSEEK_CONFIG_H__
