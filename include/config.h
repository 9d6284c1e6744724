// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __GRIDSNAKE_CONFIG_H__
#define __GRIDSNAKE_CONFIG_H__

#include "spdlog/spdlog.h"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

namespace gridsnake {

/**
 * @brief Application configuration file (singleton)
 *
 * Loads and manages configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialize once at startup and access from
 * the driving loop only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/gridsnake.json");
 *
 * // Get with default fallback
 * int cell = cfg->get<int>("/engine/cell_size", 26);
 *
 * // Set and save
 * cfg->set<int>("/scores/high_score", 12);
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
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, filling in any missing sections with defaults.
     * Creates the file with defaults if it doesn't exist. A file that fails
     * to parse is moved to `<path>.corrupt` and replaced with defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * another type (a hand-edited file, for example).
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Ignoring {} with unexpected type, using default: {}", json_ptr,
                         e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist. In-memory only until
     * save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get JSON sub-object at path (mutable)
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file (pretty-printed)
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    /// Path of the loaded configuration file
    std::string get_path();

    /// Default document written for a new config file
    static json get_default_config();

    static Config* get_instance();
};

} // namespace gridsnake

#endif // __GRIDSNAKE_CONFIG_H__
