// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "engine_config.h"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>
// C++17 filesystem - use std::filesystem if available, fall back to experimental
#if __cplusplus >= 201703L && __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

namespace gridsnake {

Config* Config::instance{NULL};

namespace {

constexpr int CURRENT_CONFIG_VERSION = 1;

/// Fill in sections a hand-edited or older file may be missing
/// @return true if anything was added
bool ensure_default_sections(json& data) {
    bool modified = false;
    json defaults = Config::get_default_config();

    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            spdlog::info("[Config] Adding missing section '{}' with defaults", it.key());
            data[it.key()] = it.value();
            modified = true;
        }
    }

    // Engine keys added after a file was written get their defaults too
    json& engine = data["engine"];
    if (engine.is_object()) {
        const json& engine_defaults = defaults["engine"];
        for (auto it = engine_defaults.begin(); it != engine_defaults.end(); ++it) {
            if (!engine.contains(it.key())) {
                spdlog::debug("[Config] Adding missing /engine/{}", it.key());
                engine[it.key()] = it.value();
                modified = true;
            }
        }
    }

    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    return {{"config_version", CURRENT_CONFIG_VERSION},
            {"log_level", "warn"},
            {"log_dest", "auto"},
            {"log_path", ""},
            {"engine", engine_config_to_json(EngineConfig{})},
            {"scores", {{"high_score", 0}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt - resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Top level of {} is not an object - resetting to defaults",
                         config_path);
            data = get_default_config();
            config_modified = true;
        }

        if (ensure_default_sections(data)) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);

        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }

        data = get_default_config();
        config_modified = true;
    }

    if (config_modified) {
        if (save()) {
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        }
    }
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

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
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace gridsnake
