// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "engine_config.h"

#include <spdlog/spdlog.h>

#include <limits>

namespace gridsnake {

namespace {

[[noreturn]] void reject(const std::string& field, const std::string& value,
                         const std::string& rule) {
    std::string msg = "invalid engine config: " + field + " = " + value + " (" + rule + ")";
    spdlog::error("[EngineConfig] {}", msg);
    throw ConfigError(msg);
}

template <typename T> void read_key(const json& section, const char* key, T& out) {
    if (!section.contains(key)) {
        return;
    }
    try {
        out = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid engine config: ") + key + ": " + e.what());
    }
}

void read_millis(const json& section, const char* key, Millis& out) {
    long long ms = out.count();
    read_key(section, key, ms);
    out = Millis(ms);
}

} // namespace

void validate(const EngineConfig& config) {
    if (config.cell_size <= 0) {
        reject("cell_size", std::to_string(config.cell_size), "must be positive");
    }
    if (config.pixel_width <= 0) {
        reject("pixel_width", std::to_string(config.pixel_width), "must be positive");
    }
    if (config.pixel_height <= 0) {
        reject("pixel_height", std::to_string(config.pixel_height), "must be positive");
    }

    const Margins& m = config.margins;
    if (m.left < 0 || m.right < 0 || m.top < 0 || m.bottom < 0) {
        reject("margins",
               std::to_string(m.left) + "," + std::to_string(m.right) + "," +
                   std::to_string(m.top) + "," + std::to_string(m.bottom),
               "must not be negative");
    }

    if (config.food_size_cells < 1 || config.food_size_cells > MIN_GRID_CELLS) {
        reject("food_size_cells", std::to_string(config.food_size_cells),
               "must be 1-" + std::to_string(MIN_GRID_CELLS));
    }
    if (config.growth_per_food < 0) {
        reject("growth_per_food", std::to_string(config.growth_per_food), "must not be negative");
    }
    if (config.tick_interval.count() <= 0) {
        reject("tick_interval_ms", std::to_string(config.tick_interval.count()),
               "must be positive");
    }
    if (config.signal_loss_window.count() < 0) {
        reject("signal_loss_window_ms", std::to_string(config.signal_loss_window.count()),
               "must not be negative");
    }
    if (config.max_catch_up_steps < 1) {
        reject("max_catch_up_steps", std::to_string(config.max_catch_up_steps),
               "must be at least 1");
    }
    if (config.eat_flash_duration.count() < 0) {
        reject("eat_flash_ms", std::to_string(config.eat_flash_duration.count()),
               "must not be negative");
    }
    if (!(config.deadzone_fraction >= 0.0)) {
        reject("deadzone_fraction", std::to_string(config.deadzone_fraction),
               "must not be negative");
    }
}

EngineConfig engine_config_from_json(const json& section) {
    EngineConfig config;
    if (!section.is_object()) {
        if (!section.is_null()) {
            throw ConfigError("invalid engine config: section must be an object");
        }
        return config;
    }

    read_key(section, "pixel_width", config.pixel_width);
    read_key(section, "pixel_height", config.pixel_height);
    read_key(section, "cell_size", config.cell_size);
    read_key(section, "food_size_cells", config.food_size_cells);
    read_key(section, "growth_per_food", config.growth_per_food);
    read_key(section, "max_catch_up_steps", config.max_catch_up_steps);
    read_key(section, "deadzone_fraction", config.deadzone_fraction);

    // Read wide so a negative seed is rejected instead of wrapping
    long long seed = config.rng_seed;
    read_key(section, "rng_seed", seed);
    if (seed < 0 || seed > static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
        reject("rng_seed", std::to_string(seed), "must be 0-4294967295");
    }
    config.rng_seed = static_cast<uint32_t>(seed);

    read_millis(section, "tick_interval_ms", config.tick_interval);
    read_millis(section, "signal_loss_window_ms", config.signal_loss_window);
    read_millis(section, "eat_flash_ms", config.eat_flash_duration);

    if (section.contains("margins")) {
        const json& margins = section.at("margins");
        if (!margins.is_object()) {
            throw ConfigError("invalid engine config: margins must be an object");
        }
        read_key(margins, "left", config.margins.left);
        read_key(margins, "right", config.margins.right);
        read_key(margins, "top", config.margins.top);
        read_key(margins, "bottom", config.margins.bottom);
    }

    return config;
}

json engine_config_to_json(const EngineConfig& config) {
    return {{"pixel_width", config.pixel_width},
            {"pixel_height", config.pixel_height},
            {"margins",
             {{"left", config.margins.left},
              {"right", config.margins.right},
              {"top", config.margins.top},
              {"bottom", config.margins.bottom}}},
            {"cell_size", config.cell_size},
            {"food_size_cells", config.food_size_cells},
            {"growth_per_food", config.growth_per_food},
            {"tick_interval_ms", config.tick_interval.count()},
            {"signal_loss_window_ms", config.signal_loss_window.count()},
            {"max_catch_up_steps", config.max_catch_up_steps},
            {"eat_flash_ms", config.eat_flash_duration.count()},
            {"deadzone_fraction", config.deadzone_fraction},
            {"rng_seed", config.rng_seed}};
}

} // namespace gridsnake
