// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file engine_config.h
 * @brief Construction parameters for SnakeEngine
 *
 * Defaults are the tuning values the game shipped with. They are plain
 * configuration, not fixed behavior.
 */

#pragma once

#include "board_geometry.h"
#include "snake_types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace gridsnake {

/**
 * @brief Raised when engine parameters contradict each other
 *
 * The only error the engine ever surfaces. Thrown at construction time.
 */
class ConfigError : public std::invalid_argument {
  public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

struct EngineConfig {
    // Playfield
    int pixel_width = 1280;
    int pixel_height = 720;
    Margins margins;
    int cell_size = 26;

    // Food
    int food_size_cells = 3;
    int growth_per_food = 2;

    // Timing
    Millis tick_interval{120};
    Millis signal_loss_window{600};
    int max_catch_up_steps = 3;
    Millis eat_flash_duration{350};

    // Input
    double deadzone_fraction = 0.55; // of cell_size

    // 0 = seed from std::random_device
    uint32_t rng_seed = 0;

    /// Deadzone in pixels
    double deadzone_px() const {
        return deadzone_fraction * cell_size;
    }
};

/**
 * @brief Reject contradictory parameters
 *
 * @throws ConfigError naming the offending field and value
 */
void validate(const EngineConfig& config);

/**
 * @brief Read an engine section, keeping defaults for absent keys
 *
 * Keys mirror EngineConfig field names. Durations are milliseconds, margins
 * an object {left, right, top, bottom}. Does not call validate().
 *
 * @throws ConfigError if a present key has the wrong JSON type
 */
EngineConfig engine_config_from_json(const json& section);

/// Write an engine section in the shape engine_config_from_json() reads
json engine_config_to_json(const EngineConfig& config);

} // namespace gridsnake
