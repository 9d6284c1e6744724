// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file snake_engine.h
 * @brief Fixed-tick snake simulation driven by a continuous pointer
 *
 * The caller owns the loop: each poll calls update() with the current time
 * and the latest pointer sample (or none). The engine turns the pointer into
 * a pending direction, replays however many fixed logical ticks have elapsed
 * (bounded by max_catch_up_steps), and returns a snapshot for rendering.
 *
 * States: Active, Paused (pointer missing longer than the signal-loss window)
 * and Over (collision, terminal until reset()).
 *
 * @threading Not synchronized. Hand RenderableState copies to other threads,
 *            never the engine itself.
 */

#pragma once

#include "board_geometry.h"
#include "engine_config.h"
#include "food_manager.h"
#include "snake_state.h"
#include "snake_types.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace gridsnake {

/**
 * @brief Read-only frame description for an external renderer
 */
struct RenderableState {
    std::vector<GridCell> body; // head first
    GridCell food_top_left;
    int food_size = 0;
    uint32_t score = 0;
    bool is_over = false;
    bool is_paused = false;
    Direction direction;
    bool eat_flash = false;

    // Board description so the renderer needs nothing else
    int grid_w = 0;
    int grid_h = 0;
    int cell_size = 0;
    PixelPoint origin;
};

class SnakeEngine {
  public:
    /**
     * @brief Build the board and start a fresh game
     *
     * @throws ConfigError if the configuration is contradictory
     */
    explicit SnakeEngine(const EngineConfig& config);

    SnakeEngine(const SnakeEngine&) = delete;
    SnakeEngine& operator=(const SnakeEngine&) = delete;

    /**
     * @brief Start a new game
     *
     * Fresh 3-cell snake at the board center facing right, new food, score 0,
     * Active. The tick and signal clocks anchor on the next update().
     */
    void reset();

    /**
     * @brief Advance the simulation to `now`
     *
     * @param now Current time; expected to be non-decreasing between calls
     * @param pointer Pointer position, or std::nullopt when nothing was detected
     * @return Snapshot after the update. Never throws.
     */
    RenderableState update(TimePoint now, std::optional<PixelPoint> pointer);

    /// Current state without advancing anything
    RenderableState snapshot(TimePoint now) const;

    /// Pixel center of the snake head
    PixelPoint head_pixel_center() const;

    const Board& board() const {
        return board_;
    }
    const EngineConfig& config() const {
        return config_;
    }

  private:
    friend class SnakeEngineTestAccess;

    void handle_signal(TimePoint now, const std::optional<PixelPoint>& pointer);
    void advance_ticks(TimePoint now);

    EngineConfig config_;
    Board board_;
    SnakeState snake_;
    FoodManager food_;

    bool clock_anchored_ = false;
    TimePoint last_tick_at_{};
    TimePoint last_signal_at_{};
    TimePoint eat_flash_until_ = TimePoint::min();
};

} // namespace gridsnake
