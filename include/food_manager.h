// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file food_manager.h
 * @brief Food block ownership and random placement away from the snake
 *
 * Food is a size_cells x size_cells square. Placement picks uniformly among
 * every top-left position whose block does not touch the snake body. When no
 * such position exists the block falls back to the grid center, overlapping
 * the body, rather than failing.
 */

#pragma once

#include "board_geometry.h"
#include "snake_types.h"

#include <cstdint>
#include <random>

namespace gridsnake {

/**
 * @brief Occupied food region
 */
struct FoodState {
    GridCell top_left;
    int size_cells = 3;

    /// True if the cell lies inside the food block
    bool covers(const GridCell& cell) const {
        return cell.col >= top_left.col && cell.col < top_left.col + size_cells &&
               cell.row >= top_left.row && cell.row < top_left.row + size_cells;
    }
};

/**
 * @brief Top-left of the centered fallback block used when no free spot exists
 */
GridCell food_fallback_position(const Board& board, int size_cells);

/**
 * @brief Choose a food top-left uniformly among blocks free of the snake
 *
 * @param board Grid bounds
 * @param occupied Snake body cells
 * @param size_cells Food block edge length in cells
 * @param rng Random source
 * @return Chosen top-left, or food_fallback_position() when the board is full
 */
GridCell place_food(const Board& board, const CellSet& occupied, int size_cells,
                    std::mt19937& rng);

/**
 * @class FoodManager
 * @brief Owns the current food block and the placement RNG
 */
class FoodManager {
  public:
    /**
     * @param size_cells Food block edge length, already validated to fit the grid
     * @param seed RNG seed; 0 seeds from std::random_device
     */
    FoodManager(int size_cells, uint32_t seed);

    /// Place a new food block and return its top-left
    GridCell respawn(const Board& board, const CellSet& occupied);

    const FoodState& food() const {
        return food_;
    }

    /// Number of respawns that had to use the center fallback
    int fallback_count() const {
        return fallback_count_;
    }

  private:
    friend class SnakeEngineTestAccess;

    FoodState food_;
    std::mt19937 rng_;
    int fallback_count_ = 0;
};

} // namespace gridsnake
