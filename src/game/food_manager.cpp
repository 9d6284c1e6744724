// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "food_manager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace gridsnake {

namespace {

bool block_is_free(const GridCell& top_left, int size_cells, const CellSet& occupied) {
    for (int dc = 0; dc < size_cells; dc++) {
        for (int dr = 0; dr < size_cells; dr++) {
            if (occupied.count({top_left.col + dc, top_left.row + dr}) != 0) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

GridCell food_fallback_position(const Board& board, int size_cells) {
    return {std::max(0, (board.grid_w() - size_cells) / 2),
            std::max(0, (board.grid_h() - size_cells) / 2)};
}

GridCell place_food(const Board& board, const CellSet& occupied, int size_cells,
                    std::mt19937& rng) {
    std::vector<GridCell> candidates;
    for (int col = 0; col <= board.grid_w() - size_cells; col++) {
        for (int row = 0; row <= board.grid_h() - size_cells; row++) {
            GridCell top_left{col, row};
            if (block_is_free(top_left, size_cells, occupied)) {
                candidates.push_back(top_left);
            }
        }
    }

    if (candidates.empty()) {
        GridCell fallback = food_fallback_position(board, size_cells);
        spdlog::warn("[FoodManager] No free {}x{} block for food, using center ({}, {})",
                     size_cells, size_cells, fallback.col, fallback.row);
        return fallback;
    }

    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}

FoodManager::FoodManager(int size_cells, uint32_t seed) {
    food_.size_cells = size_cells;
    if (seed == 0) {
        std::random_device rd;
        rng_.seed(rd());
    } else {
        rng_.seed(seed);
    }
}

GridCell FoodManager::respawn(const Board& board, const CellSet& occupied) {
    GridCell top_left = place_food(board, occupied, food_.size_cells, rng_);
    if (top_left == food_fallback_position(board, food_.size_cells) &&
        !block_is_free(top_left, food_.size_cells, occupied)) {
        fallback_count_++;
    }
    food_.top_left = top_left;
    spdlog::trace("[FoodManager] Food at ({}, {})", top_left.col, top_left.row);
    return top_left;
}

} // namespace gridsnake
