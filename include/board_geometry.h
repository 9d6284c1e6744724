// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file board_geometry.h
 * @brief Fixed-size logical grid derived from a pixel-area budget
 *
 * The bottom margin is deliberately larger than the others so that the hand
 * tracking region at the bottom of the camera frame does not cover the board.
 */

#pragma once

#include "snake_types.h"

namespace gridsnake {

/// Smallest grid dimension the engine will build; smaller requests are clamped up
constexpr int MIN_GRID_CELLS = 8;

/**
 * @brief Pixel margins around the playfield
 */
struct Margins {
    int left = 70;
    int right = 70;
    int top = 70;
    int bottom = 220; // 70 + 150 reserved for the hand
};

/**
 * @class Board
 * @brief Immutable grid description plus its pixel mapping
 */
class Board {
  public:
    Board(int pixel_width, int pixel_height, const Margins& margins, int cell_size, int grid_w,
          int grid_h);

    int grid_w() const {
        return grid_w_;
    }
    int grid_h() const {
        return grid_h_;
    }
    int cell_size() const {
        return cell_size_;
    }
    const Margins& margins() const {
        return margins_;
    }
    int pixel_width() const {
        return pixel_width_;
    }
    int pixel_height() const {
        return pixel_height_;
    }

    /// True if the cell lies inside the grid
    bool contains(const GridCell& cell) const {
        return cell.col >= 0 && cell.row >= 0 && cell.col < grid_w_ && cell.row < grid_h_;
    }

    /**
     * @brief Pixel position of the grid's top-left corner
     *
     * The grid is centered inside the usable area (frame minus margins).
     */
    PixelPoint origin() const;

    /// Pixel center of a grid cell (integer pixels, like the renderer uses)
    PixelPoint cell_center(const GridCell& cell) const;

    /// Geometric center cell of the grid
    GridCell center_cell() const {
        return {grid_w_ / 2, grid_h_ / 2};
    }

  private:
    int pixel_width_;
    int pixel_height_;
    Margins margins_;
    int cell_size_;
    int grid_w_;
    int grid_h_;
};

/**
 * @brief Build a board from the playfield size, margins and cell size
 *
 * Usable area is the frame minus margins (at least 1px each way), divided by
 * cell_size and floored, then clamped to MIN_GRID_CELLS per dimension. Never
 * fails; cell_size must already be validated as positive.
 */
Board build_board(int pixel_width, int pixel_height, const Margins& margins, int cell_size);

} // namespace gridsnake
