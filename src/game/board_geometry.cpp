// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "board_geometry.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gridsnake {

Board::Board(int pixel_width, int pixel_height, const Margins& margins, int cell_size, int grid_w,
             int grid_h)
    : pixel_width_(pixel_width), pixel_height_(pixel_height), margins_(margins),
      cell_size_(cell_size), grid_w_(grid_w), grid_h_(grid_h) {}

PixelPoint Board::origin() const {
    int usable_w = pixel_width_ - margins_.left - margins_.right;
    int usable_h = pixel_height_ - margins_.top - margins_.bottom;

    int board_w = grid_w_ * cell_size_;
    int board_h = grid_h_ * cell_size_;

    // Clamped boards can be larger than the usable area; pin them to the margin
    int ox = margins_.left + std::max(0, (usable_w - board_w) / 2);
    int oy = margins_.top + std::max(0, (usable_h - board_h) / 2);
    return {static_cast<double>(ox), static_cast<double>(oy)};
}

PixelPoint Board::cell_center(const GridCell& cell) const {
    PixelPoint o = origin();
    int half = cell_size_ / 2;
    return {o.x + cell.col * cell_size_ + half, o.y + cell.row * cell_size_ + half};
}

Board build_board(int pixel_width, int pixel_height, const Margins& margins, int cell_size) {
    int usable_w = std::max(1, pixel_width - margins.left - margins.right);
    int usable_h = std::max(1, pixel_height - margins.top - margins.bottom);

    int raw_w = usable_w / cell_size;
    int raw_h = usable_h / cell_size;

    int grid_w = std::max(MIN_GRID_CELLS, raw_w);
    int grid_h = std::max(MIN_GRID_CELLS, raw_h);

    if (grid_w != raw_w || grid_h != raw_h) {
        spdlog::warn("[BoardGeometry] Usable area {}x{}px fits {}x{} cells, clamped to {}x{}",
                     usable_w, usable_h, raw_w, raw_h, grid_w, grid_h);
    }
    spdlog::debug("[BoardGeometry] Grid: {}x{} cells of {}px", grid_w, grid_h, cell_size);

    return Board(pixel_width, pixel_height, margins, cell_size, grid_w, grid_h);
}

} // namespace gridsnake
