// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ascii_renderer.h"

#include <vector>

namespace gridsnake {

std::string render_ascii(const RenderableState& state) {
    const int w = state.grid_w;
    const int h = state.grid_h;
    if (w <= 0 || h <= 0) {
        return {};
    }

    std::vector<std::string> rows(static_cast<size_t>(h), std::string(static_cast<size_t>(w), '.'));
    auto put = [&](int col, int row, char c) {
        if (col >= 0 && row >= 0 && col < w && row < h) {
            rows[static_cast<size_t>(row)][static_cast<size_t>(col)] = c;
        }
    };

    for (int dc = 0; dc < state.food_size; dc++) {
        for (int dr = 0; dr < state.food_size; dr++) {
            put(state.food_top_left.col + dc, state.food_top_left.row + dr, '*');
        }
    }

    // Tail to head so the head glyph always wins
    for (size_t i = state.body.size(); i-- > 0;) {
        const GridCell& cell = state.body[i];
        bool in_food = cell.col >= 0 && cell.row >= 0 && cell.col < w && cell.row < h &&
                       rows[static_cast<size_t>(cell.row)][static_cast<size_t>(cell.col)] == '*';
        put(cell.col, cell.row, i == 0 ? '@' : (in_food ? '#' : 'o'));
    }

    std::string out;
    std::string border = "+" + std::string(static_cast<size_t>(w), '-') + "+\n";
    out += border;
    for (const auto& row : rows) {
        out += "|" + row + "|\n";
    }
    out += border;

    out += "Score: " + std::to_string(state.score);
    if (state.is_over) {
        out += "  GAME OVER";
    } else if (state.is_paused) {
        out += "  PAUSED";
    }
    out += "\n";
    return out;
}

} // namespace gridsnake
