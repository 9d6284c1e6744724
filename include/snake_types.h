// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file snake_types.h
 * @brief Value types shared by the snake engine modules
 *
 * Grid cells, the 8 unit directions, and pixel-space points. All are plain
 * value types with no ownership implications.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <unordered_set>

namespace gridsnake {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

/**
 * @brief Integer grid coordinate (0-indexed column/row)
 */
struct GridCell {
    int col = 0;
    int row = 0;

    bool operator==(const GridCell& o) const {
        return col == o.col && row == o.row;
    }
    bool operator!=(const GridCell& o) const {
        return !(*this == o);
    }
};

/// Hash for GridCell membership sets
struct GridCellHash {
    std::size_t operator()(const GridCell& c) const {
        unsigned long long key =
            (static_cast<unsigned long long>(static_cast<unsigned int>(c.col)) << 32) |
            static_cast<unsigned int>(c.row);
        return std::hash<unsigned long long>()(key);
    }
};

/// Set-like membership mirror of an ordered cell sequence
using CellSet = std::unordered_set<GridCell, GridCellHash>;

/**
 * @brief One of the 8 unit movement vectors
 *
 * dx/dy are each in {-1, 0, 1} and never both zero for a valid direction.
 * "No change" is modelled as std::optional<Direction> being empty.
 */
struct Direction {
    int dx = 1;
    int dy = 0;

    static constexpr Direction up() { return {0, -1}; }
    static constexpr Direction down() { return {0, 1}; }
    static constexpr Direction left() { return {-1, 0}; }
    static constexpr Direction right() { return {1, 0}; }

    Direction negated() const {
        return {-dx, -dy};
    }
    bool is_opposite_of(const Direction& o) const {
        return dx == -o.dx && dy == -o.dy;
    }
    bool is_diagonal() const {
        return dx != 0 && dy != 0;
    }

    bool operator==(const Direction& o) const {
        return dx == o.dx && dy == o.dy;
    }
    bool operator!=(const Direction& o) const {
        return !(*this == o);
    }
};

/// Step a cell one unit along a direction
inline GridCell operator+(const GridCell& c, const Direction& d) {
    return {c.col + d.dx, c.row + d.dy};
}

/**
 * @brief Point in the playfield's pixel space (same space the board was built in)
 */
struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

} // namespace gridsnake
