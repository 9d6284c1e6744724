// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "board_geometry.h"

#include <catch2/catch_all.hpp>

using namespace gridsnake;

// ============================================================================
// build_board() grid sizing
// ============================================================================

TEST_CASE("build_board: default frame", "[game][board]") {
    Board board = build_board(1280, 720, Margins{}, 26);

    // 1140x430 usable pixels
    REQUIRE(board.grid_w() == 43);
    REQUIRE(board.grid_h() == 16);
    REQUIRE(board.cell_size() == 26);
}

TEST_CASE("build_board: exact fit has no slack", "[game][board]") {
    Board board = build_board(660, 680, Margins{}, 26);

    REQUIRE(board.grid_w() == 20);
    REQUIRE(board.grid_h() == 15);
    REQUIRE(board.origin().x == 70.0);
    REQUIRE(board.origin().y == 70.0);
}

TEST_CASE("build_board: tiny frames clamp to the minimum grid", "[game][board]") {
    SECTION("frame smaller than the margins") {
        Board board = build_board(100, 100, Margins{}, 26);
        REQUIRE(board.grid_w() == MIN_GRID_CELLS);
        REQUIRE(board.grid_h() == MIN_GRID_CELLS);
    }

    SECTION("only one axis too small") {
        Board board = build_board(1280, 400, Margins{}, 26);
        REQUIRE(board.grid_w() == 43);
        REQUIRE(board.grid_h() == MIN_GRID_CELLS);
    }

    SECTION("clamped board is pinned to the top-left margin") {
        Board board = build_board(100, 100, Margins{}, 26);
        REQUIRE(board.origin().x == 70.0);
        REQUIRE(board.origin().y == 70.0);
    }
}

// ============================================================================
// Board pixel mapping
// ============================================================================

TEST_CASE("Board: origin centers the grid in the usable area", "[game][board]") {
    // 540px usable width holds 20 cells (520px), 10px on each side
    Board board = build_board(680, 680, Margins{}, 26);

    REQUIRE(board.grid_w() == 20);
    REQUIRE(board.origin().x == 80.0);
}

TEST_CASE("Board: cell_center", "[game][board]") {
    Board board = build_board(660, 680, Margins{}, 26);

    PixelPoint c = board.cell_center({0, 0});
    REQUIRE(c.x == 83.0);
    REQUIRE(c.y == 83.0);

    c = board.cell_center({10, 7});
    REQUIRE(c.x == 343.0);
    REQUIRE(c.y == 265.0);
}

TEST_CASE("Board: contains", "[game][board]") {
    Board board = build_board(660, 680, Margins{}, 26);

    REQUIRE(board.contains({0, 0}));
    REQUIRE(board.contains({19, 14}));
    REQUIRE_FALSE(board.contains({20, 0}));
    REQUIRE_FALSE(board.contains({0, 15}));
    REQUIRE_FALSE(board.contains({-1, 3}));
    REQUIRE_FALSE(board.contains({3, -1}));
}

TEST_CASE("Board: center_cell", "[game][board]") {
    REQUIRE(build_board(660, 680, Margins{}, 26).center_cell() == GridCell{10, 7});
    REQUIRE(build_board(80, 80, Margins{0, 0, 0, 0}, 10).center_cell() == GridCell{4, 4});
}
