// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ascii_renderer.h"

#include <catch2/catch_all.hpp>

using namespace gridsnake;

namespace {

RenderableState small_state() {
    RenderableState state;
    state.grid_w = 4;
    state.grid_h = 3;
    state.cell_size = 10;
    state.body = {{2, 1}, {1, 1}, {0, 1}};
    state.food_top_left = {3, 0};
    state.food_size = 1;
    state.score = 4;
    return state;
}

} // namespace

TEST_CASE("render_ascii: board, snake and food", "[replay][render]") {
    std::string expected = "+----+\n"
                           "|...*|\n"
                           "|oo@.|\n"
                           "|....|\n"
                           "+----+\n"
                           "Score: 4\n";
    REQUIRE(render_ascii(small_state()) == expected);
}

TEST_CASE("render_ascii: body overlapping food", "[replay][render]") {
    RenderableState state = small_state();
    state.food_top_left = {0, 0};
    state.food_size = 2;
    state.body = {{2, 1}, {1, 1}, {1, 2}};

    std::string expected = "+----+\n"
                           "|**..|\n"
                           "|*#@.|\n"
                           "|.o..|\n"
                           "+----+\n"
                           "Score: 4\n";
    REQUIRE(render_ascii(state) == expected);
}

TEST_CASE("render_ascii: status line", "[replay][render]") {
    RenderableState state = small_state();

    SECTION("paused") {
        state.is_paused = true;
        REQUIRE(render_ascii(state).find("Score: 4  PAUSED\n") != std::string::npos);
    }

    SECTION("game over wins over paused") {
        state.is_paused = true;
        state.is_over = true;
        REQUIRE(render_ascii(state).find("Score: 4  GAME OVER\n") != std::string::npos);
    }
}

TEST_CASE("render_ascii: empty board renders nothing", "[replay][render]") {
    RenderableState state;
    REQUIRE(render_ascii(state).empty());
}
