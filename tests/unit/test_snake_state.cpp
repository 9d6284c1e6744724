// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snake_state.h"

#include "../test_helpers/snake_engine_test_access.h"

#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

using namespace gridsnake;

namespace {

constexpr int GROWTH = 2;

/// 20x15 grid
Board scenario_board() {
    return build_board(660, 680, Margins{}, 26);
}

/// Food parked in the top-left corner, away from every path below
FoodManager parked_food() {
    FoodManager food(3, 42);
    SnakeEngineTestAccess::set_food(food, {0, 0});
    return food;
}

std::vector<GridCell> body_of(const SnakeState& snake) {
    return {snake.body().begin(), snake.body().end()};
}

} // namespace

// ============================================================================
// reset
// ============================================================================

TEST_CASE("SnakeState: reset lays out a short snake facing right", "[game][snake]") {
    Board board = scenario_board();
    SnakeState snake;
    snake.reset(board);

    REQUIRE(snake.length() == static_cast<size_t>(INITIAL_SNAKE_LENGTH));
    REQUIRE(body_of(snake) == std::vector<GridCell>{{10, 7}, {9, 7}, {8, 7}});
    REQUIRE(snake.current_direction() == Direction::right());
    REQUIRE(snake.pending_direction() == Direction::right());
    REQUIRE(snake.score() == 0);
    REQUIRE(snake.grow_credits() == 0);
    REQUIRE_FALSE(snake.is_over());
    REQUIRE_FALSE(snake.is_paused());
    REQUIRE(snake.occupied().size() == snake.length());
}

// ============================================================================
// Direction changes
// ============================================================================

TEST_CASE("SnakeState: set_pending_direction refuses reversal", "[game][snake]") {
    SnakeState snake;
    snake.reset(scenario_board());

    REQUIRE_FALSE(snake.set_pending_direction(Direction::left()));
    REQUIRE(snake.pending_direction() == Direction::right());

    REQUIRE(snake.set_pending_direction(Direction::up()));
    REQUIRE(snake.pending_direction() == Direction::up());

    // Reversal is judged against the committed direction, not the pending one
    REQUIRE(snake.set_pending_direction(Direction::down()));
    REQUIRE(snake.pending_direction() == Direction::down());
}

// ============================================================================
// step()
// ============================================================================

TEST_CASE("SnakeState: plain step moves without growing", "[game][snake]") {
    Board board = scenario_board();
    FoodManager food = parked_food();
    SnakeState snake;
    snake.reset(board);

    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Moved);
    REQUIRE(body_of(snake) == std::vector<GridCell>{{11, 7}, {10, 7}, {9, 7}});
    REQUIRE(snake.occupied().count({8, 7}) == 0);

    snake.set_pending_direction({1, 1});
    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Moved);
    REQUIRE(snake.head() == GridCell{12, 8});
    REQUIRE(snake.current_direction() == Direction{1, 1});
}

TEST_CASE("SnakeState: eating grows over the following ticks", "[game][snake]") {
    Board board = scenario_board();
    FoodManager food(3, 42);
    SnakeEngineTestAccess::set_food(food, {11, 6});

    SnakeState snake;
    snake.reset(board);

    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::AteFood);
    REQUIRE(snake.head() == GridCell{11, 7});
    REQUIRE(snake.length() == 3);
    REQUIRE(snake.score() == 1);
    REQUIRE(snake.grow_credits() == GROWTH);

    // Keep the new food off the path along row 7
    SnakeEngineTestAccess::set_food(food, {0, 0});

    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Moved);
    REQUIRE(snake.length() == 4);
    REQUIRE(snake.grow_credits() == 1);

    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Moved);
    REQUIRE(snake.length() == 5);
    REQUIRE(snake.grow_credits() == 0);

    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Moved);
    REQUIRE(snake.length() == 5);
    REQUIRE(snake.occupied().size() == 5);
}

TEST_CASE("SnakeState: eating respawns food off the body", "[game][snake]") {
    Board board = scenario_board();
    FoodManager food(3, 42);
    SnakeEngineTestAccess::set_food(food, {11, 6});

    SnakeState snake;
    snake.reset(board);
    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::AteFood);

    for (const auto& cell : snake.body()) {
        REQUIRE_FALSE(food.food().covers(cell));
    }
}

TEST_CASE("SnakeState: wall collision ends the game", "[game][snake]") {
    Board board = scenario_board();
    FoodManager food = parked_food();
    SnakeState snake;
    std::vector<GridCell> body{{19, 7}, {18, 7}, {17, 7}};
    snake.reset_to(body, Direction::right());

    REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Collided);
    REQUIRE(snake.is_over());
    REQUIRE(body_of(snake) == body);

    SECTION("further steps do nothing") {
        REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Collided);
        REQUIRE(body_of(snake) == body);
    }
}

TEST_CASE("SnakeState: self collision ends the game", "[game][snake]") {
    Board board = scenario_board();
    FoodManager food = parked_food();
    SnakeState snake;

    SECTION("running into the body") {
        std::vector<GridCell> body{{5, 5}, {6, 5}, {6, 6}, {5, 6}, {4, 6}};
        snake.reset_to(body, Direction::down());

        REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Collided);
        REQUIRE(snake.is_over());
        REQUIRE(body_of(snake) == body);
    }

    SECTION("the tail cell counts as occupied") {
        std::vector<GridCell> body{{5, 5}, {5, 4}, {6, 4}, {6, 5}};
        snake.reset_to(body, Direction::right());

        REQUIRE(snake.step(board, food, GROWTH) == StepOutcome::Collided);
        REQUIRE(snake.is_over());
    }
}

TEST_CASE("step_outcome_name", "[game][snake]") {
    REQUIRE(std::string(step_outcome_name(StepOutcome::Moved)) == "moved");
    REQUIRE(std::string(step_outcome_name(StepOutcome::AteFood)) == "ate_food");
    REQUIRE(std::string(step_outcome_name(StepOutcome::Collided)) == "collided");
}
