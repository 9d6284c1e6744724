// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file snake_state.h
 * @brief Snake body, direction, growth and collision
 *
 * The body is kept twice: a deque for order (head first, tail last) and a hash
 * set for O(1) membership. Both are updated together on every insert/remove.
 *
 * @threading Not synchronized. Owned by a single SnakeEngine.
 */

#pragma once

#include "board_geometry.h"
#include "food_manager.h"
#include "snake_types.h"

#include <cstdint>
#include <deque>
#include <vector>

namespace gridsnake {

/// Length of a freshly reset snake
constexpr int INITIAL_SNAKE_LENGTH = 3;

/**
 * @brief Result of one logical tick
 */
enum class StepOutcome { Moved, AteFood, Collided };

/// Name of a step outcome for logging
const char* step_outcome_name(StepOutcome outcome);

/**
 * @class SnakeState
 * @brief The mutable simulation subject
 */
class SnakeState {
  public:
    SnakeState() = default;

    /**
     * @brief Fresh snake at the board center facing right
     *
     * Body is [(cx,cy), (cx-1,cy), (cx-2,cy)]. Clears score, growth, pause
     * and game over.
     */
    void reset(const Board& board);

    /**
     * @brief Replace the body and direction (head first)
     *
     * Used by reset() and by tests that need a specific starting layout.
     * Clears score, growth, pause and game over.
     */
    void reset_to(const std::vector<GridCell>& body, const Direction& direction);

    /**
     * @brief Buffer a direction for the next tick
     *
     * Anti-reversal is enforced here, at assignment: a direction that is the
     * exact negation of the current direction is refused.
     *
     * @return true if the pending direction was updated
     */
    bool set_pending_direction(const Direction& direction);

    /**
     * @brief Advance one logical tick
     *
     * Adopts the pending direction and moves the head. Leaving the board or
     * hitting the body ends the game with the body left untouched. Eating
     * awards one point and growth_per_food credits, then respawns the food.
     * The tail is kept while credits held before this tick remain, so a food
     * item never grows the snake on the tick it is eaten.
     *
     * Once over, further calls return Collided without changing anything.
     */
    StepOutcome step(const Board& board, FoodManager& food, int growth_per_food);

    const std::deque<GridCell>& body() const {
        return body_;
    }
    const CellSet& occupied() const {
        return occupied_;
    }
    const GridCell& head() const {
        return body_.front();
    }
    size_t length() const {
        return body_.size();
    }

    const Direction& current_direction() const {
        return current_;
    }
    const Direction& pending_direction() const {
        return pending_;
    }

    int grow_credits() const {
        return grow_credits_;
    }
    uint32_t score() const {
        return score_;
    }

    bool is_over() const {
        return over_;
    }
    bool is_paused() const {
        return paused_;
    }
    void set_paused(bool paused) {
        paused_ = paused;
    }

  private:
    void push_head(const GridCell& cell);
    void pop_tail();

    std::deque<GridCell> body_;
    CellSet occupied_;
    Direction current_ = Direction::right();
    Direction pending_ = Direction::right();
    int grow_credits_ = 0;
    uint32_t score_ = 0;
    bool over_ = false;
    bool paused_ = false;
};

} // namespace gridsnake
