// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snake_state.h"

#include <spdlog/spdlog.h>

namespace gridsnake {

const char* step_outcome_name(StepOutcome outcome) {
    switch (outcome) {
    case StepOutcome::Moved:
        return "moved";
    case StepOutcome::AteFood:
        return "ate_food";
    case StepOutcome::Collided:
        return "collided";
    }
    return "unknown";
}

void SnakeState::reset(const Board& board) {
    GridCell center = board.center_cell();
    std::vector<GridCell> body;
    for (int i = 0; i < INITIAL_SNAKE_LENGTH; i++) {
        body.push_back({center.col - i, center.row});
    }
    reset_to(body, Direction::right());
}

void SnakeState::reset_to(const std::vector<GridCell>& body, const Direction& direction) {
    body_.clear();
    occupied_.clear();
    for (const auto& cell : body) {
        body_.push_back(cell);
        occupied_.insert(cell);
    }
    current_ = direction;
    pending_ = direction;
    grow_credits_ = 0;
    score_ = 0;
    over_ = false;
    paused_ = false;
}

bool SnakeState::set_pending_direction(const Direction& direction) {
    if (direction.is_opposite_of(current_)) {
        return false;
    }
    if (direction != pending_) {
        spdlog::trace("[SnakeState] Pending direction ({},{}) -> ({},{})", pending_.dx, pending_.dy,
                      direction.dx, direction.dy);
    }
    pending_ = direction;
    return true;
}

void SnakeState::push_head(const GridCell& cell) {
    body_.push_front(cell);
    occupied_.insert(cell);
}

void SnakeState::pop_tail() {
    occupied_.erase(body_.back());
    body_.pop_back();
}

StepOutcome SnakeState::step(const Board& board, FoodManager& food, int growth_per_food) {
    if (over_) {
        return StepOutcome::Collided;
    }

    current_ = pending_;
    GridCell new_head = head() + current_;

    if (!board.contains(new_head)) {
        over_ = true;
        spdlog::info("[SnakeState] Hit the wall at ({}, {}) - game over, score {}", new_head.col,
                     new_head.row, score_);
        return StepOutcome::Collided;
    }
    if (occupied_.count(new_head) != 0) {
        over_ = true;
        spdlog::info("[SnakeState] Hit own body at ({}, {}) - game over, score {}", new_head.col,
                     new_head.row, score_);
        return StepOutcome::Collided;
    }

    push_head(new_head);
    bool ate = food.food().covers(new_head);

    // Credits are spent before this tick's award so eating never grows on the same tick
    if (grow_credits_ > 0) {
        grow_credits_--;
    } else {
        pop_tail();
    }

    if (!ate) {
        return StepOutcome::Moved;
    }

    score_++;
    grow_credits_ += growth_per_food;
    food.respawn(board, occupied_);
    spdlog::debug("[SnakeState] Ate food at ({}, {}), score {}, credits {}", new_head.col,
                  new_head.row, score_, grow_credits_);
    return StepOutcome::AteFood;
}

} // namespace gridsnake
