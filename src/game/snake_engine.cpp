// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snake_engine.h"

#include "direction_controller.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gridsnake {

namespace {

/// Validate before anything is built from the config
Board make_board(const EngineConfig& config) {
    validate(config);
    return build_board(config.pixel_width, config.pixel_height, config.margins, config.cell_size);
}

} // namespace

SnakeEngine::SnakeEngine(const EngineConfig& config)
    : config_(config), board_(make_board(config)),
      food_(config.food_size_cells, config.rng_seed) {
    spdlog::info("[SnakeEngine] Created: grid {}x{}, tick {}ms, catch-up {}, deadzone {:.1f}px",
                 board_.grid_w(), board_.grid_h(), config_.tick_interval.count(),
                 config_.max_catch_up_steps, config_.deadzone_px());
    reset();
}

void SnakeEngine::reset() {
    snake_.reset(board_);
    food_.respawn(board_, snake_.occupied());
    clock_anchored_ = false;
    eat_flash_until_ = TimePoint::min();

    const GridCell& head = snake_.head();
    const GridCell& food = food_.food().top_left;
    spdlog::info("[SnakeEngine] New game: head ({}, {}), food ({}, {})", head.col, head.row,
                 food.col, food.row);
}

PixelPoint SnakeEngine::head_pixel_center() const {
    return board_.cell_center(snake_.head());
}

RenderableState SnakeEngine::update(TimePoint now, std::optional<PixelPoint> pointer) {
    if (!clock_anchored_) {
        last_tick_at_ = now;
        last_signal_at_ = now;
        clock_anchored_ = true;
    }

    if (snake_.is_over()) {
        return snapshot(now);
    }

    handle_signal(now, pointer);

    if (snake_.is_paused()) {
        // Nothing moves while paused
        last_tick_at_ = now;
        return snapshot(now);
    }

    advance_ticks(now);
    return snapshot(now);
}

void SnakeEngine::handle_signal(TimePoint now, const std::optional<PixelPoint>& pointer) {
    if (pointer) {
        last_signal_at_ = now;
        if (snake_.is_paused()) {
            spdlog::info("[SnakeEngine] Pointer reacquired - resuming");
            snake_.set_paused(false);
            last_tick_at_ = now;
        }

        auto dir = resolve_direction(head_pixel_center(), *pointer, snake_.current_direction(),
                                     config_.deadzone_px());
        if (dir) {
            snake_.set_pending_direction(*dir);
        }
        return;
    }

    if (!snake_.is_paused() && now - last_signal_at_ > config_.signal_loss_window) {
        spdlog::info("[SnakeEngine] Pointer lost for more than {}ms - paused",
                     config_.signal_loss_window.count());
        snake_.set_paused(true);
    }
}

void SnakeEngine::advance_ticks(TimePoint now) {
    if (now <= last_tick_at_) {
        return;
    }

    auto due = (now - last_tick_at_) / config_.tick_interval;
    if (due <= 0) {
        return;
    }

    auto steps = std::min<decltype(due)>(due, config_.max_catch_up_steps);
    if (due > steps) {
        spdlog::debug("[SnakeEngine] {} ticks due, applying {} now", due, steps);
    }

    // Advance by the applied ticks only, not to `now`, so the tick phase never drifts
    last_tick_at_ += steps * config_.tick_interval;

    for (decltype(steps) i = 0; i < steps; i++) {
        StepOutcome outcome = snake_.step(board_, food_, config_.growth_per_food);
        spdlog::trace("[SnakeEngine] Tick {}/{}: {}", i + 1, steps, step_outcome_name(outcome));

        if (outcome == StepOutcome::AteFood) {
            eat_flash_until_ = now + config_.eat_flash_duration;
        } else if (outcome == StepOutcome::Collided) {
            spdlog::info("[SnakeEngine] Game over! Score: {}", snake_.score());
            break;
        }
    }
}

RenderableState SnakeEngine::snapshot(TimePoint now) const {
    RenderableState state;
    state.body.assign(snake_.body().begin(), snake_.body().end());
    state.food_top_left = food_.food().top_left;
    state.food_size = food_.food().size_cells;
    state.score = snake_.score();
    state.is_over = snake_.is_over();
    state.is_paused = snake_.is_paused();
    state.direction = snake_.current_direction();
    state.eat_flash = now < eat_flash_until_;

    state.grid_w = board_.grid_w();
    state.grid_h = board_.grid_h();
    state.cell_size = board_.cell_size();
    state.origin = board_.origin();
    return state;
}

} // namespace gridsnake
