// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file direction_controller.h
 * @brief Continuous pointer position -> discrete 8-way direction
 *
 * Stateless. Quantizes the offset between the snake head and the pointer into
 * one of 8 unit directions, ignoring input inside a square deadzone and
 * rejecting 180-degree reversals.
 */

#pragma once

#include "snake_types.h"

#include <optional>

namespace gridsnake {

/**
 * @brief Classify one axis offset into {-1, 0, +1}
 *
 * Offsets with magnitude below the deadzone classify as 0.
 */
int classify_axis(double offset, double deadzone);

/**
 * @brief Resolve a new pending direction from a pointer sample
 *
 * @param head_center Pixel center of the snake head
 * @param pointer Pointer position in the same pixel space
 * @param current Direction the snake is currently moving in
 * @param deadzone Minimum per-axis pixel offset that counts as input
 * @return New pending direction, or std::nullopt for "no change" (pointer
 *         inside the deadzone, or candidate is the exact reverse of current)
 */
std::optional<Direction> resolve_direction(const PixelPoint& head_center, const PixelPoint& pointer,
                                           const Direction& current, double deadzone);

} // namespace gridsnake
