// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "direction_controller.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace gridsnake {

int classify_axis(double offset, double deadzone) {
    if (std::fabs(offset) < deadzone) {
        return 0;
    }
    return offset > 0 ? 1 : -1;
}

std::optional<Direction> resolve_direction(const PixelPoint& head_center, const PixelPoint& pointer,
                                           const Direction& current, double deadzone) {
    double dx = pointer.x - head_center.x;
    double dy = pointer.y - head_center.y;

    // Hysteresis: jitter around the head never changes direction
    if (std::fabs(dx) < deadzone && std::fabs(dy) < deadzone) {
        return std::nullopt;
    }

    // At least one axis is outside the deadzone here, so the candidate is never (0,0)
    Direction candidate{classify_axis(dx, deadzone), classify_axis(dy, deadzone)};

    if (candidate.is_opposite_of(current)) {
        spdlog::trace("[DirectionController] Rejected reversal ({},{}) while moving ({},{})",
                      candidate.dx, candidate.dy, current.dx, current.dy);
        return std::nullopt;
    }

    return candidate;
}

} // namespace gridsnake
