// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ascii_renderer.h
 * @brief Text rendering of engine snapshots for the replay tool
 *
 * Legend: '@' head, 'o' body, '*' food, '#' food under the body, '.' empty.
 */

#pragma once

#include "snake_engine.h"

#include <string>

namespace gridsnake {

/**
 * @brief Render a snapshot as a bordered text frame plus a status line
 *
 * The status line reads "Score: N" followed by "PAUSED" or "GAME OVER" when
 * applicable. Every line ends with '\n'.
 */
std::string render_ascii(const RenderableState& state);

} // namespace gridsnake
