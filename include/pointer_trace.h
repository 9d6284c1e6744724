// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file pointer_trace.h
 * @brief Recorded pointer samples for headless replay
 *
 * Format, one sample per line:
 * @code
 * # comment
 * 0    640 300     <t_ms> <x> <y>   pointer detected
 * 33   -           <t_ms> -         no detection this poll
 * @endcode
 * Timestamps are milliseconds from the start of the recording and must not
 * decrease. Blank lines are ignored.
 */

#pragma once

#include "snake_types.h"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace gridsnake {

struct PointerSample {
    Millis at{0};
    std::optional<PixelPoint> pointer;
};

/**
 * @brief Parse a trace from a stream
 *
 * @param in Input stream
 * @param out Output: samples in file order (cleared first)
 * @param error Output: "line N: reason" on failure
 * @return true on success
 */
bool parse_pointer_trace(std::istream& in, std::vector<PointerSample>& out, std::string& error);

/// Open and parse a trace file; same contract as parse_pointer_trace()
bool load_pointer_trace(const std::string& path, std::vector<PointerSample>& out,
                        std::string& error);

/**
 * @brief Synthesize a pointer circling a center point
 *
 * Used when no trace is supplied: one detected sample every poll period for
 * the whole duration, moving around a circle of the given radius.
 */
std::vector<PointerSample> circling_trace(const PixelPoint& center, double radius,
                                          Millis duration, Millis poll_period,
                                          Millis revolution);

} // namespace gridsnake
