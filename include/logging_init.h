// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup for the gridsnake tools
 *
 * Console sink always (unless disabled), plus an optional rotating file sink.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace gridsnake {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    // Console only for an interactive tool
    Console, // Console only
    File,    // Console + rotating file
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path; // Empty = default location (File target only)
    bool enable_console = true;
};

/// Install a plain console logger so logging before init() is safe
void init_early();

/// Replace the default logger according to config
void init(const LogConfig& config);

/**
 * @brief Parse a level name (case-sensitive)
 *
 * Accepts trace, debug, info, warn, warning, error, critical, off.
 * Anything else returns default_level.
 */
spdlog::level::level_enum
parse_level(const std::string& str, spdlog::level::level_enum default_level = spdlog::level::warn);

/// Map -v count to a level: 0 or less warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// Parse "auto", "console" or "file"; unknown strings give Auto
LogTarget parse_log_target(const std::string& str);

/// Inverse of parse_log_target()
const char* log_target_name(LogTarget target);

/// Default log file path ($XDG_DATA_HOME/gridsnake/gridsnake.log or fallbacks)
std::string default_log_file_path();

} // namespace logging
} // namespace gridsnake
