// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace gridsnake {
namespace logging {

namespace {

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp"; // Last resort fallback
}

/// Add the file sink when requested
void add_file_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                   const std::string& file_path) {
    if (target != LogTarget::File) {
        return;
    }

    std::string path = file_path.empty() ? default_log_file_path() : file_path;
    try {
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
    } catch (const spdlog::spdlog_ex& e) {
        // Fall back to the remaining sinks
        spdlog::warn("[Logging] Could not open log file {}: {}", path, e.what());
    }
}

} // namespace

std::string default_log_file_path() {
    std::string dir = get_xdg_data_home() + "/gridsnake";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return dir + "/gridsnake.log";
}

void init_early() {
    auto logger = std::make_shared<spdlog::logger>(
        "gridsnake", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? LogTarget::Console : config.target;
    add_file_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("gridsnake", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity >= 3 ? spdlog::level::trace : spdlog::level::warn;
    }
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Console:
        return "console";
    case LogTarget::File:
        return "file";
    }
    return "unknown";
}

} // namespace logging
} // namespace gridsnake
