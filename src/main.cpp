// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief gridsnake-replay: drive the engine headlessly from a pointer trace
 *
 * Stands in for the hand tracker (trace file or synthetic circle) and the
 * renderer (ASCII frames), so the engine can be exercised end to end without
 * a camera or display.
 */

#include "ascii_renderer.h"
#include "cli_args.h"
#include "config.h"
#include "engine_config.h"
#include "high_score_store.h"
#include "logging_init.h"
#include "pointer_trace.h"
#include "snake_engine.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace gridsnake;

namespace {

constexpr Millis SYNTHETIC_REVOLUTION{4000};

void init_logging(const CliArgs& args, Config& config) {
    logging::LogConfig log_config;

    // CLI verbosity takes precedence over the config file
    if (args.verbosity > 0) {
        log_config.level = logging::verbosity_to_level(args.verbosity);
    } else {
        log_config.level = logging::parse_level(config.get<std::string>("/log_level", "warn"));
    }

    std::string log_dest = args.log_dest;
    if (log_dest.empty()) {
        log_dest = config.get<std::string>("/log_dest", "auto");
    }
    log_config.target = logging::parse_log_target(log_dest);

    log_config.file_path = args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = config.get<std::string>("/log_path", "");
    }

    logging::init(log_config);
}

std::vector<PointerSample> synthetic_trace(const Board& board, const CliArgs& args) {
    PixelPoint origin = board.origin();
    int board_w = board.grid_w() * board.cell_size();
    int board_h = board.grid_h() * board.cell_size();

    PixelPoint center{origin.x + board_w / 2.0, origin.y + board_h / 2.0};
    double radius = std::min(board_w, board_h) / 3.0;

    spdlog::info("[Replay] No trace given, circling ({:.0f}, {:.0f}) r={:.0f} for {}s", center.x,
                 center.y, radius, args.duration_sec);
    return circling_trace(center, radius, Millis(args.duration_sec * 1000), Millis(args.poll_ms),
                          SYNTHETIC_REVOLUTION);
}

} // namespace

int main(int argc, char** argv) {
    logging::init_early();

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.show_help ? 0 : 1;
    }

    Config* config = Config::get_instance();
    config->init(args.config_path);
    init_logging(args, *config);

    EngineConfig engine_config;
    try {
        engine_config = engine_config_from_json(config->get_json("/engine"));
    } catch (const ConfigError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    if (args.seed_set) {
        engine_config.rng_seed = args.seed;
    }

    std::unique_ptr<SnakeEngine> engine;
    try {
        engine = std::make_unique<SnakeEngine>(engine_config);
    } catch (const ConfigError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    std::vector<PointerSample> samples;
    if (args.trace_path.empty()) {
        samples = synthetic_trace(engine->board(), args);
    } else {
        std::string error;
        if (!load_pointer_trace(args.trace_path, samples, error)) {
            spdlog::error("[Replay] {}", error);
            fprintf(stderr, "Error: %s\n", error.c_str());
            return 1;
        }
    }

    HighScoreStore high_scores(*config);
    high_scores.load();

    // Replay on a synthetic clock so runs are reproducible
    const TimePoint start{};
    RenderableState state = engine->snapshot(start);
    size_t polls = 0;

    for (const auto& sample : samples) {
        state = engine->update(start + sample.at, sample.pointer);
        high_scores.observe(state);
        polls++;

        if (args.print_frames) {
            printf("t=%lldms\n%s\n", static_cast<long long>(sample.at.count()),
                   render_ascii(state).c_str());
        }
        if (state.is_over) {
            spdlog::info("[Replay] Game over after {} of {} samples", polls, samples.size());
            break;
        }
    }

    if (!args.print_frames) {
        printf("%s", render_ascii(state).c_str());
    }
    printf("Length: %zu  Best: %u\n", state.body.size(), high_scores.high_score());

    spdlog::info("[Replay] Done: {} polls, score {}, length {}", polls, state.score,
                 state.body.size());
    return 0;
}
