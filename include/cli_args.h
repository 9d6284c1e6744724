// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for gridsnake-replay
 */

#include <cstdint>
#include <string>

namespace gridsnake {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = "gridsnake.json";
    std::string trace_path; // Empty = synthesize a circling pointer

    // Synthetic trace
    int poll_ms = 30;
    int duration_sec = 10;

    // Overrides /engine/rng_seed when seed_set
    uint32_t seed = 0;
    bool seed_set = false;

    bool print_frames = false;
    bool show_help = false;

    // Logging
    int verbosity = 0;
    std::string log_dest; // Empty = config file value
    std::string log_file; // Empty = config file value
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace gridsnake
