// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace gridsnake {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Replays recorded pointer samples through the snake engine.\n");
    printf("Options:\n");
    printf("  -c, --config <path>  Config file (default: gridsnake.json, created if missing)\n");
    printf("  -t, --trace <path>   Pointer trace to replay (default: circle the board)\n");
    printf("  --poll-ms <n>        Poll period for the synthetic trace (1-1000, default: 30)\n");
    printf("  --duration <sec>     Length of the synthetic trace (1-3600, default: 10)\n");
    printf("  --seed <n>           Food placement seed (overrides config)\n");
    printf("  --frames             Print every frame instead of only the last\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, console, file\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("\nTrace format (one sample per line):\n");
    printf("  <t_ms> <x> <y>       pointer detected at pixel (x, y)\n");
    printf("  <t_ms> -             no detection this poll\n");
    printf("  # comment\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -c/--config requires an argument\n");
                return false;
            }
            args.config_path = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--trace") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -t/--trace requires an argument\n");
                return false;
            }
            args.trace_path = argv[++i];
        } else if (strcmp(argv[i], "--poll-ms") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --poll-ms requires an argument\n");
                return false;
            }
            if (!parse_int(argv[++i], 1, 1000, args.poll_ms, "--poll-ms"))
                return false;
        } else if (strcmp(argv[i], "--duration") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --duration requires an argument\n");
                return false;
            }
            if (!parse_int(argv[++i], 1, 3600, args.duration_sec, "--duration"))
                return false;
        } else if (strcmp(argv[i], "--seed") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --seed requires an argument\n");
                return false;
            }
            char* endptr;
            unsigned long val = strtoul(argv[++i], &endptr, 10);
            if (*endptr != '\0' || val > 0xFFFFFFFFul) {
                printf("Error: invalid --seed: %s\n", argv[i]);
                return false;
            }
            args.seed = static_cast<uint32_t>(val);
            args.seed_set = true;
        } else if (strcmp(argv[i], "--frames") == 0) {
            args.print_frames = true;
        } else if (strcmp(argv[i], "--log-dest") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-dest requires an argument\n");
                return false;
            }
            const char* dest = argv[++i];
            if (strcmp(dest, "auto") != 0 && strcmp(dest, "console") != 0 &&
                strcmp(dest, "file") != 0) {
                printf("Error: invalid --log-dest: %s (auto, console, file)\n", dest);
                return false;
            }
            args.log_dest = dest;
        } else if (strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-file requires an argument\n");
                return false;
            }
            args.log_file = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (strncmp(argv[i], "-v", 2) == 0 &&
                   strspn(argv[i] + 1, "v") == strlen(argv[i] + 1)) {
            // -vv, -vvv
            args.verbosity += static_cast<int>(strlen(argv[i] + 1));
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.show_help = true;
            return false;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace gridsnake
