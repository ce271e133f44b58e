// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "arcseek_version.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace arcseek {

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

// Helper for "--opt value" and "--opt=value" forms
static const char* option_value(int argc, char** argv, int& i, const char* long_name) {
    size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    return nullptr;
}

static bool matches(const char* arg, const char* short_name, const char* long_name) {
    if (short_name && strcmp(arg, short_name) == 0)
        return true;
    size_t len = strlen(long_name);
    return strncmp(arg, long_name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>  Config file (default: arcseek.json)\n");
    printf("  -s, --size <WxH>     Window size (e.g. 480x480)\n");
    printf("  -m, --mode <mode>    Scroll mode: drift, gravity, snap\n");
    printf("  -t, --timeout <sec>  Auto-quit after specified seconds (1-3600)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        // Config file
        if (matches(argv[i], "-c", "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value) {
                printf("Error: -c/--config requires a path argument\n");
                return false;
            }
            args.config_path = value;
        }
        // Window size
        else if (matches(argv[i], "-s", "--size")) {
            const char* value = option_value(argc, argv, i, "--size");
            if (!value) {
                printf("Error: -s/--size requires an argument\n");
                return false;
            }
            int w = 0, h = 0;
            if (sscanf(value, "%dx%d", &w, &h) != 2 || w <= 0 || h <= 0) {
                printf("Error: invalid size: %s (expected WxH, e.g. 480x480)\n", value);
                return false;
            }
            args.screen_width = w;
            args.screen_height = h;
        }
        // Scroll mode
        else if (matches(argv[i], "-m", "--mode")) {
            const char* value = option_value(argc, argv, i, "--mode");
            if (!value) {
                printf("Error: -m/--mode requires an argument\n");
                return false;
            }
            args.scroll_mode = parse_scroll_mode(value);
            if (!args.scroll_mode) {
                printf("Error: invalid --mode value: %s\n", value);
                printf("Valid values: drift, gravity, snap\n");
                return false;
            }
        }
        // Timeout
        else if (matches(argv[i], "-t", "--timeout")) {
            const char* value = option_value(argc, argv, i, "--timeout");
            if (!value) {
                printf("Error: -t/--timeout requires a number of seconds\n");
                return false;
            }
            if (!parse_int(value, 1, 3600, args.timeout_sec, "timeout"))
                return false;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], nullptr, "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value) {
                printf("Error: --log-dest requires an argument\n");
                return false;
            }
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], nullptr, "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value) {
                printf("Error: --log-file requires a path argument\n");
                return false;
            }
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.exit_requested = true;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("arcseek-demo %s\n", ARCSEEK_VERSION);
            args.exit_requested = true;
            return false;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace arcseek
