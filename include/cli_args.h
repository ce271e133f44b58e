// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for arcseek-demo
 */

#include "seek_arc_types.h"

#include <optional>
#include <string>

namespace arcseek {

/**
 * @brief Parsed command-line arguments
 *
 * Unset optionals/empty strings mean "use the config file value".
 */
struct CliArgs {
    // Config file (default: arcseek.json in the working directory)
    std::string config_path = "arcseek.json";

    // Window size override (-s WxH)
    int screen_width = -1;  // -1 = not set
    int screen_height = -1; // -1 = not set

    // Widget overrides
    std::optional<ScrollMode> scroll_mode;

    // Automation
    int timeout_sec = 0; // 0 = run until the window closes

    // Logging
    int verbosity = 0;
    std::string log_dest; // CLI override for log destination
    std::string log_file; // CLI override for log file path

    // Set when -h/-V printed something and the program should exit successfully
    bool exit_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true to continue; false if help/version was shown (args.exit_requested)
 *         or an error was printed
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace arcseek
