// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @file logging_init.h
 * @brief spdlog setup for ArcSeek executables
 *
 * Every executable calls init() once, before anything logs. Messages carry a
 * bracketed component tag: spdlog::debug("[SeekArc] ...").
 *
 * Level precedence: CLI -v flags > "log_level" in the config file > warn.
 */

namespace arcseek {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux); console elsewhere
    Journal, ///< systemd journal (needs ARCSEEK_HAS_SYSTEMD)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file, 5MB x 3
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    /// Explicit log file for LogTarget::File; resolved automatically when empty
    std::string file_path;
};

/**
 * @brief Build the "arcseek" logger and install it as spdlog's default
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn"/"warning", "error",
 *        "critical", "off"). Case sensitive.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level from CLI verbosity and the config file value
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/// "auto", "journal", "syslog", "file", "console"; unknown strings give Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace arcseek
