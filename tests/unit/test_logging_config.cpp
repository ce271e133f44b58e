// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace arcseek;
using namespace arcseek::logging;

namespace {

LogConfig quiet_console() {
    LogConfig config;
    config.target = LogTarget::Console;
    return config;
}

} // namespace

// ============================================================================
// parse_level() tests
// ============================================================================

TEST_CASE("parse_level: valid level strings", "[logging][config]") {
    SECTION("trace") {
        REQUIRE(parse_level("trace") == spdlog::level::trace);
    }

    SECTION("debug") {
        REQUIRE(parse_level("debug") == spdlog::level::debug);
    }

    SECTION("info") {
        REQUIRE(parse_level("info") == spdlog::level::info);
    }

    SECTION("warn and its alias") {
        REQUIRE(parse_level("warn") == spdlog::level::warn);
        REQUIRE(parse_level("warning") == spdlog::level::warn);
    }

    SECTION("error") {
        REQUIRE(parse_level("error") == spdlog::level::err);
    }

    SECTION("critical") {
        REQUIRE(parse_level("critical") == spdlog::level::critical);
    }

    SECTION("off") {
        REQUIRE(parse_level("off") == spdlog::level::off);
    }
}

TEST_CASE("parse_level: returns default for invalid input", "[logging][config]") {
    SECTION("empty string") {
        REQUIRE(parse_level("", spdlog::level::warn) == spdlog::level::warn);
        REQUIRE(parse_level("", spdlog::level::debug) == spdlog::level::debug);
    }

    SECTION("unrecognized string") {
        REQUIRE(parse_level("verbose", spdlog::level::warn) == spdlog::level::warn);
        REQUIRE(parse_level("TRACE", spdlog::level::info) == spdlog::level::info); // case sensitive
    }
}

// ============================================================================
// verbosity_to_level() tests
// ============================================================================

TEST_CASE("verbosity_to_level: CLI verbosity flags", "[logging][config]") {
    SECTION("-v (1) = info") {
        REQUIRE(verbosity_to_level(1) == spdlog::level::info);
    }

    SECTION("-vv (2) = debug") {
        REQUIRE(verbosity_to_level(2) == spdlog::level::debug);
    }

    SECTION("-vvv (3+) = trace") {
        REQUIRE(verbosity_to_level(3) == spdlog::level::trace);
        REQUIRE(verbosity_to_level(10) == spdlog::level::trace);
    }

    SECTION("0 or negative = warn") {
        REQUIRE(verbosity_to_level(0) == spdlog::level::warn);
        REQUIRE(verbosity_to_level(-1) == spdlog::level::warn);
    }
}

// ============================================================================
// resolve_log_level() tests
// ============================================================================

TEST_CASE("resolve_log_level: precedence rules", "[logging][config]") {
    SECTION("CLI verbosity takes precedence over config") {
        REQUIRE(resolve_log_level(2, "error") == spdlog::level::debug);
        REQUIRE(resolve_log_level(1, "trace") == spdlog::level::info);
    }

    SECTION("config file used when no CLI verbosity") {
        REQUIRE(resolve_log_level(0, "debug") == spdlog::level::debug);
        REQUIRE(resolve_log_level(0, "error") == spdlog::level::err);
    }

    SECTION("defaults to warn when neither is set") {
        REQUIRE(resolve_log_level(0, "") == spdlog::level::warn);
        REQUIRE(resolve_log_level(0, "loud") == spdlog::level::warn);
    }
}

// ============================================================================
// Log targets
// ============================================================================

TEST_CASE("parse_log_target: valid targets", "[logging][config]") {
    REQUIRE(parse_log_target("auto") == LogTarget::Auto);
    REQUIRE(parse_log_target("journal") == LogTarget::Journal);
    REQUIRE(parse_log_target("syslog") == LogTarget::Syslog);
    REQUIRE(parse_log_target("file") == LogTarget::File);
    REQUIRE(parse_log_target("console") == LogTarget::Console);
}

TEST_CASE("parse_log_target: defaults to Auto for unknown", "[logging][config]") {
    REQUIRE(parse_log_target("") == LogTarget::Auto);
    REQUIRE(parse_log_target("stderr") == LogTarget::Auto);
    REQUIRE(parse_log_target("FILE") == LogTarget::Auto);
}

TEST_CASE("log_target_name: round-trip", "[logging][config]") {
    for (LogTarget target : {LogTarget::Auto, LogTarget::Journal, LogTarget::Syslog,
                             LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE("logging::init: installs the arcseek logger", "[logging]") {
    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::Console;
    init(config);

    auto logger = spdlog::default_logger();
    REQUIRE(logger->name() == "arcseek");
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE(logger->sinks().size() == 1);

    // Leave a quiet console logger for other tests
    init(quiet_console());
}

TEST_CASE("logging::init: file target writes to the given path", "[logging]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "arcseek_logging_test.log";
    std::error_code ec;
    fs::remove(path, ec);

    LogConfig config;
    config.level = spdlog::level::info;
    config.target = LogTarget::File;
    config.enable_console = false;
    config.file_path = path.string();
    init(config);

    REQUIRE(spdlog::default_logger()->sinks().size() == 1);
    spdlog::info("[LoggingTest] hello");
    spdlog::default_logger()->flush();

    REQUIRE(fs::exists(path));
    REQUIRE(fs::file_size(path) > 0);

    init(quiet_console());
    fs::remove(path, ec);
}
