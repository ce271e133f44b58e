// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for arcseek-demo command-line parsing
 */

#include "cli_args.h"

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <string>
#include <vector>

using namespace arcseek;

namespace {

// Owns argv storage for parse_cli_args()
struct Argv {
    explicit Argv(std::initializer_list<const char*> args) {
        storage.emplace_back("arcseek-demo");
        for (const char* a : args) {
            storage.emplace_back(a);
        }
        for (auto& s : storage) {
            pointers.push_back(s.data());
        }
    }

    int argc() const {
        return static_cast<int>(pointers.size());
    }
    char** argv() {
        return pointers.data();
    }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

bool parse(std::initializer_list<const char*> args, CliArgs& out) {
    Argv a(args);
    return parse_cli_args(a.argc(), a.argv(), out);
}

} // namespace

TEST_CASE("CliArgs: defaults", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({}, args));

    REQUIRE(args.config_path == "arcseek.json");
    REQUIRE(args.screen_width == -1);
    REQUIRE(args.screen_height == -1);
    REQUIRE_FALSE(args.scroll_mode.has_value());
    REQUIRE(args.timeout_sec == 0);
    REQUIRE(args.verbosity == 0);
    REQUIRE(args.log_dest.empty());
    REQUIRE(args.log_file.empty());
    REQUIRE_FALSE(args.exit_requested);
}

TEST_CASE("CliArgs: config path", "[cli_args]") {
    SECTION("short form") {
        CliArgs args;
        REQUIRE(parse({"-c", "/etc/arcseek.json"}, args));
        REQUIRE(args.config_path == "/etc/arcseek.json");
    }

    SECTION("--opt=value form") {
        CliArgs args;
        REQUIRE(parse({"--config=other.json"}, args));
        REQUIRE(args.config_path == "other.json");
    }

    SECTION("missing value") {
        CliArgs args;
        REQUIRE_FALSE(parse({"--config"}, args));
        REQUIRE_FALSE(args.exit_requested);
    }
}

TEST_CASE("CliArgs: window size", "[cli_args]") {
    SECTION("valid") {
        CliArgs args;
        REQUIRE(parse({"-s", "800x480"}, args));
        REQUIRE(args.screen_width == 800);
        REQUIRE(args.screen_height == 480);
    }

    SECTION("malformed") {
        CliArgs args;
        REQUIRE_FALSE(parse({"--size", "800"}, args));
        REQUIRE_FALSE(parse({"--size", "0x480"}, args));
        REQUIRE_FALSE(parse({"--size", "axb"}, args));
    }
}

TEST_CASE("CliArgs: scroll mode", "[cli_args]") {
    SECTION("names") {
        CliArgs args;
        REQUIRE(parse({"-m", "gravity"}, args));
        REQUIRE(args.scroll_mode == ScrollMode::Gravity);

        REQUIRE(parse({"--mode=snap"}, args));
        REQUIRE(args.scroll_mode == ScrollMode::Snap);
    }

    SECTION("invalid") {
        CliArgs args;
        REQUIRE_FALSE(parse({"--mode", "bounce"}, args));
    }
}

TEST_CASE("CliArgs: timeout range", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({"-t", "30"}, args));
    REQUIRE(args.timeout_sec == 30);

    CliArgs bad;
    REQUIRE_FALSE(parse({"-t", "0"}, bad));
    REQUIRE_FALSE(parse({"-t", "3601"}, bad));
    REQUIRE_FALSE(parse({"-t", "10s"}, bad));
}

TEST_CASE("CliArgs: verbosity accumulates", "[cli_args]") {
    SECTION("-vv") {
        CliArgs args;
        REQUIRE(parse({"-vv"}, args));
        REQUIRE(args.verbosity == 2);
    }

    SECTION("mixed forms") {
        CliArgs args;
        REQUIRE(parse({"-v", "--verbose", "-vvv"}, args));
        REQUIRE(args.verbosity == 5);
    }
}

TEST_CASE("CliArgs: log destination", "[cli_args]") {
    SECTION("valid") {
        CliArgs args;
        REQUIRE(parse({"--log-dest", "file", "--log-file", "/tmp/a.log"}, args));
        REQUIRE(args.log_dest == "file");
        REQUIRE(args.log_file == "/tmp/a.log");
    }

    SECTION("invalid") {
        CliArgs args;
        REQUIRE_FALSE(parse({"--log-dest=stderr"}, args));
    }
}

TEST_CASE("CliArgs: help and version request exit", "[cli_args]") {
    SECTION("help") {
        CliArgs args;
        REQUIRE_FALSE(parse({"--help"}, args));
        REQUIRE(args.exit_requested);
    }

    SECTION("version") {
        CliArgs args;
        REQUIRE_FALSE(parse({"-V"}, args));
        REQUIRE(args.exit_requested);
    }
}

TEST_CASE("CliArgs: unknown argument", "[cli_args]") {
    CliArgs args;
    REQUIRE_FALSE(parse({"--frobnicate"}, args));
    REQUIRE_FALSE(args.exit_requested);
}
