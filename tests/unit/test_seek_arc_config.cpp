// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_seek_arc_config.cpp
 * @brief SeekArcConfig JSON parsing, color parsing and apply()
 */

#include "seek_arc_config.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace arcseek;
using namespace std::string_view_literals;
using Catch::Approx;
using json = nlohmann::json;

// ============================================================================
// parse_color / format_color
// ============================================================================

TEST_CASE("parse_color: string forms", "[seek_arc][config][color]") {
    SECTION("#RRGGBB is opaque") {
        REQUIRE(parse_color("#2196F3"sv) == 0xFF2196F3u);
        REQUIRE(parse_color("2196f3"sv) == 0xFF2196F3u);
    }

    SECTION("#AARRGGBB keeps alpha") {
        REQUIRE(parse_color("#1F000000"sv) == 0x1F000000u);
        REQUIRE(parse_color("#00000000"sv) == 0x00000000u);
    }

    SECTION("0x prefix") {
        REQUIRE(parse_color("0x80FF0000"sv) == 0x80FF0000u);
        REQUIRE(parse_color("0XFF0000"sv) == 0xFFFF0000u);
    }

    SECTION("invalid") {
        REQUIRE_FALSE(parse_color(""sv).has_value());
        REQUIRE_FALSE(parse_color("#"sv).has_value());
        REQUIRE_FALSE(parse_color("#FFF"sv).has_value());
        REQUIRE_FALSE(parse_color("#GG0000"sv).has_value());
        REQUIRE_FALSE(parse_color("red"sv).has_value());
        REQUIRE_FALSE(parse_color("#FF00FF00FF"sv).has_value());
    }
}

TEST_CASE("parse_color: JSON forms", "[seek_arc][config][color]") {
    REQUIRE(parse_color(json("#FF0000")) == 0xFFFF0000u);
    REQUIRE(parse_color(json(0x80112233u)) == 0x80112233u);
    REQUIRE(parse_color(json(255)) == 0x000000FFu);
    REQUIRE_FALSE(parse_color(json(-1)).has_value());
    REQUIRE_FALSE(parse_color(json(true)).has_value());
    REQUIRE_FALSE(parse_color(json::array()).has_value());
}

TEST_CASE("format_color: #AARRGGBB", "[seek_arc][config][color]") {
    REQUIRE(format_color(0xFF2196F3) == "#FF2196F3");
    REQUIRE(format_color(0x1F000000) == "#1F000000");
    REQUIRE(parse_color(std::string_view(format_color(0x12ABCDEF))) == 0x12ABCDEFu);
}

// ============================================================================
// SeekArcConfig::from_json
// ============================================================================

TEST_CASE("SeekArcConfig: defaults match the widget", "[seek_arc][config]") {
    SeekArcConfig config;

    REQUIRE(config.min == SeekArc::DEFAULT_MIN);
    REQUIRE(config.max == SeekArc::DEFAULT_MAX);
    REQUIRE(config.start_angle == Approx(SeekArc::DEFAULT_START_ANGLE));
    REQUIRE(config.sweep_angle == Approx(SeekArc::DEFAULT_SWEEP_ANGLE));
    REQUIRE(config.sweep_color == SeekArc::DEFAULT_SWEEP_COLOR);
    REQUIRE(config.progress_color.pressed == SeekArc::DEFAULT_PRESSED_COLOR);
    REQUIRE(config.thumb == SeekArcConfig::THUMB_DEFAULT);
    REQUIRE_FALSE(config.thumb_hidden());
    REQUIRE_FALSE(config.thumb_image().has_value());
    REQUIRE(config.scroll_mode == ScrollMode::Drift);
    REQUIRE(config.touch_inside);
    REQUIRE(config.enabled);
}

TEST_CASE("SeekArcConfig: from_json reads every key", "[seek_arc][config]") {
    json j = {{"min", 10},
              {"max", 20},
              {"progress", 15},
              {"start_angle", 135},
              {"sweep_angle", 270.5},
              {"stroke_width", 8},
              {"thumb_radius", 10},
              {"sweep_color", "#33000000"},
              {"progress_color",
               {{"normal", "#FF0000"}, {"pressed", "#00FF00"}, {"disabled", "#80808080"}}},
              {"thumb", "none"},
              {"scroll_mode", "gravity"},
              {"touch_inside", false},
              {"enabled", false}};

    SeekArcConfig config = SeekArcConfig::from_json(j);

    REQUIRE(config.min == 10);
    REQUIRE(config.max == 20);
    REQUIRE(config.progress == 15);
    REQUIRE(config.start_angle == Approx(135.0f));
    REQUIRE(config.sweep_angle == Approx(270.5f));
    REQUIRE(config.stroke_width == Approx(8.0f));
    REQUIRE(config.thumb_radius == Approx(10.0f));
    REQUIRE(config.sweep_color == 0x33000000u);
    REQUIRE(config.progress_color.normal == 0xFFFF0000u);
    REQUIRE(config.progress_color.pressed == 0xFF00FF00u);
    REQUIRE(config.progress_color.disabled == 0x80808080u);
    REQUIRE(config.thumb_hidden());
    REQUIRE(config.scroll_mode == ScrollMode::Gravity);
    REQUIRE_FALSE(config.touch_inside);
    REQUIRE_FALSE(config.enabled);
}

TEST_CASE("SeekArcConfig: single progress color fills every state", "[seek_arc][config]") {
    SeekArcConfig config = SeekArcConfig::from_json({{"progress_color", "#2196F3"}});

    REQUIRE(config.progress_color == ColorStateList::value_of(0xFF2196F3));
}

TEST_CASE("SeekArcConfig: invalid values keep defaults", "[seek_arc][config]") {
    SeekArcConfig defaults;
    json j = {{"min", "zero"},
              {"max", 1.5},
              {"sweep_angle", "wide"},
              {"sweep_color", "blue"},
              {"scroll_mode", "bounce"},
              {"touch_inside", 1},
              {"stroke_width", -4},
              {"thumb", 7}};

    SeekArcConfig config = SeekArcConfig::from_json(j);

    REQUIRE(config.min == defaults.min);
    REQUIRE(config.max == defaults.max);
    REQUIRE(config.sweep_angle == Approx(defaults.sweep_angle));
    REQUIRE(config.sweep_color == defaults.sweep_color);
    REQUIRE(config.scroll_mode == defaults.scroll_mode);
    REQUIRE(config.touch_inside == defaults.touch_inside);
    REQUIRE(config.stroke_width == Approx(0.0f));
    REQUIRE(config.thumb == defaults.thumb);
}

TEST_CASE("SeekArcConfig: numeric scroll mode", "[seek_arc][config]") {
    REQUIRE(SeekArcConfig::from_json({{"scroll_mode", 2}}).scroll_mode == ScrollMode::Snap);
    REQUIRE(SeekArcConfig::from_json({{"scroll_mode", 0}}).scroll_mode == ScrollMode::Drift);
}

TEST_CASE("SeekArcConfig: null or non-object gives defaults", "[seek_arc][config]") {
    SeekArcConfig defaults;
    REQUIRE(SeekArcConfig::from_json(json()).max == defaults.max);
    REQUIRE(SeekArcConfig::from_json(json::array()).max == defaults.max);
    REQUIRE(SeekArcConfig::from_json("gauge").max == defaults.max);
}

TEST_CASE("SeekArcConfig: thumb image path", "[seek_arc][config]") {
    SeekArcConfig config = SeekArcConfig::from_json({{"thumb", "A:/res/knob.png"}});

    REQUIRE_FALSE(config.thumb_hidden());
    REQUIRE(config.thumb_image() == std::string("A:/res/knob.png"));
}

TEST_CASE("SeekArcConfig: to_json feeds from_json", "[seek_arc][config]") {
    SeekArcConfig config;
    config.min = 5;
    config.max = 50;
    config.sweep_angle = 180.0f;
    config.progress_color = ColorStateList{0xFF010203, 0xFF040506, 0x00070809};
    config.scroll_mode = ScrollMode::Snap;
    config.thumb = SeekArcConfig::THUMB_NONE;

    json j = config.to_json();
    REQUIRE(j["scroll_mode"] == "snap");
    REQUIRE(j["progress_color"]["disabled"] == "#00070809");

    SeekArcConfig back = SeekArcConfig::from_json(j);
    REQUIRE(back.min == 5);
    REQUIRE(back.max == 50);
    REQUIRE(back.sweep_angle == Approx(180.0f));
    REQUIRE(back.progress_color == config.progress_color);
    REQUIRE(back.scroll_mode == ScrollMode::Snap);
    REQUIRE(back.thumb_hidden());
}

// ============================================================================
// apply()
// ============================================================================

TEST_CASE("SeekArcConfig: apply pushes settings into an arc", "[seek_arc][config]") {
    SeekArcConfig config;
    config.min = 10;
    config.max = 20;
    config.progress = 18;
    config.start_angle = 135.0f;
    config.sweep_angle = 270.0f;
    config.stroke_width = 8.0f;
    config.thumb_radius = 6.0f;
    config.thumb = SeekArcConfig::THUMB_NONE;
    config.scroll_mode = ScrollMode::Snap;
    config.touch_inside = false;
    config.enabled = false;

    SeekArc arc;
    config.apply(arc);

    REQUIRE(arc.min() == 10);
    REQUIRE(arc.max() == 20);
    REQUIRE(arc.progress() == 18);
    REQUIRE(arc.start_angle() == Approx(135.0f));
    REQUIRE(arc.sweep_angle() == Approx(270.0f));
    REQUIRE(arc.stroke_width() == Approx(8.0f));
    REQUIRE(arc.thumb_radius() == Approx(6.0f));
    REQUIRE_FALSE(arc.thumb_visible());
    REQUIRE(arc.scroll_mode() == ScrollMode::Snap);
    REQUIRE_FALSE(arc.touch_inside());
    REQUIRE_FALSE(arc.is_enabled());
}

TEST_CASE("SeekArcConfig: apply is independent of the arc's current range",
          "[seek_arc][config]") {
    SeekArc arc;
    arc.set_max(5);

    // min above the arc's current max must not be clamped away
    SeekArcConfig config;
    config.min = 50;
    config.max = 200;
    config.progress = 150;
    config.apply(arc);

    REQUIRE(arc.min() == 50);
    REQUIRE(arc.max() == 200);
    REQUIRE(arc.progress() == 150);
}

TEST_CASE("SeekArcConfig: apply converts lengths", "[seek_arc][config]") {
    SeekArcConfig config;
    config.stroke_width = 10.0f;
    config.thumb_radius = 7.0f;

    SeekArc arc;
    config.apply(arc, [](int32_t dp) { return dp * 2; });

    REQUIRE(arc.stroke_width() == Approx(20.0f));
    REQUIRE(arc.thumb_radius() == Approx(14.0f));
}
