// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_seek_arc_scroller.cpp
 * @brief Frame-polled animator driven by a fake clock
 */

#include "seek_arc_scroller.h"

#include <catch2/catch_test_macros.hpp>

using namespace arcseek;

namespace {

class ScrollerTestFixture {
  protected:
    uint32_t now_ms = 1000;
    SeekArcScroller scroller{[this]() { return now_ms; }};
};

} // namespace

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: starts finished at zero",
                 "[seek_arc][scroller]") {
    REQUIRE(scroller.is_finished());
    REQUIRE(scroller.current() == 0);
    REQUIRE(scroller.final_value() == 0);
    REQUIRE_FALSE(scroller.compute_offset());
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: animates with ease-out",
                 "[seek_arc][scroller]") {
    scroller.start_scroll(0, 1000);
    REQUIRE_FALSE(scroller.is_finished());
    REQUIRE(scroller.final_value() == 1000);
    REQUIRE(scroller.duration() == SeekArcScroller::DEFAULT_DURATION_MS);

    REQUIRE(scroller.compute_offset());
    REQUIRE(scroller.current() == 0);

    now_ms += 125;
    REQUIRE(scroller.compute_offset());
    // Ease-out covers more than half the distance in half the time
    REQUIRE(scroller.current() > 500);
    REQUIRE(scroller.current() < 1000);
    REQUIRE_FALSE(scroller.is_finished());

    now_ms += 125;
    REQUIRE(scroller.compute_offset());
    REQUIRE(scroller.current() == 1000);
    REQUIRE(scroller.is_finished());

    // Landing poll reported; nothing left to do
    REQUIRE_FALSE(scroller.compute_offset());
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: moves monotonically backwards too",
                 "[seek_arc][scroller]") {
    scroller.start_scroll(5000, -3000, 100);

    int32_t last = scroller.current();
    for (int i = 0; i < 12; i++) {
        now_ms += 10;
        scroller.compute_offset();
        REQUIRE(scroller.current() <= last);
        REQUIRE(scroller.current() >= 2000);
        last = scroller.current();
    }
    REQUIRE(scroller.current() == 2000);
    REQUIRE(scroller.is_finished());
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: set_final lands on the next poll",
                 "[seek_arc][scroller]") {
    scroller.set_final(4200);
    REQUIRE(scroller.final_value() == 4200);
    REQUIRE(scroller.current() == 0);
    REQUIRE_FALSE(scroller.is_finished());

    REQUIRE(scroller.compute_offset());
    REQUIRE(scroller.current() == 4200);
    REQUIRE(scroller.is_finished());
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: set_final cuts a running animation short",
                 "[seek_arc][scroller]") {
    scroller.start_scroll(0, 900);
    now_ms += 50;
    scroller.compute_offset();
    REQUIRE(scroller.current() > 0);
    REQUIRE(scroller.current() < 900);

    // No time passes: the new value still lands on the very next poll
    scroller.set_final(4200);
    REQUIRE(scroller.compute_offset());
    REQUIRE(scroller.current() == 4200);
    REQUIRE(scroller.is_finished());
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: abort_animation jumps to the target",
                 "[seek_arc][scroller]") {
    scroller.start_scroll(0, 900);
    now_ms += 50;
    scroller.compute_offset();
    REQUIRE(scroller.current() < 900);

    scroller.abort_animation();
    REQUIRE(scroller.current() == 900);
    REQUIRE(scroller.is_finished());
    REQUIRE_FALSE(scroller.compute_offset());
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: force_finished freezes current",
                 "[seek_arc][scroller]") {
    scroller.start_scroll(0, 900);
    now_ms += 50;
    scroller.compute_offset();
    int32_t frozen = scroller.current();

    scroller.force_finished(true);
    now_ms += 500;
    REQUIRE_FALSE(scroller.compute_offset());
    REQUIRE(scroller.current() == frozen);
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: retarget starts from current",
                 "[seek_arc][scroller]") {
    scroller.start_scroll(0, 1000);
    now_ms += 100;
    scroller.compute_offset();
    int32_t midway = scroller.current();

    scroller.start_scroll(scroller.current(), 0 - scroller.current());
    REQUIRE(scroller.current() == midway);
    REQUIRE(scroller.final_value() == 0);

    now_ms += 300;
    REQUIRE(scroller.compute_offset());
    REQUIRE(scroller.current() == 0);
}

TEST_CASE_METHOD(ScrollerTestFixture, "SeekArcScroller: survives tick wrap-around",
                 "[seek_arc][scroller]") {
    now_ms = 0xFFFFFF00u;
    scroller.start_scroll(0, 100);

    now_ms += 0x80; // still before the wrap
    REQUIRE(scroller.compute_offset());
    REQUIRE_FALSE(scroller.is_finished());

    now_ms += 0x100; // wrapped past zero, 384ms elapsed
    REQUIRE(scroller.compute_offset());
    REQUIRE(scroller.current() == 100);
    REQUIRE(scroller.is_finished());
}
