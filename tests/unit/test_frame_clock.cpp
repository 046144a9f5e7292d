/**
 * @file test_frame_clock.cpp
 * @brief Unit tests for FrameClock
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <shaderlay/frame_clock.h>

using namespace shaderlay;
using Catch::Matchers::WithinAbs;

TEST_CASE("FrameClock elapsed and delta", "[clock]") {
    FrameClock clock;
    clock.start(10.0);

    SECTION("first tick at start time is zero") {
        FrameTime t = clock.tick(10.0);
        REQUIRE_THAT(t.time, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(t.delta, WithinAbs(0.0f, 1e-6f));
    }

    SECTION("time is measured from start, delta from previous tick") {
        clock.tick(10.5);
        FrameTime t = clock.tick(11.25);
        REQUIRE_THAT(t.time, WithinAbs(1.25f, 1e-5f));
        REQUIRE_THAT(t.delta, WithinAbs(0.75f, 1e-5f));
    }

    SECTION("time never runs backwards") {
        clock.tick(12.0);
        FrameTime t = clock.tick(11.0);
        REQUIRE_THAT(t.time, WithinAbs(2.0f, 1e-5f));
        REQUIRE_THAT(t.delta, WithinAbs(0.0f, 1e-6f));
    }
}

TEST_CASE("FrameClock time scale", "[clock]") {
    FrameClock clock;
    clock.setTimeScale(0.5);
    clock.start(0.0);

    FrameTime t = clock.tick(4.0);
    REQUIRE_THAT(t.time, WithinAbs(2.0f, 1e-5f));
    REQUIRE_THAT(t.delta, WithinAbs(2.0f, 1e-5f));
}

TEST_CASE("FrameClock starts on first tick if not started", "[clock]") {
    FrameClock clock;
    REQUIRE_FALSE(clock.isRunning());

    FrameTime t = clock.tick(3.0);
    REQUIRE(clock.isRunning());
    REQUIRE(clock.epoch() == 3.0);
    REQUIRE_THAT(t.time, WithinAbs(0.0f, 1e-6f));
}
