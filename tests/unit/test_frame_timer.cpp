/**
 * @file test_frame_timer.cpp
 * @brief Unit tests for frame delta, pacing and FPS averaging
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "FrameTimer.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("FrameTimer delta time", "[timer]") {
    FrameTimer timer(60);
    timer.start(10.0);

    SECTION("tick returns seconds since the previous tick") {
        REQUIRE_THAT(timer.tick(10.02), WithinAbs(0.02f, 1e-5f));
        REQUIRE_THAT(timer.tick(10.05), WithinAbs(0.03f, 1e-5f));
        REQUIRE(timer.frameCount() == 2);
    }

    SECTION("a clock going backwards yields zero") {
        REQUIRE(timer.tick(9.0) == 0.0f);
    }
}

TEST_CASE("FrameTimer pacing", "[timer]") {
    FrameTimer timer(60);
    timer.start(0.0);

    SECTION("budget is one target frame") {
        REQUIRE_THAT(timer.frameBudget(), WithinAbs(1.0 / 60.0, 1e-9));
    }

    SECTION("remaining shrinks as the frame runs") {
        timer.tick(1.0);
        REQUIRE_THAT(timer.remaining(1.0), WithinAbs(1.0 / 60.0, 1e-9));
        REQUIRE_THAT(timer.remaining(1.01), WithinAbs(1.0 / 60.0 - 0.01, 1e-9));
    }

    SECTION("remaining is zero once over budget") {
        timer.tick(1.0);
        REQUIRE(timer.remaining(1.5) == 0.0);
    }

    SECTION("no target rate means no waiting") {
        FrameTimer unpaced(0);
        unpaced.start(0.0);
        unpaced.tick(0.001);
        REQUIRE(unpaced.remaining(0.001) == 0.0);
    }
}

TEST_CASE("FrameTimer FPS readout", "[timer]") {
    FrameTimer timer(60, 0.5);
    timer.start(0.0);

    SECTION("reads zero before the first window completes") {
        for (int i = 1; i < 10; ++i) timer.tick(i / 60.0);
        REQUIRE(timer.fps() == 0);
    }

    SECTION("steady 60 Hz ticks report 60") {
        for (int i = 1; i <= 120; ++i) timer.tick(i / 60.0);
        REQUIRE(timer.fps() == 60);
    }

    SECTION("steady 30 Hz ticks report 30") {
        for (int i = 1; i <= 60; ++i) timer.tick(i / 30.0);
        REQUIRE(timer.fps() == 30);
    }

    SECTION("readout follows a rate change") {
        double t = 0.0;
        for (int i = 0; i < 60; ++i) { t += 1.0 / 60.0; timer.tick(t); }
        for (int i = 0; i < 40; ++i) { t += 1.0 / 20.0; timer.tick(t); }
        REQUIRE(timer.fps() == 20);
    }
}
