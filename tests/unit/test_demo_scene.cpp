/**
 * @file test_demo_scene.cpp
 * @brief Unit tests for the per-frame scene state update
 *
 * DemoScene is pure state; none of these tests need a GL context.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "Config.hpp"
#include "DemoScene.hpp"
#include "Types.hpp"

#include <cmath>

using Catch::Matchers::WithinAbs;

static FrameInput idle(float dt = 0.0f) {
    FrameInput in;
    in.dt = dt;
    return in;
}

static FrameInput mouse(float dx, float dy) {
    FrameInput in;
    in.mouseDelta = glm::vec2(dx, dy);
    return in;
}

static FrameInput scroll(float delta) {
    FrameInput in;
    in.scroll = delta;
    return in;
}

TEST_CASE("DemoScene initial state", "[scene]") {
    DemoScene scene;

    SECTION("toggles start unlocked, spinning, marker visible") {
        REQUIRE_FALSE(scene.mouseLocked());
        REQUIRE(scene.spinActive());
        REQUIRE(scene.drawLightMarker());
    }

    SECTION("rotation starts at zero") {
        REQUIRE(scene.rotation() == 0.0f);
        REQUIRE(scene.cubeAngleDeg() == 0.0f);
    }

    SECTION("light starts at (2,2,2) in white") {
        REQUIRE(scene.lightPosition() == glm::vec3(2.0f, 2.0f, 2.0f));
        REQUIRE(scene.lightColor() == colors::WHITE);
    }

    SECTION("camera starts at 45/45 on a radius of 5") {
        REQUIRE_THAT(scene.camera().azimuthDeg, WithinAbs(45.0f, 1e-6f));
        REQUIRE_THAT(scene.camera().polarDeg, WithinAbs(45.0f, 1e-6f));
        REQUIRE_THAT(glm::length(scene.cameraPosition()), WithinAbs(5.0f, 1e-4f));
    }
}

TEST_CASE("DemoScene toggles", "[scene][toggle]") {
    DemoScene scene;

    SECTION("lock pressed twice returns to the original state") {
        FrameInput in = idle();
        in.lockPressed = true;
        scene.step(in);
        REQUIRE(scene.mouseLocked());
        scene.step(in);
        REQUIRE_FALSE(scene.mouseLocked());
    }

    SECTION("step reports which toggles changed") {
        FrameInput in = idle();
        in.lockPressed = true;
        in.markerPressed = true;
        StepEvents ev = scene.step(in);
        REQUIRE(ev.lockChanged);
        REQUIRE_FALSE(ev.spinChanged);
        REQUIRE(ev.markerChanged);
        REQUIRE_FALSE(scene.drawLightMarker());
    }

    SECTION("no key, no change") {
        StepEvents ev = scene.step(idle(0.016f));
        REQUIRE_FALSE(ev.lockChanged);
        REQUIRE_FALSE(ev.spinChanged);
        REQUIRE_FALSE(ev.markerChanged);
        REQUIRE(scene.spinActive());
    }
}

TEST_CASE("DemoScene spin accumulator", "[scene][spin]") {
    DemoScene scene;

    SECTION("increases by elapsed time while spinning") {
        scene.step(idle(0.25f));
        scene.step(idle(0.25f));
        REQUIRE_THAT(scene.rotation(), WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(scene.cubeAngleDeg(), WithinAbs(25.0f, 1e-4f));
    }

    SECTION("turning spin off resets rotation to zero") {
        scene.step(idle(1.5f));
        REQUIRE(scene.rotation() > 0.0f);

        FrameInput off = idle(0.1f);
        off.spinPressed = true;
        scene.step(off);
        REQUIRE_FALSE(scene.spinActive());
        REQUIRE(scene.rotation() == 0.0f);
    }

    SECTION("rotation is frozen while spin is off") {
        FrameInput off = idle();
        off.spinPressed = true;
        scene.step(off);
        for (int i = 0; i < 10; ++i) scene.step(idle(0.1f));
        REQUIRE(scene.rotation() == 0.0f);
    }

    SECTION("turning spin back on resumes monotonic increase") {
        FrameInput toggle = idle();
        toggle.spinPressed = true;
        scene.step(toggle); // off
        scene.step(toggle); // on
        REQUIRE(scene.spinActive());

        float last = scene.rotation();
        for (int i = 0; i < 5; ++i) {
            scene.step(idle(1.0f / 60.0f));
            REQUIRE(scene.rotation() > last);
            last = scene.rotation();
        }
    }
}

TEST_CASE("DemoScene light height", "[scene][light]") {
    DemoScene scene;

    SECTION("scroll moves light by half a unit per notch") {
        scene.step(scroll(1.0f));
        REQUIRE_THAT(scene.lightPosition().y, WithinAbs(2.5f, 1e-6f));
        scene.step(scroll(-3.0f));
        REQUIRE_THAT(scene.lightPosition().y, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("only the vertical component changes") {
        scene.step(scroll(4.0f));
        REQUIRE(scene.lightPosition().x == 2.0f);
        REQUIRE(scene.lightPosition().z == 2.0f);
    }

    SECTION("clamped at the top") {
        scene.step(scroll(100.0f));
        REQUIRE(scene.lightPosition().y == cfg::LIGHT_Y_MAX);
    }

    SECTION("clamped at the bottom") {
        scene.step(scroll(-100.0f));
        REQUIRE(scene.lightPosition().y == cfg::LIGHT_Y_MIN);
    }

    SECTION("stays in range over an arbitrary sequence") {
        const float deltas[] = {3.0f, 7.5f, 12.0f, -1.0f, -40.0f, 2.0f, 0.5f, -9.0f, 25.0f, -0.5f};
        for (int round = 0; round < 20; ++round) {
            for (float d : deltas) {
                scene.step(scroll(d * (round % 2 ? -1.0f : 1.0f)));
                float y = scene.lightPosition().y;
                REQUIRE(y >= cfg::LIGHT_Y_MIN);
                REQUIRE(y <= cfg::LIGHT_Y_MAX);
            }
        }
    }
}

TEST_CASE("DemoScene mouse look", "[scene][camera]") {
    DemoScene scene;

    SECTION("mouse deltas are ignored while unlocked") {
        glm::vec3 before = scene.cameraPosition();
        scene.step(mouse(120.0f, -80.0f));
        REQUIRE(scene.camera().azimuthDeg == cfg::CAMERA_AZIMUTH_DEG);
        REQUIRE(scene.camera().polarDeg == cfg::CAMERA_POLAR_DEG);
        REQUIRE(scene.cameraPosition() == before);
    }

    SECTION("locked deltas subtract half a degree per pixel") {
        scene.toggleMouseLock();
        scene.step(mouse(10.0f, 4.0f));
        REQUIRE_THAT(scene.camera().azimuthDeg, WithinAbs(40.0f, 1e-5f));
        REQUIRE_THAT(scene.camera().polarDeg, WithinAbs(43.0f, 1e-5f));
    }

    SECTION("delta in the same frame the lock turns on is applied") {
        FrameInput in = mouse(-20.0f, 0.0f);
        in.lockPressed = true;
        scene.step(in);
        REQUIRE_THAT(scene.camera().azimuthDeg, WithinAbs(55.0f, 1e-5f));
    }

    SECTION("delta in the same frame the lock turns off is dropped") {
        scene.toggleMouseLock();
        FrameInput in = mouse(-20.0f, 0.0f);
        in.lockPressed = true;
        scene.step(in);
        REQUIRE_FALSE(scene.mouseLocked());
        REQUIRE(scene.camera().azimuthDeg == cfg::CAMERA_AZIMUTH_DEG);
    }

    SECTION("polar angle stays within [-85, 85]") {
        scene.toggleMouseLock();
        const float dys[] = {-400.0f, 33.0f, 1000.0f, -7.0f, -2000.0f, 90.0f, 12.5f};
        for (int round = 0; round < 10; ++round) {
            for (float dy : dys) {
                scene.step(mouse(5.0f, dy));
                REQUIRE(scene.camera().polarDeg >= -85.0f);
                REQUIRE(scene.camera().polarDeg <= 85.0f);
            }
        }
        scene.step(mouse(0.0f, -10000.0f));
        REQUIRE(scene.camera().polarDeg == 85.0f);
        scene.step(mouse(0.0f, 10000.0f));
        REQUIRE(scene.camera().polarDeg == -85.0f);
    }

    SECTION("camera position follows the angles") {
        scene.toggleMouseLock();
        // az 45 -> 0, polar 45 -> 0
        scene.step(mouse(90.0f, 90.0f));
        glm::vec3 p = scene.cameraPosition();
        REQUIRE_THAT(p.x, WithinAbs(0.0f, 1e-4f));
        REQUIRE_THAT(p.y, WithinAbs(0.0f, 1e-4f));
        REQUIRE_THAT(p.z, WithinAbs(5.0f, 1e-4f));
    }
}

TEST_CASE("DemoScene overlay text", "[scene][text]") {
    DemoScene scene;

    SECTION("help lines are fixed") {
        const auto& help = DemoScene::helpLines();
        REQUIRE(help.size() == 5);
        REQUIRE(help.front() == "Controls:");
        REQUIRE(help[1] == "L - Toggle mouse lock");
        REQUIRE(help.back() == "Scroll - Move light Y");
    }

    SECTION("initial status lines") {
        auto lines = scene.statusLines();
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0] == "Mouse locked: NO");
        REQUIRE(lines[1] == "Spinning: YES");
        REQUIRE(lines[2] == "Light Y: 2.0");
    }

    SECTION("status follows state") {
        FrameInput in = scroll(-5.0f);
        in.lockPressed = true;
        in.spinPressed = true;
        scene.step(in);
        auto lines = scene.statusLines();
        REQUIRE(lines[0] == "Mouse locked: YES");
        REQUIRE(lines[1] == "Spinning: NO");
        REQUIRE(lines[2] == "Light Y: -0.5");
    }
}

TEST_CASE("Color8 normalization", "[types]") {
    SECTION("white maps to 1") {
        REQUIRE(colors::WHITE.toVec3() == glm::vec3(1.0f));
    }

    SECTION("channels scale independently") {
        Color8 c{255, 0, 51, 255};
        glm::vec3 v = c.toVec3();
        REQUIRE_THAT(v.r, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(v.g, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(v.b, WithinAbs(0.2f, 1e-6f));
    }
}
