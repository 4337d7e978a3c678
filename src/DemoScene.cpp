#include "DemoScene.hpp"

#include "Util.hpp"

#include <iomanip>
#include <sstream>

static const char* yesNo(bool b) {
    return b ? "YES" : "NO";
}

static const char* onOff(bool b) {
    return b ? "ON" : "OFF";
}

DemoScene::DemoScene() {
    reset();
}

void DemoScene::reset() {
    m_camera = OrbitCamera();
    m_cameraPos = m_camera.position();

    m_lightPos = glm::vec3(cfg::LIGHT_START_X, cfg::LIGHT_START_Y, cfg::LIGHT_START_Z);
    m_lightColor = colors::WHITE;

    m_rotation = 0.0f;
    m_mouseLocked = false;
    m_spinActive = true;
    m_drawLightMarker = true;
}

StepEvents DemoScene::step(const FrameInput& in) {
    StepEvents ev;

    if (in.lockPressed) {
        toggleMouseLock();
        ev.lockChanged = true;
    }
    if (in.spinPressed) {
        toggleSpin();
        ev.spinChanged = true;
    }
    if (in.markerPressed) {
        toggleLightMarker();
        ev.markerChanged = true;
    }

    scrollLight(in.scroll);
    advance(in.dt);

    // Sampled after the toggles: a delta in the frame that unlocks is dropped.
    if (m_mouseLocked) {
        look(in.mouseDelta);
    }

    m_cameraPos = m_camera.position();
    return ev;
}

void DemoScene::toggleMouseLock() {
    m_mouseLocked = !m_mouseLocked;
    util::logInfo(std::string("Mouse lock: ") + onOff(m_mouseLocked));
}

void DemoScene::toggleSpin() {
    m_spinActive = !m_spinActive;
    if (!m_spinActive) {
        m_rotation = 0.0f;
    }
    util::logInfo(std::string("Spin: ") + onOff(m_spinActive));
}

void DemoScene::toggleLightMarker() {
    m_drawLightMarker = !m_drawLightMarker;
    util::logInfo(std::string("Light marker: ") + onOff(m_drawLightMarker));
}

void DemoScene::scrollLight(float delta) {
    m_lightPos.y += delta * cfg::SCROLL_LIGHT_STEP;
    m_lightPos.y = util::clampf(m_lightPos.y, cfg::LIGHT_Y_MIN, cfg::LIGHT_Y_MAX);
}

void DemoScene::advance(float dt) {
    if (m_spinActive) {
        m_rotation += cfg::SPIN_SPEED * dt;
    }
}

void DemoScene::look(const glm::vec2& mouseDelta) {
    m_camera.orbit(mouseDelta.x, mouseDelta.y, cfg::MOUSE_SENSITIVITY);
}

const std::vector<std::string>& DemoScene::helpLines() {
    static const std::vector<std::string> lines = {
        "Controls:",
        "L - Toggle mouse lock",
        "S - Toggle cube spin",
        "D - Toggle light debug",
        "Scroll - Move light Y",
    };
    return lines;
}

std::vector<std::string> DemoScene::statusLines() const {
    std::ostringstream light;
    light << "Light Y: " << std::fixed << std::setprecision(1) << m_lightPos.y;

    return {
        std::string("Mouse locked: ") + yesNo(m_mouseLocked),
        std::string("Spinning: ") + yesNo(m_spinActive),
        light.str(),
    };
}
