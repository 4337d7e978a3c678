#pragma once

#include "Camera.hpp"
#include "Config.hpp"
#include "Types.hpp"

#include <glm/glm.hpp>

#include <string>
#include <vector>

// Which toggles changed during the last step (for cursor mode / logging)
struct StepEvents {
    bool lockChanged = false;
    bool spinChanged = false;
    bool markerChanged = false;
};

class DemoScene {
public:
    DemoScene();

    // Per-frame update: toggles, scroll, spin, mouse look, camera position
    StepEvents step(const FrameInput& in);

    void toggleMouseLock();
    void toggleSpin();
    void toggleLightMarker();
    void scrollLight(float delta);
    void advance(float dt);
    void look(const glm::vec2& mouseDelta);

    bool mouseLocked() const { return m_mouseLocked; }
    bool spinActive() const { return m_spinActive; }
    bool drawLightMarker() const { return m_drawLightMarker; }
    float rotation() const { return m_rotation; }
    float cubeAngleDeg() const { return m_rotation * cfg::CUBE_ROTATION_SCALE_DEG; }

    const OrbitCamera& camera() const { return m_camera; }
    glm::vec3 cameraPosition() const { return m_cameraPos; }

    glm::vec3 lightPosition() const { return m_lightPos; }
    Color8 lightColor() const { return m_lightColor; }

    // Overlay text
    static const std::vector<std::string>& helpLines();
    std::vector<std::string> statusLines() const;

private:
    void reset();

    OrbitCamera m_camera;
    glm::vec3 m_cameraPos{0.0f};

    glm::vec3 m_lightPos{cfg::LIGHT_START_X, cfg::LIGHT_START_Y, cfg::LIGHT_START_Z};
    Color8 m_lightColor = colors::WHITE;

    float m_rotation = 0.0f;
    bool m_mouseLocked = false;
    bool m_spinActive = true;
    bool m_drawLightMarker = true;
};
