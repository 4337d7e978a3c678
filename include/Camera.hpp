#pragma once

#include "Config.hpp"

#include <glm/glm.hpp>

// Orbit camera around a target at a fixed radius
class OrbitCamera {
public:
    glm::vec3 target = glm::vec3(0.0f, 0.0f, 0.0f);
    float azimuthDeg = cfg::CAMERA_AZIMUTH_DEG; // about Y
    float polarDeg = cfg::CAMERA_POLAR_DEG;     // elevation, [-85, 85]
    float distance = cfg::CAMERA_DISTANCE;
    float fovyDeg = cfg::CAMERA_FOVY_DEG;

    // Subtracts scaled mouse motion from both angles and re-clamps the polar angle.
    void orbit(float dx, float dy, float sensitivity);

    glm::vec3 position() const;
    glm::mat4 view() const;
    glm::mat4 projection(float aspect) const;
};
