#include "Camera.hpp"

#include "Util.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <cmath>

void OrbitCamera::orbit(float dx, float dy, float sensitivity) {
    azimuthDeg -= dx * sensitivity;
    polarDeg -= dy * sensitivity;
    polarDeg = util::clampf(polarDeg, cfg::CAMERA_POLAR_MIN, cfg::CAMERA_POLAR_MAX);
}

glm::vec3 OrbitCamera::position() const {
    float az = glm::radians(azimuthDeg);
    float pol = glm::radians(polarDeg);

    // azimuth 0 / polar 0 looks down -Z from +Z
    glm::vec3 dir;
    dir.x = std::sin(az) * std::cos(pol);
    dir.y = std::sin(pol);
    dir.z = std::cos(az) * std::cos(pol);

    return target + dir * distance;
}

glm::mat4 OrbitCamera::view() const {
    return glm::lookAt(position(), target, glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::mat4 OrbitCamera::projection(float aspect) const {
    return glm::perspective(glm::radians(fovyDeg), aspect, cfg::CAMERA_NEAR, cfg::CAMERA_FAR);
}
