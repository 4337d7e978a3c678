#pragma once

#include <glm/glm.hpp>

#include <cstdint>

// 8-bit RGBA color
struct Color8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    // Per-channel [0,1] for shader uniforms
    glm::vec3 toVec3() const {
        return glm::vec3(r / 255.0f, g / 255.0f, b / 255.0f);
    }
};

inline bool operator==(const Color8& a, const Color8& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

namespace colors {
inline constexpr Color8 WHITE{255, 255, 255, 255};
inline constexpr Color8 RAYWHITE{245, 245, 245, 255};
inline constexpr Color8 BLACK{0, 0, 0, 255};
} // namespace colors

// Input sampled once per frame
struct FrameInput {
    bool lockPressed = false;
    bool spinPressed = false;
    bool markerPressed = false;
    float scroll = 0.0f;
    glm::vec2 mouseDelta = glm::vec2(0.0f);
    float dt = 0.0f;
};
