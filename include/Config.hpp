#pragma once

#include <array>
#include <string>

namespace cfg {

// Window
inline constexpr int WINDOW_WIDTH = 800;
inline constexpr int WINDOW_HEIGHT = 600;
inline constexpr const char* WINDOW_TITLE = "Spinning Cube with Lighting";
inline constexpr int TARGET_FPS = 60;
inline constexpr double FPS_AVERAGE_SECONDS = 0.5;

// Orbit camera (degrees / world units)
// World uses: X (right), Y (up), Z (toward viewer at azimuth 0)
inline constexpr float CAMERA_AZIMUTH_DEG = 45.0f;
inline constexpr float CAMERA_POLAR_DEG = 45.0f;
inline constexpr float CAMERA_DISTANCE = 5.0f;
inline constexpr float CAMERA_FOVY_DEG = 45.0f;
inline constexpr float CAMERA_NEAR = 0.1f;
inline constexpr float CAMERA_FAR = 1000.0f;
inline constexpr float CAMERA_POLAR_MIN = -85.0f; // allow looking from below
inline constexpr float CAMERA_POLAR_MAX = 85.0f;

// Input
inline constexpr float MOUSE_SENSITIVITY = 0.5f;  // degrees per pixel
inline constexpr float SCROLL_LIGHT_STEP = 0.5f;  // world units per wheel notch
inline constexpr float SPIN_SPEED = 1.0f;         // accumulator units per second

// Point light
inline constexpr float LIGHT_START_X = 2.0f;
inline constexpr float LIGHT_START_Y = 2.0f;
inline constexpr float LIGHT_START_Z = 2.0f;
inline constexpr float LIGHT_Y_MIN = -5.0f;
inline constexpr float LIGHT_Y_MAX = 10.0f;
inline constexpr float LIGHT_MARKER_RADIUS = 0.1f;

// Cube
inline constexpr float CUBE_SIZE = 2.0f;
inline constexpr float CUBE_ROTATION_SCALE_DEG = 50.0f; // rotation accumulator -> degrees
inline constexpr float CUBE_AXIS_X = 0.5f;
inline constexpr float CUBE_AXIS_Y = 1.0f;
inline constexpr float CUBE_AXIS_Z = 0.0f;

// Reference grid on the XZ plane
inline constexpr int GRID_SLICES = 10;
inline constexpr float GRID_SPACING = 1.0f;

// Phong terms used by lighting.frag
inline constexpr float AMBIENT_STRENGTH = 0.1f;
inline constexpr float SPECULAR_STRENGTH = 0.5f;
inline constexpr float SHININESS = 32.0f;

// Overlay text (top-left pixel coordinates)
inline constexpr int FONT_PIXEL_SIZE = 20;
inline constexpr int TEXT_LEFT = 10;
inline constexpr int TEXT_TOP = 10;
inline constexpr int TEXT_LINE_STEP = 30;
inline constexpr int FPS_BOTTOM_OFFSET = 30;

inline const std::string LIGHTING_VERT = "assets/shaders/lighting.vert";
inline const std::string LIGHTING_FRAG = "assets/shaders/lighting.frag";
inline const std::string FLAT_VERT = "assets/shaders/flat.vert";
inline const std::string FLAT_FRAG = "assets/shaders/flat.frag";
inline const std::string TEXT_VERT = "assets/shaders/text.vert";
inline const std::string TEXT_FRAG = "assets/shaders/text.frag";

// Font for the overlay; first existing file wins.
inline const std::array<std::string, 4> FONT_CANDIDATES = {
    "assets/fonts/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/Library/Fonts/Arial.ttf",
};

} // namespace cfg
