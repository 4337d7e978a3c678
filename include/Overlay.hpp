#pragma once

#include "DemoScene.hpp"

#include <string>
#include <vector>

// Text overlay layout in window coordinates (top-left origin, not framebuffer pixels)
namespace overlay {

struct TextLine {
    std::string text;
    int x = 0;
    int y = 0;
};

// Help lines, status lines, then the FPS line anchored to the bottom edge.
std::vector<TextLine> layout(const DemoScene& scene, int fps, int windowH);

// Framebuffer pixels per window unit (2 on a typical HiDPI display, never below 1).
float contentScale(int framebufferW, int windowW);

} // namespace overlay
