#include "Overlay.hpp"

#include "Config.hpp"

#include <algorithm>
#include <utility>

namespace overlay {

std::vector<TextLine> layout(const DemoScene& scene, int fps, int windowH) {
    std::vector<TextLine> lines;

    int y = cfg::TEXT_TOP;
    for (const auto& text : DemoScene::helpLines()) {
        lines.push_back(TextLine{text, cfg::TEXT_LEFT, y});
        y += cfg::TEXT_LINE_STEP;
    }
    for (auto& text : scene.statusLines()) {
        lines.push_back(TextLine{std::move(text), cfg::TEXT_LEFT, y});
        y += cfg::TEXT_LINE_STEP;
    }

    lines.push_back(TextLine{"FPS: " + std::to_string(fps), cfg::TEXT_LEFT, windowH - cfg::FPS_BOTTOM_OFFSET});
    return lines;
}

float contentScale(int framebufferW, int windowW) {
    if (framebufferW <= 0 || windowW <= 0) return 1.0f;
    return std::max(1.0f, (float)framebufferW / (float)windowW);
}

} // namespace overlay
