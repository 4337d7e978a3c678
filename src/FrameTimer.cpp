#include "FrameTimer.hpp"

#include <algorithm>
#include <cmath>

FrameTimer::FrameTimer(int targetFps, double averageWindow)
    : m_budget(targetFps > 0 ? 1.0 / (double)targetFps : 0.0),
      m_window(averageWindow > 0.0 ? averageWindow : 0.5) {}

void FrameTimer::start(double now) {
    m_last = now;
    m_windowStart = now;
    m_windowFrames = 0;
    m_fps = 0;
    m_totalFrames = 0;
}

float FrameTimer::tick(double now) {
    double dt = std::max(0.0, now - m_last);
    m_last = now;
    ++m_totalFrames;

    // Count frames in the window; refresh the readout when it closes
    ++m_windowFrames;
    double elapsed = now - m_windowStart;
    if (elapsed >= m_window) {
        m_fps = (int)std::lround((double)m_windowFrames / elapsed);
        m_windowFrames = 0;
        m_windowStart = now;
    }

    return (float)dt;
}

double FrameTimer::remaining(double now) const {
    if (m_budget <= 0.0) return 0.0;
    return std::max(0.0, m_budget - (now - m_last));
}
