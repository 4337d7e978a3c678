#include "Input.hpp"

void InputAccumulator::cursorMoved(double x, double y) {
    if (m_seeded) {
        m_dx += x - m_lastX;
        m_dy += y - m_lastY;
    }
    m_lastX = x;
    m_lastY = y;
    m_seeded = true;
}

void InputAccumulator::reseed(double x, double y) {
    m_lastX = x;
    m_lastY = y;
    m_seeded = true;
}

FrameInput InputAccumulator::drain() {
    FrameInput f;
    f.lockPressed = m_lockPressed;
    f.spinPressed = m_spinPressed;
    f.markerPressed = m_markerPressed;
    f.scroll = (float)m_scroll;
    f.mouseDelta = glm::vec2((float)m_dx, (float)m_dy);

    m_lockPressed = m_spinPressed = m_markerPressed = false;
    m_scroll = 0.0;
    m_dx = m_dy = 0.0;
    return f;
}
