#pragma once

#include "Types.hpp"

// Collects window events between two frames; drained once per frame.
// Cursor motion is always accumulated; DemoScene decides whether it orbits the camera.
class InputAccumulator {
public:
    void pressLock() { m_lockPressed = true; }
    void pressSpin() { m_spinPressed = true; }
    void pressMarker() { m_markerPressed = true; }

    void addScroll(double dy) { m_scroll += dy; }

    // First call after construction or reseed() only sets the reference point.
    void cursorMoved(double x, double y);

    // New reference point without producing a delta (cursor mode switches warp the cursor).
    void reseed(double x, double y);

    // Returns the pending input (dt left at 0) and clears it.
    FrameInput drain();

private:
    bool m_lockPressed = false;
    bool m_spinPressed = false;
    bool m_markerPressed = false;
    double m_scroll = 0.0;

    bool m_seeded = false;
    double m_lastX = 0.0;
    double m_lastY = 0.0;
    double m_dx = 0.0;
    double m_dy = 0.0;
};
