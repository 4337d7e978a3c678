#pragma once

#include "Config.hpp"

// Frame delta, target-rate pacing and an averaged FPS readout.
// Times are seconds from any monotonic clock (glfwGetTime in the app).
class FrameTimer {
public:
    explicit FrameTimer(int targetFps = cfg::TARGET_FPS,
                        double averageWindow = cfg::FPS_AVERAGE_SECONDS);

    void start(double now);

    // Marks the beginning of a frame; returns seconds since the previous one.
    float tick(double now);

    // Seconds left in the current frame budget (0 when already over).
    double remaining(double now) const;

    double frameBudget() const { return m_budget; }
    int fps() const { return m_fps; }
    unsigned long long frameCount() const { return m_totalFrames; }

private:
    double m_budget = 0.0;
    double m_window = 0.5;

    double m_last = 0.0;
    double m_windowStart = 0.0;
    int m_windowFrames = 0;
    int m_fps = 0;
    unsigned long long m_totalFrames = 0;
};
