#pragma once

// Shaderlay - Frame Clock
// Elapsed and delta time for the animation uniforms

namespace shaderlay {

struct FrameTime {
    float time = 0.0f;   // Seconds since the clock started
    float delta = 0.0f;  // Seconds since the previous tick
};

class FrameClock {
public:
    FrameClock() = default;

    // Start (or restart) the clock at `now` seconds
    void start(double now);

    // Advance to `now`, returning scaled elapsed and delta time.
    // Time never runs backwards: an earlier `now` yields a zero delta.
    FrameTime tick(double now);

    void setTimeScale(double scale) { m_timeScale = scale; }
    double timeScale() const { return m_timeScale; }

    bool isRunning() const { return m_running; }
    double epoch() const { return m_epoch; }
    double lastTick() const { return m_lastTick; }

private:
    double m_epoch = 0.0;
    double m_lastTick = 0.0;
    double m_timeScale = 1.0;
    bool m_running = false;
};

} // namespace shaderlay
