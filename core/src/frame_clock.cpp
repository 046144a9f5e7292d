// Shaderlay - Frame Clock Implementation

#include <shaderlay/frame_clock.h>
#include <algorithm>

namespace shaderlay {

void FrameClock::start(double now) {
    m_epoch = now;
    m_lastTick = now;
    m_running = true;
}

FrameTime FrameClock::tick(double now) {
    if (!m_running) {
        start(now);
    }

    now = std::max(now, m_lastTick);

    FrameTime t;
    t.time = static_cast<float>((now - m_epoch) * m_timeScale);
    t.delta = static_cast<float>((now - m_lastTick) * m_timeScale);
    m_lastTick = now;
    return t;
}

} // namespace shaderlay
