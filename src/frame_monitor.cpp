#include <pulsenet/frame_monitor.h>

#include <algorithm>
#include <cmath>

namespace pulsenet {

FrameMonitor::FrameMonitor() = default;

void FrameMonitor::frame() {
    Clock::time_point now = Clock::now();
    if (m_started) {
        std::chrono::duration<float, std::milli> delta = now - m_lastFrame;
        addFrameTime(delta.count());
    }
    m_lastFrame = now;
    m_started = true;
}

void FrameMonitor::addFrameTime(float ms) {
    m_frameTimes.push(std::max(ms, 0.0f));
}

void FrameMonitor::reset() {
    m_frameTimes.clear();
    m_started = false;
}

int FrameMonitor::fps() const {
    float avg = m_frameTimes.mean();
    if (avg <= 0.0f) return 0;
    return static_cast<int>(std::lround(1000.0f / avg));
}

bool FrameMonitor::isPerformanceLow() const {
    return m_frameTimes.full() && frameTimeMs() > 0.0f && fps() < LOW_FPS;
}

int reducedNodeCount(int current) {
    return std::min(current, std::max(100, current - 50));
}

} // namespace pulsenet
