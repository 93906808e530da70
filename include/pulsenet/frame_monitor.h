#pragma once

/**
 * @file frame_monitor.h
 * @brief Rolling frame-time statistics for the tick loop
 */

#include <pulsenet/audio/dsp/ring_window.h>
#include <chrono>
#include <cstdint>

namespace pulsenet {

/**
 * @brief Tracks the last 60 frame times and flags sustained low FPS
 *
 * @par Example
 * @code
 * FrameMonitor monitor;
 * while (running) {
 *     tick();
 *     monitor.frame();
 *     if (monitor.isPerformanceLow()) {
 *         network.setNodeCount(reducedNodeCount(network.nodeCount()));
 *     }
 * }
 * @endcode
 */
class FrameMonitor {
public:
    FrameMonitor();

    /// @brief Mark the end of a frame (measures time since the previous call)
    void frame();

    /// @brief Record an explicit frame duration in milliseconds
    void addFrameTime(float ms);

    /// @brief Forget all samples and restart the clock
    void reset();

    /// @brief Rounded frames per second over the window (0 before any frame)
    int fps() const;

    /// @brief Mean frame time over the window in milliseconds
    float frameTimeMs() const { return m_frameTimes.mean(); }

    /// @brief True when the window is full and fps() < 30
    bool isPerformanceLow() const;

    uint32_t sampleCount() const { return m_frameTimes.size(); }

    static constexpr uint32_t WINDOW = 60;
    static constexpr int LOW_FPS = 30;

private:
    using Clock = std::chrono::steady_clock;

    audio::dsp::RingWindow m_frameTimes{WINDOW};
    Clock::time_point m_lastFrame;
    bool m_started = false;
};

/**
 * @brief Next node count after a low-performance report
 * @return current - 50 floored at 100, never more than current
 */
int reducedNodeCount(int current);

} // namespace pulsenet
