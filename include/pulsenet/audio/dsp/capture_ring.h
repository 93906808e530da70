#pragma once

/**
 * @file capture_ring.h
 * @brief Mono ring buffer filled from interleaved device blocks
 *
 * CaptureRing mixes each incoming block down to mono, writes it at the
 * cursor and reports the block's RMS and peak. Readers copy the newest
 * frames without consuming them. Not synchronized; the owner locks.
 */

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace pulsenet::audio::dsp {

/// @brief Signal levels of one written block
struct BlockLevels {
    float rms = 0.0f;
    float peak = 0.0f;
};

class CaptureRing {
public:
    CaptureRing() = default;

    explicit CaptureRing(uint32_t frames) { init(frames); }

    /// @brief Allocate storage for `frames` mono frames and clear
    void init(uint32_t frames) {
        m_buffer.assign(frames, 0.0f);
        m_writePos = 0;
        m_written = 0;
    }

    uint32_t capacity() const { return static_cast<uint32_t>(m_buffer.size()); }

    /// @brief Frames of real data held (at most capacity())
    uint32_t available() const { return m_written; }

    /**
     * @brief Mix an interleaved block to mono and append it
     * @param input frameCount * channels samples
     * @return Levels of the mixed block (zero if nothing was written)
     */
    BlockLevels write(const float* input, uint32_t frameCount, uint32_t channels) {
        BlockLevels levels;
        uint32_t size = capacity();
        if (!input || frameCount == 0 || channels == 0 || size == 0) return levels;

        float sumSquares = 0.0f;
        for (uint32_t i = 0; i < frameCount; i++) {
            float sample = 0.0f;
            for (uint32_t c = 0; c < channels; c++) {
                sample += input[i * channels + c];
            }
            sample /= static_cast<float>(channels);

            sumSquares += sample * sample;
            levels.peak = std::max(levels.peak, std::abs(sample));

            m_buffer[m_writePos] = sample;
            m_writePos = (m_writePos + 1) % size;
        }
        m_written = std::min(m_written + std::min(frameCount, size), size);

        levels.rms = std::sqrt(sumSquares / static_cast<float>(frameCount));
        return levels;
    }

    /**
     * @brief Copy the newest frames, oldest first
     * @return Frames of real data copied; the front of output is zero-filled
     *         when fewer are available
     */
    uint32_t latest(float* output, uint32_t frameCount) const {
        if (!output || frameCount == 0) return 0;

        uint32_t size = capacity();
        uint32_t count = std::min(m_written, frameCount);
        uint32_t padding = frameCount - count;

        std::fill(output, output + padding, 0.0f);
        if (count == 0) return 0;

        // Newest `count` frames end just before the write position
        uint32_t pos = (m_writePos + size - count) % size;
        for (uint32_t i = 0; i < count; i++) {
            output[padding + i] = m_buffer[pos];
            pos = (pos + 1) % size;
        }
        return count;
    }

private:
    std::vector<float> m_buffer;
    uint32_t m_writePos = 0;
    uint32_t m_written = 0;
};

} // namespace pulsenet::audio::dsp
