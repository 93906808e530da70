#pragma once

/**
 * @file ring_window.h
 * @brief Fixed-capacity sliding window over scalar history
 *
 * RingWindow keeps the most recent N values in a circular buffer indexed by
 * a write cursor. Pushing never shifts or reallocates. Used for the energy,
 * peak and trend histories of the beat and intelligence stages.
 */

#include <algorithm>
#include <cstdint>
#include <vector>

namespace pulsenet::audio::dsp {

class RingWindow {
public:
    RingWindow() = default;

    explicit RingWindow(uint32_t capacity) { init(capacity); }

    /**
     * @brief Allocate storage and clear
     * @param capacity Number of values retained
     */
    void init(uint32_t capacity) {
        m_buffer.assign(capacity, 0.0f);
        m_writePos = 0;
        m_count = 0;
    }

    /// @brief Forget all values (capacity is kept)
    void clear() {
        std::fill(m_buffer.begin(), m_buffer.end(), 0.0f);
        m_writePos = 0;
        m_count = 0;
    }

    /// @brief Append a value, overwriting the oldest once full
    void push(float value) {
        if (m_buffer.empty()) return;
        m_buffer[m_writePos] = value;
        m_writePos = (m_writePos + 1) % capacity();
        if (m_count < capacity()) m_count++;
    }

    uint32_t capacity() const { return static_cast<uint32_t>(m_buffer.size()); }
    uint32_t size() const { return m_count; }
    bool full() const { return m_count == capacity() && m_count > 0; }
    bool empty() const { return m_count == 0; }

    /**
     * @brief Value by age order
     * @param index 0 = oldest retained value, size()-1 = newest
     */
    float at(uint32_t index) const {
        uint32_t start = (m_writePos + capacity() - m_count) % capacity();
        return m_buffer[(start + index) % capacity()];
    }

    /// @brief Most recently pushed value (0 when empty)
    float newest() const { return m_count > 0 ? at(m_count - 1) : 0.0f; }

    /**
     * @brief Mean of a contiguous age range
     * @param first Index of first value (0 = oldest)
     * @param count Number of values
     */
    float mean(uint32_t first, uint32_t count) const {
        if (count == 0) return 0.0f;
        float sum = 0.0f;
        for (uint32_t i = 0; i < count; i++) {
            sum += at(first + i);
        }
        return sum / static_cast<float>(count);
    }

    /// @brief Mean of every retained value
    float mean() const { return mean(0, m_count); }

    /// @brief Mean of the newest `count` values
    float meanNewest(uint32_t count) const {
        count = std::min(count, m_count);
        return mean(m_count - count, count);
    }

    /// @brief Maximum retained value (0 when empty)
    float max() const {
        float result = 0.0f;
        for (uint32_t i = 0; i < m_count; i++) {
            result = (i == 0) ? at(i) : std::max(result, at(i));
        }
        return result;
    }

private:
    std::vector<float> m_buffer;
    uint32_t m_writePos = 0;
    uint32_t m_count = 0;
};

} // namespace pulsenet::audio::dsp
