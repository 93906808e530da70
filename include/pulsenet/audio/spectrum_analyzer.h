#pragma once

/**
 * @file spectrum_analyzer.h
 * @brief Windowed FFT producing byte-scaled magnitude bins
 *
 * SpectrumAnalyzer behaves like a browser analyser node:
 * - Power-of-two FFT size (256 to 32768, default 4096)
 * - Hann window over the newest fftSize samples
 * - Temporal smoothing of linear magnitudes
 * - Decibel window [minDecibels, maxDecibels] mapped onto 0-255
 */

#include <cstdint>
#include <memory>
#include <vector>

namespace pulsenet::audio {

class SpectrumAnalyzer {
public:
    SpectrumAnalyzer();
    ~SpectrumAnalyzer();

    SpectrumAnalyzer(const SpectrumAnalyzer&) = delete;
    SpectrumAnalyzer& operator=(const SpectrumAnalyzer&) = delete;

    // -------------------------------------------------------------------------
    /// @name Configuration
    /// @{

    /**
     * @brief Set FFT size
     * @param n Rounded up to the next power of two in [256, 32768]
     */
    void setFftSize(int n);

    /// @brief Smoothing time constant (0 = none, just below 1 = heavy)
    void setSmoothing(float s);

    /// @brief Decibel range mapped to bytes 0..255
    void setDecibelRange(float minDb, float maxDb);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Analysis
    /// @{

    /**
     * @brief Transform one window of samples
     * @param samples fftSize() mono samples, oldest first
     */
    void process(const float* samples);

    /// @brief Forget smoothing history
    void reset();

    /// @brief Byte magnitudes (binCount() entries)
    const uint8_t* bytes() const { return m_bytes.data(); }

    /// @brief Smoothed linear magnitudes (binCount() entries)
    const float* magnitudes() const { return m_smoothed.data(); }

    /// @}

    int fftSize() const { return m_fftSize; }
    int binCount() const { return m_fftSize / 2; }
    float smoothing() const { return m_smoothing; }
    float minDecibels() const { return m_minDb; }
    float maxDecibels() const { return m_maxDb; }

private:
    void allocateBuffers();

    int m_fftSize = 4096;
    float m_smoothing = 0.65f;
    float m_minDb = -100.0f;
    float m_maxDb = -30.0f;

    // FFT state (pimpl to hide KissFFT types)
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    std::vector<float> m_smoothed;
    std::vector<uint8_t> m_bytes;
};

} // namespace pulsenet::audio
