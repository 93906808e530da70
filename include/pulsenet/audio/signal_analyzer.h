#pragma once

/**
 * @file signal_analyzer.h
 * @brief Microphone -> normalized band energies
 *
 * SignalAnalyzer provides:
 * - Capture acquisition through a SampleSource (miniaudio by default)
 * - Byte-scaled FFT spectrum (SpectrumAnalyzer)
 * - Four contiguous bands: sub-bass, bass, mid, high
 * - Self-calibrating normalization against a decaying running maximum
 */

#include <pulsenet/audio/audio_types.h>
#include <pulsenet/audio/sample_source.h>
#include <pulsenet/audio/spectrum_analyzer.h>
#include <pulsenet/param.h>
#include <pulsenet/param_registry.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace pulsenet::audio {

/**
 * @brief Half-open FFT bin range [start, end)
 */
struct BandRange {
    uint32_t start = 0;
    uint32_t end = 0;
};

/**
 * @brief Banded energy extraction from live input
 *
 * @par Example
 * @code
 * SignalAnalyzer analyzer;           // default microphone
 * analyzer.fftSize(4096);
 * analyzer.initialize();             // throws CaptureUnavailable
 *
 * // Once per tick:
 * BandEnergySample s = analyzer.analyze();
 * float bass = s.bass;
 * @endcode
 */
class SignalAnalyzer : public ParamRegistry {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<float> smoothing{"smoothing", 0.65f, 0.0f, 0.999f};  ///< Spectrum smoothing constant

    /// @}
    // -------------------------------------------------------------------------

    /// @brief Analyze the default microphone
    SignalAnalyzer();

    /// @brief Analyze an explicit source (device selection, tests, file playback)
    explicit SignalAnalyzer(std::unique_ptr<SampleSource> source);

    ~SignalAnalyzer() override;

    // -------------------------------------------------------------------------
    /// @name Configuration
    /// @{

    /**
     * @brief Set FFT size (power of two, default 4096)
     *
     * Takes effect immediately; band boundaries are recomputed if the
     * analyzer is already initialized.
     */
    SignalAnalyzer& fftSize(int n);

    /// @brief Decibel window used for byte scaling (default -100..-30)
    SignalAnalyzer& decibelRange(float minDb, float maxDb);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Open the capture source and compute band boundaries
     * @throws CaptureUnavailable if the input cannot be opened
     */
    void initialize();

    /// @brief Release the capture source
    void destroy();

    /// @brief True between a successful initialize() and destroy()
    bool isActive() const { return m_active; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Analysis
    /// @{

    /**
     * @brief Analyze the newest window of captured audio
     * @return Band energies, or an all-zero sample if not initialized
     */
    BandEnergySample analyze();

    /**
     * @brief Band stage only, for spectra computed elsewhere
     * @param bins Byte magnitudes
     * @param count Number of bins (must match configureBands())
     *
     * Updates the running maxima exactly like analyze().
     */
    BandEnergySample analyzeSpectrum(const uint8_t* bins, uint32_t count);

    /**
     * @brief Compute band bin boundaries
     * @param sampleRate Capture sample rate in Hz
     * @param binCount Number of magnitude bins (fftSize / 2)
     */
    void configureBands(uint32_t sampleRate, uint32_t binCount);

    /// @brief Forget running maxima and spectrum smoothing
    void reset();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Queries
    /// @{

    BandRange subBassRange() const { return m_ranges[SubBass]; }
    BandRange bassRange() const { return m_ranges[Bass]; }
    BandRange midRange() const { return m_ranges[Mid]; }
    BandRange highRange() const { return m_ranges[High]; }

    int fftSize() const { return m_spectrum.fftSize(); }
    int binCount() const { return m_spectrum.binCount(); }

    /// @brief Input latency reported by the source in milliseconds
    float latencyMs() const;

    /// @}

private:
    enum Band { SubBass = 0, Bass, Mid, High, BandCount };

    static float bandMean(const uint8_t* bins, uint32_t count, BandRange range);

    std::unique_ptr<SampleSource> m_source;
    SpectrumAnalyzer m_spectrum;
    std::vector<float> m_frames;

    BandRange m_ranges[BandCount];
    uint32_t m_binCount = 0;
    float m_runningMax[BandCount] = {0.0f, 0.0f, 0.0f, 0.0f};

    bool m_active = false;

    static constexpr float MAX_DECAY = 0.995f;
    static constexpr float MAX_FLOOR = 10.0f;
};

} // namespace pulsenet::audio
