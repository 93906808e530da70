#pragma once

/**
 * @file beat_detector.h
 * @brief Beat and transient detection over band energies
 *
 * BeatDetector provides:
 * - Adaptive-threshold beat detection (mean + k * stdDev over ~43 ticks)
 * - Cooldown against double triggering
 * - Continuous confidence that decays between beats
 * - One-tick transient detection
 * - EMA-smoothed bands and recent peak memory
 */

#include <pulsenet/audio/audio_types.h>
#include <pulsenet/audio/dsp/ring_window.h>
#include <pulsenet/param.h>
#include <pulsenet/param_registry.h>
#include <cstdint>

namespace pulsenet::audio {

/**
 * @brief Beat/transient detector
 *
 * Tracks a composite energy (bass * 1.5 + total * 0.5). Once the history
 * window is full, a beat fires when the energy exceeds
 * mean + sensitivity * stdDev * 2, is above an absolute floor, and the
 * cooldown has elapsed.
 *
 * @par Example
 * @code
 * BeatDetector beats;
 * beats.setSensitivity(0.8f);
 *
 * // Once per tick:
 * BeatResult r = beats.detect(analyzer.analyze());
 * if (r.isBeat && r.beatStrength == BeatStrength::Strong) {
 *     // Flash
 * }
 * @endcode
 */
class BeatDetector : public ParamRegistry {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<float> sensitivity{"sensitivity", 0.6f, 0.3f, 1.0f};      ///< Threshold multiplier
    Param<int> cooldownTicks{"cooldownTicks", 15, 0, 120};            ///< Minimum ticks between beats
    Param<float> smoothingFactor{"smoothingFactor", 0.3f, 0.01f, 1.0f}; ///< EMA alpha (higher = faster)

    /// @}
    // -------------------------------------------------------------------------

    BeatDetector();

    /**
     * @brief Analyze one tick
     * @param sample Current band energies
     */
    BeatResult detect(const BandEnergySample& sample);

    /**
     * @brief Set beat sensitivity
     * @param s Clamped to [0.3, 1.0]
     */
    void setSensitivity(float s) { sensitivity = sensitivity.clamped(s); }

    /// @brief EMA-smoothed bass/mid/high
    SmoothedEnergy getSmoothedEnergy() const { return m_smoothed; }

    /// @brief Maximum of each band over the last ~30 ticks
    RecentPeaks getRecentPeaks() const;

    /// @brief Ticks elapsed since the last beat (counts from construction/reset)
    uint64_t getTicksSinceLastBeat() const { return m_ticksSinceBeat; }

    /// @brief Adaptive threshold of the most recent full-window tick
    float lastThreshold() const { return m_lastThreshold; }

    /// @brief Clear history, cooldown and confidence
    void reset();

    static constexpr uint32_t HISTORY_SIZE = 43;       // ~0.7 s at 60 ticks/s
    static constexpr uint32_t PEAK_HISTORY_SIZE = 30;  // ~0.5 s
    static constexpr float TRANSIENT_THRESHOLD = 0.15f;
    static constexpr float MIN_ENERGY = 0.3f;
    static constexpr float CONFIDENCE_DECAY = 0.9f;

private:
    void updateSmoothedEnergy(const BandEnergySample& sample);
    void updatePeakHistory(const BandEnergySample& sample);

    dsp::RingWindow m_energyHistory{HISTORY_SIZE};
    int m_cooldown = 0;
    float m_confidence = 0.0f;
    float m_lastEnergy = 0.0f;
    float m_lastThreshold = 0.0f;
    uint64_t m_ticksSinceBeat = 0;

    SmoothedEnergy m_smoothed;

    dsp::RingWindow m_peakBass{PEAK_HISTORY_SIZE};
    dsp::RingWindow m_peakMid{PEAK_HISTORY_SIZE};
    dsp::RingWindow m_peakHigh{PEAK_HISTORY_SIZE};
};

} // namespace pulsenet::audio
