#pragma once

/**
 * @file audio_intelligence.h
 * @brief Per-tick orchestration and enrichment of the audio pipeline
 *
 * AudioIntelligence runs SignalAnalyzer -> BeatDetector and adds:
 * - Silence detection (debounced loudness floor)
 * - Climax detection (energy growth over a 120-tick window)
 * - Beat-drop detection (fall after sustained high energy)
 * - High-frequency spike intensity
 * - A hysteresis energy-state machine (CALM/BUILDING/PEAK/BREAKDOWN/DROP)
 */

#include <pulsenet/audio/audio_types.h>
#include <pulsenet/audio/beat_detector.h>
#include <pulsenet/audio/dsp/ring_window.h>
#include <pulsenet/audio/signal_analyzer.h>
#include <pulsenet/param.h>
#include <pulsenet/param_registry.h>
#include <cstdint>
#include <memory>

namespace pulsenet::audio {

/**
 * @brief Hysteresis state machine over a weighted energy trend
 *
 * Each transition has an up-threshold and a lower down-threshold. A state
 * must be held for minHoldTicks before another transition, except the
 * forced entry into DROP. DROP reverts to PEAK or BREAKDOWN after
 * dropTimeoutTicks.
 */
class EnergyStateMachine {
public:
    struct Thresholds {
        float buildingUp = 0.35f;    ///< CALM -> BUILDING
        float buildingDown = 0.25f;  ///< BUILDING/BREAKDOWN -> CALM
        float peakUp = 0.65f;        ///< BUILDING/BREAKDOWN -> PEAK
        float peakDown = 0.50f;      ///< PEAK -> BREAKDOWN
    };

    EnergyStateMachine();

    /**
     * @brief Advance one tick
     * @param totalEnergy Current total energy (0-1)
     * @param beatDrop True when a beat drop was detected this tick
     * @return State after this tick
     */
    EnergyState update(float totalEnergy, bool beatDrop);

    void reset();

    EnergyState state() const { return m_state; }
    uint32_t ticksInState() const { return m_ticksInState; }

    /// @brief Weighted moving average of total energy (newest weighted most)
    float trend() const { return m_trend; }

    void setMinHoldTicks(uint32_t ticks) { m_minHoldTicks = ticks; }
    void setDropTimeoutTicks(uint32_t ticks) { m_dropTimeoutTicks = ticks; }
    void setThresholds(const Thresholds& t) { m_thresholds = t; }

    uint32_t minHoldTicks() const { return m_minHoldTicks; }
    uint32_t dropTimeoutTicks() const { return m_dropTimeoutTicks; }
    const Thresholds& thresholds() const { return m_thresholds; }

    static constexpr uint32_t TREND_WINDOW = 60;

private:
    float weightedAverage() const;
    EnergyState nextState(float trend) const;
    void enter(EnergyState state);

    EnergyState m_state = EnergyState::Calm;
    uint32_t m_ticksInState = 0;
    float m_trend = 0.0f;
    dsp::RingWindow m_history{TREND_WINDOW};

    Thresholds m_thresholds;
    uint32_t m_minHoldTicks = 120;      // ~2 s
    uint32_t m_dropTimeoutTicks = 180;  // ~3 s
};

/**
 * @brief Central audio hub producing one AudioDescription per tick
 *
 * @par Example
 * @code
 * AudioIntelligence audio;
 * audio.initialize();                       // throws CaptureUnavailable
 * audio.beatDetector().setSensitivity(0.7f);
 *
 * // Once per frame:
 * AudioDescription d = audio.analyze();
 * network.update(d);
 * @endcode
 */
class AudioIntelligence : public ParamRegistry {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<float> silenceThreshold{"silenceThreshold", 0.05f, 0.01f, 0.2f};   ///< Loudness floor
    Param<float> climaxSensitivity{"climaxSensitivity", 0.7f, 0.3f, 1.0f};   ///< Growth rate for climax

    /// @}
    // -------------------------------------------------------------------------

    /// @brief Use the default microphone
    AudioIntelligence();

    /// @brief Use an explicit capture source
    explicit AudioIntelligence(std::unique_ptr<SampleSource> source);

    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /// @throws CaptureUnavailable if the input cannot be opened
    void initialize() { m_analyzer.initialize(); }

    /// @brief Release the capture stream
    void destroy() { m_analyzer.destroy(); }

    bool isActive() const { return m_analyzer.isActive(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Analysis
    /// @{

    /**
     * @brief Run the full pipeline for this tick
     *
     * Returns a description with zero bands (and silence accumulating) when
     * the analyzer is not initialized.
     */
    AudioDescription analyze();

    /**
     * @brief Enrich an already-analyzed sample
     *
     * analyze() is analyzer.analyze() followed by this. Exposed for hosts
     * that run their own spectrum stage.
     */
    AudioDescription process(const BandEnergySample& sample);

    /// @brief Clear all detector histories
    void reset();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Tuning
    /// @{

    /// @brief Clamped to [0.01, 0.2]
    void setSilenceThreshold(float t) { silenceThreshold = silenceThreshold.clamped(t); }

    /// @brief Clamped to [0.3, 1.0]
    void setClimaxSensitivity(float s) { climaxSensitivity = climaxSensitivity.clamped(s); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Components
    /// @{

    SignalAnalyzer& signalAnalyzer() { return m_analyzer; }
    const SignalAnalyzer& signalAnalyzer() const { return m_analyzer; }
    BeatDetector& beatDetector() { return m_beats; }
    const BeatDetector& beatDetector() const { return m_beats; }
    EnergyStateMachine& stateMachine() { return m_states; }
    const EnergyStateMachine& stateMachine() const { return m_states; }

    EnergyState energyState() const { return m_states.state(); }
    uint32_t ticksInState() const { return m_states.ticksInState(); }
    float energyTrend() const { return m_states.trend(); }

    /// @}

    static constexpr uint32_t SILENCE_TICKS_REQUIRED = 30;  // ~0.5 s
    static constexpr uint32_t CLIMAX_WINDOW = 120;          // ~2 s
    static constexpr uint32_t DROP_WINDOW = 30;             // ~0.5 s
    static constexpr uint32_t DROP_COMPARE = 10;
    static constexpr float DROP_HIGH_ENERGY = 0.6f;
    static constexpr float DROP_THRESHOLD = 0.4f;
    static constexpr uint32_t SPIKE_WINDOW = 10;
    static constexpr uint32_t SPIKE_MIN_HISTORY = 5;
    static constexpr uint32_t SPIKE_EXCLUDE_NEWEST = 3;
    static constexpr float SPIKE_THRESHOLD = 0.3f;

private:
    struct DropResult {
        bool isDrop = false;
        float intensity = 0.0f;
    };

    bool detectSilence(float loudness);
    bool detectClimax(float totalEnergy);
    DropResult detectBeatDrop(float totalEnergy);
    float detectHighSpike(float highEnergy);

    SignalAnalyzer m_analyzer;
    BeatDetector m_beats;
    EnergyStateMachine m_states;

    uint32_t m_silenceTicks = 0;
    dsp::RingWindow m_climaxTrend{CLIMAX_WINDOW};
    dsp::RingWindow m_dropHistory{DROP_WINDOW};
    dsp::RingWindow m_highHistory{SPIKE_WINDOW};
};

} // namespace pulsenet::audio
