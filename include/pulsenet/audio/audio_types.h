#pragma once

/**
 * @file audio_types.h
 * @brief Per-tick records passed between the audio stages
 *
 * BandEnergySample (SignalAnalyzer) -> BeatResult (BeatDetector) ->
 * AudioDescription (AudioIntelligence). All three are plain values produced
 * fresh every tick.
 */

#include <cstdint>

namespace pulsenet::audio {

/**
 * @brief Normalized band energies for one tick
 *
 * The spectrum pointer refers to the analyzer's internal byte buffer and
 * stays valid until the next SignalAnalyzer::analyze() call.
 */
struct BandEnergySample {
    float subBass = 0.0f;           ///< 20-60 Hz, 0-1
    float bass = 0.0f;              ///< 60-250 Hz, 0-1
    float mid = 0.0f;               ///< 250-2000 Hz, 0-1
    float high = 0.0f;              ///< 2000-20000 Hz, 0-1
    float totalEnergy = 0.0f;       ///< Mean of the four normalized bands
    float loudness = 0.0f;          ///< Mean over all bins / 255

    const uint8_t* spectrum = nullptr;  ///< Raw byte magnitudes (binCount entries)
    uint32_t spectrumSize = 0;
};

/**
 * @brief Beat strength classification
 */
enum class BeatStrength : int {
    None = 0,
    Weak = 1,
    Medium = 2,
    Strong = 3
};

/**
 * @brief Output of BeatDetector::detect()
 */
struct BeatResult {
    bool isBeat = false;
    float confidence = 0.0f;        ///< 0-1, decays by 0.9 per tick without a beat
    float energy = 0.0f;            ///< Composite energy (bass*1.5 + total*0.5)
    bool isTransient = false;
    BeatStrength beatStrength = BeatStrength::None;
};

/**
 * @brief Smoothed (EMA) band energies
 */
struct SmoothedEnergy {
    float bass = 0.0f;
    float mid = 0.0f;
    float high = 0.0f;
};

/**
 * @brief Recent per-band maxima
 */
struct RecentPeaks {
    float bass = 0.0f;
    float mid = 0.0f;
    float high = 0.0f;
};

/**
 * @brief Coarse musical energy state
 *
 * Ordered progression CALM -> BUILDING -> PEAK -> BREAKDOWN, with DROP
 * entered directly on a detected beat drop.
 */
enum class EnergyState : int {
    Calm = 0,
    Building,
    Peak,
    Breakdown,
    Drop
};

/// @brief Upper-case state name ("CALM", "BUILDING", ...)
const char* stateName(EnergyState state);

/**
 * @brief Enriched per-tick audio record consumed by every visual
 *
 * bassEnergy()/midEnergy()/highEnergy() are the legacy names for
 * bass/mids/highs and always read the same member.
 */
struct AudioDescription {
    // Frequency bands (normalized 0-1)
    float subBass = 0.0f;
    float bass = 0.0f;
    float mids = 0.0f;
    float highs = 0.0f;

    // Overall metrics
    float loudness = 0.0f;
    float totalEnergy = 0.0f;

    // Beat detection
    bool isBeat = false;
    BeatStrength beatStrength = BeatStrength::None;
    float beatConfidence = 0.0f;
    float beatEnergy = 0.0f;
    bool isTransient = false;

    // Dynamics
    bool isSilence = false;
    bool isClimax = false;
    bool isBeatDrop = false;
    float beatDropIntensity = 0.0f;
    float highSpikeIntensity = 0.0f;
    EnergyState energyState = EnergyState::Calm;

    // Smoothed values (EMA)
    float smoothBass = 0.0f;
    float smoothMids = 0.0f;
    float smoothHighs = 0.0f;

    // Peak memory
    float recentPeakBass = 0.0f;
    float recentPeakMids = 0.0f;
    float recentPeakHighs = 0.0f;

    // Raw spectrum, valid until the next analyze()
    const uint8_t* spectrum = nullptr;
    uint32_t spectrumSize = 0;

    // Legacy names
    float bassEnergy() const { return bass; }
    float midEnergy() const { return mids; }
    float highEnergy() const { return highs; }
};

} // namespace pulsenet::audio
