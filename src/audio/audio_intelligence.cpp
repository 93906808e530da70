#include <pulsenet/audio/audio_intelligence.h>

#include <algorithm>

namespace pulsenet::audio {

const char* stateName(EnergyState state) {
    switch (state) {
        case EnergyState::Calm: return "CALM";
        case EnergyState::Building: return "BUILDING";
        case EnergyState::Peak: return "PEAK";
        case EnergyState::Breakdown: return "BREAKDOWN";
        case EnergyState::Drop: return "DROP";
    }
    return "UNKNOWN";
}

// =============================================================================
// EnergyStateMachine
// =============================================================================

EnergyStateMachine::EnergyStateMachine() = default;

float EnergyStateMachine::weightedAverage() const {
    // Linear weights: oldest 1, newest N
    float sum = 0.0f;
    float weights = 0.0f;
    for (uint32_t i = 0; i < m_history.size(); i++) {
        float w = static_cast<float>(i + 1);
        sum += m_history.at(i) * w;
        weights += w;
    }
    return weights > 0.0f ? sum / weights : 0.0f;
}

EnergyState EnergyStateMachine::nextState(float trend) const {
    const Thresholds& t = m_thresholds;

    switch (m_state) {
        case EnergyState::Calm:
            if (trend >= t.buildingUp) return EnergyState::Building;
            break;
        case EnergyState::Building:
            if (trend >= t.peakUp) return EnergyState::Peak;
            if (trend < t.buildingDown) return EnergyState::Calm;
            break;
        case EnergyState::Peak:
            if (trend < t.peakDown) return EnergyState::Breakdown;
            break;
        case EnergyState::Breakdown:
            if (trend >= t.peakUp) return EnergyState::Peak;
            if (trend < t.buildingDown) return EnergyState::Calm;
            break;
        case EnergyState::Drop:
            break;
    }
    return m_state;
}

void EnergyStateMachine::enter(EnergyState state) {
    m_state = state;
    m_ticksInState = 0;
}

EnergyState EnergyStateMachine::update(float totalEnergy, bool beatDrop) {
    m_history.push(totalEnergy);
    m_trend = weightedAverage();
    m_ticksInState++;

    // Forced entry, ignores the hold time and re-arms an active DROP
    if (beatDrop) {
        enter(EnergyState::Drop);
        return m_state;
    }

    if (m_ticksInState < m_minHoldTicks) {
        return m_state;
    }

    if (m_state == EnergyState::Drop) {
        if (m_ticksInState >= m_dropTimeoutTicks) {
            enter(m_trend >= m_thresholds.peakDown ? EnergyState::Peak : EnergyState::Breakdown);
        }
        return m_state;
    }

    EnergyState next = nextState(m_trend);
    if (next != m_state) {
        enter(next);
    }
    return m_state;
}

void EnergyStateMachine::reset() {
    m_history.clear();
    m_trend = 0.0f;
    enter(EnergyState::Calm);
}

// =============================================================================
// AudioIntelligence
// =============================================================================

AudioIntelligence::AudioIntelligence() : m_analyzer() {
    registerParam(silenceThreshold);
    registerParam(climaxSensitivity);
}

AudioIntelligence::AudioIntelligence(std::unique_ptr<SampleSource> source)
    : m_analyzer(std::move(source)) {
    registerParam(silenceThreshold);
    registerParam(climaxSensitivity);
}

AudioDescription AudioIntelligence::analyze() {
    return process(m_analyzer.analyze());
}

AudioDescription AudioIntelligence::process(const BandEnergySample& sample) {
    BeatResult beat = m_beats.detect(sample);
    SmoothedEnergy smoothed = m_beats.getSmoothedEnergy();
    RecentPeaks peaks = m_beats.getRecentPeaks();

    bool isSilence = detectSilence(sample.loudness);
    bool isClimax = detectClimax(sample.totalEnergy);
    DropResult drop = detectBeatDrop(sample.totalEnergy);
    float highSpike = detectHighSpike(sample.high);
    EnergyState state = m_states.update(sample.totalEnergy, drop.isDrop);

    AudioDescription d;
    d.subBass = sample.subBass;
    d.bass = sample.bass;
    d.mids = sample.mid;
    d.highs = sample.high;
    d.loudness = sample.loudness;
    d.totalEnergy = sample.totalEnergy;

    d.isBeat = beat.isBeat;
    d.beatStrength = beat.beatStrength;
    d.beatConfidence = beat.confidence;
    d.beatEnergy = beat.energy;
    d.isTransient = beat.isTransient;

    d.isSilence = isSilence;
    d.isClimax = isClimax;
    d.isBeatDrop = drop.isDrop;
    d.beatDropIntensity = drop.intensity;
    d.highSpikeIntensity = highSpike;
    d.energyState = state;

    d.smoothBass = smoothed.bass;
    d.smoothMids = smoothed.mid;
    d.smoothHighs = smoothed.high;

    d.recentPeakBass = peaks.bass;
    d.recentPeakMids = peaks.mid;
    d.recentPeakHighs = peaks.high;

    d.spectrum = sample.spectrum;
    d.spectrumSize = sample.spectrumSize;
    return d;
}

void AudioIntelligence::reset() {
    m_beats.reset();
    m_states.reset();
    m_silenceTicks = 0;
    m_climaxTrend.clear();
    m_dropHistory.clear();
    m_highHistory.clear();
}

bool AudioIntelligence::detectSilence(float loudness) {
    if (loudness < silenceThreshold) {
        m_silenceTicks++;
    } else {
        m_silenceTicks = 0;
    }
    return m_silenceTicks > SILENCE_TICKS_REQUIRED;
}

bool AudioIntelligence::detectClimax(float totalEnergy) {
    m_climaxTrend.push(totalEnergy);
    if (!m_climaxTrend.full()) {
        return false;
    }

    uint32_t half = CLIMAX_WINDOW / 2;
    float avgFirst = m_climaxTrend.mean(0, half);
    float avgSecond = m_climaxTrend.mean(half, half);

    // Offset keeps growth off a near-silent base finite
    float growthRate = (avgSecond - avgFirst) / (avgFirst + 0.01f);

    return growthRate > climaxSensitivity && totalEnergy > 0.6f;
}

AudioIntelligence::DropResult AudioIntelligence::detectBeatDrop(float totalEnergy) {
    m_dropHistory.push(totalEnergy);

    DropResult result;
    if (!m_dropHistory.full()) {
        return result;
    }

    float recentAvg = m_dropHistory.meanNewest(DROP_COMPARE);
    float olderAvg = m_dropHistory.mean(0, DROP_COMPARE);

    float dropMagnitude = olderAvg - recentAvg;
    result.isDrop = olderAvg > DROP_HIGH_ENERGY && dropMagnitude > DROP_THRESHOLD;
    result.intensity = result.isDrop ? std::min(dropMagnitude, 1.0f) : 0.0f;
    return result;
}

float AudioIntelligence::detectHighSpike(float highEnergy) {
    m_highHistory.push(highEnergy);
    if (m_highHistory.size() < SPIKE_MIN_HISTORY) {
        return 0.0f;
    }

    uint32_t baselineCount = m_highHistory.size() - SPIKE_EXCLUDE_NEWEST;
    float baseline = m_highHistory.mean(0, baselineCount);

    float spike = highEnergy - baseline;
    if (spike > SPIKE_THRESHOLD) {
        return std::min(spike / 0.7f, 1.0f);
    }
    return 0.0f;
}

} // namespace pulsenet::audio
