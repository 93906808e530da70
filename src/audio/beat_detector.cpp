#include <pulsenet/audio/beat_detector.h>

#include <algorithm>
#include <cmath>

namespace pulsenet::audio {

BeatDetector::BeatDetector() {
    registerParam(sensitivity);
    registerParam(cooldownTicks);
    registerParam(smoothingFactor);
}

BeatResult BeatDetector::detect(const BandEnergySample& sample) {
    // Bass dominates the composite energy
    float currentEnergy = sample.bass * 1.5f + sample.totalEnergy * 0.5f;

    updateSmoothedEnergy(sample);
    updatePeakHistory(sample);

    // Transient: sharp one-tick rise, independent of the window
    float energyDelta = currentEnergy - m_lastEnergy;
    bool isTransient = energyDelta > TRANSIENT_THRESHOLD && currentEnergy > MIN_ENERGY;
    m_lastEnergy = currentEnergy;

    m_energyHistory.push(currentEnergy);

    if (m_cooldown > 0) {
        m_cooldown--;
    }
    m_ticksSinceBeat++;

    BeatResult result;
    result.energy = currentEnergy;

    // Not enough history for a meaningful threshold yet
    if (!m_energyHistory.full()) {
        return result;
    }

    result.isTransient = isTransient;

    float avgEnergy = m_energyHistory.mean();
    float variance = 0.0f;
    for (uint32_t i = 0; i < m_energyHistory.size(); i++) {
        float diff = m_energyHistory.at(i) - avgEnergy;
        variance += diff * diff;
    }
    variance /= static_cast<float>(m_energyHistory.size());
    float stdDev = std::sqrt(variance);

    float sens = sensitivity;
    float threshold = avgEnergy + sens * stdDev * 2.0f;
    m_lastThreshold = threshold;

    bool isBeat = currentEnergy > threshold && m_cooldown == 0 && currentEnergy > MIN_ENERGY;

    if (isBeat) {
        m_confidence = std::min((currentEnergy - threshold) / threshold, 1.0f);
        m_cooldown = cooldownTicks;
        m_ticksSinceBeat = 0;

        if (m_confidence < 0.3f) {
            result.beatStrength = BeatStrength::Weak;
        } else if (m_confidence < 0.7f) {
            result.beatStrength = BeatStrength::Medium;
        } else {
            result.beatStrength = BeatStrength::Strong;
        }
    } else {
        m_confidence *= CONFIDENCE_DECAY;
    }

    result.isBeat = isBeat;
    result.confidence = m_confidence;
    return result;
}

void BeatDetector::updateSmoothedEnergy(const BandEnergySample& sample) {
    float alpha = smoothingFactor;
    m_smoothed.bass = alpha * sample.bass + (1.0f - alpha) * m_smoothed.bass;
    m_smoothed.mid = alpha * sample.mid + (1.0f - alpha) * m_smoothed.mid;
    m_smoothed.high = alpha * sample.high + (1.0f - alpha) * m_smoothed.high;
}

void BeatDetector::updatePeakHistory(const BandEnergySample& sample) {
    m_peakBass.push(sample.bass);
    m_peakMid.push(sample.mid);
    m_peakHigh.push(sample.high);
}

RecentPeaks BeatDetector::getRecentPeaks() const {
    RecentPeaks peaks;
    peaks.bass = std::max(m_peakBass.max(), 0.0f);
    peaks.mid = std::max(m_peakMid.max(), 0.0f);
    peaks.high = std::max(m_peakHigh.max(), 0.0f);
    return peaks;
}

void BeatDetector::reset() {
    m_energyHistory.clear();
    m_cooldown = 0;
    m_confidence = 0.0f;
    m_lastEnergy = 0.0f;
    m_lastThreshold = 0.0f;
    m_ticksSinceBeat = 0;
    m_smoothed = SmoothedEnergy{};
    m_peakBass.clear();
    m_peakMid.clear();
    m_peakHigh.clear();
}

} // namespace pulsenet::audio
