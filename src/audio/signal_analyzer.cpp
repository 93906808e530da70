#include <pulsenet/audio/signal_analyzer.h>
#include <pulsenet/audio/audio_capture.h>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace pulsenet::audio {

SignalAnalyzer::SignalAnalyzer() : SignalAnalyzer(std::make_unique<AudioCapture>()) {}

SignalAnalyzer::SignalAnalyzer(std::unique_ptr<SampleSource> source)
    : m_source(std::move(source)) {
    registerParam(smoothing);
}

SignalAnalyzer::~SignalAnalyzer() {
    destroy();
}

SignalAnalyzer& SignalAnalyzer::fftSize(int n) {
    m_spectrum.setFftSize(n);
    m_frames.assign(m_spectrum.fftSize(), 0.0f);
    if (m_active) {
        configureBands(m_source->sampleRate(), m_spectrum.binCount());
    }
    return *this;
}

SignalAnalyzer& SignalAnalyzer::decibelRange(float minDb, float maxDb) {
    m_spectrum.setDecibelRange(minDb, maxDb);
    return *this;
}

void SignalAnalyzer::initialize() {
    if (!m_source) {
        throw CaptureUnavailable("[SignalAnalyzer] No capture source");
    }

    // Failure leaves the analyzer inactive so the caller can retry
    m_source->open();

    m_frames.assign(m_spectrum.fftSize(), 0.0f);
    m_spectrum.reset();
    configureBands(m_source->sampleRate(), m_spectrum.binCount());

    m_active = true;
    std::cout << "[SignalAnalyzer] Initialized: fft " << m_spectrum.fftSize()
              << ", " << m_source->sampleRate() << "Hz\n";
}

void SignalAnalyzer::destroy() {
    if (m_source) {
        m_source->close();
    }
    if (m_active) {
        std::cout << "[SignalAnalyzer] Destroyed\n";
    }
    m_active = false;
}

void SignalAnalyzer::configureBands(uint32_t sampleRate, uint32_t binCount) {
    m_binCount = binCount;
    if (sampleRate == 0 || binCount == 0) {
        for (auto& r : m_ranges) r = BandRange{};
        return;
    }

    float binSize = (sampleRate / 2.0f) / binCount;
    auto toBin = [&](float hz) {
        return std::min(static_cast<uint32_t>(std::floor(hz / binSize)), binCount);
    };

    m_ranges[SubBass] = {toBin(20.0f), toBin(60.0f)};
    m_ranges[Bass] = {m_ranges[SubBass].end, toBin(250.0f)};
    m_ranges[Mid] = {m_ranges[Bass].end, toBin(2000.0f)};
    m_ranges[High] = {m_ranges[Mid].end, toBin(20000.0f)};

    std::cout << "[SignalAnalyzer] Frequency ranges: subBass " << m_ranges[SubBass].start << "-" << m_ranges[SubBass].end
              << ", bass " << m_ranges[Bass].start << "-" << m_ranges[Bass].end
              << ", mid " << m_ranges[Mid].start << "-" << m_ranges[Mid].end
              << ", high " << m_ranges[High].start << "-" << m_ranges[High].end << "\n";
}

void SignalAnalyzer::reset() {
    std::fill(std::begin(m_runningMax), std::end(m_runningMax), 0.0f);
    m_spectrum.reset();
}

float SignalAnalyzer::bandMean(const uint8_t* bins, uint32_t count, BandRange range) {
    uint32_t end = std::min(range.end, count);
    if (!bins || range.start >= end) {
        return 0.0f;
    }

    float sum = 0.0f;
    for (uint32_t i = range.start; i < end; i++) {
        sum += bins[i];
    }
    return sum / static_cast<float>(end - range.start);
}

BandEnergySample SignalAnalyzer::analyze() {
    if (!m_active) {
        return BandEnergySample{};
    }

    m_spectrum.setSmoothing(smoothing);
    m_source->latestSamples(m_frames.data(), static_cast<uint32_t>(m_frames.size()));
    m_spectrum.process(m_frames.data());

    return analyzeSpectrum(m_spectrum.bytes(), static_cast<uint32_t>(m_spectrum.binCount()));
}

BandEnergySample SignalAnalyzer::analyzeSpectrum(const uint8_t* bins, uint32_t count) {
    BandEnergySample sample;
    if (!bins || count == 0) {
        return sample;
    }

    float raw[BandCount];
    float normalized[BandCount];
    for (int b = 0; b < BandCount; b++) {
        raw[b] = bandMean(bins, count, m_ranges[b]);

        // Decaying running maximum, floored to keep the division sane
        m_runningMax[b] = std::max(raw[b], m_runningMax[b] * MAX_DECAY);
        m_runningMax[b] = std::max(m_runningMax[b], MAX_FLOOR);

        normalized[b] = std::clamp(raw[b] / m_runningMax[b], 0.0f, 1.0f);
    }

    sample.subBass = normalized[SubBass];
    sample.bass = normalized[Bass];
    sample.mid = normalized[Mid];
    sample.high = normalized[High];
    sample.totalEnergy = (sample.subBass + sample.bass + sample.mid + sample.high) / 4.0f;
    sample.loudness = std::clamp(bandMean(bins, count, {0, count}) / 255.0f, 0.0f, 1.0f);
    sample.spectrum = bins;
    sample.spectrumSize = count;
    return sample;
}

float SignalAnalyzer::latencyMs() const {
    if (!m_source || !m_active) {
        return 0.0f;
    }
    return m_source->latencyMs();
}

} // namespace pulsenet::audio
