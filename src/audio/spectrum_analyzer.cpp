#include <pulsenet/audio/spectrum_analyzer.h>
#include <kiss_fft.h>

#include <algorithm>
#include <cmath>

namespace pulsenet::audio {

struct SpectrumAnalyzer::Impl {
    kiss_fft_cfg cfg = nullptr;
    std::vector<kiss_fft_cpx> fftIn;
    std::vector<kiss_fft_cpx> fftOut;
    std::vector<float> window;  // Hann window

    ~Impl() {
        if (cfg) {
            kiss_fft_free(cfg);
        }
    }
};

SpectrumAnalyzer::SpectrumAnalyzer() : m_impl(std::make_unique<Impl>()) {
    allocateBuffers();
}

SpectrumAnalyzer::~SpectrumAnalyzer() = default;

void SpectrumAnalyzer::setFftSize(int n) {
    int size = 256;
    while (size < n && size < 32768) {
        size *= 2;
    }

    if (size != m_fftSize) {
        m_fftSize = size;
        allocateBuffers();
    }
}

void SpectrumAnalyzer::setSmoothing(float s) {
    if (std::isnan(s)) return;
    m_smoothing = std::clamp(s, 0.0f, 0.999f);
}

void SpectrumAnalyzer::setDecibelRange(float minDb, float maxDb) {
    if (!std::isfinite(minDb) || !std::isfinite(maxDb) || maxDb <= minDb) {
        return;
    }
    m_minDb = minDb;
    m_maxDb = maxDb;
}

void SpectrumAnalyzer::allocateBuffers() {
    if (m_impl->cfg) {
        kiss_fft_free(m_impl->cfg);
        m_impl->cfg = nullptr;
    }

    m_impl->cfg = kiss_fft_alloc(m_fftSize, 0, nullptr, nullptr);
    m_impl->fftIn.resize(m_fftSize);
    m_impl->fftOut.resize(m_fftSize);

    m_impl->window.resize(m_fftSize);
    for (int i = 0; i < m_fftSize; i++) {
        m_impl->window[i] = 0.5f * (1.0f - std::cos(2.0f * 3.14159265f * i / (m_fftSize - 1)));
    }

    m_smoothed.assign(m_fftSize / 2, 0.0f);
    m_bytes.assign(m_fftSize / 2, 0);
}

void SpectrumAnalyzer::reset() {
    std::fill(m_smoothed.begin(), m_smoothed.end(), 0.0f);
    std::fill(m_bytes.begin(), m_bytes.end(), 0);
}

void SpectrumAnalyzer::process(const float* samples) {
    if (!m_impl->cfg || !samples) return;

    for (int i = 0; i < m_fftSize; i++) {
        m_impl->fftIn[i].r = samples[i] * m_impl->window[i];
        m_impl->fftIn[i].i = 0.0f;
    }

    kiss_fft(m_impl->cfg, m_impl->fftIn.data(), m_impl->fftOut.data());

    int bins = binCount();
    float scale = 1.0f / m_fftSize;
    float range = m_maxDb - m_minDb;

    for (int i = 0; i < bins; i++) {
        float re = m_impl->fftOut[i].r;
        float im = m_impl->fftOut[i].i;
        float mag = std::sqrt(re * re + im * im) * scale;

        m_smoothed[i] = m_smoothing * m_smoothed[i] + (1.0f - m_smoothing) * mag;

        // Silence maps to the bottom of the byte range
        float db = m_smoothed[i] > 0.0f ? 20.0f * std::log10(m_smoothed[i]) : m_minDb;
        float scaled = 255.0f * (db - m_minDb) / range;
        m_bytes[i] = static_cast<uint8_t>(std::clamp(scaled, 0.0f, 255.0f));
    }
}

} // namespace pulsenet::audio
