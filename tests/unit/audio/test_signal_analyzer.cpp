/**
 * @file test_signal_analyzer.cpp
 * @brief Unit tests for SpectrumAnalyzer and SignalAnalyzer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <pulsenet/audio/signal_analyzer.h>
#include <pulsenet/audio/spectrum_analyzer.h>
#include <support/synthetic_source.h>

#include <memory>
#include <vector>

using namespace pulsenet::audio;
using pulsenet::test::SineSource;
using Catch::Matchers::WithinAbs;

// =============================================================================
// SpectrumAnalyzer
// =============================================================================

TEST_CASE("SpectrumAnalyzer defaults", "[audio][spectrum]") {
    SpectrumAnalyzer spectrum;

    REQUIRE(spectrum.fftSize() == 4096);
    REQUIRE(spectrum.binCount() == 2048);
    REQUIRE_THAT(spectrum.smoothing(), WithinAbs(0.65f, 0.001f));
    REQUIRE_THAT(spectrum.minDecibels(), WithinAbs(-100.0f, 0.001f));
    REQUIRE_THAT(spectrum.maxDecibels(), WithinAbs(-30.0f, 0.001f));
}

TEST_CASE("SpectrumAnalyzer size rounding", "[audio][spectrum]") {
    SpectrumAnalyzer spectrum;

    SECTION("rounds up to a power of two") {
        spectrum.setFftSize(1000);
        REQUIRE(spectrum.fftSize() == 1024);
        REQUIRE(spectrum.binCount() == 512);
    }

    SECTION("clamps to 256..32768") {
        spectrum.setFftSize(16);
        REQUIRE(spectrum.fftSize() == 256);
        spectrum.setFftSize(1 << 20);
        REQUIRE(spectrum.fftSize() == 32768);
    }

    SECTION("invalid decibel range is ignored") {
        spectrum.setDecibelRange(-20.0f, -40.0f);
        REQUIRE_THAT(spectrum.minDecibels(), WithinAbs(-100.0f, 0.001f));
        REQUIRE_THAT(spectrum.maxDecibels(), WithinAbs(-30.0f, 0.001f));
    }
}

TEST_CASE("SpectrumAnalyzer silence maps to zero bytes", "[audio][spectrum]") {
    SpectrumAnalyzer spectrum;
    spectrum.setFftSize(1024);

    std::vector<float> silence(1024, 0.0f);
    spectrum.process(silence.data());

    for (int i = 0; i < spectrum.binCount(); i++) {
        REQUIRE(spectrum.bytes()[i] == 0);
    }
}

TEST_CASE("SpectrumAnalyzer sine peaks at its bin", "[audio][spectrum]") {
    SpectrumAnalyzer spectrum;
    spectrum.setFftSize(1024);
    spectrum.setSmoothing(0.0f);

    // 1000 Hz at 48 kHz -> bin 1000 / (24000 / 512) = 21.3
    SineSource sine(1000.0f, 0.5f, 48000);
    std::vector<float> frames(1024);
    sine.latestSamples(frames.data(), 1024);
    spectrum.process(frames.data());

    int peakBin = 0;
    for (int i = 1; i < spectrum.binCount(); i++) {
        if (spectrum.magnitudes()[i] > spectrum.magnitudes()[peakBin]) peakBin = i;
    }
    REQUIRE(peakBin >= 20);
    REQUIRE(peakBin <= 22);
    REQUIRE(spectrum.bytes()[peakBin] == 255);
}

// =============================================================================
// SignalAnalyzer
// =============================================================================

TEST_CASE("SignalAnalyzer before initialize", "[audio][analyzer]") {
    SignalAnalyzer analyzer(std::make_unique<SineSource>(100.0f, 0.5f));

    REQUIRE_FALSE(analyzer.isActive());

    BandEnergySample s = analyzer.analyze();
    REQUIRE(s.subBass == 0.0f);
    REQUIRE(s.bass == 0.0f);
    REQUIRE(s.mid == 0.0f);
    REQUIRE(s.high == 0.0f);
    REQUIRE(s.loudness == 0.0f);
    REQUIRE(s.totalEnergy == 0.0f);
    REQUIRE(s.spectrum == nullptr);
    REQUIRE(s.spectrumSize == 0);
    REQUIRE_THAT(analyzer.latencyMs(), WithinAbs(0.0f, 0.001f));
}

TEST_CASE("SignalAnalyzer initialize failure", "[audio][analyzer]") {
    SECTION("no source") {
        SignalAnalyzer analyzer(nullptr);
        REQUIRE_THROWS_AS(analyzer.initialize(), CaptureUnavailable);
        REQUIRE_FALSE(analyzer.isActive());
    }

    SECTION("source refuses to open, then recovers") {
        auto source = std::make_unique<SineSource>(100.0f, 0.5f);
        SineSource* raw = source.get();
        raw->setFailOpen(true);

        SignalAnalyzer analyzer(std::move(source));
        REQUIRE_THROWS_AS(analyzer.initialize(), CaptureUnavailable);
        REQUIRE_FALSE(analyzer.isActive());

        raw->setFailOpen(false);
        analyzer.initialize();
        REQUIRE(analyzer.isActive());
        REQUIRE(raw->isOpen());
    }
}

TEST_CASE("SignalAnalyzer band boundaries", "[audio][analyzer]") {
    SignalAnalyzer analyzer(nullptr);
    analyzer.configureBands(44100, 2048);

    // Bin width 22050 / 2048 = 10.77 Hz
    REQUIRE(analyzer.subBassRange().start == 1);
    REQUIRE(analyzer.subBassRange().end == 5);
    REQUIRE(analyzer.bassRange().start == 5);
    REQUIRE(analyzer.bassRange().end == 23);
    REQUIRE(analyzer.midRange().start == 23);
    REQUIRE(analyzer.midRange().end == 185);
    REQUIRE(analyzer.highRange().start == 185);
    REQUIRE(analyzer.highRange().end == 1857);

    SECTION("high band is clipped to the bin count") {
        analyzer.configureBands(48000, 256);
        REQUIRE(analyzer.highRange().end <= 256);
        REQUIRE(analyzer.midRange().end == analyzer.highRange().start);
    }
}

TEST_CASE("SignalAnalyzer running-max normalization", "[audio][analyzer]") {
    SignalAnalyzer analyzer(nullptr);
    analyzer.configureBands(44100, 2048);

    std::vector<uint8_t> bins(2048, 0);

    SECTION("quiet input is measured against the floor") {
        // Bass band at 5 -> 5 / max(5, 10)
        for (uint32_t i = 5; i < 23; i++) bins[i] = 5;
        BandEnergySample s = analyzer.analyzeSpectrum(bins.data(), 2048);
        REQUIRE_THAT(s.bass, WithinAbs(0.5f, 0.001f));
        REQUIRE_THAT(s.subBass, WithinAbs(0.0f, 0.001f));
    }

    SECTION("loud input normalizes to 1, then decays the maximum") {
        for (uint32_t i = 5; i < 23; i++) bins[i] = 200;
        BandEnergySample first = analyzer.analyzeSpectrum(bins.data(), 2048);
        REQUIRE_THAT(first.bass, WithinAbs(1.0f, 0.001f));

        for (uint32_t i = 5; i < 23; i++) bins[i] = 100;
        BandEnergySample second = analyzer.analyzeSpectrum(bins.data(), 2048);
        REQUIRE_THAT(second.bass, WithinAbs(100.0f / (200.0f * 0.995f), 0.001f));
    }

    SECTION("total energy is the mean of the four bands") {
        for (auto& b : bins) b = 255;
        BandEnergySample s = analyzer.analyzeSpectrum(bins.data(), 2048);
        REQUIRE_THAT(s.totalEnergy, WithinAbs(1.0f, 0.001f));
        REQUIRE_THAT(s.loudness, WithinAbs(1.0f, 0.001f));
        REQUIRE(s.spectrum == bins.data());
        REQUIRE(s.spectrumSize == 2048);
    }

    SECTION("reset forgets running maxima") {
        for (uint32_t i = 5; i < 23; i++) bins[i] = 200;
        analyzer.analyzeSpectrum(bins.data(), 2048);
        analyzer.reset();

        for (uint32_t i = 5; i < 23; i++) bins[i] = 100;
        BandEnergySample s = analyzer.analyzeSpectrum(bins.data(), 2048);
        REQUIRE_THAT(s.bass, WithinAbs(1.0f, 0.001f));
    }
}

TEST_CASE("SignalAnalyzer values stay in range", "[audio][analyzer]") {
    SignalAnalyzer analyzer(std::make_unique<SineSource>(100.0f, 0.5f));
    analyzer.initialize();

    for (int tick = 0; tick < 30; tick++) {
        BandEnergySample s = analyzer.analyze();
        for (float v : {s.subBass, s.bass, s.mid, s.high, s.loudness, s.totalEnergy}) {
            REQUIRE(v >= 0.0f);
            REQUIRE(v <= 1.0f);
        }
    }
}

TEST_CASE("SignalAnalyzer detects a bass tone", "[audio][analyzer]") {
    auto source = std::make_unique<SineSource>(100.0f, 0.5f, 48000);
    SineSource* raw = source.get();

    SignalAnalyzer analyzer(std::move(source));
    analyzer.initialize();
    REQUIRE(analyzer.isActive());
    REQUIRE(analyzer.binCount() == 2048);
    REQUIRE_THAT(analyzer.latencyMs(), WithinAbs(5.0f, 0.001f));

    BandEnergySample s = analyzer.analyze();
    REQUIRE(s.bass > 0.9f);
    REQUIRE(s.high < 0.1f);
    REQUIRE(s.bass > s.high);
    REQUIRE(s.spectrumSize == 2048);

    SECTION("destroy closes the source and stops analysis") {
        analyzer.destroy();
        REQUIRE_FALSE(analyzer.isActive());
        REQUIRE_FALSE(raw->isOpen());
        REQUIRE(analyzer.analyze().bass == 0.0f);
    }
}

TEST_CASE("SignalAnalyzer params", "[audio][analyzer]") {
    SignalAnalyzer analyzer(nullptr);
    float out[4] = {0};

    REQUIRE(analyzer.getParam("smoothing", out));
    REQUIRE_THAT(out[0], WithinAbs(0.65f, 0.001f));

    SECTION("fftSize chains") {
        SignalAnalyzer& ref = analyzer.fftSize(2048);
        REQUIRE(&ref == &analyzer);
        REQUIRE(analyzer.fftSize() == 2048);
        REQUIRE(analyzer.binCount() == 1024);
    }
}
