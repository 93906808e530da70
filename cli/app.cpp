// Pulsenet Application
// Headless tick loop: microphone -> audio intelligence -> spatial network

#include "app.h"

#include <pulsenet/pulsenet.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <thread>

namespace pulsenet {

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
    g_running = false;
}

constexpr int TICK_RATE = 60;

} // namespace

struct Application::Impl {
    EngineConfig engine;
    int maxFrames = 0;

    std::unique_ptr<audio::AudioIntelligence> audio;
    audio::AudioCapture* capture = nullptr;  // owned by audio
    std::unique_ptr<network::SpatialNetwork> network;
    FrameMonitor monitor;

    uint64_t frame = 0;
    uint64_t beatCount = 0;
};

Application::~Application() {
    shutdown();
}

int Application::init(const AppConfig& config) {
    m_impl = new Impl();
    m_impl->maxFrames = config.maxFrames;

    // Config file first, then command-line overrides
    if (!config.configPath.empty()) {
        auto loaded = loadEngineConfig(config.configPath);
        if (!loaded) {
            std::cerr << "Failed to load config: " << config.configPath << std::endl;
            return 1;
        }
        m_impl->engine = *loaded;
    }

    EngineConfig& engine = m_impl->engine;
    if (config.nodeCount) engine.network.nodeCount = *config.nodeCount;
    if (config.connectionThreshold) engine.network.connectionThreshold = *config.connectionThreshold;
    if (config.sensitivity) engine.beat.sensitivity = *config.sensitivity;
    if (config.deviceIndex) engine.analyzer.deviceIndex = *config.deviceIndex;
    if (config.seed) engine.network.seed = *config.seed;
    if (config.width) engine.network.width = *config.width;
    if (config.height) engine.network.height = *config.height;

    auto capture = std::make_unique<audio::AudioCapture>();
    capture->sampleRate(engine.analyzer.sampleRate).device(engine.analyzer.deviceIndex);
    m_impl->capture = capture.get();

    m_impl->audio = std::make_unique<audio::AudioIntelligence>(std::move(capture));
    m_impl->network = std::make_unique<network::SpatialNetwork>(engine.network.width, engine.network.height);
    applyEngineConfig(engine, *m_impl->audio, *m_impl->network);

    try {
        m_impl->audio->initialize();
    } catch (const audio::CaptureUnavailable& e) {
        std::cerr << "Microphone unavailable: " << e.what() << std::endl;
        std::cerr << "Check that an input device exists and that access is permitted." << std::endl;
        return 2;
    }

    std::cout << "Input latency: " << m_impl->audio->signalAnalyzer().latencyMs() << " ms" << std::endl;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    m_initialized = true;
    return 0;
}

int Application::run() {
    if (!m_initialized || !m_impl) {
        return 1;
    }

    using Clock = std::chrono::steady_clock;
    const auto tickPeriod = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / TICK_RATE));

    audio::AudioIntelligence& audio = *m_impl->audio;
    network::SpatialNetwork& net = *m_impl->network;
    FrameMonitor& monitor = m_impl->monitor;

    auto nextTick = Clock::now();

    // Main loop
    while (g_running) {
        audio::AudioDescription d = audio.analyze();
        net.update(d);

        if (d.isBeat) m_impl->beatCount++;
        m_impl->frame++;
        monitor.frame();

        // Auto quality: shed nodes while the loop cannot keep up
        if (monitor.isPerformanceLow()) {
            int next = reducedNodeCount(net.nodeCount());
            if (next != net.nodeCount()) {
                std::cerr << "[Application] Performance degraded, reducing node count to " << next << std::endl;
                net.setNodeCount(next);
                monitor.reset();
            }
        }

        if (m_impl->frame % TICK_RATE == 0) {
            network::NetworkStats stats = net.getStats();
            const audio::AudioCapture& capture = *m_impl->capture;
            std::printf("[%-9s] trend %.2f | in rms %.3f peak %.3f | bass %.2f mids %.2f highs %.2f"
                        " | beats %llu%s | nodes %u edges %u | %d fps\n",
                        audio::stateName(d.energyState), audio.energyTrend(),
                        capture.rmsLevel(), capture.peakLevel(),
                        d.bass, d.mids, d.highs,
                        static_cast<unsigned long long>(m_impl->beatCount),
                        d.isSilence ? " (silence)" : "",
                        stats.nodeCount, stats.edgeCount, monitor.fps());
            std::fflush(stdout);
        }

        if (m_impl->maxFrames > 0 && m_impl->frame >= static_cast<uint64_t>(m_impl->maxFrames)) {
            break;
        }

        nextTick += tickPeriod;
        auto now = Clock::now();
        if (nextTick > now) {
            std::this_thread::sleep_until(nextTick);
        } else {
            // Behind schedule; do not try to catch up
            nextTick = now;
        }
    }

    return 0;
}

void Application::shutdown() {
    if (!m_impl) {
        return;
    }

    std::cout << "Shutting down..." << std::endl;

    if (m_impl->audio) {
        m_impl->audio->destroy();
    }

    delete m_impl;
    m_impl = nullptr;
    m_initialized = false;
}

} // namespace pulsenet
