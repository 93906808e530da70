#include <pulsenet/config.h>
#include <pulsenet/audio/audio_intelligence.h>
#include <pulsenet/network/spatial_network.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace pulsenet {

using json = nlohmann::json;

namespace {

uint32_t ticksValue(const json& j, const char* key, uint32_t def) {
    int v = j.value(key, static_cast<int>(def));
    return static_cast<uint32_t>(std::max(v, 0));
}

EngineConfig fromJson(const json& root) {
    EngineConfig config;

    if (root.contains("analyzer")) {
        const json& a = root["analyzer"];
        AnalyzerConfig& c = config.analyzer;
        c.fftSize = a.value("fftSize", c.fftSize);
        c.smoothing = a.value("smoothing", c.smoothing);
        c.minDecibels = a.value("minDecibels", c.minDecibels);
        c.maxDecibels = a.value("maxDecibels", c.maxDecibels);
        c.sampleRate = ticksValue(a, "sampleRate", c.sampleRate);
        c.deviceIndex = a.value("deviceIndex", c.deviceIndex);
    }

    if (root.contains("beat")) {
        const json& b = root["beat"];
        BeatConfig& c = config.beat;
        c.sensitivity = b.value("sensitivity", c.sensitivity);
        c.cooldownTicks = b.value("cooldownTicks", c.cooldownTicks);
        c.smoothingFactor = b.value("smoothingFactor", c.smoothingFactor);
    }

    if (root.contains("intelligence")) {
        const json& i = root["intelligence"];
        IntelligenceConfig& c = config.intelligence;
        c.silenceThreshold = i.value("silenceThreshold", c.silenceThreshold);
        c.climaxSensitivity = i.value("climaxSensitivity", c.climaxSensitivity);
        c.minStateHoldTicks = ticksValue(i, "minStateHoldTicks", c.minStateHoldTicks);
        c.dropTimeoutTicks = ticksValue(i, "dropTimeoutTicks", c.dropTimeoutTicks);
    }

    if (root.contains("network")) {
        const json& n = root["network"];
        NetworkConfig& c = config.network;
        c.nodeCount = n.value("nodeCount", c.nodeCount);
        c.connectionThreshold = n.value("connectionThreshold", c.connectionThreshold);
        c.cellSize = n.value("cellSize", c.cellSize);
        c.width = n.value("width", c.width);
        c.height = n.value("height", c.height);
        c.seed = n.value("seed", c.seed);
    }

    return config;
}

} // namespace

std::optional<EngineConfig> parseEngineConfig(const std::string& text) {
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            std::cerr << "[Config] Expected a JSON object\n";
            return std::nullopt;
        }
        return fromJson(root);
    } catch (const json::exception& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<EngineConfig> loadEngineConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parseEngineConfig(buffer.str());
    if (config) {
        std::cout << "[Config] Loaded: " << path << "\n";
    } else {
        std::cerr << "[Config] Invalid config: " << path << "\n";
    }
    return config;
}

void applyEngineConfig(const EngineConfig& config, audio::AudioIntelligence& audio,
                       network::SpatialNetwork& network) {
    audio::SignalAnalyzer& analyzer = audio.signalAnalyzer();
    analyzer.fftSize(config.analyzer.fftSize)
            .decibelRange(config.analyzer.minDecibels, config.analyzer.maxDecibels);
    analyzer.smoothing = analyzer.smoothing.clamped(config.analyzer.smoothing);

    audio::BeatDetector& beats = audio.beatDetector();
    beats.setSensitivity(config.beat.sensitivity);
    beats.cooldownTicks = beats.cooldownTicks.clamped(config.beat.cooldownTicks);
    beats.smoothingFactor = beats.smoothingFactor.clamped(config.beat.smoothingFactor);

    audio.setSilenceThreshold(config.intelligence.silenceThreshold);
    audio.setClimaxSensitivity(config.intelligence.climaxSensitivity);
    audio.stateMachine().setMinHoldTicks(config.intelligence.minStateHoldTicks);
    audio.stateMachine().setDropTimeoutTicks(config.intelligence.dropTimeoutTicks);

    network.resize(config.network.width, config.network.height);
    network.setConnectionThreshold(config.network.connectionThreshold);
    network.cellSize = network.cellSize.clamped(config.network.cellSize);
    network.seed(config.network.seed);
    network.initialize(config.network.nodeCount);
}

} // namespace pulsenet
