#pragma once

/**
 * @file config.h
 * @brief Startup configuration for the audio pipeline and network
 *
 * An engine config is a JSON object with optional sections:
 *
 * @code
 * {
 *   "analyzer":     { "fftSize": 4096, "smoothing": 0.65, "minDecibels": -100,
 *                     "maxDecibels": -30, "sampleRate": 48000, "deviceIndex": -1 },
 *   "beat":         { "sensitivity": 0.6, "cooldownTicks": 15, "smoothingFactor": 0.3 },
 *   "intelligence": { "silenceThreshold": 0.05, "climaxSensitivity": 0.7,
 *                     "minStateHoldTicks": 120, "dropTimeoutTicks": 180 },
 *   "network":      { "nodeCount": 500, "connectionThreshold": 150, "cellSize": 100,
 *                     "width": 1280, "height": 720, "seed": 42 }
 * }
 * @endcode
 *
 * Missing keys keep their defaults. Range limits are enforced when the
 * config is applied, by the components themselves.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace pulsenet {

namespace audio { class AudioIntelligence; }
namespace network { class SpatialNetwork; }

struct AnalyzerConfig {
    int fftSize = 4096;
    float smoothing = 0.65f;
    float minDecibels = -100.0f;
    float maxDecibels = -30.0f;
    uint32_t sampleRate = 48000;
    int deviceIndex = -1;           ///< -1 = system default
};

struct BeatConfig {
    float sensitivity = 0.6f;
    int cooldownTicks = 15;
    float smoothingFactor = 0.3f;
};

struct IntelligenceConfig {
    float silenceThreshold = 0.05f;
    float climaxSensitivity = 0.7f;
    uint32_t minStateHoldTicks = 120;
    uint32_t dropTimeoutTicks = 180;
};

struct NetworkConfig {
    int nodeCount = 500;
    float connectionThreshold = 150.0f;
    float cellSize = 100.0f;
    float width = 1280.0f;
    float height = 720.0f;
    uint32_t seed = 42;
};

struct EngineConfig {
    AnalyzerConfig analyzer;
    BeatConfig beat;
    IntelligenceConfig intelligence;
    NetworkConfig network;
};

/**
 * @brief Parse an engine config from JSON text
 * @return Config, or std::nullopt on malformed JSON or mistyped values
 */
std::optional<EngineConfig> parseEngineConfig(const std::string& text);

/**
 * @brief Load an engine config file
 * @return Config, or std::nullopt if the file is unreadable or invalid
 */
std::optional<EngineConfig> loadEngineConfig(const std::string& path);

/**
 * @brief Push a config into live components
 *
 * Analyzer, beat and intelligence settings are applied in place. The
 * network is resized, reseeded and re-initialized with nodeCount nodes.
 * Capture settings (sampleRate, deviceIndex) belong to the SampleSource
 * and are applied by whoever constructs it.
 */
void applyEngineConfig(const EngineConfig& config, audio::AudioIntelligence& audio,
                       network::SpatialNetwork& network);

} // namespace pulsenet
