// Pulsenet Application
// Headless tick loop: microphone -> audio intelligence -> spatial network

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pulsenet {

// Configuration passed from command-line arguments
// Unset overrides keep the value from the config file (or the default)
struct AppConfig {
    std::string configPath;

    std::optional<int> nodeCount;
    std::optional<float> connectionThreshold;
    std::optional<float> sensitivity;
    std::optional<int> deviceIndex;
    std::optional<uint32_t> seed;
    std::optional<float> width;
    std::optional<float> height;

    // Frame limit
    int maxFrames = 0;  // 0 = unlimited
};

// Main application class
// Owns the audio pipeline and network, and runs the 60 Hz loop
class Application {
public:
    Application() = default;
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Initialize the application with given config
    // Returns 0 on success, non-zero on error
    int init(const AppConfig& config);

    // Run the main loop until interrupted or maxFrames is reached
    // Returns exit code (0 = success)
    int run();

    // Cleanup (called by destructor, can be called explicitly)
    void shutdown();

private:
    struct Impl;
    Impl* m_impl = nullptr;
    bool m_initialized = false;
};

} // namespace pulsenet
