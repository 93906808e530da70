// Pulsenet - Entry Point
// Parses command-line arguments and runs the application

#include "app.h"
#include <pulsenet/audio/audio_capture.h>
#include <cstdlib>
#include <iostream>
#include <string>

// Helper to parse WxH format
static bool parseSize(const std::string& s, int& w, int& h) {
    size_t x = s.find('x');
    if (x == std::string::npos) {
        return false;
    }
    w = std::atoi(s.substr(0, x).c_str());
    h = std::atoi(s.substr(x + 1).c_str());
    return w > 0 && h > 0;
}

static void printUsage() {
    std::cout << "Pulsenet - Audio-reactive node network\n\n";
    std::cout << "Usage:\n";
    std::cout << "  pulsenet [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>         Load engine config (JSON)\n";
    std::cout << "  --nodes <n>             Node count (default 500)\n";
    std::cout << "  --threshold <px>        Connection threshold (default 150)\n";
    std::cout << "  --sensitivity <s>       Beat sensitivity 0.3-1.0 (default 0.6)\n";
    std::cout << "  --device <index>        Input device index (default: system default)\n";
    std::cout << "  --list-devices          List input devices and exit\n";
    std::cout << "  --frames <n>            Stop after n ticks (default: run until Ctrl+C)\n";
    std::cout << "  --size <WxH>            Canvas size (default 1280x720)\n";
    std::cout << "  --seed <n>              Network random seed (default 42)\n";
    std::cout << "  --help                  Show this help\n";
}

static int listDevices() {
    auto devices = pulsenet::audio::AudioCapture::listDevices();
    if (devices.empty()) {
        std::cout << "No input devices found" << std::endl;
        return 1;
    }

    std::cout << "Input devices:\n";
    for (const auto& d : devices) {
        std::cout << "  [" << d.index << "] " << d.name << (d.isDefault ? " (default)" : "") << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    pulsenet::AppConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--list-devices") {
            return listDevices();
        } else if (arg == "--config" && hasValue) {
            config.configPath = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config.configPath = arg.substr(9);
        } else if (arg == "--nodes" && hasValue) {
            config.nodeCount = std::atoi(argv[++i]);
        } else if (arg == "--threshold" && hasValue) {
            config.connectionThreshold = std::strtof(argv[++i], nullptr);
        } else if (arg == "--sensitivity" && hasValue) {
            config.sensitivity = std::strtof(argv[++i], nullptr);
        } else if (arg == "--device" && hasValue) {
            config.deviceIndex = std::atoi(argv[++i]);
        } else if (arg == "--frames" && hasValue) {
            config.maxFrames = std::atoi(argv[++i]);
        } else if (arg.rfind("--frames=", 0) == 0) {
            config.maxFrames = std::atoi(arg.substr(9).c_str());
        } else if (arg == "--seed" && hasValue) {
            config.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--size" && hasValue) {
            int w = 0;
            int h = 0;
            if (!parseSize(argv[++i], w, h)) {
                std::cerr << "Invalid --size, expected WxH" << std::endl;
                return 1;
            }
            config.width = static_cast<float>(w);
            config.height = static_cast<float>(h);
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            printUsage();
            return 1;
        }
    }

    std::cout << "Pulsenet - Starting..." << std::endl;

    pulsenet::Application app;

    int initResult = app.init(config);
    if (initResult != 0) {
        return initResult;
    }

    return app.run();
}
