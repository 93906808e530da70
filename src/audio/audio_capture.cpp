/**
 * @file audio_capture.cpp
 * @brief AudioCapture implementation using miniaudio
 */

// Prevent Windows.h from defining min/max macros
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

#include <pulsenet/audio/audio_capture.h>
#include <algorithm>
#include <iostream>

namespace pulsenet::audio {

struct AudioCapture::Impl {
    ma_device device;
    ma_context context;
    bool deviceInitialized = false;
    bool contextInitialized = false;
};

AudioCapture::AudioCapture() : m_impl(std::make_unique<Impl>()) {}

AudioCapture::~AudioCapture() {
    close();
}

std::vector<AudioDeviceInfo> AudioCapture::listDevices() {
    std::vector<AudioDeviceInfo> devices;

    ma_context context;
    if (ma_context_init(nullptr, 0, nullptr, &context) != MA_SUCCESS) {
        std::cerr << "[AudioCapture] Failed to initialize context for device enumeration\n";
        return devices;
    }

    ma_device_info* captureDevices;
    ma_uint32 captureCount;
    ma_device_info* playbackDevices;
    ma_uint32 playbackCount;

    if (ma_context_get_devices(&context, &playbackDevices, &playbackCount, &captureDevices, &captureCount) != MA_SUCCESS) {
        std::cerr << "[AudioCapture] Failed to enumerate devices\n";
        ma_context_uninit(&context);
        return devices;
    }

    for (ma_uint32 i = 0; i < captureCount; i++) {
        AudioDeviceInfo info;
        info.name = captureDevices[i].name;
        info.index = i;
        info.isDefault = captureDevices[i].isDefault;
        devices.push_back(info);
    }

    ma_context_uninit(&context);
    return devices;
}

void AudioCapture::open() {
    if (m_open) {
        close();
    }

    if (ma_context_init(nullptr, 0, nullptr, &m_impl->context) != MA_SUCCESS) {
        throw CaptureUnavailable("[AudioCapture] Failed to initialize audio context");
    }
    m_impl->contextInitialized = true;

    // Capture as f32, let the backend pick the channel count; the callback
    // mixes everything down to mono
    ma_device_config config = ma_device_config_init(ma_device_type_capture);
    config.capture.format = ma_format_f32;
    config.capture.channels = 0;
    config.sampleRate = m_requestedRate;
    config.dataCallback = &AudioCapture::dataCallback;
    config.pUserData = this;
    config.periodSizeInFrames = 256;

    // Ask for the unprocessed signal where the backend exposes the choice
    config.aaudio.inputPreset = ma_aaudio_input_preset_unprocessed;

    ma_device_info* captureDevices = nullptr;
    ma_uint32 captureCount = 0;
    ma_device_info* playbackDevices = nullptr;
    ma_uint32 playbackCount = 0;

    if (ma_context_get_devices(&m_impl->context, &playbackDevices, &playbackCount, &captureDevices, &captureCount) == MA_SUCCESS) {
        if (captureCount == 0) {
            close();
            throw CaptureUnavailable("[AudioCapture] No audio input device available");
        }
        if (m_deviceIndex >= 0) {
            if (static_cast<ma_uint32>(m_deviceIndex) >= captureCount) {
                close();
                throw CaptureUnavailable("[AudioCapture] Input device index " +
                                         std::to_string(m_deviceIndex) + " out of range");
            }
            config.capture.pDeviceID = &captureDevices[m_deviceIndex].id;
            std::cout << "[AudioCapture] Using device: " << captureDevices[m_deviceIndex].name << "\n";
        }
    }

    if (ma_device_init(&m_impl->context, &config, &m_impl->device) != MA_SUCCESS) {
        close();
        throw CaptureUnavailable("[AudioCapture] Failed to open capture device (permission denied or no input)");
    }
    m_impl->deviceInitialized = true;
    m_sampleRate = m_impl->device.sampleRate;

    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        m_ring.init(m_bufferFrames);
    }
    m_rmsLevel = 0.0f;
    m_peakLevel = 0.0f;

    if (ma_device_start(&m_impl->device) != MA_SUCCESS) {
        close();
        throw CaptureUnavailable("[AudioCapture] Failed to start capture");
    }

    m_open = true;
    std::cout << "[AudioCapture] Initialized: " << m_sampleRate << "Hz, "
              << m_impl->device.capture.channels << " channel(s)\n";
}

void AudioCapture::close() {
    if (m_impl->deviceInitialized) {
        ma_device_uninit(&m_impl->device);
        m_impl->deviceInitialized = false;
    }

    if (m_impl->contextInitialized) {
        ma_context_uninit(&m_impl->context);
        m_impl->contextInitialized = false;
    }

    if (m_open) {
        std::cout << "[AudioCapture] Closed\n";
    }
    m_open = false;
}

uint32_t AudioCapture::latestSamples(float* output, uint32_t frameCount) const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_ring.latest(output, frameCount);
}

float AudioCapture::latencyMs() const {
    if (!m_impl->deviceInitialized || m_sampleRate == 0) {
        return 0.0f;
    }
    const auto& cap = m_impl->device.capture;
    float frames = static_cast<float>(cap.internalPeriodSizeInFrames * cap.internalPeriods);
    return frames * 1000.0f / static_cast<float>(m_sampleRate);
}

void AudioCapture::dataCallback(ma_device* pDevice, void* output, const void* input, ma_uint32 frameCount) {
    (void)output;

    AudioCapture* capture = static_cast<AudioCapture*>(pDevice->pUserData);
    capture->processInput(static_cast<const float*>(input), frameCount, pDevice->capture.channels);
}

void AudioCapture::processInput(const float* input, uint32_t frameCount, uint32_t channels) {
    if (!input || frameCount == 0 || channels == 0) return;

    dsp::BlockLevels levels;
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        levels = m_ring.write(input, frameCount, channels);
    }

    m_rmsLevel = m_rmsLevel.load() * 0.9f + levels.rms * 0.1f;
    m_peakLevel = std::max(m_peakLevel.load() * 0.95f, levels.peak);
}

} // namespace pulsenet::audio
