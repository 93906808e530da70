#pragma once

/**
 * @file audio_capture.h
 * @brief Microphone capture using miniaudio
 */

#include <pulsenet/audio/sample_source.h>
#include <pulsenet/audio/dsp/capture_ring.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct ma_device;

namespace pulsenet::audio {

/**
 * @brief Audio capture device information.
 */
struct AudioDeviceInfo {
    std::string name;
    uint32_t index;
    bool isDefault;
};

/**
 * @brief Default-microphone capture into a ring buffer.
 *
 * The device callback mixes input to mono and writes it into a ring buffer
 * sized for several FFT windows. The analysis side reads the newest frames
 * without consuming them. No processing is applied to the raw signal.
 *
 * @par Example
 * @code
 * AudioCapture capture;
 * capture.sampleRate(48000).device(-1);
 * capture.open();   // throws CaptureUnavailable
 * std::vector<float> frames(4096);
 * capture.latestSamples(frames.data(), 4096);
 * @endcode
 */
class AudioCapture : public SampleSource {
public:
    AudioCapture();
    ~AudioCapture() override;

    // Non-copyable
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /**
     * @brief List available audio input devices.
     * @return Vector of device information (empty if enumeration fails).
     */
    static std::vector<AudioDeviceInfo> listDevices();

    // -------------------------------------------------------------------------
    /// @name Configuration (applied on the next open())
    /// @{

    /// @brief Requested sample rate in Hz
    AudioCapture& sampleRate(uint32_t hz) { m_requestedRate = hz; return *this; }

    /// @brief Device index from listDevices(), -1 for the system default
    AudioCapture& device(int index) { m_deviceIndex = index; return *this; }

    /// @brief Ring buffer length in frames
    AudioCapture& bufferFrames(uint32_t frames) { m_bufferFrames = frames; return *this; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name SampleSource
    /// @{

    void open() override;
    void close() override;
    bool isOpen() const override { return m_open; }
    uint32_t sampleRate() const override { return m_sampleRate; }
    uint32_t latestSamples(float* output, uint32_t frameCount) const override;
    float latencyMs() const override;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Metering
    /// @{

    /// @brief Smoothed RMS input level (0-1)
    float rmsLevel() const { return m_rmsLevel.load(); }

    /// @brief Decaying peak input level (0-1)
    float peakLevel() const { return m_peakLevel.load(); }

    /// @}

private:
    // Called by miniaudio when audio data is available
    static void dataCallback(ma_device* device, void* output, const void* input, unsigned int frameCount);
    void processInput(const float* input, uint32_t frameCount, uint32_t channels);

    struct Impl;
    std::unique_ptr<Impl> m_impl;

    // Captured mono samples, guarded by m_bufferMutex
    dsp::CaptureRing m_ring;
    mutable std::mutex m_bufferMutex;

    uint32_t m_requestedRate = 48000;
    uint32_t m_sampleRate = 48000;
    int m_deviceIndex = -1;
    uint32_t m_bufferFrames = 16384;
    std::atomic<bool> m_open{false};

    std::atomic<float> m_rmsLevel{0.0f};
    std::atomic<float> m_peakLevel{0.0f};
};

} // namespace pulsenet::audio
