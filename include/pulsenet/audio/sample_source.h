#pragma once

/**
 * @file sample_source.h
 * @brief Raw capture input contract for the analysis pipeline
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pulsenet::audio {

/**
 * @brief Thrown when no usable audio input can be opened
 *
 * Covers permission denial, a missing input device, and backend failures
 * while opening or starting the device. The pipeline stays uninitialized and
 * initialize() may be called again.
 */
class CaptureUnavailable : public std::runtime_error {
public:
    explicit CaptureUnavailable(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Source of mono float samples (-1 to 1)
 *
 * Implementations always hold the most recent samples; reading never
 * blocks and never consumes.
 */
class SampleSource {
public:
    virtual ~SampleSource() = default;

    /**
     * @brief Acquire the input
     * @throws CaptureUnavailable if the input cannot be opened
     */
    virtual void open() = 0;

    /// @brief Release the input (safe to call when not open)
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// @brief Sample rate in Hz
    virtual uint32_t sampleRate() const = 0;

    /**
     * @brief Copy the newest frames, oldest first
     * @param output Receives frameCount samples
     * @param frameCount Number of frames requested
     * @return Frames of real data copied; the front of output is zero-filled
     *         when fewer are available
     */
    virtual uint32_t latestSamples(float* output, uint32_t frameCount) const = 0;

    /// @brief Input latency in milliseconds (0 if unknown)
    virtual float latencyMs() const { return 0.0f; }
};

} // namespace pulsenet::audio
