#pragma once

/**
 * @file audio_drive.h
 * @brief Sanitized audio inputs for the network simulation
 */

#include <pulsenet/audio/audio_types.h>
#include <algorithm>
#include <cmath>

namespace pulsenet::network {

/**
 * @brief The subset of an AudioDescription the simulation reacts to
 *
 * Every value is finite and inside [0, 1]. Garbage in an AudioDescription
 * (NaN, negative, > 1) degrades to "no reactivity" instead of propagating
 * into node positions.
 */
struct AudioDrive {
    float bass = 0.0f;
    float mids = 0.0f;
    float highs = 0.0f;
    float total = 0.0f;
    bool isBeat = false;
    float beatConfidence = 0.0f;

    static float sanitize(float v) {
        if (!std::isfinite(v)) return 0.0f;
        return std::clamp(v, 0.0f, 1.0f);
    }

    static AudioDrive from(const audio::AudioDescription& d) {
        AudioDrive drive;
        drive.bass = sanitize(d.bassEnergy());
        drive.mids = sanitize(d.midEnergy());
        drive.highs = sanitize(d.highEnergy());
        drive.total = sanitize(d.totalEnergy);
        drive.isBeat = d.isBeat;
        drive.beatConfidence = sanitize(d.beatConfidence);
        return drive;
    }
};

} // namespace pulsenet::network
