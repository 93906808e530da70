#pragma once

/**
 * @file node.h
 * @brief A single point in the network
 */

#include <pulsenet/network/audio_drive.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <random>

namespace pulsenet::network {

/**
 * @brief Mobile network point with audio-driven visual hints
 *
 * Movement is step-based: a node occasionally picks a jump target
 * (probability and distance scale with high-band energy) and snaps to it.
 * Targets wrap around the canvas.
 */
struct Node {
    uint32_t id = 0;
    glm::vec2 position{0.0f};
    glm::vec2 target{0.0f};     ///< Position the node snaps to

    float baseSize = 3.0f;
    float size = 3.0f;          ///< baseSize + bass * 20
    float glow = 0.0f;          ///< highs * 30
    float energy = 0.0f;        ///< Total energy at the last update

    bool active = true;

    Node() = default;
    Node(uint32_t nodeId, const glm::vec2& pos)
        : id(nodeId), position(pos), target(pos) {}

    /**
     * @brief Advance one tick
     * @param drive Sanitized audio inputs
     * @param canvas Canvas size for wrap-around
     * @param rng Simulation random source
     */
    void update(const AudioDrive& drive, const glm::vec2& canvas, std::mt19937& rng);

    /// @brief Move to a uniformly random canvas position
    void resetPosition(const glm::vec2& canvas, std::mt19937& rng);

    float distanceTo(const Node& other) const { return glm::distance(position, other.position); }
};

} // namespace pulsenet::network
