#pragma once

/**
 * @file edge.h
 * @brief Proximity link between two nodes
 */

#include <pulsenet/network/audio_drive.h>
#include <pulsenet/network/node.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <random>
#include <vector>

namespace pulsenet::network {

/**
 * @brief Link between two nodes, rebuilt every tick
 *
 * a and b index into SpatialNetwork::nodes() with a < b. Edges never
 * survive past the update() that produced them.
 */
struct Edge {
    uint32_t a = 0;
    uint32_t b = 0;
    float distance = 0.0f;
    float opacity = 0.6f;
    float thickness = 1.0f;
    bool active = true;

    Edge() = default;
    Edge(uint32_t nodeA, uint32_t nodeB, float dist)
        : a(nodeA), b(nodeB), distance(dist) {}

    /**
     * @brief Apply audio-driven visuals
     *
     * Thickness follows bass. High-band energy makes the opacity flicker.
     */
    void update(const AudioDrive& drive, std::mt19937& rng);

    /// @brief Midpoint of the two endpoints
    glm::vec2 midpoint(const std::vector<Node>& nodes) const {
        return (nodes[a].position + nodes[b].position) * 0.5f;
    }
};

} // namespace pulsenet::network
