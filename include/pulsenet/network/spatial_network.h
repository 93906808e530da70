#pragma once

/**
 * @file spatial_network.h
 * @brief Audio-reactive node network with grid-accelerated linking
 *
 * SpatialNetwork owns a set of mobile nodes and regenerates the proximity
 * edges between them every tick. Edges link any two active nodes closer
 * than a dynamic threshold (base threshold + mids * 100). Qualifying beats
 * rewire a fraction of nodes to new positions and spawn burst nodes.
 */

#include <pulsenet/audio/audio_types.h>
#include <pulsenet/network/audio_drive.h>
#include <pulsenet/network/edge.h>
#include <pulsenet/network/node.h>
#include <pulsenet/network/spatial_grid.h>
#include <pulsenet/param.h>
#include <pulsenet/param_registry.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <random>
#include <vector>

namespace pulsenet::network {

/// @brief Counts reported by SpatialNetwork::getStats()
struct NetworkStats {
    uint32_t nodeCount = 0;     ///< Active nodes
    uint32_t edgeCount = 0;     ///< Active edges
    float density = 0.0f;       ///< edgeCount / possible pairs
};

/**
 * @brief Node/edge simulation driven by an AudioDescription
 *
 * @par Example
 * @code
 * SpatialNetwork net(1280, 720);
 * net.initialize(500);
 *
 * // Once per tick:
 * net.update(intelligence.analyze());
 * for (const Edge& e : net.edges()) {
 *     glm::vec2 a = net.nodes()[e.a].position;
 * }
 * @endcode
 */
class SpatialNetwork : public ParamRegistry {
public:
    // -------------------------------------------------------------------------
    /// @name Parameters (public for direct access)
    /// @{

    Param<float> connectionThreshold{"connectionThreshold", 150.0f, 0.0f, 1000.0f};  ///< Base link distance (px)
    Param<float> cellSize{"cellSize", 100.0f, 10.0f, 1000.0f};                       ///< Grid cell edge (px)
    Param<float> beatConfidenceFloor{"beatConfidenceFloor", 0.6f, 0.0f, 1.0f};       ///< Beats above this rewire

    /// @}
    // -------------------------------------------------------------------------

    SpatialNetwork(float width = 1280.0f, float height = 720.0f);

    /// @brief Reseed the simulation random source (default seed 42)
    void seed(uint32_t s);

    /**
     * @brief Replace all nodes with count nodes at random positions
     *
     * Edges are cleared; the first update() links the new nodes.
     */
    void initialize(int count);

    /**
     * @brief Advance one tick
     *
     * Order: node motion, beat rewiring, grid rebuild, edge regeneration.
     * Edges therefore always reflect the positions after this call.
     */
    void update(const audio::AudioDescription& audio);

    /**
     * @brief Change the target node count without resetting the simulation
     *
     * Grows to count immediately. Shrinks only when the node set exceeds
     * count * 1.2, trimming to that bound (burst nodes keep some headroom).
     */
    void setNodeCount(int count);

    /// @brief Base connection distance in pixels (clamped to >= 0)
    void setConnectionThreshold(float px);

    /// @brief Change the canvas size, scaling node positions proportionally (non-finite sizes are ignored)
    void resize(float width, float height);

    /// @brief Scale node positions about the canvas center by pulseScale()
    void applyPulse();

    /// @brief Active node/edge counts
    NetworkStats getStats() const;

    // -------------------------------------------------------------------------
    /// @name Queries
    /// @{

    const std::vector<Node>& nodes() const { return m_nodes; }
    const std::vector<Edge>& edges() const { return m_edges; }
    const SpatialGrid& grid() const { return m_grid; }

    /// @brief Link distance used by the last update()
    float dynamicThreshold() const { return m_dynamicThreshold; }

    /// @brief 1 + bass * 0.3 from the last update()
    float pulseScale() const { return m_pulseScale; }

    /// @brief Target node count (the node set may hold burst extras)
    int nodeCount() const { return m_targetCount; }

    glm::vec2 canvasSize() const { return m_canvas; }

    /// @}

private:
    void onBeat(float confidence);
    void addNode(float baseSize);
    void rebuildEdges(const AudioDrive& drive);
    void dropDanglingEdges();

    std::vector<Node> m_nodes;
    std::vector<Edge> m_edges;
    std::vector<NodePair> m_pairs;
    SpatialGrid m_grid;

    glm::vec2 m_canvas;
    int m_targetCount = 0;
    uint32_t m_nextId = 0;

    float m_dynamicThreshold = 150.0f;
    float m_pulseScale = 1.0f;

    std::mt19937 m_rng{42};

    static constexpr float BURST_BASE_SIZE = 5.0f;
    static constexpr float BURST_CAP = 1.5f;
    static constexpr float TRIM_HEADROOM = 1.2f;
};

} // namespace pulsenet::network
