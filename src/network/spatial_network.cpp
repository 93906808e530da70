#include <pulsenet/network/spatial_network.h>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace pulsenet::network {

SpatialNetwork::SpatialNetwork(float width, float height)
    : m_canvas(std::max(width, 1.0f), std::max(height, 1.0f)) {
    registerParam(connectionThreshold);
    registerParam(cellSize);
    registerParam(beatConfidenceFloor);
    m_dynamicThreshold = connectionThreshold;
}

void SpatialNetwork::seed(uint32_t s) {
    m_rng.seed(s);
}

void SpatialNetwork::addNode(float baseSize) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    glm::vec2 pos(unit(m_rng) * m_canvas.x, unit(m_rng) * m_canvas.y);

    Node& node = m_nodes.emplace_back(m_nextId++, pos);
    node.baseSize = baseSize;
    node.size = baseSize;
}

void SpatialNetwork::initialize(int count) {
    m_targetCount = std::max(count, 0);

    // Headroom for burst nodes so beats do not reallocate
    m_nodes.clear();
    m_nodes.reserve(static_cast<size_t>(std::ceil(m_targetCount * BURST_CAP)) + 1);
    m_edges.clear();
    m_pairs.clear();

    for (int i = 0; i < m_targetCount; i++) {
        addNode(Node().baseSize);
    }

    std::cout << "[SpatialNetwork] Created " << m_nodes.size() << " nodes\n";
}

void SpatialNetwork::update(const audio::AudioDescription& audio) {
    AudioDrive drive = AudioDrive::from(audio);

    m_pulseScale = 1.0f + drive.bass * 0.3f;

    for (Node& node : m_nodes) {
        node.update(drive, m_canvas, m_rng);
    }

    if (drive.isBeat && drive.beatConfidence > beatConfidenceFloor) {
        onBeat(drive.beatConfidence);
    }

    rebuildEdges(drive);
}

void SpatialNetwork::rebuildEdges(const AudioDrive& drive) {
    m_dynamicThreshold = std::max(0.0f, connectionThreshold + drive.mids * 100.0f);

    // A 3x3 scan only covers the threshold when cells are at least that wide
    float cell = std::max(static_cast<float>(cellSize), m_dynamicThreshold);
    m_grid.build(m_nodes, m_canvas, cell);
    findPairs(m_grid, m_nodes, m_dynamicThreshold, m_pairs);

    // Overwrite in place; capacity is kept between ticks
    m_edges.resize(m_pairs.size());
    for (size_t i = 0; i < m_pairs.size(); i++) {
        const NodePair& p = m_pairs[i];
        Edge& edge = m_edges[i];
        edge = Edge(p.first, p.second, m_nodes[p.first].distanceTo(m_nodes[p.second]));
        edge.update(drive, m_rng);
    }
}

void SpatialNetwork::onBeat(float confidence) {
    if (m_nodes.empty()) return;

    int rewireCount = static_cast<int>(std::floor(m_nodes.size() * (0.1f + confidence * 0.1f)));

    std::uniform_int_distribution<size_t> pick(0, m_nodes.size() - 1);
    for (int i = 0; i < rewireCount; i++) {
        m_nodes[pick(m_rng)].resetPosition(m_canvas, m_rng);
    }

    int burstCount = static_cast<int>(std::floor(rewireCount * 0.25f));
    float cap = m_targetCount * BURST_CAP;
    for (int i = 0; i < burstCount; i++) {
        if (static_cast<float>(m_nodes.size()) >= cap) break;
        addNode(BURST_BASE_SIZE);
    }
}

void SpatialNetwork::setNodeCount(int count) {
    m_targetCount = std::max(count, 0);

    size_t target = static_cast<size_t>(m_targetCount);
    size_t limit = static_cast<size_t>(std::floor(m_targetCount * TRIM_HEADROOM));

    if (m_nodes.size() < target) {
        m_nodes.reserve(static_cast<size_t>(std::ceil(m_targetCount * BURST_CAP)) + 1);
        while (m_nodes.size() < target) {
            addNode(Node().baseSize);
        }
    } else if (m_nodes.size() > limit) {
        m_nodes.erase(m_nodes.begin() + static_cast<std::ptrdiff_t>(limit), m_nodes.end());
        dropDanglingEdges();
    }
}

void SpatialNetwork::dropDanglingEdges() {
    uint32_t n = static_cast<uint32_t>(m_nodes.size());
    m_edges.erase(std::remove_if(m_edges.begin(), m_edges.end(),
                                 [n](const Edge& e) { return e.a >= n || e.b >= n; }),
                  m_edges.end());
}

void SpatialNetwork::setConnectionThreshold(float px) {
    if (!std::isfinite(px)) px = 0.0f;
    connectionThreshold = connectionThreshold.clamped(px);
}

void SpatialNetwork::resize(float width, float height) {
    if (!std::isfinite(width) || !std::isfinite(height)) {
        return;
    }

    glm::vec2 next(std::max(width, 1.0f), std::max(height, 1.0f));
    glm::vec2 scale = next / m_canvas;

    for (Node& node : m_nodes) {
        node.position *= scale;
        node.target *= scale;
    }
    m_canvas = next;

    // Keep distances in step with the scaled positions
    for (Edge& edge : m_edges) {
        edge.distance = m_nodes[edge.a].distanceTo(m_nodes[edge.b]);
    }
}

void SpatialNetwork::applyPulse() {
    glm::vec2 center = m_canvas * 0.5f;
    for (Node& node : m_nodes) {
        node.position = center + (node.position - center) * m_pulseScale;
    }
}

NetworkStats SpatialNetwork::getStats() const {
    NetworkStats stats;
    stats.nodeCount = static_cast<uint32_t>(
        std::count_if(m_nodes.begin(), m_nodes.end(), [](const Node& n) { return n.active; }));
    stats.edgeCount = static_cast<uint32_t>(
        std::count_if(m_edges.begin(), m_edges.end(), [](const Edge& e) { return e.active; }));

    if (stats.nodeCount > 1) {
        float n = static_cast<float>(stats.nodeCount);
        float pairs = n * (n - 1.0f) * 0.5f;
        stats.density = stats.edgeCount / pairs;
    }
    return stats;
}

} // namespace pulsenet::network
