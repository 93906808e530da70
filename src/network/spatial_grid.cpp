#include <pulsenet/network/spatial_grid.h>

#include <algorithm>
#include <cmath>

namespace pulsenet::network {

namespace {

// Clamp in float before converting so far-off or NaN coordinates stay defined
int clampedCell(float coord, float cellSize, uint32_t count) {
    float c = std::floor(coord / cellSize);
    if (!(c > 0.0f)) return 0;
    if (c >= static_cast<float>(count - 1)) return static_cast<int>(count) - 1;
    return static_cast<int>(c);
}

uint32_t axisCells(float extent, float cellSize) {
    float n = std::ceil(extent / cellSize);
    if (!(n > 1.0f)) return 1;
    if (n >= static_cast<float>(SpatialGrid::MAX_AXIS_CELLS)) return SpatialGrid::MAX_AXIS_CELLS;
    return static_cast<uint32_t>(n);
}

} // namespace

int SpatialGrid::cellX(float x) const {
    return clampedCell(x, m_cellSize, m_cols);
}

int SpatialGrid::cellY(float y) const {
    return clampedCell(y, m_cellSize, m_rows);
}

void SpatialGrid::build(const std::vector<Node>& nodes, const glm::vec2& canvas, float cellSize) {
    float width = std::isfinite(canvas.x) ? std::max(canvas.x, 1.0f) : 1.0f;
    float height = std::isfinite(canvas.y) ? std::max(canvas.y, 1.0f) : 1.0f;

    // Wider cells keep the table bounded and still cover the requested radius
    float requested = std::isfinite(cellSize) ? std::max(cellSize, 1.0f) : std::max(width, height);
    float maxCells = static_cast<float>(MAX_AXIS_CELLS);
    m_cellSize = std::max({requested, width / maxCells, height / maxCells});

    m_cols = axisCells(width, m_cellSize);
    m_rows = axisCells(height, m_cellSize);

    size_t cellCount = static_cast<size_t>(m_cols) * m_rows;
    m_cellStart.assign(cellCount + 1, 0);
    m_nodeCell.assign(nodes.size(), NO_CELL);

    // Count nodes per cell
    uint32_t indexed = 0;
    for (size_t i = 0; i < nodes.size(); i++) {
        if (!nodes[i].active) continue;
        uint32_t cell = static_cast<uint32_t>(cellY(nodes[i].position.y)) * m_cols +
                        static_cast<uint32_t>(cellX(nodes[i].position.x));
        m_nodeCell[i] = cell;
        m_cellStart[cell + 1]++;
        indexed++;
    }

    // Prefix sum -> start offsets
    for (size_t c = 0; c < cellCount; c++) {
        m_cellStart[c + 1] += m_cellStart[c];
    }

    // Scatter
    m_cellNodes.resize(indexed);
    m_cursor.assign(m_cellStart.begin(), m_cellStart.end() - 1);
    for (size_t i = 0; i < nodes.size(); i++) {
        uint32_t cell = m_nodeCell[i];
        if (cell == NO_CELL) continue;
        m_cellNodes[m_cursor[cell]++] = static_cast<uint32_t>(i);
    }
}

uint32_t SpatialGrid::cellPopulation(uint32_t col, uint32_t row) const {
    if (col >= m_cols || row >= m_rows) return 0;
    uint32_t cell = row * m_cols + col;
    return m_cellStart[cell + 1] - m_cellStart[cell];
}

void findPairs(const SpatialGrid& grid, const std::vector<Node>& nodes, float threshold,
               std::vector<NodePair>& out) {
    out.clear();
    if (threshold <= 0.0f) return;

    float thresholdSq = threshold * threshold;

    for (size_t i = 0; i < nodes.size(); i++) {
        const Node& nodeA = nodes[i];
        if (!nodeA.active) continue;

        size_t first = out.size();
        uint32_t self = static_cast<uint32_t>(i);

        grid.forEachNeighbor(nodeA.position, [&](uint32_t j) {
            // Each unordered pair once, never a self-edge
            if (j <= self) return;
            glm::vec2 diff = nodes[j].position - nodeA.position;
            if (glm::dot(diff, diff) < thresholdSq) {
                out.emplace_back(self, j);
            }
        });

        std::sort(out.begin() + static_cast<std::ptrdiff_t>(first), out.end());
    }
}

void findPairsBruteForce(const std::vector<Node>& nodes, float threshold, std::vector<NodePair>& out) {
    out.clear();
    if (threshold <= 0.0f) return;

    float thresholdSq = threshold * threshold;

    for (size_t i = 0; i < nodes.size(); i++) {
        if (!nodes[i].active) continue;
        for (size_t j = i + 1; j < nodes.size(); j++) {
            if (!nodes[j].active) continue;
            glm::vec2 diff = nodes[j].position - nodes[i].position;
            if (glm::dot(diff, diff) < thresholdSq) {
                out.emplace_back(static_cast<uint32_t>(i), static_cast<uint32_t>(j));
            }
        }
    }
}

} // namespace pulsenet::network
