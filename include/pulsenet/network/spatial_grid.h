#pragma once

/**
 * @file spatial_grid.h
 * @brief Uniform-cell index for near-neighbor queries
 *
 * SpatialGrid buckets active nodes by floor(position / cellSize) using a
 * counting sort into flat arrays. Rebuilding reuses the arrays, so a
 * steady-state rebuild does not allocate.
 */

#include <pulsenet/network/node.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <utility>
#include <vector>

namespace pulsenet::network {

/// @brief Unordered node pair (first < second)
using NodePair = std::pair<uint32_t, uint32_t>;

class SpatialGrid {
public:
    /// Upper bound on columns and rows; larger canvases get wider cells
    static constexpr uint32_t MAX_AXIS_CELLS = 1024;

    /**
     * @brief Re-index the active nodes
     * @param nodes Node array (inactive nodes are skipped)
     * @param canvas Canvas size in pixels
     * @param cellSize Minimum cell edge length in pixels. Cells grow when the
     *        canvas would need more than MAX_AXIS_CELLS per axis.
     */
    void build(const std::vector<Node>& nodes, const glm::vec2& canvas, float cellSize);

    /**
     * @brief Visit every indexed node in the 3x3 cells around a position
     * @param pos Query position
     * @param fn Called with each node index
     */
    template<typename Fn>
    void forEachNeighbor(const glm::vec2& pos, Fn&& fn) const {
        if (m_cols == 0 || m_rows == 0) return;

        int cx = cellX(pos.x);
        int cy = cellY(pos.y);
        for (int dy = -1; dy <= 1; dy++) {
            int y = cy + dy;
            if (y < 0 || y >= static_cast<int>(m_rows)) continue;
            for (int dx = -1; dx <= 1; dx++) {
                int x = cx + dx;
                if (x < 0 || x >= static_cast<int>(m_cols)) continue;
                uint32_t cell = static_cast<uint32_t>(y) * m_cols + static_cast<uint32_t>(x);
                for (uint32_t i = m_cellStart[cell]; i < m_cellStart[cell + 1]; i++) {
                    fn(m_cellNodes[i]);
                }
            }
        }
    }

    /// @brief Column of an x coordinate, clamped into the grid
    int cellX(float x) const;

    /// @brief Row of a y coordinate, clamped into the grid
    int cellY(float y) const;

    uint32_t columns() const { return m_cols; }
    uint32_t rows() const { return m_rows; }
    float cellSize() const { return m_cellSize; }

    /// @brief Number of nodes indexed by the last build()
    uint32_t indexedCount() const { return static_cast<uint32_t>(m_cellNodes.size()); }

    /// @brief Number of nodes in one cell
    uint32_t cellPopulation(uint32_t col, uint32_t row) const;

private:
    uint32_t m_cols = 0;
    uint32_t m_rows = 0;
    float m_cellSize = 1.0f;

    std::vector<uint32_t> m_cellStart;  // cells + 1 prefix offsets
    std::vector<uint32_t> m_cellNodes;  // node indices grouped by cell
    std::vector<uint32_t> m_nodeCell;   // cell of each node, NO_CELL if inactive
    std::vector<uint32_t> m_cursor;

    static constexpr uint32_t NO_CELL = 0xFFFFFFFFu;
};

/**
 * @brief Grid-accelerated pair search
 * @param grid Grid built from the same nodes, cellSize >= threshold
 * @param nodes Node array
 * @param threshold Link distance (strict)
 * @param out Cleared, then filled with pairs sorted by (first, second)
 */
void findPairs(const SpatialGrid& grid, const std::vector<Node>& nodes, float threshold,
               std::vector<NodePair>& out);

/**
 * @brief Reference O(n^2) pair search with the same semantics as findPairs()
 */
void findPairsBruteForce(const std::vector<Node>& nodes, float threshold, std::vector<NodePair>& out);

} // namespace pulsenet::network
