/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_HPP
#define GRID_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>
#include "utils/GridPoint.hpp"

namespace GridRoute {

enum class CellState : uint8_t { FREE = 0, OBSTACLE = 1 };

/**
 * Immutable obstacle matrix for one planning request.
 *
 * Cells are stored row-major (index = x * columns + y). The constructor
 * validates shape, size (at most MAX_CELL_COUNT cells) and cell domain and
 * throws MalformedGridError on violation, so
 * every constructed Grid is rectangular and holds only FREE/OBSTACLE.
 * The content fingerprint is computed once and keys the PathCache.
 */
class Grid {
public:
    // Search buffers address cells with int
    static constexpr size_t MAX_CELL_COUNT = static_cast<size_t>(std::numeric_limits<int>::max());

    Grid(int rows, int columns, std::vector<uint8_t> cells);

    // Builds from nested rows where 0 = free and 1 = obstacle
    static Grid fromRows(const std::vector<std::vector<int>>& rows);

    int rows() const { return m_rows; }
    int columns() const { return m_columns; }
    size_t cellCount() const { return m_cells.size(); }
    size_t freeCellCount() const;

    bool inBounds(const Point& p) const {
        return p.x >= 0 && p.y >= 0 && p.x < m_rows && p.y < m_columns;
    }

    // Out-of-bounds cells count as blocked
    bool isBlocked(const Point& p) const {
        if (!inBounds(p)) return true;
        return m_cells[index(p)] == static_cast<uint8_t>(CellState::OBSTACLE);
    }
    bool isFree(const Point& p) const { return !isBlocked(p); }

    size_t index(const Point& p) const {
        return static_cast<size_t>(p.x) * static_cast<size_t>(m_columns) + static_cast<size_t>(p.y);
    }
    Point pointAt(size_t idx) const {
        return Point(static_cast<int>(idx / static_cast<size_t>(m_columns)),
                     static_cast<int>(idx % static_cast<size_t>(m_columns)));
    }

    uint64_t fingerprint() const { return m_fingerprint; }

private:
    int m_rows;
    int m_columns;
    std::vector<uint8_t> m_cells;
    uint64_t m_fingerprint{0};

    void validate() const;
    uint64_t computeFingerprint() const;
};

} // namespace GridRoute

#endif // GRID_HPP
