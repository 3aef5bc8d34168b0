/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/Grid.hpp"
#include "core/RouteErrors.hpp"
#include <algorithm>
#include <string>

namespace GridRoute {

Grid::Grid(int rows, int columns, std::vector<uint8_t> cells)
    : m_rows(rows), m_columns(columns), m_cells(std::move(cells)) {
    validate();
    m_fingerprint = computeFingerprint();
}

Grid Grid::fromRows(const std::vector<std::vector<int>>& rows) {
    if (rows.empty() || rows.front().empty()) {
        throw MalformedGridError("Grid must have at least one row and one column");
    }

    const size_t columns = rows.front().size();
    std::vector<uint8_t> cells;
    cells.reserve(rows.size() * columns);

    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != columns) {
            throw MalformedGridError("Grid row " + std::to_string(r) + " has " +
                                     std::to_string(rows[r].size()) + " cells, expected " +
                                     std::to_string(columns));
        }
        for (size_t c = 0; c < columns; ++c) {
            const int value = rows[r][c];
            if (value != 0 && value != 1) {
                throw MalformedGridError("Grid cell (" + std::to_string(r) + "," +
                                         std::to_string(c) + ") has value " +
                                         std::to_string(value) +
                                         ", cells must be 0 (free) or 1 (obstacle)");
            }
            cells.push_back(static_cast<uint8_t>(value));
        }
    }

    return Grid(static_cast<int>(rows.size()), static_cast<int>(columns), std::move(cells));
}

size_t Grid::freeCellCount() const {
    return static_cast<size_t>(std::count(m_cells.begin(), m_cells.end(),
                                          static_cast<uint8_t>(CellState::FREE)));
}

void Grid::validate() const {
    if (m_rows <= 0 || m_columns <= 0) {
        throw MalformedGridError("Grid dimensions must be positive: " +
                                 std::to_string(m_rows) + "x" + std::to_string(m_columns));
    }

    const size_t expected = static_cast<size_t>(m_rows) * static_cast<size_t>(m_columns);
    if (expected > MAX_CELL_COUNT) {
        throw MalformedGridError("Grid " + std::to_string(m_rows) + "x" + std::to_string(m_columns) +
                                 " exceeds " + std::to_string(MAX_CELL_COUNT) + " cells");
    }
    if (m_cells.size() != expected) {
        throw MalformedGridError("Grid declares " + std::to_string(m_rows) + "x" +
                                 std::to_string(m_columns) + " but holds " +
                                 std::to_string(m_cells.size()) + " cells");
    }

    auto bad = std::find_if(m_cells.begin(), m_cells.end(), [](uint8_t cell) {
        return cell != static_cast<uint8_t>(CellState::FREE) &&
               cell != static_cast<uint8_t>(CellState::OBSTACLE);
    });
    if (bad != m_cells.end()) {
        const Point p = pointAt(static_cast<size_t>(bad - m_cells.begin()));
        throw MalformedGridError("Grid cell (" + std::to_string(p.x) + "," +
                                 std::to_string(p.y) + ") has value " +
                                 std::to_string(static_cast<int>(*bad)) +
                                 ", cells must be 0 (free) or 1 (obstacle)");
    }
}

uint64_t Grid::computeFingerprint() const {
    // FNV-1a over dimensions then cells
    uint64_t hash = 14695981039346656037ULL; // FNV offset basis
    auto mix = [&hash](uint64_t value) {
        hash ^= value;
        hash *= 1099511628211ULL; // FNV prime
    };

    mix(static_cast<uint32_t>(m_rows));
    mix(static_cast<uint32_t>(m_columns));
    for (uint8_t cell : m_cells) {
        mix(cell);
    }
    return hash;
}

} // namespace GridRoute
