/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GRID_POINT_HPP
#define GRID_POINT_HPP

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <ostream>

namespace GridRoute {

// A grid cell address. x is the row, y is the column.
struct Point {
    int x{0};
    int y{0};

    Point() = default;
    Point(int row, int column) : x(row), y(column) {}

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }

    // Row-major ordering for ordered containers
    bool operator<(const Point& other) const {
        return x < other.x || (x == other.x && y < other.y);
    }
};

inline int manhattanDistance(const Point& a, const Point& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// Stream operator for Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, const Point& p) {
    return os << "(" << p.x << "," << p.y << ")";
}

} // namespace GridRoute

namespace std {
template<>
struct hash<GridRoute::Point> {
    size_t operator()(const GridRoute::Point& p) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32) |
                          static_cast<uint32_t>(p.y);
        return std::hash<uint64_t>{}(packed);
    }
};
} // namespace std

#endif // GRID_POINT_HPP
