/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/ReachabilitySearch.hpp"
#include "pathfinding/AStarSearch.hpp"
#include "core/Logger.hpp"
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_set>

namespace GridRoute {

LegMap ReachabilitySearch::reach(const Grid& grid, const Point& source,
                                 const std::vector<Point>& targets) const {
    LegMap found;
    if (grid.isBlocked(source)) {
        PATHFIND_WARN("reach(): source (" + std::to_string(source.x) + "," +
                      std::to_string(source.y) + ") is not a free cell");
        return found;
    }

    std::unordered_set<size_t> remaining;
    for (const Point& t : targets) {
        if (grid.inBounds(t)) {
            remaining.insert(grid.index(t));
        }
    }
    if (remaining.empty()) {
        return found;
    }

    // parent == -1 marks the source, -2 marks unvisited
    std::vector<int64_t> parent(grid.cellCount(), -2);
    std::deque<size_t> queue;

    const size_t sourceIndex = grid.index(source);
    parent[sourceIndex] = -1;
    queue.push_back(sourceIndex);

    while (!queue.empty() && !remaining.empty()) {
        const size_t current = queue.front();
        queue.pop_front();

        if (remaining.erase(current) > 0) {
            std::vector<Point> path;
            for (int64_t c = static_cast<int64_t>(current); c >= 0; c = parent[static_cast<size_t>(c)]) {
                path.push_back(grid.pointAt(static_cast<size_t>(c)));
            }
            found.emplace(grid.pointAt(current), std::vector<Point>(path.rbegin(), path.rend()));
        }

        const Point cp = grid.pointAt(current);
        for (int i = 0; i < AStarSearch::DIRECTION_COUNT; ++i) {
            const Point np(cp.x + AStarSearch::DIR_DX[i], cp.y + AStarSearch::DIR_DY[i]);
            if (grid.isBlocked(np)) continue;

            const size_t nIndex = grid.index(np);
            if (parent[nIndex] != -2) continue;
            parent[nIndex] = static_cast<int64_t>(current);
            queue.push_back(nIndex);
        }
    }

    return found;
}

} // namespace GridRoute
