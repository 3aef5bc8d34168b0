/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/AStarSearch.hpp"
#include "pathfinding/PathCache.hpp"
#include "core/Logger.hpp"
#include <string>

namespace GridRoute {

namespace {
std::string describe(const Point& p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}
} // namespace

PathfindingResult AStarSearch::findPath(const Grid& grid, const Point& start, const Point& goal,
                                        std::vector<Point>& outPath) {
    outPath.clear();
    m_stats.totalRequests++;

    // Endpoint legality is the caller's contract; guard it anyway
    if (grid.isBlocked(start)) {
        PATHFIND_ERROR("findPath: INVALID_START - " + describe(start) +
                       " is outside the grid or on an obstacle");
        m_stats.invalidEndpoints++;
        return PathfindingResult::INVALID_START;
    }
    if (grid.isBlocked(goal)) {
        PATHFIND_ERROR("findPath: INVALID_GOAL - " + describe(goal) +
                       " is outside the grid or on an obstacle");
        m_stats.invalidEndpoints++;
        return PathfindingResult::INVALID_GOAL;
    }

    if (m_cache) {
        if (auto cached = m_cache->find(grid.fingerprint(), start, goal)) {
            outPath = std::move(*cached);
            m_stats.cacheHits++;
            m_stats.successfulPaths++;
            return PathfindingResult::SUCCESS;
        }
    }

    PathfindingResult result = search(grid, start, goal, outPath);
    if (result == PathfindingResult::SUCCESS) {
        m_stats.successfulPaths++;
        if (m_cache) {
            m_cache->insert(grid.fingerprint(), start, goal, outPath);
        }
    } else {
        m_stats.noPathResults++;
        PATHFIND_DEBUG("findPath: no path " + describe(start) + " -> " + describe(goal));
    }
    return result;
}

PathfindingResult AStarSearch::search(const Grid& grid, const Point& start, const Point& goal,
                                      std::vector<Point>& outPath) {
    if (start == goal) {
        outPath.push_back(start);
        return PathfindingResult::SUCCESS;
    }

    const size_t gridSize = grid.cellCount();

    thread_local NodePool nodePool;
    nodePool.ensureCapacity(gridSize);
    nodePool.reset(gridSize);

    auto& open = nodePool.openQueue;
    auto& gScore = nodePool.gScoreBuffer;
    auto& parent = nodePool.parentBuffer;
    auto& closed = nodePool.closedBuffer;

    const int startIndex = static_cast<int>(grid.index(start));
    const int goalIndex = static_cast<int>(grid.index(goal));
    uint64_t sequence = 0;

    gScore[static_cast<size_t>(startIndex)] = 0;
    open.push(NodePool::Node{startIndex, manhattanDistance(start, goal), sequence++});

    while (!open.empty()) {
        NodePool::Node cur = open.top(); open.pop();

        const size_t cIndex = static_cast<size_t>(cur.cell);
        if (closed[cIndex]) continue; // stale duplicate of an improved entry
        closed[cIndex] = 1;
        m_stats.expandedNodes++;

        if (cur.cell == goalIndex) {
            // reconstruct by walking parents back to the start
            std::vector<Point> rev;
            for (int c = goalIndex; c != -1; c = parent[static_cast<size_t>(c)]) {
                rev.push_back(grid.pointAt(static_cast<size_t>(c)));
            }
            outPath.assign(rev.rbegin(), rev.rend());
            return PathfindingResult::SUCCESS;
        }

        const Point cp = grid.pointAt(cIndex);
        const int gCur = gScore[cIndex];

        for (int i = 0; i < DIRECTION_COUNT; ++i) {
            const Point np(cp.x + DIR_DX[i], cp.y + DIR_DY[i]);
            if (grid.isBlocked(np)) continue; // also rejects out-of-bounds

            const size_t nIndex = grid.index(np);
            if (closed[nIndex]) continue;

            const int tentative = gCur + 1;
            // Only re-enqueue on a strictly better cost
            if (tentative < gScore[nIndex]) {
                gScore[nIndex] = tentative;
                parent[nIndex] = cur.cell;
                open.push(NodePool::Node{static_cast<int>(nIndex),
                                         tentative + manhattanDistance(np, goal),
                                         sequence++});
            }
        }
    }

    return PathfindingResult::NO_PATH_FOUND;
}

} // namespace GridRoute
