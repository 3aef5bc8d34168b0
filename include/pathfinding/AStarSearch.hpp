/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ASTAR_SEARCH_HPP
#define ASTAR_SEARCH_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <queue>
#include <vector>
#include "pathfinding/Grid.hpp"
#include "pathfinding/PathfindingResult.hpp"
#include "utils/GridPoint.hpp"

namespace GridRoute {

class PathCache;

/**
 * Shortest path search on a 4-connected unit-cost Grid.
 *
 * Classic A* with the Manhattan heuristic, which is admissible and consistent
 * here, so the first time the goal is popped its cost is optimal. Frontier
 * entries carry a monotonically increasing sequence number that breaks f-score
 * ties in insertion order, and neighbours are always expanded in the order
 * +column, +row, -column, -row. Together these make the returned path fully
 * deterministic among equal-length alternatives.
 *
 * When constructed with a PathCache, results are looked up before the search
 * and stored after a successful one.
 */
class AStarSearch {
public:
    explicit AStarSearch(PathCache* cache = nullptr) : m_cache(cache) {}

    PathfindingResult findPath(const Grid& grid, const Point& start, const Point& goal,
                               std::vector<Point>& outPath);

    // Statistics
    struct AStarStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t noPathResults{0};
        uint64_t invalidEndpoints{0};
        uint64_t cacheHits{0};
        uint64_t expandedNodes{0};
    };

    void resetStats() { m_stats = AStarStats{}; }
    const AStarStats& getStats() const { return m_stats; }

    // Neighbour expansion order: +column, +row, -column, -row
    static constexpr int DIRECTION_COUNT = 4;
    static constexpr int DIR_DX[DIRECTION_COUNT] = {0, 1, 0, -1};
    static constexpr int DIR_DY[DIRECTION_COUNT] = {1, 0, -1, 0};

private:
    PathCache* m_cache;
    AStarStats m_stats{};

    PathfindingResult search(const Grid& grid, const Point& start, const Point& goal,
                             std::vector<Point>& outPath);

    // Object pool reused across calls on the same thread
    struct NodePool {
        struct Node { int cell; int f; uint64_t seq; };
        // Min-heap on f, then on insertion sequence
        struct Cmp {
            bool operator()(const Node& a, const Node& b) const {
                if (a.f != b.f) return a.f > b.f;
                return a.seq > b.seq;
            }
        };

        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<int> gScoreBuffer;
        std::vector<int> parentBuffer;
        std::vector<uint8_t> closedBuffer;

        void ensureCapacity(size_t gridSize) {
            if (gScoreBuffer.size() < gridSize) {
                gScoreBuffer.resize(gridSize);
                parentBuffer.resize(gridSize);
                closedBuffer.resize(gridSize);
            }
        }

        void reset(size_t gridSize) {
            // Clear but don't deallocate
            while (!openQueue.empty()) openQueue.pop();
            std::fill_n(gScoreBuffer.begin(), gridSize, std::numeric_limits<int>::max());
            std::fill_n(parentBuffer.begin(), gridSize, -1);
            std::fill_n(closedBuffer.begin(), gridSize, 0);
        }
    };

    // NodePool is thread_local within search()
};

} // namespace GridRoute

#endif // ASTAR_SEARCH_HPP
