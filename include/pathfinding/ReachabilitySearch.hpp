/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REACHABILITY_SEARCH_HPP
#define REACHABILITY_SEARCH_HPP

#include <unordered_map>
#include <vector>
#include "pathfinding/Grid.hpp"
#include "utils/GridPoint.hpp"

namespace GridRoute {

// Shortest path from one source to each reachable target
using LegMap = std::unordered_map<Point, std::vector<Point>>;

/**
 * Multi-target breadth-first search.
 *
 * One traversal from the source yields shortest paths to every requested
 * target. Movement is unit-cost, so dequeue order equals path-cost order and a
 * target's path is final the first time it is dequeued. The traversal stops
 * as soon as every target is resolved. Unreachable targets are absent from
 * the result. Expansion order matches AStarSearch.
 */
class ReachabilitySearch {
public:
    LegMap reach(const Grid& grid, const Point& source, const std::vector<Point>& targets) const;
};

} // namespace GridRoute

#endif // REACHABILITY_SEARCH_HPP
