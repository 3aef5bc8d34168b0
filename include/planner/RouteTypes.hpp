/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_TYPES_HPP
#define ROUTE_TYPES_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "pathfinding/PathfindingResult.hpp"
#include "utils/GridPoint.hpp"

namespace GridRoute {

// Requested trade-off between route quality and planning time
enum class RouteMode { OPTIMAL, BALANCED, FAST };

// Waypoint-ordering algorithm actually run for a request
enum class RouteStrategy {
    SINGLE_LEG,       // no waypoints, one A* search
    EXHAUSTIVE,       // every permutation, globally optimal order
    MATRIX_HEURISTIC, // nearest neighbour over a BFS all-pairs leg table
    DIRECT_HEURISTIC  // nearest neighbour with legs searched on demand
};

std::optional<RouteMode> parseRouteMode(std::string_view text);
const char* toString(RouteMode mode);
const char* toString(RouteStrategy strategy);

inline std::ostream& operator<<(std::ostream& os, RouteMode mode) { return os << toString(mode); }
inline std::ostream& operator<<(std::ostream& os, RouteStrategy strategy) { return os << toString(strategy); }

struct PlannerConfig {
    // Exhaustive search runs at most this many waypoints (8! = 40320 orders)
    size_t exhaustiveWaypointLimit{8};
    // Above this count every mode uses the direct heuristic
    size_t directHeuristicThreshold{10};
    size_t cacheCapacity{1000};
    bool rejectDuplicateWaypoints{true};
};

struct RouteResult {
    PathfindingResult result{PathfindingResult::NO_PATH_FOUND};
    std::vector<Point> path;
    int totalDistance{-1};
    RouteStrategy strategy{RouteStrategy::SINGLE_LEG};
    RouteMode requestedMode{RouteMode::OPTIMAL};
    bool fellBack{false};
    double computationTimeMs{0.0};

    bool found() const { return result == PathfindingResult::SUCCESS; }
};

} // namespace GridRoute

#endif // ROUTE_TYPES_HPP
