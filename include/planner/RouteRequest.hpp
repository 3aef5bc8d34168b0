/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_REQUEST_HPP
#define ROUTE_REQUEST_HPP

#include <string>
#include <vector>
#include "pathfinding/Grid.hpp"
#include "utils/GridPoint.hpp"

namespace GridRoute {

// One planning request as supplied by a caller
struct RouteRequest {
    Grid grid;
    Point start;
    Point end;
    std::vector<Point> waypoints;
    std::string algorithm{"optimal"};
};

} // namespace GridRoute

#endif // ROUTE_REQUEST_HPP
