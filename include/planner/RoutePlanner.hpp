/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_PLANNER_HPP
#define ROUTE_PLANNER_HPP

#include <vector>
#include "pathfinding/Grid.hpp"
#include "planner/RouteTypes.hpp"
#include "planner/StrategySelector.hpp"
#include "utils/GridPoint.hpp"

namespace GridRoute {

class PathCache;

/**
 * @brief Plans a route from start to end through every waypoint.
 *
 * The visiting order is chosen by one of three strategies:
 * - EXHAUSTIVE: enumerates all orders with std::next_permutation and keeps the
 *   cheapest. Cost grows factorially, so it is capped by
 *   PlannerConfig::exhaustiveWaypointLimit and falls back to MATRIX_HEURISTIC
 *   beyond it.
 * - MATRIX_HEURISTIC: one ReachabilitySearch per start/waypoint builds an
 *   all-pairs leg table, then repeatedly appends the nearest unvisited waypoint.
 * - DIRECT_HEURISTIC: repeatedly heads for the unvisited waypoint with the
 *   smallest Manhattan distance, searching each leg on demand with A* through
 *   the PathCache.
 *
 * Both heuristics are greedy nearest-neighbour constructions without any
 * local-improvement pass, so their routes can be noticeably longer than the
 * exhaustive optimum.
 *
 * plan() keeps all search state on the stack; one RoutePlanner may serve
 * concurrent calls as long as the shared PathCache outlives it.
 */
class RoutePlanner {
public:
    explicit RoutePlanner(PathCache& cache, PlannerConfig config = {});

    /**
     * @brief Plan a route using the strategy chosen by StrategySelector
     * @throws InvalidWaypointError on duplicate waypoints when rejection is enabled
     */
    RouteResult plan(const Grid& grid, const Point& start, const Point& end,
                     const std::vector<Point>& waypoints,
                     RouteMode mode = RouteMode::OPTIMAL) const;

    /**
     * @brief Run one strategy regardless of the selector.
     * EXHAUSTIVE above the configured limit still degrades to MATRIX_HEURISTIC.
     */
    RouteResult runStrategy(const Grid& grid, const Point& start, const Point& end,
                            const std::vector<Point>& waypoints, RouteStrategy strategy) const;

    /**
     * @brief Leg stitching rule shared by every strategy: the leg's first point
     * is dropped when it repeats the route's last point.
     */
    static void appendLeg(std::vector<Point>& route, const std::vector<Point>& leg);

    const PlannerConfig& getConfig() const { return m_config; }
    const StrategySelector& getSelector() const { return m_selector; }

private:
    PathCache& m_cache;
    PlannerConfig m_config;
    StrategySelector m_selector;

    void rejectDuplicates(const std::vector<Point>& waypoints) const;

    PathfindingResult planSingleLeg(const Grid& grid, const Point& start, const Point& end,
                                    std::vector<Point>& outPath) const;
    PathfindingResult planExhaustive(const Grid& grid, const Point& start, const Point& end,
                                     const std::vector<Point>& waypoints,
                                     std::vector<Point>& outPath) const;
    PathfindingResult planMatrixHeuristic(const Grid& grid, const Point& start, const Point& end,
                                          const std::vector<Point>& waypoints,
                                          std::vector<Point>& outPath) const;
    PathfindingResult planDirectHeuristic(const Grid& grid, const Point& start, const Point& end,
                                          const std::vector<Point>& waypoints,
                                          std::vector<Point>& outPath) const;
};

} // namespace GridRoute

#endif // ROUTE_PLANNER_HPP
