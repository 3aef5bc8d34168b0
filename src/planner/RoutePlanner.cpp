/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planner/RoutePlanner.hpp"
#include "core/Logger.hpp"
#include "core/RouteErrors.hpp"
#include "pathfinding/AStarSearch.hpp"
#include "pathfinding/PathCache.hpp"
#include "pathfinding/ReachabilitySearch.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <numeric>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace GridRoute {

namespace {

std::string describe(const Point& p) {
    return "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
}

/*
 * Legs between route nodes of one request. Node 0 is the start, nodes
 * 1..n the waypoints in input order, node n+1 the end. A stored nullopt
 * records a leg known to be unreachable.
 */
class LegTable {
public:
    using Leg = std::optional<std::vector<Point>>;

    const Leg* find(size_t from, size_t to) const {
        auto it = m_legs.find(std::make_pair(from, to));
        return it != m_legs.end() ? &it->second : nullptr;
    }

    const Leg& store(size_t from, size_t to, Leg leg) {
        return m_legs.insert_or_assign(std::make_pair(from, to), std::move(leg)).first->second;
    }

    void reserve(size_t count) { m_legs.reserve(count); }

private:
    boost::container::flat_map<std::pair<size_t, size_t>, Leg> m_legs;
};

// Indices 1..n of waypoints still to visit, in input order
using RemainingList = boost::container::small_vector<size_t, 16>;

RemainingList makeRemaining(size_t waypointCount) {
    RemainingList remaining(waypointCount);
    std::iota(remaining.begin(), remaining.end(), size_t{1});
    return remaining;
}

} // namespace

RoutePlanner::RoutePlanner(PathCache& cache, PlannerConfig config)
    : m_cache(cache), m_config(config), m_selector(config) {}

void RoutePlanner::appendLeg(std::vector<Point>& route, const std::vector<Point>& leg) {
    if (leg.empty()) {
        return;
    }
    auto first = leg.begin();
    if (!route.empty() && route.back() == leg.front()) {
        ++first;
    }
    route.insert(route.end(), first, leg.end());
}

void RoutePlanner::rejectDuplicates(const std::vector<Point>& waypoints) const {
    std::unordered_set<Point> seen;
    seen.reserve(waypoints.size());
    for (const Point& w : waypoints) {
        if (!seen.insert(w).second) {
            PLANNER_ERROR("Duplicate pickup point " + describe(w));
            throw InvalidWaypointError("Pickup points must be unique, " + describe(w) +
                                       " appears more than once");
        }
    }
}

RouteResult RoutePlanner::plan(const Grid& grid, const Point& start, const Point& end,
                               const std::vector<Point>& waypoints, RouteMode mode) const {
    if (m_config.rejectDuplicateWaypoints) {
        rejectDuplicates(waypoints);
    }

    const RouteStrategy strategy = m_selector.select(mode, waypoints.size());
    const bool fellBack = m_selector.isFallback(mode, waypoints.size());
    if (fellBack) {
        PLANNER_WARN(std::string("Too many pickup points (") + std::to_string(waypoints.size()) +
                     ") for " + toString(mode) + " mode, using " + toString(strategy));
    }

    RouteResult result = runStrategy(grid, start, end, waypoints, strategy);
    result.requestedMode = mode;
    result.fellBack = result.fellBack || fellBack;
    return result;
}

RouteResult RoutePlanner::runStrategy(const Grid& grid, const Point& start, const Point& end,
                                      const std::vector<Point>& waypoints,
                                      RouteStrategy strategy) const {
    const auto startTime = std::chrono::steady_clock::now();

    RouteResult result;
    result.strategy = strategy;

    if (waypoints.empty()) {
        result.strategy = RouteStrategy::SINGLE_LEG;
    } else if (strategy == RouteStrategy::SINGLE_LEG) {
        // Waypoints cannot be ignored, the direct heuristic is the cheapest honest choice
        result.strategy = RouteStrategy::DIRECT_HEURISTIC;
    } else if (strategy == RouteStrategy::EXHAUSTIVE &&
               waypoints.size() > m_config.exhaustiveWaypointLimit) {
        PLANNER_WARN("Too many pickup points for exhaustive search (" +
                     std::to_string(waypoints.size()) + " > " +
                     std::to_string(m_config.exhaustiveWaypointLimit) +
                     "), falling back to matrix heuristic");
        result.strategy = RouteStrategy::MATRIX_HEURISTIC;
        result.fellBack = true;
    }

    // Endpoints and waypoints are validated upstream; keep the outcome typed if not
    if (grid.isBlocked(start)) {
        PLANNER_ERROR("Start " + describe(start) + " is outside the grid or on an obstacle");
        result.result = PathfindingResult::INVALID_START;
    } else if (grid.isBlocked(end)) {
        PLANNER_ERROR("End " + describe(end) + " is outside the grid or on an obstacle");
        result.result = PathfindingResult::INVALID_GOAL;
    } else {
        switch (result.strategy) {
            case RouteStrategy::SINGLE_LEG:
                result.result = planSingleLeg(grid, start, end, result.path);
                break;
            case RouteStrategy::EXHAUSTIVE:
                result.result = planExhaustive(grid, start, end, waypoints, result.path);
                break;
            case RouteStrategy::MATRIX_HEURISTIC:
                result.result = planMatrixHeuristic(grid, start, end, waypoints, result.path);
                break;
            case RouteStrategy::DIRECT_HEURISTIC:
                result.result = planDirectHeuristic(grid, start, end, waypoints, result.path);
                break;
        }
    }

    if (result.found()) {
        result.totalDistance = static_cast<int>(result.path.size()) - 1;
    } else {
        result.path.clear();
        result.totalDistance = -1;
    }

    const auto endTime = std::chrono::steady_clock::now();
    result.computationTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    PLANNER_INFO(std::string("Route ") + (result.found() ? "found" : "not found") + " using " +
                 toString(result.strategy) + " with " + std::to_string(waypoints.size()) +
                 " pickup points in " + std::to_string(result.computationTimeMs) + "ms");
    return result;
}

PathfindingResult RoutePlanner::planSingleLeg(const Grid& grid, const Point& start, const Point& end,
                                              std::vector<Point>& outPath) const {
    AStarSearch astar(&m_cache);
    return astar.findPath(grid, start, end, outPath);
}

PathfindingResult RoutePlanner::planExhaustive(const Grid& grid, const Point& start, const Point& end,
                                               const std::vector<Point>& waypoints,
                                               std::vector<Point>& outPath) const {
    const size_t n = waypoints.size();
    const size_t endNode = n + 1;
    auto nodePoint = [&](size_t node) -> const Point& {
        if (node == 0) return start;
        if (node == endNode) return end;
        return waypoints[node - 1];
    };

    AStarSearch astar(&m_cache);
    LegTable legs;
    legs.reserve((n + 1) * (n + 1));

    // Each distinct leg is searched once per request, later orders reuse it
    auto legFor = [&](size_t from, size_t to) -> const LegTable::Leg& {
        if (const LegTable::Leg* known = legs.find(from, to)) {
            return *known;
        }
        std::vector<Point> path;
        if (astar.findPath(grid, nodePoint(from), nodePoint(to), path) == PathfindingResult::SUCCESS) {
            return legs.store(from, to, std::move(path));
        }
        return legs.store(from, to, std::nullopt);
    };

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{1});
    std::vector<size_t> bestOrder;
    int bestCost = std::numeric_limits<int>::max();
    uint64_t permutations = 0;

    // Lexicographic enumeration; strict improvement keeps the first optimum found
    do {
        ++permutations;
        int cost = 0;
        size_t prev = 0;
        bool valid = true;
        for (size_t k = 0; k <= n && valid; ++k) {
            const size_t next = (k < n) ? order[k] : endNode;
            const LegTable::Leg& leg = legFor(prev, next);
            if (!leg) {
                valid = false;
                break;
            }
            cost += static_cast<int>(leg->size()) - 1;
            if (cost >= bestCost) {
                valid = false; // cannot beat the best complete order
            }
            prev = next;
        }
        if (valid) {
            bestCost = cost;
            bestOrder = order;
        }
    } while (std::next_permutation(order.begin(), order.end()));

    PLANNER_DEBUG("Exhaustive search evaluated " + std::to_string(permutations) +
                  " visiting orders, " + std::to_string(astar.getStats().totalRequests) +
                  " leg searches");

    if (bestOrder.empty()) {
        return PathfindingResult::NO_PATH_FOUND;
    }

    size_t prev = 0;
    for (size_t k = 0; k <= n; ++k) {
        const size_t next = (k < n) ? bestOrder[k] : endNode;
        appendLeg(outPath, *legFor(prev, next));
        prev = next;
    }
    return PathfindingResult::SUCCESS;
}

PathfindingResult RoutePlanner::planMatrixHeuristic(const Grid& grid, const Point& start, const Point& end,
                                                    const std::vector<Point>& waypoints,
                                                    std::vector<Point>& outPath) const {
    const size_t n = waypoints.size();
    const size_t endNode = n + 1;

    std::vector<Point> nodes;
    nodes.reserve(n + 2);
    nodes.push_back(start);
    nodes.insert(nodes.end(), waypoints.begin(), waypoints.end());
    nodes.push_back(end);

    // One traversal per source fills a whole row of the leg table
    ReachabilitySearch reachability;
    LegTable legs;
    legs.reserve((n + 1) * (n + 1));
    for (size_t from = 0; from <= n; ++from) {
        std::vector<Point> targets;
        targets.reserve(n + 1);
        for (size_t to = 1; to <= endNode; ++to) {
            if (to != from) targets.push_back(nodes[to]);
        }

        LegMap reached = reachability.reach(grid, nodes[from], targets);
        for (size_t to = 1; to <= endNode; ++to) {
            if (to == from) continue;
            auto it = reached.find(nodes[to]);
            if (it != reached.end()) {
                legs.store(from, to, it->second);
            } else {
                legs.store(from, to, std::nullopt);
            }
        }
    }

    RemainingList remaining = makeRemaining(n);
    size_t current = 0;
    while (!remaining.empty()) {
        auto nearest = remaining.end();
        size_t nearestLength = std::numeric_limits<size_t>::max();
        for (auto it = remaining.begin(); it != remaining.end(); ++it) {
            const LegTable::Leg* leg = legs.find(current, *it);
            if (leg && *leg && (*leg)->size() < nearestLength) {
                nearestLength = (*leg)->size();
                nearest = it;
            }
        }
        if (nearest == remaining.end()) {
            PLANNER_DEBUG("Matrix heuristic: no remaining pickup point reachable from " +
                          describe(nodes[current]));
            outPath.clear();
            return PathfindingResult::NO_PATH_FOUND;
        }

        appendLeg(outPath, **legs.find(current, *nearest));
        current = *nearest;
        remaining.erase(nearest);
    }

    const LegTable::Leg* finalLeg = legs.find(current, endNode);
    if (!finalLeg || !*finalLeg) {
        PLANNER_DEBUG("Matrix heuristic: end unreachable from " + describe(nodes[current]));
        outPath.clear();
        return PathfindingResult::NO_PATH_FOUND;
    }
    appendLeg(outPath, **finalLeg);
    return PathfindingResult::SUCCESS;
}

PathfindingResult RoutePlanner::planDirectHeuristic(const Grid& grid, const Point& start, const Point& end,
                                                    const std::vector<Point>& waypoints,
                                                    std::vector<Point>& outPath) const {
    AStarSearch astar(&m_cache);
    RemainingList remaining = makeRemaining(waypoints.size());
    Point current = start;
    std::vector<Point> leg;

    while (!remaining.empty()) {
        // Manhattan distance ranks candidates without searching
        auto nearest = std::min_element(remaining.begin(), remaining.end(),
            [&](size_t a, size_t b) {
                return manhattanDistance(current, waypoints[a - 1]) <
                       manhattanDistance(current, waypoints[b - 1]);
            });
        const Point& target = waypoints[*nearest - 1];

        if (astar.findPath(grid, current, target, leg) != PathfindingResult::SUCCESS) {
            PLANNER_DEBUG("Direct heuristic: pickup point " + describe(target) +
                          " unreachable from " + describe(current));
            outPath.clear();
            return PathfindingResult::NO_PATH_FOUND;
        }
        appendLeg(outPath, leg);
        current = target;
        remaining.erase(nearest);
    }

    if (astar.findPath(grid, current, end, leg) != PathfindingResult::SUCCESS) {
        PLANNER_DEBUG("Direct heuristic: end unreachable from " + describe(current));
        outPath.clear();
        return PathfindingResult::NO_PATH_FOUND;
    }
    appendLeg(outPath, leg);
    return PathfindingResult::SUCCESS;
}

} // namespace GridRoute
