/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RouteEngine.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

namespace GridRoute {

namespace {

size_t readCount(const SettingsManager& settings, const std::string& key, size_t fallback) {
    const int value = settings.get<int>("planner", key, static_cast<int>(fallback));
    if (value < 0) {
        SETTINGS_WARNING("planner." + key + " must not be negative, using " + std::to_string(fallback));
        return fallback;
    }
    return static_cast<size_t>(value);
}

} // namespace

RouteEngine::RouteEngine(PlannerConfig config)
    : m_cache(config.cacheCapacity), m_planner(m_cache, config) {
    ENGINE_INFO("RouteEngine initialized (exhaustive limit " + std::to_string(config.exhaustiveWaypointLimit) +
                ", direct threshold " + std::to_string(config.directHeuristicThreshold) +
                ", cache capacity " + std::to_string(config.cacheCapacity) + ")");
}

RouteResult RouteEngine::plan(const Grid& grid, const Point& start, const Point& end,
                              const std::vector<Point>& waypoints, const std::string& mode) {
    RouteMode routeMode = RouteMode::OPTIMAL;
    if (auto parsed = parseRouteMode(mode)) {
        routeMode = *parsed;
    } else {
        ENGINE_WARN("Unknown algorithm '" + mode + "', planning as optimal");
    }

    RouteResult result = m_planner.plan(grid, start, end, waypoints, routeMode);
    recordResult(result);
    return result;
}

RouteResult RouteEngine::plan(const RouteRequest& request) {
    return plan(request.grid, request.start, request.end, request.waypoints, request.algorithm);
}

void RouteEngine::clearCache() {
    m_cache.clear();
}

void RouteEngine::recordResult(const RouteResult& result) {
    m_totalPlans.fetch_add(1, std::memory_order_relaxed);
    if (result.found()) {
        m_routesFound.fetch_add(1, std::memory_order_relaxed);
    } else {
        m_routesNotFound.fetch_add(1, std::memory_order_relaxed);
    }
    if (result.fellBack) {
        m_fallbacks.fetch_add(1, std::memory_order_relaxed);
    }
    m_strategyCounts[static_cast<size_t>(result.strategy)].fetch_add(1, std::memory_order_relaxed);
}

EngineStats RouteEngine::getStats() const {
    EngineStats stats;
    stats.totalPlans = m_totalPlans.load(std::memory_order_relaxed);
    stats.routesFound = m_routesFound.load(std::memory_order_relaxed);
    stats.routesNotFound = m_routesNotFound.load(std::memory_order_relaxed);
    stats.fallbacks = m_fallbacks.load(std::memory_order_relaxed);
    for (size_t i = 0; i < m_strategyCounts.size(); ++i) {
        stats.strategyCounts[i] = m_strategyCounts[i].load(std::memory_order_relaxed);
    }
    return stats;
}

void RouteEngine::resetStats() {
    m_totalPlans.store(0, std::memory_order_relaxed);
    m_routesFound.store(0, std::memory_order_relaxed);
    m_routesNotFound.store(0, std::memory_order_relaxed);
    m_fallbacks.store(0, std::memory_order_relaxed);
    for (auto& count : m_strategyCounts) {
        count.store(0, std::memory_order_relaxed);
    }
}

PlannerConfig RouteEngine::configFromSettings(const SettingsManager& settings) {
    PlannerConfig config;
    config.exhaustiveWaypointLimit = readCount(settings, "exhaustive_waypoint_limit", config.exhaustiveWaypointLimit);
    config.directHeuristicThreshold = readCount(settings, "direct_heuristic_threshold", config.directHeuristicThreshold);
    config.cacheCapacity = readCount(settings, "cache_capacity", config.cacheCapacity);
    config.rejectDuplicateWaypoints = settings.get<bool>("planner", "reject_duplicate_waypoints",
                                                          config.rejectDuplicateWaypoints);
    return config;
}

} // namespace GridRoute
