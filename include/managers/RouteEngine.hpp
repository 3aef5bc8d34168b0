/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_ENGINE_HPP
#define ROUTE_ENGINE_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "pathfinding/PathCache.hpp"
#include "planner/RoutePlanner.hpp"
#include "planner/RouteRequest.hpp"
#include "planner/RouteTypes.hpp"

namespace GridRoute {

class SettingsManager;

/**
 * @brief Snapshot of RouteEngine counters
 */
struct EngineStats {
    uint64_t totalPlans{0};
    uint64_t routesFound{0};
    uint64_t routesNotFound{0};
    uint64_t fallbacks{0};
    // Indexed by RouteStrategy
    std::array<uint64_t, 4> strategyCounts{};

    uint64_t countFor(RouteStrategy strategy) const {
        return strategyCounts[static_cast<size_t>(strategy)];
    }
};

/**
 * @brief Entry point for route planning
 *
 * Owns the PathCache shared by every request and the RoutePlanner that runs
 * on top of it. plan() may be called from several threads at once: all search
 * state is per call and the cache serializes its own access.
 *
 * Usage:
 *   GridRoute::RouteEngine engine(RouteEngine::configFromSettings(SettingsManager::Instance()));
 *   auto result = engine.plan(grid, {0, 0}, {2, 2}, {{0, 2}}, "optimal");
 *   if (result.found()) { ... result.path, result.totalDistance, result.strategy ... }
 */
class RouteEngine {
public:
    explicit RouteEngine(PlannerConfig config = {});

    /**
     * @brief Plans a route through every waypoint
     * @param mode "optimal", "balanced" or "fast"; anything else plans as optimal
     * @throws InvalidWaypointError on duplicate waypoints when rejection is enabled
     */
    RouteResult plan(const Grid& grid, const Point& start, const Point& end,
                     const std::vector<Point>& waypoints,
                     const std::string& mode = "optimal");

    RouteResult plan(const RouteRequest& request);

    /**
     * @brief Drops every cached path and resets cache statistics
     * Later queries recompute their legs from scratch.
     */
    void clearCache();

    PathCacheStats getCacheStats() const { return m_cache.getStats(); }

    EngineStats getStats() const;
    void resetStats();

    const PlannerConfig& getConfig() const { return m_planner.getConfig(); }

    /**
     * @brief Reads the "planner" category; missing or negative values keep
     * the PlannerConfig defaults
     */
    static PlannerConfig configFromSettings(const SettingsManager& settings);

    RouteEngine(const RouteEngine&) = delete;
    RouteEngine& operator=(const RouteEngine&) = delete;

private:
    PathCache m_cache;
    RoutePlanner m_planner;

    std::atomic<uint64_t> m_totalPlans{0};
    std::atomic<uint64_t> m_routesFound{0};
    std::atomic<uint64_t> m_routesNotFound{0};
    std::atomic<uint64_t> m_fallbacks{0};
    std::array<std::atomic<uint64_t>, 4> m_strategyCounts{};

    void recordResult(const RouteResult& result);
};

} // namespace GridRoute

#endif // ROUTE_ENGINE_HPP
