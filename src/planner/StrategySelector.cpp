/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planner/StrategySelector.hpp"

namespace GridRoute {

RouteStrategy StrategySelector::select(RouteMode mode, size_t waypointCount) const {
    if (waypointCount == 0) {
        return RouteStrategy::SINGLE_LEG;
    }
    if (mode == RouteMode::FAST || waypointCount > m_directThreshold) {
        return RouteStrategy::DIRECT_HEURISTIC;
    }
    if (mode == RouteMode::BALANCED) {
        return RouteStrategy::MATRIX_HEURISTIC;
    }
    if (waypointCount <= m_exhaustiveLimit) {
        return RouteStrategy::EXHAUSTIVE;
    }
    return RouteStrategy::MATRIX_HEURISTIC;
}

bool StrategySelector::isFallback(RouteMode mode, size_t waypointCount) const {
    if (waypointCount == 0) {
        return false;
    }
    const RouteStrategy chosen = select(mode, waypointCount);
    switch (mode) {
        case RouteMode::OPTIMAL: return chosen != RouteStrategy::EXHAUSTIVE;
        case RouteMode::BALANCED: return chosen != RouteStrategy::MATRIX_HEURISTIC;
        case RouteMode::FAST: return false;
        default: return false;
    }
}

} // namespace GridRoute
