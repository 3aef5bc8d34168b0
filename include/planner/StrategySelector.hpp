/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STRATEGY_SELECTOR_HPP
#define STRATEGY_SELECTOR_HPP

#include <cstddef>
#include "planner/RouteTypes.hpp"

namespace GridRoute {

/**
 * Maps (requested mode, waypoint count) to a strategy. Stateless apart from
 * the two thresholds; rules are applied in order:
 *
 *   count == 0                          -> SINGLE_LEG
 *   FAST, or count > directThreshold    -> DIRECT_HEURISTIC
 *   BALANCED                            -> MATRIX_HEURISTIC
 *   OPTIMAL, count <= exhaustiveLimit   -> EXHAUSTIVE
 *   OPTIMAL, otherwise                  -> MATRIX_HEURISTIC (fallback)
 */
class StrategySelector {
public:
    StrategySelector() = default;
    StrategySelector(size_t exhaustiveLimit, size_t directThreshold)
        : m_exhaustiveLimit(exhaustiveLimit), m_directThreshold(directThreshold) {}
    explicit StrategySelector(const PlannerConfig& config)
        : StrategySelector(config.exhaustiveWaypointLimit, config.directHeuristicThreshold) {}

    RouteStrategy select(RouteMode mode, size_t waypointCount) const;

    // True when the strategy chosen is cheaper than the one the mode asks for
    bool isFallback(RouteMode mode, size_t waypointCount) const;

    size_t exhaustiveLimit() const { return m_exhaustiveLimit; }
    size_t directThreshold() const { return m_directThreshold; }

private:
    size_t m_exhaustiveLimit{8};
    size_t m_directThreshold{10};
};

} // namespace GridRoute

#endif // STRATEGY_SELECTOR_HPP
