/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planner/RouteTypes.hpp"
#include <algorithm>
#include <cctype>

namespace GridRoute {

std::optional<RouteMode> parseRouteMode(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "optimal") return RouteMode::OPTIMAL;
    if (lowered == "balanced") return RouteMode::BALANCED;
    if (lowered == "fast") return RouteMode::FAST;
    return std::nullopt;
}

const char* toString(RouteMode mode) {
    switch (mode) {
        case RouteMode::OPTIMAL: return "optimal";
        case RouteMode::BALANCED: return "balanced";
        case RouteMode::FAST: return "fast";
        default: return "unknown";
    }
}

const char* toString(RouteStrategy strategy) {
    switch (strategy) {
        case RouteStrategy::SINGLE_LEG: return "single_leg";
        case RouteStrategy::EXHAUSTIVE: return "exhaustive";
        case RouteStrategy::MATRIX_HEURISTIC: return "matrix_heuristic";
        case RouteStrategy::DIRECT_HEURISTIC: return "direct_heuristic";
        default: return "unknown";
    }
}

} // namespace GridRoute
