/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_ERRORS_HPP
#define ROUTE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace GridRoute {

/**
 * Grid shape or cell values are invalid: rows of unequal length, dimensions
 * that do not match the cell data, or a cell outside {0 free, 1 obstacle}.
 * Distinct from a route that simply does not exist.
 */
class MalformedGridError : public std::invalid_argument {
public:
    explicit MalformedGridError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Duplicate waypoint in a planning request.
class InvalidWaypointError : public std::invalid_argument {
public:
    explicit InvalidWaypointError(const std::string& message)
        : std::invalid_argument(message) {}
};

// JSON request document is missing a field or carries the wrong type.
class RequestFormatError : public std::runtime_error {
public:
    explicit RequestFormatError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace GridRoute

#endif // ROUTE_ERRORS_HPP
