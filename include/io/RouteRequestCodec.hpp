/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_REQUEST_CODEC_HPP
#define ROUTE_REQUEST_CODEC_HPP

#include <cstddef>
#include <string>
#include "planner/RouteRequest.hpp"
#include "planner/RouteTypes.hpp"
#include "utils/GridPoint.hpp"
#include "utils/JsonReader.hpp"

namespace GridRoute {

/**
 * JSON wire format of planning requests and responses.
 *
 * Request:
 *   {"grid": [[0,1,...],...], "rows": R, "columns": C,
 *    "start": {"x":..,"y":..}, "end": {...},
 *    "pickup_points": [{...}, ...], "algorithm": "optimal"}
 * rows/columns are optional and checked against grid when present;
 * pickup_points and algorithm are optional.
 *
 * Response:
 *   {"path": [{"x":..,"y":..},...], "total_distance": N,
 *    "computation_time": seconds, "algorithm_used": "<mode>",
 *    "strategy_used": "<strategy>"}
 * or {"error": "NoPathFound", "message": "No valid path found"}.
 */
namespace RouteCodec {

constexpr int MAX_GRID_DIMENSION = 1000;
constexpr size_t MAX_PICKUP_POINTS = 50;

/**
 * @brief Decodes a request document
 * @throws RequestFormatError on missing fields, wrong types or limits exceeded
 * @throws MalformedGridError when the grid is not a rectangular 0/1 matrix
 */
RouteRequest parseRequest(const JsonValue& root);

/**
 * @brief Parses JSON text then decodes it
 * @throws RequestFormatError on JSON syntax errors, plus everything parseRequest throws
 */
RouteRequest parseRequestText(const std::string& text);

/**
 * @brief Rejects endpoints or pickup points that are outside the grid or on
 * an obstacle, naming the first offending point. Pickup points are named by
 * their 1-based position, e.g. "Pickup point 3 (4, 1) is on an obstacle".
 * @throws RequestFormatError
 */
void validatePoints(const RouteRequest& request);

Point decodePoint(const JsonValue& value, const std::string& field);
JsonValue encodePoint(const Point& point);

// Success response, or the NoPathFound error document
JsonValue encodeResult(const RouteResult& result);

JsonValue encodeError(const std::string& error, const std::string& message);

} // namespace RouteCodec

} // namespace GridRoute

#endif // ROUTE_REQUEST_CODEC_HPP
