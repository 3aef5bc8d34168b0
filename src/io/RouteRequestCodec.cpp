/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "io/RouteRequestCodec.hpp"
#include "core/Logger.hpp"
#include "core/RouteErrors.hpp"

namespace GridRoute {
namespace RouteCodec {

namespace {

[[noreturn]] void reject(const std::string& message) {
    CODEC_ERROR(message);
    throw RequestFormatError(message);
}

int requireInt(const JsonValue& value, const std::string& field) {
    if (value.isNull()) {
        reject("Missing field '" + field + "'");
    }
    auto number = value.tryAsInt();
    if (!number) {
        reject("Field '" + field + "' must be an integer");
    }
    return *number;
}

std::string describe(const std::string& name, const Point& p) {
    return name + " point (" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

void checkPoint(const Grid& grid, const Point& p, const std::string& name) {
    if (!grid.inBounds(p)) {
        reject(describe(name, p) + " is outside grid bounds");
    }
    if (grid.isBlocked(p)) {
        reject(describe(name, p) + " is on an obstacle");
    }
}

Grid decodeGrid(const JsonValue& root) {
    const JsonArray* rows = root["grid"].tryAsArray();
    if (!rows) {
        reject(root.hasKey("grid") ? "Field 'grid' must be an array of rows" : "Missing field 'grid'");
    }

    std::vector<std::vector<int>> cells;
    cells.reserve(rows->size());
    for (size_t r = 0; r < rows->size(); ++r) {
        const JsonArray* row = (*rows)[r].tryAsArray();
        if (!row) {
            reject("Grid row " + std::to_string(r) + " is not an array");
        }
        std::vector<int> values;
        values.reserve(row->size());
        for (size_t c = 0; c < row->size(); ++c) {
            auto cell = (*row)[c].tryAsInt();
            if (!cell) {
                reject("Grid cell (" + std::to_string(r) + ", " + std::to_string(c) + ") is not an integer");
            }
            values.push_back(*cell);
        }
        cells.push_back(std::move(values));
    }

    // fromRows enforces rectangularity and the 0/1 cell domain
    Grid grid = Grid::fromRows(cells);

    if (grid.rows() > MAX_GRID_DIMENSION || grid.columns() > MAX_GRID_DIMENSION) {
        reject("Grid dimensions " + std::to_string(grid.rows()) + "x" + std::to_string(grid.columns()) +
               " exceed " + std::to_string(MAX_GRID_DIMENSION));
    }
    if (root.hasKey("rows") && requireInt(root["rows"], "rows") != grid.rows()) {
        throw MalformedGridError("Declared rows " + std::to_string(root["rows"].asInt()) +
                                 " do not match grid with " + std::to_string(grid.rows()) + " rows");
    }
    if (root.hasKey("columns") && requireInt(root["columns"], "columns") != grid.columns()) {
        throw MalformedGridError("Declared columns " + std::to_string(root["columns"].asInt()) +
                                 " do not match grid with " + std::to_string(grid.columns()) + " columns");
    }
    return grid;
}

} // namespace

Point decodePoint(const JsonValue& value, const std::string& field) {
    if (!value.isObject()) {
        reject(value.isNull() ? "Missing field '" + field + "'" : "Field '" + field + "' must be an object");
    }
    const int x = requireInt(value["x"], field + ".x");
    const int y = requireInt(value["y"], field + ".y");
    if (x < 0 || y < 0) {
        reject("Field '" + field + "' must have non-negative coordinates");
    }
    return Point(x, y);
}

JsonValue encodePoint(const Point& point) {
    JsonValue value{JsonObject{}};
    value["x"] = JsonValue(point.x);
    value["y"] = JsonValue(point.y);
    return value;
}

RouteRequest parseRequest(const JsonValue& root) {
    if (!root.isObject()) {
        reject("Request must be a JSON object");
    }

    Grid grid = decodeGrid(root);
    Point start = decodePoint(root["start"], "start");
    Point end = decodePoint(root["end"], "end");

    std::vector<Point> waypoints;
    if (root.hasKey("pickup_points")) {
        const JsonArray* points = root["pickup_points"].tryAsArray();
        if (!points) {
            reject("Field 'pickup_points' must be an array");
        }
        if (points->size() > MAX_PICKUP_POINTS) {
            reject("At most " + std::to_string(MAX_PICKUP_POINTS) + " pickup points are allowed, got " +
                   std::to_string(points->size()));
        }
        waypoints.reserve(points->size());
        for (size_t i = 0; i < points->size(); ++i) {
            waypoints.push_back(decodePoint((*points)[i], "pickup_points[" + std::to_string(i) + "]"));
        }
    }

    std::string algorithm = "optimal";
    if (root.hasKey("algorithm") && !root["algorithm"].isNull()) {
        auto text = root["algorithm"].tryAsString();
        if (!text) {
            reject("Field 'algorithm' must be a string");
        }
        algorithm = *text;
    }

    CODEC_DEBUG("Decoded request: " + std::to_string(grid.rows()) + "x" + std::to_string(grid.columns()) +
                " grid, " + std::to_string(waypoints.size()) + " pickup points, algorithm " + algorithm);
    return RouteRequest{std::move(grid), start, end, std::move(waypoints), std::move(algorithm)};
}

RouteRequest parseRequestText(const std::string& text) {
    JsonReader reader;
    if (!reader.parse(text)) {
        reject("Invalid JSON: " + reader.getLastError());
    }
    return parseRequest(reader.getRoot());
}

void validatePoints(const RouteRequest& request) {
    checkPoint(request.grid, request.start, "Start");
    checkPoint(request.grid, request.end, "End");
    for (size_t i = 0; i < request.waypoints.size(); ++i) {
        checkPoint(request.grid, request.waypoints[i], "Pickup " + std::to_string(i + 1));
    }
}

JsonValue encodeResult(const RouteResult& result) {
    if (!result.found()) {
        return encodeError("NoPathFound", "No valid path found");
    }

    JsonArray path;
    path.reserve(result.path.size());
    for (const Point& p : result.path) {
        path.push_back(encodePoint(p));
    }

    JsonValue response{JsonObject{}};
    response["path"] = JsonValue(std::move(path));
    response["total_distance"] = JsonValue(result.totalDistance);
    response["computation_time"] = JsonValue(result.computationTimeMs / 1000.0);
    response["algorithm_used"] = JsonValue(toString(result.requestedMode));
    response["strategy_used"] = JsonValue(toString(result.strategy));
    return response;
}

JsonValue encodeError(const std::string& error, const std::string& message) {
    JsonValue response{JsonObject{}};
    response["error"] = JsonValue(error);
    response["message"] = JsonValue(message);
    return response;
}

} // namespace RouteCodec
} // namespace GridRoute
