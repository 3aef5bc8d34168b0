/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE RoutePlannerTests
#include <boost/test/unit_test.hpp>

#include "common/RouteTestHelpers.hpp"
#include "core/Logger.hpp"
#include "core/RouteErrors.hpp"
#include "pathfinding/PathCache.hpp"
#include "planner/RoutePlanner.hpp"
#include <algorithm>
#include <random>
#include <vector>

using namespace GridRoute;
using namespace GridRoute::TestHelpers;

struct QuietLogFixture {
    QuietLogFixture() { GRIDROUTE_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogFixture() { GRIDROUTE_DISABLE_BENCHMARK_MODE(); }
};

BOOST_GLOBAL_FIXTURE(QuietLogFixture);

struct PlannerFixture {
    PathCache cache;
    RoutePlanner planner{cache};

    void checkRoute(const Grid& grid, const RouteResult& result, const Point& start, const Point& end,
                    const std::vector<Point>& waypoints) const {
        BOOST_REQUIRE(result.found());
        BOOST_REQUIRE(!result.path.empty());
        BOOST_CHECK_EQUAL(result.path.front(), start);
        BOOST_CHECK_EQUAL(result.path.back(), end);
        BOOST_CHECK(isContiguous(result.path));
        BOOST_CHECK(avoidsObstacles(grid, result.path));
        BOOST_CHECK(visitsAll(result.path, waypoints));
        BOOST_CHECK_EQUAL(result.totalDistance, static_cast<int>(result.path.size()) - 1);
    }
};

namespace {

// Distinct free cells that are neither start nor end
std::vector<Point> pickWaypoints(const Grid& grid, size_t count, const Point& start, const Point& end,
                                 uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> row(0, grid.rows() - 1);
    std::uniform_int_distribution<int> column(0, grid.columns() - 1);
    std::vector<Point> points;
    while (points.size() < count) {
        const Point p(row(rng), column(rng));
        if (grid.isBlocked(p) || p == start || p == end ||
            std::find(points.begin(), points.end(), p) != points.end()) {
            continue;
        }
        points.push_back(p);
    }
    return points;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(EndToEndScenarioTests, PlannerFixture)

BOOST_AUTO_TEST_CASE(TestOpenGridWithoutWaypoints) {
    Grid grid = openGrid(3, 3);
    RouteResult result = planner.plan(grid, Point(0, 0), Point(2, 2), {});

    checkRoute(grid, result, Point(0, 0), Point(2, 2), {});
    BOOST_CHECK_EQUAL(result.path.size(), 5);
    BOOST_CHECK_EQUAL(result.totalDistance, 4);
    BOOST_CHECK_EQUAL(result.strategy, RouteStrategy::SINGLE_LEG);
    BOOST_CHECK(!result.fellBack);
}

BOOST_AUTO_TEST_CASE(TestSingleWaypointOnOptimalRoute) {
    Grid grid = openGrid(3, 3);
    RouteResult result = planner.plan(grid, Point(0, 0), Point(2, 2), {Point(0, 2)});

    checkRoute(grid, result, Point(0, 0), Point(2, 2), {Point(0, 2)});
    BOOST_CHECK_EQUAL(result.strategy, RouteStrategy::EXHAUSTIVE);
    BOOST_CHECK_EQUAL(result.totalDistance, 4);
    const std::vector<Point> expected{Point(0, 0), Point(0, 1), Point(0, 2), Point(1, 2), Point(2, 2)};
    BOOST_CHECK_EQUAL_COLLECTIONS(result.path.begin(), result.path.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestWallWithGap) {
    Grid grid = gapWallGrid(2);
    RouteResult result = planner.plan(grid, Point(0, 0), Point(4, 4), {});

    checkRoute(grid, result, Point(0, 0), Point(4, 4), {});
    BOOST_CHECK(visitsAll(result.path, {Point(2, 2)}));
    BOOST_CHECK_EQUAL(result.totalDistance, 8);
}

BOOST_AUTO_TEST_CASE(TestWallWithoutGap) {
    Grid grid = gapWallGrid(-1);
    RouteResult result = planner.plan(grid, Point(0, 0), Point(4, 4), {});

    BOOST_CHECK(!result.found());
    BOOST_CHECK_EQUAL(result.result, PathfindingResult::NO_PATH_FOUND);
    BOOST_CHECK(result.path.empty());
    BOOST_CHECK_EQUAL(result.totalDistance, -1);
}

BOOST_AUTO_TEST_CASE(TestNineWaypointsFallBackToMatrix) {
    Grid grid = openGrid(6, 6);
    const std::vector<Point> waypoints{Point(0, 5), Point(1, 1), Point(1, 4), Point(2, 2), Point(2, 5),
                                       Point(3, 0), Point(3, 3), Point(4, 1), Point(4, 4)};
    RouteResult result = planner.plan(grid, Point(0, 0), Point(5, 5), waypoints, RouteMode::OPTIMAL);

    checkRoute(grid, result, Point(0, 0), Point(5, 5), waypoints);
    BOOST_CHECK_EQUAL(result.strategy, RouteStrategy::MATRIX_HEURISTIC);
    BOOST_CHECK_EQUAL(result.requestedMode, RouteMode::OPTIMAL);
    BOOST_CHECK(result.fellBack);
}

BOOST_AUTO_TEST_CASE(TestClearCacheThenRepeat) {
    Grid grid = randomGrid(12, 12, 0.2, 5);
    const Point start(0, 0);
    const Point end(11, 11);
    const auto waypoints = pickWaypoints(grid, 3, start, end, 11);

    RouteResult first = planner.plan(grid, start, end, waypoints);
    const size_t cachedLegs = cache.size();
    BOOST_CHECK_GT(cachedLegs, 0u);

    cache.clear();
    BOOST_CHECK_EQUAL(cache.size(), 0);

    RouteResult second = planner.plan(grid, start, end, waypoints);
    BOOST_CHECK_EQUAL(first.found(), second.found());
    BOOST_CHECK_EQUAL(first.totalDistance, second.totalDistance);
    BOOST_CHECK_EQUAL(cache.size(), cachedLegs);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(StrategyQualityTests, PlannerFixture)

BOOST_AUTO_TEST_CASE(TestExhaustiveNeverWorseThanHeuristics) {
    int compared = 0;
    for (uint32_t seed = 1; seed <= 25; ++seed) {
        Grid grid = randomGrid(10, 10, 0.2, seed);
        const Point start(0, 0);
        const Point end(9, 9);
        const auto waypoints = pickWaypoints(grid, 5, start, end, seed * 31);

        RouteResult exhaustive = planner.runStrategy(grid, start, end, waypoints, RouteStrategy::EXHAUSTIVE);
        RouteResult matrix = planner.runStrategy(grid, start, end, waypoints, RouteStrategy::MATRIX_HEURISTIC);
        RouteResult direct = planner.runStrategy(grid, start, end, waypoints, RouteStrategy::DIRECT_HEURISTIC);

        // All strategies agree on solvability
        BOOST_CHECK_EQUAL(exhaustive.found(), matrix.found());
        BOOST_CHECK_EQUAL(exhaustive.found(), direct.found());
        if (!exhaustive.found()) {
            continue;
        }

        ++compared;
        checkRoute(grid, exhaustive, start, end, waypoints);
        checkRoute(grid, matrix, start, end, waypoints);
        checkRoute(grid, direct, start, end, waypoints);
        BOOST_CHECK_LE(exhaustive.totalDistance, matrix.totalDistance);
        BOOST_CHECK_LE(exhaustive.totalDistance, direct.totalDistance);
    }
    BOOST_CHECK_GT(compared, 5);
}

BOOST_AUTO_TEST_CASE(TestExhaustiveFindsKnownOptimum) {
    // Waypoints listed out of order; the optimum sweeps left to right
    Grid grid = openGrid(1, 7);
    const std::vector<Point> waypoints{Point(0, 6), Point(0, 2), Point(0, 4)};
    RouteResult result = planner.plan(grid, Point(0, 0), Point(0, 6), waypoints);

    checkRoute(grid, result, Point(0, 0), Point(0, 6), waypoints);
    BOOST_CHECK_EQUAL(result.strategy, RouteStrategy::EXHAUSTIVE);
    BOOST_CHECK_EQUAL(result.totalDistance, 6);
}

BOOST_AUTO_TEST_CASE(TestMatrixTieKeepsInputOrder) {
    Grid grid = openGrid(1, 5);
    // Both waypoints are two steps from the start
    const std::vector<Point> waypoints{Point(0, 4), Point(0, 0)};
    RouteResult result = planner.plan(grid, Point(0, 2), Point(0, 0), waypoints, RouteMode::BALANCED);

    checkRoute(grid, result, Point(0, 2), Point(0, 0), waypoints);
    BOOST_CHECK_EQUAL(result.strategy, RouteStrategy::MATRIX_HEURISTIC);
    BOOST_CHECK_EQUAL(result.path[1], Point(0, 3));
    BOOST_CHECK_EQUAL(result.totalDistance, 6);
}

BOOST_AUTO_TEST_CASE(TestDirectHeuristicRanksByManhattanDistance) {
    // (2,0) is closer by Manhattan distance but the wall makes it the longer walk
    Grid grid = Grid::fromRows({{0, 0, 0, 0},
                                {1, 1, 1, 0},
                                {0, 0, 0, 0}});
    const std::vector<Point> waypoints{Point(0, 3), Point(2, 0)};
    RouteResult direct = planner.plan(grid, Point(0, 0), Point(2, 3), waypoints, RouteMode::FAST);

    checkRoute(grid, direct, Point(0, 0), Point(2, 3), waypoints);
    BOOST_CHECK_EQUAL(direct.strategy, RouteStrategy::DIRECT_HEURISTIC);
    // Around the wall to (2,0) takes 8, back up to (0,3) 5, then 2 down to the end
    BOOST_CHECK_EQUAL(direct.totalDistance, 15);

    RouteResult exhaustive = planner.runStrategy(grid, Point(0, 0), Point(2, 3), waypoints,
                                                 RouteStrategy::EXHAUSTIVE);
    BOOST_CHECK_EQUAL(exhaustive.totalDistance, 11);
}

BOOST_AUTO_TEST_CASE(TestExhaustiveAboveLimitDegrades) {
    Grid grid = openGrid(6, 6);
    const auto waypoints = pickWaypoints(grid, 9, Point(0, 0), Point(5, 5), 3);
    RouteResult result = planner.runStrategy(grid, Point(0, 0), Point(5, 5), waypoints, RouteStrategy::EXHAUSTIVE);

    checkRoute(grid, result, Point(0, 0), Point(5, 5), waypoints);
    BOOST_CHECK_EQUAL(result.strategy, RouteStrategy::MATRIX_HEURISTIC);
    BOOST_CHECK(result.fellBack);
}

BOOST_AUTO_TEST_CASE(TestManyWaypointsUseDirect) {
    Grid grid = openGrid(8, 8);
    const auto waypoints = pickWaypoints(grid, 12, Point(0, 0), Point(7, 7), 19);
    RouteResult result = planner.plan(grid, Point(0, 0), Point(7, 7), waypoints, RouteMode::OPTIMAL);

    checkRoute(grid, result, Point(0, 0), Point(7, 7), waypoints);
    BOOST_CHECK_EQUAL(result.strategy, RouteStrategy::DIRECT_HEURISTIC);
    BOOST_CHECK(result.fellBack);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RouteEdgeCaseTests, PlannerFixture)

BOOST_AUTO_TEST_CASE(TestAppendLegDropsSharedJoint) {
    std::vector<Point> route{Point(0, 0), Point(0, 1)};
    RoutePlanner::appendLeg(route, {Point(0, 1), Point(0, 2)});
    BOOST_CHECK_EQUAL(route.size(), 3);

    RoutePlanner::appendLeg(route, {Point(5, 5)});
    BOOST_CHECK_EQUAL(route.size(), 4);

    RoutePlanner::appendLeg(route, {});
    BOOST_CHECK_EQUAL(route.size(), 4);
}

BOOST_AUTO_TEST_CASE(TestDuplicateWaypointsRejected) {
    Grid grid = openGrid(3, 3);
    BOOST_CHECK_THROW(planner.plan(grid, Point(0, 0), Point(2, 2), {Point(1, 1), Point(1, 1)}),
                      InvalidWaypointError);
}

BOOST_AUTO_TEST_CASE(TestDuplicateWaypointsToleratedWhenConfigured) {
    PlannerConfig config;
    config.rejectDuplicateWaypoints = false;
    RoutePlanner lenient(cache, config);
    Grid grid = openGrid(3, 3);

    RouteResult result = lenient.plan(grid, Point(0, 0), Point(2, 2), {Point(1, 1), Point(1, 1)});
    checkRoute(grid, result, Point(0, 0), Point(2, 2), {Point(1, 1)});
    BOOST_CHECK_EQUAL(result.totalDistance, 4);
}

BOOST_AUTO_TEST_CASE(TestWaypointOnEndpoint) {
    Grid grid = openGrid(3, 3);
    RouteResult result = planner.plan(grid, Point(0, 0), Point(2, 2), {Point(0, 0), Point(2, 2)});

    checkRoute(grid, result, Point(0, 0), Point(2, 2), {});
    BOOST_CHECK_EQUAL(result.totalDistance, 4);
}

BOOST_AUTO_TEST_CASE(TestUnreachableWaypoint) {
    Grid grid = Grid::fromRows({{0, 0, 0},
                                {0, 1, 1},
                                {0, 1, 0}});
    for (RouteMode mode : {RouteMode::OPTIMAL, RouteMode::BALANCED, RouteMode::FAST}) {
        RouteResult result = planner.plan(grid, Point(0, 0), Point(2, 0), {Point(2, 2)}, mode);
        BOOST_CHECK(!result.found());
        BOOST_CHECK(result.path.empty());
        BOOST_CHECK_EQUAL(result.totalDistance, -1);
    }
}

BOOST_AUTO_TEST_CASE(TestBlockedEndpoints) {
    Grid grid = Grid::fromRows({{0, 1},
                                {0, 0}});
    BOOST_CHECK_EQUAL(planner.plan(grid, Point(0, 1), Point(1, 1), {}).result, PathfindingResult::INVALID_START);
    BOOST_CHECK_EQUAL(planner.plan(grid, Point(0, 0), Point(0, 1), {Point(1, 0)}).result,
                      PathfindingResult::INVALID_GOAL);
    BOOST_CHECK_EQUAL(planner.plan(grid, Point(0, 0), Point(1, 1), {Point(0, 1)}).result,
                      PathfindingResult::NO_PATH_FOUND);
}

BOOST_AUTO_TEST_CASE(TestRepeatedPlansAreIdentical) {
    Grid grid = randomGrid(10, 10, 0.15, 9);
    const auto waypoints = pickWaypoints(grid, 4, Point(0, 0), Point(9, 9), 99);
    for (RouteMode mode : {RouteMode::OPTIMAL, RouteMode::BALANCED, RouteMode::FAST}) {
        RouteResult a = planner.plan(grid, Point(0, 0), Point(9, 9), waypoints, mode);
        RouteResult b = planner.plan(grid, Point(0, 0), Point(9, 9), waypoints, mode);
        BOOST_CHECK_EQUAL(a.result, b.result);
        BOOST_CHECK_EQUAL_COLLECTIONS(a.path.begin(), a.path.end(), b.path.begin(), b.path.end());
    }
}

BOOST_AUTO_TEST_SUITE_END()
