#include <catch2/catch.hpp>
#include <cmath>
#include "../include/core/TimeGrid.hpp"

using namespace randomwalk;
using Catch::Detail::Approx;

TEST_CASE("TimeGrid construction", "[TimeGrid]") {
    TimeGrid grid(0.1, 1.0);

    REQUIRE(grid.size() == 11);
    REQUIRE(grid[0] == 0.0);
    REQUIRE(std::abs(grid[1] - 0.1) < 1e-12);
    REQUIRE(std::abs(grid[10] - 1.0) < 1e-12);
}

TEST_CASE("TimeGrid includes the duration despite rounding", "[TimeGrid]") {
    TimeGrid grid(0.01, 0.04);

    REQUIRE(grid.size() == 5);
    REQUIRE(grid[4] == Approx(0.04).margin(1e-12));

    REQUIRE(TimeGrid::numPointsFor(0.01, 1.0) == 101);
    REQUIRE(TimeGrid::numPointsFor(0.01, 0.05) == 6);
    REQUIRE(TimeGrid::numPointsFor(0.1, 0.3) == 4);
}

TEST_CASE("TimeGrid stops at the last point not beyond duration", "[TimeGrid]") {
    // 0, 0.3, 0.6, 0.9 : 1.2 dépasserait 1.0
    TimeGrid grid(0.3, 1.0);

    REQUIRE(grid.size() == 4);
    REQUIRE(grid[3] == Approx(0.9).margin(1e-12));
}

TEST_CASE("TimeGrid with zero duration has a single point", "[TimeGrid]") {
    TimeGrid grid(0.01, 0.0);

    REQUIRE(grid.size() == 1);
    REQUIRE(grid[0] == 0.0);
}

TEST_CASE("TimeGrid rejects invalid parameters", "[TimeGrid]") {
    REQUIRE_THROWS_AS(TimeGrid(0.0, 1.0), InvalidParameter);
    REQUIRE_THROWS_AS(TimeGrid(-0.01, 1.0), InvalidParameter);
    REQUIRE_THROWS_AS(TimeGrid(0.01, -1.0), InvalidParameter);
    REQUIRE_THROWS_AS(TimeGrid(0.01, NAN), InvalidParameter);
    REQUIRE_THROWS_AS(TimeGrid(0.01, 1.0)[101], std::out_of_range);
}

TEST_CASE("TimeGrid rejects an axis too long to represent", "[TimeGrid]") {
    REQUIRE_THROWS_AS(TimeGrid::numPointsFor(1.0, 1e300), InvalidParameter);
    REQUIRE_THROWS_AS(TimeGrid::numPointsFor(1e-300, 1.0), InvalidParameter);
    REQUIRE_THROWS_AS(TimeGrid(1.0, 1e300), InvalidParameter);

    // Une grande durée représentable reste exacte
    REQUIRE(TimeGrid::numPointsFor(1.0, 1e6) == 1000001);
}
