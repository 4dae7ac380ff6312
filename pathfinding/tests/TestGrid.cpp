/**
 * @file TestGrid.cpp
 * @brief Unit tests for pathfinding::Grid.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/pathfinding/Grid.hpp"

namespace gpo::pathfinding {

TEST_CASE("Grid create validates shape", "[pathfinding][grid]")
{
    REQUIRE(Grid::create(2, 2, {1, 2, 3, 4}).has_value());

    auto zero = Grid::create(0, 3, {});
    REQUIRE_FALSE(zero.has_value());
    REQUIRE(zero.error().code() == core::ErrorCode::kInvalidArgument);

    auto mismatch = Grid::create(3, 2, {1, 2, 3});
    REQUIRE_FALSE(mismatch.has_value());
    REQUIRE(mismatch.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Grid maps nodes to row-major indices", "[pathfinding][grid]")
{
    auto grid = Grid::create(4, 3, std::vector<core::u32>(12, 1));
    REQUIRE(grid.has_value());

    REQUIRE(grid->cells() == 12);
    REQUIRE(grid->index(Node{3, 1}) == 7);
    REQUIRE(grid->node(7) == Node{3, 1});
    REQUIRE(grid->contains(Node{3, 2}));
    REQUIRE_FALSE(grid->contains(Node{4, 0}));
    REQUIRE_FALSE(grid->contains(Node{0, 3}));
}

TEST_CASE("Grid minimumNode picks the lowest index on ties", "[pathfinding][grid]")
{
    auto grid = Grid::create(4, 4, {8, 2, 3, 4, 5, 6, 7, 1, 9, 10, 11, 12, 13, 14, 15, 16});
    REQUIRE(grid.has_value());
    REQUIRE(grid->minimumNode() == Node{3, 1});

    auto tied = Grid::create(3, 1, {5, 2, 2});
    REQUIRE(tied.has_value());
    REQUIRE(tied->minimumNode() == Node{1, 0});
}

TEST_CASE("Grid walls are excluded from the finite maximum", "[pathfinding][grid]")
{
    auto grid = Grid::create(3, 1, {4, core::kImpassableCost, 9});
    REQUIRE(grid.has_value());
    REQUIRE(grid->maxFiniteCost() == 9);
    REQUIRE_FALSE(grid->passable(1));
    REQUIRE(grid->passable(2));

    auto sentinel = grid->unreachedSentinel();
    REQUIRE(sentinel.has_value());
    REQUIRE(*sentinel == 3 * 9 + 1);
}

TEST_CASE("Grid rejects costs whose distances could overflow", "[pathfinding][grid]")
{
    auto grid = Grid::create(2, 2, {1, 2, 3, 2'000'000'000u});
    REQUIRE(grid.has_value());

    auto sentinel = grid->unreachedSentinel();
    REQUIRE_FALSE(sentinel.has_value());
    REQUIRE(sentinel.error().code() == core::ErrorCode::kInvalidArgument);
}

} // namespace gpo::pathfinding
