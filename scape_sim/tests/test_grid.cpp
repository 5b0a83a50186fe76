#include <catch2/catch_test_macros.hpp>
#include "core/Grid.hpp"
#include "core/Errors.hpp"

using namespace scape;

TEST_CASE("Grid: Construction rejects empty dimensions", "[grid]") {
    REQUIRE_THROWS_AS(Grid(0, 5), OutOfBounds);
    REQUIRE_THROWS_AS(Grid(5, -1), OutOfBounds);

    Grid grid(4, 3);
    REQUIRE(grid.getWidth() == 4);
    REQUIRE(grid.getHeight() == 3);
    REQUIRE(grid.occupantCount() == 0);
}

TEST_CASE("Grid: Bounds checks", "[grid]") {
    Grid grid(4, 3);
    REQUIRE(grid.inBounds({ 0, 0 }));
    REQUIRE(grid.inBounds({ 3, 2 }));
    REQUIRE_FALSE(grid.inBounds({ 4, 0 }));
    REQUIRE_FALSE(grid.inBounds({ 0, 3 }));
    REQUIRE_FALSE(grid.inBounds({ -1, 1 }));

    REQUIRE_THROWS_AS(grid.place(1, { 4, 0 }), OutOfBounds);
    REQUIRE_THROWS_AS(grid.cellContents({ -1, 0 }), OutOfBounds);
    REQUIRE(grid.occupantCount() == 0);
}

TEST_CASE("Grid: Place keeps insertion order within a cell", "[grid]") {
    Grid grid(5, 5);
    grid.place(7, { 2, 2 });
    grid.place(3, { 2, 2 });
    grid.place(9, { 2, 2 });

    const auto& cell = grid.cellContents({ 2, 2 });
    REQUIRE(cell == std::vector<ObjectId>{ 7, 3, 9 });
    REQUIRE(grid.locate(3) == Coord{ 2, 2 });
}

TEST_CASE("Grid: Placing an existing occupant relocates it", "[grid]") {
    Grid grid(5, 5);
    grid.place(1, { 0, 0 });
    grid.place(1, { 4, 4 });

    REQUIRE(grid.cellContents({ 0, 0 }).empty());
    REQUIRE(grid.cellContents({ 4, 4 }) == std::vector<ObjectId>{ 1 });
    REQUIRE(grid.occupantCount() == 1);
}

TEST_CASE("Grid: Remove", "[grid]") {
    Grid grid(5, 5);
    grid.place(1, { 1, 1 });

    SECTION("from the wrong cell throws NotPresent") {
        REQUIRE_THROWS_AS(grid.remove(1, { 1, 2 }), NotPresent);
        REQUIRE(grid.locate(1).has_value());
    }

    SECTION("an unknown occupant throws NotPresent") {
        REQUIRE_THROWS_AS(grid.remove(2, { 1, 1 }), NotPresent);
    }

    SECTION("from the right cell clears it") {
        grid.remove(1, { 1, 1 });
        REQUIRE(grid.cellContents({ 1, 1 }).empty());
        REQUIRE_FALSE(grid.locate(1).has_value());
    }
}

TEST_CASE("Grid: Move", "[grid]") {
    Grid grid(5, 5);
    grid.place(1, { 1, 1 });

    grid.move(1, { 2, 1 });
    REQUIRE(grid.locate(1) == Coord{ 2, 1 });
    REQUIRE(grid.cellContents({ 1, 1 }).empty());

    REQUIRE_THROWS_AS(grid.move(1, { 5, 1 }), OutOfBounds);
    REQUIRE(grid.locate(1) == Coord{ 2, 1 });

    REQUIRE_THROWS_AS(grid.move(42, { 0, 0 }), NotPresent);
}

TEST_CASE("Grid: Neighbors use Chebyshev distance without wrapping", "[grid]") {
    Grid grid(5, 5);
    grid.place(1, { 0, 0 });
    grid.place(2, { 1, 1 });    // diagonal, distance 1
    grid.place(3, { 2, 0 });    // distance 2
    grid.place(4, { 4, 4 });    // opposite corner, reachable only by wrapping

    auto near = grid.neighbors({ 0, 0 }, 1, ObjectId(1));
    REQUIRE(near == std::vector<ObjectId>{ 2 });

    auto wider = grid.neighbors({ 0, 0 }, 2, ObjectId(1));
    REQUIRE(wider == std::vector<ObjectId>{ 2, 3 });

    auto all = grid.neighbors({ 2, 2 }, 2);
    REQUIRE(all == std::vector<ObjectId>{ 1, 2, 3, 4 });
}

TEST_CASE("Grid: Neighbors include the center cell but never self", "[grid]") {
    Grid grid(3, 3);
    grid.place(1, { 1, 1 });
    grid.place(2, { 1, 1 });

    REQUIRE(grid.neighbors({ 1, 1 }, 0, ObjectId(1)) == std::vector<ObjectId>{ 2 });
    REQUIRE(grid.neighbors({ 1, 1 }, 0) == std::vector<ObjectId>{ 1, 2 });
    REQUIRE(grid.neighbors({ 1, 1 }, -1).empty());
}

TEST_CASE("Grid: chebyshev helper", "[grid]") {
    REQUIRE(chebyshev({ 0, 0 }, { 3, 1 }) == 3);
    REQUIRE(chebyshev({ 2, 5 }, { 1, 1 }) == 4);
    REQUIRE(chebyshev({ 2, 2 }, { 2, 2 }) == 0);
}
