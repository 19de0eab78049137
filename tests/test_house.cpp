/**
 * @file test_house.cpp
 * @brief Unit tests for House.
 */

#include <sudokulogic/house.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace sudokulogic;

TEST_CASE("House enumeration order", "[house]") {
    REQUIRE(ALL_HOUSES.size() == 27);

    for (std::size_t i = 0; i < BOARD_SIZE; ++i) {
        REQUIRE(ALL_HOUSES[i] == House::row(i));
        REQUIRE(ALL_HOUSES[BOARD_SIZE + i] == House::column(i));
        REQUIRE(ALL_HOUSES[2 * BOARD_SIZE + i] == House::box(i));
    }
}

TEST_CASE("House cell indices", "[house]") {
    SECTION("row") {
        House row = House::row(3);
        REQUIRE(row.kind() == House::Kind::Row);
        REQUIRE(row.index() == 3);
        REQUIRE(row.position_from_cell_index(0) == Position(0, 3));
        REQUIRE(row.position_from_cell_index(8) == Position(8, 3));
    }

    SECTION("column") {
        House column = House::column(6);
        REQUIRE(column.position_from_cell_index(0) == Position(6, 0));
        REQUIRE(column.position_from_cell_index(5) == Position(6, 5));
    }

    SECTION("box") {
        House box = House::box(7);
        REQUIRE(box.position_from_cell_index(0) == Position(3, 6));
        REQUIRE(box.position_from_cell_index(4) == Position(4, 7));
        REQUIRE(box.position_from_cell_index(8) == Position(5, 8));
    }

    SECTION("positions match cell indices") {
        for (const House& house : ALL_HOUSES) {
            DigitPositions expected;
            for (std::size_t i = 0; i < BOARD_SIZE; ++i) {
                expected.insert(house.position_from_cell_index(i));
            }
            REQUIRE(house.positions() == expected);
            REQUIRE(house.positions_from_mask(HouseMask::full()) == expected);
        }
    }
}

TEST_CASE("House mask conversion", "[house]") {
    HouseMask mask{std::uint8_t{1}, std::uint8_t{4}, std::uint8_t{7}};

    REQUIRE(House::row(0).positions_from_mask(mask) ==
            DigitPositions{Position(1, 0), Position(4, 0), Position(7, 0)});
    REQUIRE(House::box(4).positions_from_mask(mask) ==
            DigitPositions{Position(4, 3), Position(4, 4), Position(4, 5)});
    REQUIRE(House::column(2).positions_from_mask(HouseMask{}).empty());
}

TEST_CASE("House kind names", "[house]") {
    REQUIRE(std::string(House::row(0).kind_name()) == "row");
    REQUIRE(std::string(House::column(0).kind_name()) == "column");
    REQUIRE(std::string(House::box(0).kind_name()) == "box");
}
