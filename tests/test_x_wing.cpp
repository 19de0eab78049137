/**
 * @file test_x_wing.cpp
 * @brief Tests for XWing.
 */

#include "technique_tester.hpp"

using namespace sudokulogic;
using sudokulogic::testing::TechniqueTester;

namespace {

// Keep @p digit in row @p y only at columns @p x1 and @p x2
void pin_row(CandidateGrid& grid, std::size_t y, Digit digit, std::size_t x1, std::size_t x2) {
    DigitPositions removed = ROW_POSITIONS[y].difference(DigitPositions{Position(x1, y), Position(x2, y)});
    grid.remove_candidate_with_mask(removed, digit);
}

void pin_column(CandidateGrid& grid, std::size_t x, Digit digit, std::size_t y1, std::size_t y2) {
    DigitPositions removed = COLUMN_POSITIONS[x].difference(DigitPositions{Position(x, y1), Position(x, y2)});
    grid.remove_candidate_with_mask(removed, digit);
}

} // namespace

TEST_CASE("XWing on rows", "[x_wing]") {
    CandidateGrid candidates;
    pin_row(candidates, 0, Digit::D1, 1, 7);
    pin_row(candidates, 4, Digit::D1, 1, 7);

    TechniqueTester tester(candidates);
    tester.apply_once(XWing())
        .assert_removed_exact(Position(1, 2), {Digit::D1})
        .assert_removed_exact(Position(7, 6), {Digit::D1})
        .assert_removed_exact(Position(1, 8), {Digit::D1})
        .assert_no_change(Position(1, 0))
        .assert_no_change(Position(7, 4))
        .assert_no_change(Position(2, 2));

    for (std::size_t y = 0; y < BOARD_SIZE; ++y) {
        bool corner_row = y == 0 || y == 4;
        REQUIRE(tester.current().digit_positions(Digit::D1).contains(Position(1, y)) == corner_row);
        REQUIRE(tester.current().digit_positions(Digit::D1).contains(Position(7, y)) == corner_row);
    }

    SECTION("step") {
        std::optional<TechniqueStep> step;
        REQUIRE(XWing().find_step(tester.initial(), step) == Error::Ok);
        REQUIRE(step.has_value());
        REQUIRE(step->technique_name() == "X-Wing");
        DigitPositions corners{Position(1, 0), Position(7, 0), Position(1, 4), Position(7, 4)};
        REQUIRE(step->condition_cells() == corners);
        REQUIRE(step->condition_digit_cells()[0].first == corners);
        REQUIRE(step->condition_digit_cells()[0].second == DigitSet{Digit::D1});
        REQUIRE(step->application().size() == 1);
        REQUIRE(step->application()[0].positions.size() == 14);
    }
}

TEST_CASE("XWing on columns", "[x_wing]") {
    CandidateGrid candidates;
    pin_column(candidates, 2, Digit::D4, 3, 8);
    pin_column(candidates, 6, Digit::D4, 3, 8);

    TechniqueTester(candidates)
        .apply_once(XWing())
        .assert_removed_exact(Position(0, 3), {Digit::D4})
        .assert_removed_exact(Position(8, 8), {Digit::D4})
        .assert_no_change(Position(2, 3))
        .assert_no_change(Position(0, 4));
}

TEST_CASE("XWing contradiction", "[x_wing]") {
    // Rows 0 and 1 hold D1 only in columns 0 and 1: four corners in box 0
    CandidateGrid candidates;
    pin_row(candidates, 0, Digit::D1, 0, 1);
    pin_row(candidates, 1, Digit::D1, 0, 1);

    TechniqueGrid grid(candidates);
    bool changed = false;
    REQUIRE(XWing().apply(grid, changed) == Error::Inconsistent);

    std::optional<TechniqueStep> step;
    REQUIRE(XWing().find_step(TechniqueGrid(candidates), step) == Error::Inconsistent);
    REQUIRE_FALSE(step.has_value());
}

TEST_CASE("XWing without effect", "[x_wing]") {
    SECTION("mismatched columns") {
        CandidateGrid candidates;
        pin_row(candidates, 0, Digit::D1, 1, 7);
        pin_row(candidates, 4, Digit::D1, 1, 6);
        TechniqueTester(candidates).apply_once(XWing()).assert_no_change(Position(1, 2));
    }

    SECTION("cover lines already clear") {
        CandidateGrid candidates;
        pin_row(candidates, 0, Digit::D1, 1, 7);
        pin_row(candidates, 4, Digit::D1, 1, 7);
        TechniqueGrid grid(candidates);
        bool changed = false;
        REQUIRE(XWing().apply(grid, changed) == Error::Ok);
        REQUIRE(changed);
        REQUIRE(XWing().apply(grid, changed) == Error::Ok);
        REQUIRE_FALSE(changed);
    }
}
