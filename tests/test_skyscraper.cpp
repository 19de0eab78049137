/**
 * @file test_skyscraper.cpp
 * @brief Tests for Skyscraper.
 */

#include "technique_tester.hpp"

using namespace sudokulogic;
using sudokulogic::testing::TechniqueTester;

namespace {

void keep_only(CandidateGrid& grid, const DigitPositions& line, Digit digit, const DigitPositions& kept) {
    grid.remove_candidate_with_mask(line.difference(kept), digit);
}

} // namespace

TEST_CASE("Skyscraper on columns", "[skyscraper]") {
    // Base on row 0, roofs at r4c2 and r5c8
    CandidateGrid candidates;
    keep_only(candidates, COLUMN_POSITIONS[1], Digit::D1, DigitPositions{Position(1, 0), Position(1, 3)});
    keep_only(candidates, COLUMN_POSITIONS[7], Digit::D1, DigitPositions{Position(7, 0), Position(7, 4)});

    TechniqueGrid grid(candidates);
    bool changed = true;
    REQUIRE(XWing().apply(grid, changed) == Error::Ok);
    REQUIRE_FALSE(changed);

    TechniqueTester tester(candidates);
    tester.apply_once(Skyscraper())
        .assert_removed_exact(Position(0, 4), {Digit::D1})
        .assert_removed_exact(Position(2, 4), {Digit::D1})
        .assert_removed_exact(Position(6, 3), {Digit::D1})
        .assert_removed_exact(Position(8, 3), {Digit::D1})
        .assert_no_change(Position(1, 3))
        .assert_no_change(Position(7, 4))
        .assert_no_change(Position(4, 3))
        .assert_no_change(Position(0, 5));

    SECTION("step") {
        std::optional<TechniqueStep> step;
        REQUIRE(Skyscraper().find_step(tester.initial(), step) == Error::Ok);
        REQUIRE(step.has_value());
        REQUIRE(step->technique_name() == "Skyscraper");
        DigitPositions cells{Position(1, 0), Position(7, 0), Position(1, 3), Position(7, 4)};
        REQUIRE(step->condition_cells() == cells);
        REQUIRE(step->condition_digit_cells()[0].first == cells);
        REQUIRE(step->describe() == "Skyscraper: remove 1 from r4c7 r4c9 r5c1 r5c3");
    }
}

TEST_CASE("Skyscraper on rows", "[skyscraper]") {
    // Base on column 0, roofs at r1c4 and r5c5
    CandidateGrid candidates;
    keep_only(candidates, ROW_POSITIONS[0], Digit::D1, DigitPositions{Position(0, 0), Position(3, 0)});
    keep_only(candidates, ROW_POSITIONS[4], Digit::D1, DigitPositions{Position(0, 4), Position(4, 4)});

    TechniqueTester(candidates)
        .apply_once(Skyscraper())
        .assert_removed_exact(Position(4, 1), {Digit::D1})
        .assert_removed_exact(Position(4, 2), {Digit::D1})
        .assert_removed_exact(Position(3, 3), {Digit::D1})
        .assert_removed_exact(Position(3, 5), {Digit::D1})
        .assert_no_change(Position(5, 1))
        .assert_no_change(Position(3, 4));
}

TEST_CASE("Skyscraper without effect", "[skyscraper]") {
    SECTION("links in the same band") {
        CandidateGrid candidates;
        keep_only(candidates, COLUMN_POSITIONS[1], Digit::D1, DigitPositions{Position(1, 0), Position(1, 3)});
        keep_only(candidates, COLUMN_POSITIONS[2], Digit::D1, DigitPositions{Position(2, 0), Position(2, 4)});
        TechniqueTester(candidates).apply_once(Skyscraper()).assert_no_change(Position(0, 4));
    }

    SECTION("all candidates") {
        TechniqueTester(CandidateGrid()).apply_once(Skyscraper());
    }
}
