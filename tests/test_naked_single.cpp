/**
 * @file test_naked_single.cpp
 * @brief Tests for NakedSingle (propagation of decided cells).
 */

#include "technique_tester.hpp"

#include <string>

using namespace sudokulogic;
using sudokulogic::testing::TechniqueTester;

namespace {

const char* EASY = "53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79";

} // namespace

TEST_CASE("NakedSingle propagates a decided cell", "[naked_single]") {
    CandidateGrid candidates;
    candidates.place(Position(0, 0), Digit::D1);
    TechniqueTester tester(candidates);

    tester.apply_once(NakedSingle());

    for (Position peer : Position(0, 0).house_peers()) {
        tester.assert_removed_exact(peer, {Digit::D1});
    }
    tester.assert_no_change(Position(0, 0));
    tester.assert_no_change(Position(4, 4));
    REQUIRE(tester.current().decided_propagated().contains(Position(0, 0)));

    SECTION("repeat call reports no change") {
        TechniqueGrid grid = tester.current();
        bool changed = true;
        REQUIRE(NakedSingle().apply(grid, changed) == Error::Ok);
        REQUIRE_FALSE(changed);
        REQUIRE(grid == tester.current());
    }
}

TEST_CASE("NakedSingle step contents", "[naked_single]") {
    CandidateGrid candidates;
    candidates.place(Position(0, 0), Digit::D1);
    TechniqueGrid grid(candidates);

    std::optional<TechniqueStep> step;
    REQUIRE(NakedSingle().find_step(grid, step) == Error::Ok);
    REQUIRE(step.has_value());

    REQUIRE(step->technique_name() == "Naked Single");
    REQUIRE(step->condition_cells() == DigitPositions{Position(0, 0)});
    REQUIRE(step->condition_digit_cells().size() == 1);
    REQUIRE(step->condition_digit_cells()[0].second == DigitSet{Digit::D1});
    REQUIRE(step->application().size() == 1);
    REQUIRE(step->application()[0] ==
            TechniqueApplication::elimination(Position(0, 0).house_peers(), DigitSet{Digit::D1}));
    REQUIRE(step->describe().rfind("Naked Single: remove 1 from r1c2 r1c3", 0) == 0);

    SECTION("find_step leaves the grid alone") {
        REQUIRE(grid.candidates() == candidates);
        REQUIRE(grid.decided_propagated().empty());
    }
}

TEST_CASE("NakedSingle without effect", "[naked_single]") {
    SECTION("no decided cells") {
        TechniqueTester(CandidateGrid()).apply_once(NakedSingle());
    }

    SECTION("decided cell whose peers lack the digit") {
        CandidateGrid candidates;
        candidates.remove_candidate_with_mask(DigitPositions::full(), Digit::D9);
        candidates.place(Position(4, 4), Digit::D9);

        TechniqueGrid grid(candidates);
        bool changed = true;
        REQUIRE(NakedSingle().apply(grid, changed) == Error::Ok);
        REQUIRE_FALSE(changed);
        REQUIRE(grid.decided_propagated().contains(Position(4, 4)));
    }
}

TEST_CASE("NakedSingle on givens", "[naked_single]") {
    TechniqueTester tester = TechniqueTester::from_str(EASY);
    tester.apply_once(NakedSingle());

    // r1c1 = 5 and r1c2 = 3
    tester.assert_removed_includes(Position(2, 0), {Digit::D3, Digit::D5, Digit::D7})
        .assert_removed_includes(Position(0, 2), {Digit::D5, Digit::D6, Digit::D9})
        .assert_no_change(Position(0, 0));

    SECTION("until stuck solves an easy puzzle") {
        tester.apply_until_stuck(NakedSingle());
        bool solved = false;
        REQUIRE(tester.current().is_solved(solved) == Error::Ok);
        REQUIRE(solved);
        REQUIRE(tester.current().to_digit_grid().to_line() ==
                "534678912672195348198342567859761423426853791713924856961537284287419635345286179");
    }
}
