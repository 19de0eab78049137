/**
 * @file test_naked_subset.cpp
 * @brief Tests for NakedPair, NakedTriple and NakedQuad.
 */

#include "technique_tester.hpp"

using namespace sudokulogic;
using sudokulogic::testing::TechniqueTester;

namespace {

void restrict_to(CandidateGrid& grid, Position pos, const DigitSet& digits) {
    grid.remove_candidate_set_with_mask(DigitPositions::from_elem(pos), ~digits);
}

} // namespace

// ============================================================================
// Naked Pair
// ============================================================================

TEST_CASE("NakedPair in a row", "[naked_pair]") {
    const DigitSet pair{Digit::D1, Digit::D2};
    CandidateGrid candidates;
    restrict_to(candidates, Position(0, 0), pair);
    restrict_to(candidates, Position(4, 0), pair);

    TechniqueTester tester(candidates);
    tester.apply_once(NakedPair());
    for (std::size_t x = 0; x < BOARD_SIZE; ++x) {
        if (x == 0 || x == 4) {
            tester.assert_no_change(Position(x, 0));
        } else {
            tester.assert_removed_exact(Position(x, 0), {Digit::D1, Digit::D2});
        }
    }
    // Only the row is affected
    tester.assert_no_change(Position(0, 1)).assert_no_change(Position(4, 8)).assert_no_change(Position(1, 1));

    SECTION("step") {
        std::optional<TechniqueStep> step;
        REQUIRE(NakedPair().find_step(tester.initial(), step) == Error::Ok);
        REQUIRE(step.has_value());
        REQUIRE(step->technique_name() == "Naked Pair");
        REQUIRE(step->condition_cells() == DigitPositions{Position(0, 0), Position(4, 0)});
        REQUIRE(step->condition_digit_cells()[0].second == pair);
        REQUIRE(step->application().size() == 2);
    }
}

TEST_CASE("NakedPair in a column and box", "[naked_pair]") {
    const DigitSet pair{Digit::D5, Digit::D9};
    CandidateGrid candidates;
    restrict_to(candidates, Position(0, 0), pair);
    restrict_to(candidates, Position(0, 2), pair);

    // (0,0) and (0,2) share column 0 and box 0
    TechniqueTester tester(candidates);
    tester.apply_once(NakedPair())
        .assert_removed_exact(Position(0, 8), {Digit::D5, Digit::D9})
        .assert_removed_exact(Position(2, 1), {Digit::D5, Digit::D9})
        .assert_no_change(Position(3, 0));
}

TEST_CASE("NakedPair contradiction", "[naked_pair]") {
    // Three cells of one row holding only D1 and D2
    CandidateGrid candidates;
    for (std::size_t x : {0U, 4U, 8U}) {
        restrict_to(candidates, Position(x, 0), DigitSet{Digit::D1, Digit::D2});
    }
    TechniqueGrid grid(candidates);

    bool changed = false;
    REQUIRE(NakedPair().apply(grid, changed) == Error::Inconsistent);

    std::optional<TechniqueStep> step;
    REQUIRE(NakedPair().find_step(TechniqueGrid(candidates), step) == Error::Inconsistent);
    REQUIRE_FALSE(step.has_value());
}

TEST_CASE("NakedPair ignores mismatched pairs", "[naked_pair]") {
    CandidateGrid candidates;
    restrict_to(candidates, Position(0, 0), DigitSet{Digit::D1, Digit::D2});
    restrict_to(candidates, Position(3, 0), DigitSet{Digit::D2, Digit::D3});
    restrict_to(candidates, Position(6, 0), DigitSet{Digit::D1, Digit::D3});

    TechniqueTester(candidates).apply_once(NakedPair()).assert_no_change(Position(1, 0));
}

// ============================================================================
// Naked Triple / Quad
// ============================================================================

TEST_CASE("NakedTriple from three bivalue cells", "[naked_triple]") {
    CandidateGrid candidates;
    restrict_to(candidates, Position(0, 0), DigitSet{Digit::D1, Digit::D2});
    restrict_to(candidates, Position(3, 0), DigitSet{Digit::D2, Digit::D3});
    restrict_to(candidates, Position(6, 0), DigitSet{Digit::D1, Digit::D3});

    TechniqueTester tester(candidates);
    tester.apply_once(NakedTriple());
    for (std::size_t x : {1U, 2U, 4U, 5U, 7U, 8U}) {
        tester.assert_removed_exact(Position(x, 0), {Digit::D1, Digit::D2, Digit::D3});
    }
    tester.assert_no_change(Position(0, 0)).assert_no_change(Position(1, 1));

    std::optional<TechniqueStep> step;
    REQUIRE(NakedTriple().find_step(tester.initial(), step) == Error::Ok);
    REQUIRE(step.has_value());
    REQUIRE(step->technique_name() == "Naked Triple");
    REQUIRE(step->condition_digit_cells()[0].second == DigitSet{Digit::D1, Digit::D2, Digit::D3});
}

TEST_CASE("NakedTriple contradiction", "[naked_triple]") {
    SECTION("three cells with two digits") {
        CandidateGrid candidates;
        restrict_to(candidates, Position(0, 0), DigitSet{Digit::D1, Digit::D2});
        restrict_to(candidates, Position(0, 4), DigitSet{Digit::D1, Digit::D2});
        restrict_to(candidates, Position(0, 8), DigitSet{Digit::D1, Digit::D2});
        TechniqueGrid grid(candidates);
        bool changed = false;
        REQUIRE(NakedTriple().apply(grid, changed) == Error::Inconsistent);
    }

    SECTION("four cells within three digits") {
        CandidateGrid candidates;
        const DigitSet triple{Digit::D4, Digit::D5, Digit::D6};
        for (std::size_t x : {0U, 3U, 6U, 8U}) {
            restrict_to(candidates, Position(x, 4), triple);
        }
        TechniqueGrid grid(candidates);
        bool changed = false;
        REQUIRE(NakedTriple().apply(grid, changed) == Error::Inconsistent);
    }
}

TEST_CASE("NakedQuad in a column", "[naked_quad]") {
    CandidateGrid candidates;
    restrict_to(candidates, Position(0, 0), DigitSet{Digit::D1, Digit::D2});
    restrict_to(candidates, Position(0, 2), DigitSet{Digit::D2, Digit::D3});
    restrict_to(candidates, Position(0, 4), DigitSet{Digit::D3, Digit::D4});
    restrict_to(candidates, Position(0, 7), DigitSet{Digit::D1, Digit::D4});

    TechniqueGrid grid(candidates);
    bool changed = true;
    REQUIRE(NakedPair().apply(grid, changed) == Error::Ok);
    REQUIRE_FALSE(changed);
    REQUIRE(NakedTriple().apply(grid, changed) == Error::Ok);
    REQUIRE_FALSE(changed);

    TechniqueTester tester(candidates);
    tester.apply_once(NakedQuad());
    for (std::size_t y : {1U, 3U, 5U, 6U, 8U}) {
        tester.assert_removed_exact(Position(0, y), {Digit::D1, Digit::D2, Digit::D3, Digit::D4});
    }
    tester.assert_no_change(Position(1, 0));
}

TEST_CASE("NakedQuad contradiction", "[naked_quad]") {
    SECTION("five cells within four digits") {
        CandidateGrid candidates;
        const DigitSet quad{Digit::D1, Digit::D2, Digit::D3, Digit::D4};
        for (std::size_t x : {0U, 2U, 4U, 6U, 8U}) {
            restrict_to(candidates, Position(x, 3), quad);
        }
        TechniqueGrid grid(candidates);
        bool changed = false;
        REQUIRE(NakedQuad().apply(grid, changed) == Error::Inconsistent);
    }

    SECTION("four cells with three digits") {
        CandidateGrid candidates;
        restrict_to(candidates, Position(0, 3), DigitSet{Digit::D1, Digit::D2});
        restrict_to(candidates, Position(3, 3), DigitSet{Digit::D2, Digit::D3});
        restrict_to(candidates, Position(5, 3), DigitSet{Digit::D1, Digit::D3});
        restrict_to(candidates, Position(8, 3), DigitSet{Digit::D1, Digit::D2});
        TechniqueGrid grid(candidates);
        bool changed = false;
        REQUIRE(NakedQuad().apply(grid, changed) == Error::Inconsistent);
    }
}
