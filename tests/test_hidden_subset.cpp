/**
 * @file test_hidden_subset.cpp
 * @brief Tests for HiddenPair, HiddenTriple and HiddenQuad.
 */

#include "technique_tester.hpp"

#include <initializer_list>

using namespace sudokulogic;
using sudokulogic::testing::TechniqueTester;

namespace {

// Remove @p digit from every cell of row @p y except the listed columns
void confine_in_row(CandidateGrid& grid, std::size_t y, Digit digit, std::initializer_list<std::size_t> xs) {
    for (std::size_t x = 0; x < BOARD_SIZE; ++x) {
        bool keep = false;
        for (std::size_t kept : xs) {
            keep |= kept == x;
        }
        if (!keep) {
            grid.remove_candidate(Position(x, y), digit);
        }
    }
}

} // namespace

TEST_CASE("HiddenPair in a row", "[hidden_pair]") {
    CandidateGrid candidates;
    confine_in_row(candidates, 0, Digit::D1, {0, 4});
    confine_in_row(candidates, 0, Digit::D2, {0, 4});

    TechniqueTester tester(candidates);
    tester.apply_once(HiddenPair());

    const std::initializer_list<Digit> others = {Digit::D3, Digit::D4, Digit::D5, Digit::D6,
                                                 Digit::D7, Digit::D8, Digit::D9};
    tester.assert_removed_exact(Position(0, 0), others)
        .assert_removed_exact(Position(4, 0), others)
        .assert_no_change(Position(1, 0))
        .assert_no_change(Position(0, 1));

    SECTION("step") {
        std::optional<TechniqueStep> step;
        REQUIRE(HiddenPair().find_step(tester.initial(), step) == Error::Ok);
        REQUIRE(step.has_value());
        REQUIRE(step->technique_name() == "Hidden Pair");
        REQUIRE(step->condition_cells() == DigitPositions{Position(0, 0), Position(4, 0)});
        REQUIRE(step->condition_digit_cells()[0].second == DigitSet{Digit::D1, Digit::D2});
        REQUIRE(step->application().size() == 7);
    }

    SECTION("fixed point") {
        TechniqueGrid grid = tester.current();
        bool changed = true;
        REQUIRE(HiddenPair().apply(grid, changed) == Error::Ok);
        REQUIRE_FALSE(changed);
    }
}

TEST_CASE("HiddenPair contradiction", "[hidden_pair]") {
    // D1, D2 and D3 all confined to the same two cells
    CandidateGrid candidates;
    for (Digit digit : {Digit::D1, Digit::D2, Digit::D3}) {
        confine_in_row(candidates, 0, digit, {0, 4});
    }

    TechniqueGrid grid(candidates);
    bool changed = false;
    REQUIRE(HiddenPair().apply(grid, changed) == Error::Inconsistent);

    std::optional<TechniqueStep> step;
    REQUIRE(HiddenPair().find_step(TechniqueGrid(candidates), step) == Error::Inconsistent);
    REQUIRE_FALSE(step.has_value());
}

TEST_CASE("HiddenTriple in a row", "[hidden_triple]") {
    CandidateGrid candidates;
    confine_in_row(candidates, 0, Digit::D1, {0, 3});
    confine_in_row(candidates, 0, Digit::D2, {3, 6});
    confine_in_row(candidates, 0, Digit::D3, {0, 6});

    TechniqueGrid grid(candidates);
    bool changed = true;
    REQUIRE(HiddenPair().apply(grid, changed) == Error::Ok);
    REQUIRE_FALSE(changed);

    TechniqueTester tester(candidates);
    tester.apply_once(HiddenTriple());
    REQUIRE(tester.current().candidates_at(Position(0, 0)) == DigitSet{Digit::D1, Digit::D3});
    REQUIRE(tester.current().candidates_at(Position(3, 0)) == DigitSet{Digit::D1, Digit::D2});
    REQUIRE(tester.current().candidates_at(Position(6, 0)) == DigitSet{Digit::D2, Digit::D3});
    tester.assert_no_change(Position(1, 0));
}

TEST_CASE("HiddenTriple contradiction", "[hidden_triple]") {
    CandidateGrid candidates;
    for (Digit digit : {Digit::D1, Digit::D2, Digit::D3}) {
        confine_in_row(candidates, 5, digit, {2, 7});
    }

    TechniqueGrid grid(candidates);
    bool changed = false;
    REQUIRE(HiddenTriple().apply(grid, changed) == Error::Inconsistent);
}

TEST_CASE("HiddenQuad in a row", "[hidden_quad]") {
    CandidateGrid candidates;
    confine_in_row(candidates, 8, Digit::D6, {0, 2});
    confine_in_row(candidates, 8, Digit::D7, {2, 4});
    confine_in_row(candidates, 8, Digit::D8, {4, 8});
    confine_in_row(candidates, 8, Digit::D9, {0, 8});

    TechniqueTester tester(candidates);
    tester.apply_once(HiddenQuad());
    for (std::size_t x : {0U, 2U, 4U, 8U}) {
        tester.assert_removed_includes(Position(x, 8), {Digit::D1, Digit::D2, Digit::D3, Digit::D4,
                                                        Digit::D5});
    }
    tester.assert_no_change(Position(1, 8));
}

TEST_CASE("HiddenQuad contradiction", "[hidden_quad]") {
    SECTION("five digits in four cells") {
        CandidateGrid candidates;
        for (Digit digit : {Digit::D1, Digit::D2, Digit::D3, Digit::D4, Digit::D5}) {
            confine_in_row(candidates, 3, digit, {0, 2, 4, 6});
        }
        TechniqueGrid grid(candidates);
        bool changed = false;
        REQUIRE(HiddenQuad().apply(grid, changed) == Error::Inconsistent);
    }

    SECTION("four digits in three cells") {
        CandidateGrid candidates;
        for (Digit digit : {Digit::D1, Digit::D2, Digit::D3, Digit::D4}) {
            confine_in_row(candidates, 3, digit, {0, 2, 4});
        }
        TechniqueGrid grid(candidates);
        bool changed = false;
        REQUIRE(HiddenQuad().apply(grid, changed) == Error::Inconsistent);
    }
}
