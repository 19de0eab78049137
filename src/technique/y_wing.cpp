/**
 * @file y_wing.cpp
 * @brief YWing scan.
 */

#include <sudokulogic/technique/y_wing.hpp>

namespace sudokulogic {

namespace {

struct Wing {
    Position pivot;
    Position wing1;
    Position wing2;
    Digit a;
    Digit b;
    Digit c;
};

/*
 * Pivots are bivalue cells {a, b} with a < b. The first wing is a bivalue
 * peer {a, c}, the second a bivalue peer {b, c}.
 */
template <typename OnChange>
void scan(TechniqueGrid& grid, OnChange&& on_change) {
    const DigitPositions bivalue_cells = grid.classify_cells<3>()[2];
    for (Position pivot : bivalue_cells) {
        const DigitSet pivot_digits = grid.candidates_at(pivot);
        auto pair = pivot_digits.as_double();
        if (!pair) {
            continue;
        }
        const auto [a, b] = *pair;
        const DigitPositions pivot_peers = pivot.house_peers() & bivalue_cells;

        for (Position wing1 : pivot_peers & grid.digit_positions(a)) {
            auto c = grid.candidates_at(wing1).difference(pivot_digits).as_single();
            if (!c) {
                continue;
            }
            for (Position wing2 : pivot_peers & grid.digit_positions(b) & grid.digit_positions(*c)) {
                const DigitPositions eliminations = wing1.house_peers() & wing2.house_peers();
                if (grid.remove_candidate_with_mask(eliminations, *c) &&
                    on_change(grid, Wing{pivot, wing1, wing2, a, b, *c})) {
                    return;
                }
            }
        }
    }
}

} // namespace

Error YWing::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
    step.reset();
    TechniqueGrid after = grid;
    scan(after, [&](const TechniqueGrid& current, const Wing& wing) {
        ConditionDigitCells digit_cells = {
            {DigitPositions::from_elem(wing.pivot), DigitSet{wing.a, wing.b}},
            {DigitPositions::from_elem(wing.wing1), DigitSet{wing.a, wing.c}},
            {DigitPositions::from_elem(wing.wing2), DigitSet{wing.b, wing.c}}};
        step = TechniqueStep::from_diff(NAME, DigitPositions{wing.pivot, wing.wing1, wing.wing2},
                                        std::move(digit_cells), grid, current);
        return true;
    });
    return Error::Ok;
}

Error YWing::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    scan(grid, [&](const TechniqueGrid&, const Wing&) {
        changed = true;
        return false;
    });
    return Error::Ok;
}

} // namespace sudokulogic
