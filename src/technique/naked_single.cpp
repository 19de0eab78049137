/**
 * @file naked_single.cpp
 * @brief NakedSingle scan.
 */

#include <sudokulogic/technique/naked_single.hpp>

namespace sudokulogic {

namespace {

/*
 * Propagates every decided cell not yet propagated, in board order. The
 * visitor runs after each propagation that removed candidates and returns
 * true to stop the scan.
 */
template <typename OnChange>
void scan(TechniqueGrid& grid, OnChange&& on_change) {
    DigitPositions pending = grid.decided_cells().difference(grid.decided_propagated());
    for (Position pos : pending) {
        auto digit = grid.candidates_at(pos).as_single();
        if (!digit) {
            continue;
        }
        bool removed = grid.remove_candidate_with_mask(pos.house_peers(), *digit);
        grid.insert_decided_propagated(pos);
        if (removed && on_change(grid, pos, *digit)) {
            return;
        }
    }
}

} // namespace

Error NakedSingle::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
    step.reset();
    TechniqueGrid after = grid;
    scan(after, [&](const TechniqueGrid& current, Position pos, Digit digit) {
        DigitPositions cell = DigitPositions::from_elem(pos);
        step = TechniqueStep::from_diff(NAME, cell, {{cell, DigitSet::from_elem(digit)}}, grid,
                                        current);
        return true;
    });
    return Error::Ok;
}

Error NakedSingle::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    scan(grid, [&](const TechniqueGrid&, Position, Digit) {
        changed = true;
        return false;
    });
    return Error::Ok;
}

} // namespace sudokulogic
