/**
 * @file hidden_single.cpp
 * @brief HiddenSingle scan.
 */

#include <sudokulogic/technique/hidden_single.hpp>

namespace sudokulogic {

namespace {

template <typename OnChange>
void scan(TechniqueGrid& grid, OnChange&& on_change) {
    for (Digit digit : ALL_DIGITS) {
        for (const House& house : ALL_HOUSES) {
            auto cell_index = grid.house_mask(house, digit).as_single();
            if (!cell_index) {
                continue;
            }
            // place() reports no change when the cell is already decided
            Position pos = house.position_from_cell_index(*cell_index);
            if (grid.place(pos, digit) && on_change(grid, house, pos, digit)) {
                return;
            }
        }
    }
}

} // namespace

Error HiddenSingle::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
    step.reset();
    TechniqueGrid after = grid;
    scan(after, [&](const TechniqueGrid& current, const House& house, Position pos, Digit digit) {
        step = TechniqueStep::from_diff(NAME, house.positions(),
                                        {{house.positions(), DigitSet::from_elem(digit)}}, grid,
                                        current, {TechniqueApplication::placement(pos, digit)});
        return true;
    });
    return Error::Ok;
}

Error HiddenSingle::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    scan(grid, [&](const TechniqueGrid&, const House&, Position, Digit) {
        changed = true;
        return false;
    });
    return Error::Ok;
}

} // namespace sudokulogic
