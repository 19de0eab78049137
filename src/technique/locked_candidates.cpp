/**
 * @file locked_candidates.cpp
 * @brief LockedCandidates scan.
 */

#include <sudokulogic/technique/locked_candidates.hpp>

namespace sudokulogic {

namespace {

enum class LockKind { Pointing, Claiming };

/*
 * For every box, the three rows then the three columns crossing it, every
 * digit with a candidate in the intersection. Intersections made only of
 * decided cells are skipped.
 */
template <typename OnChange>
void scan(TechniqueGrid& grid, OnChange&& on_change) {
    for (std::size_t box = 0; box < BOARD_SIZE; ++box) {
        const House box_house = House::box(box);
        const Position origin = Position::box_origin(box);
        const std::array<House, 2 * BOX_SIZE> lines = {
            House::row(origin.y()),        House::row(origin.y() + 1),    House::row(origin.y() + 2),
            House::column(origin.x()),     House::column(origin.x() + 1), House::column(origin.x() + 2)};

        for (const House& line : lines) {
            const DigitPositions intersection = box_house.positions() & line.positions();
            if (intersection.is_subset(grid.decided_cells())) {
                continue;
            }
            const DigitPositions rest_in_box = box_house.positions().difference(intersection);
            const DigitPositions rest_in_line = line.positions().difference(intersection);

            for (Digit digit : ALL_DIGITS) {
                const DigitPositions positions = grid.digit_positions(digit);
                const DigitPositions locked = positions & intersection;
                if (locked.empty()) {
                    continue;
                }

                if ((positions & rest_in_box).empty()) {
                    if (grid.remove_candidate_with_mask(rest_in_line, digit) &&
                        on_change(grid, LockKind::Pointing, box_house, line, locked, digit)) {
                        return;
                    }
                } else if ((positions & rest_in_line).empty()) {
                    if (grid.remove_candidate_with_mask(rest_in_box, digit) &&
                        on_change(grid, LockKind::Claiming, box_house, line, locked, digit)) {
                        return;
                    }
                }
            }
        }
    }
}

} // namespace

Error LockedCandidates::find_step(const TechniqueGrid& grid,
                                  std::optional<TechniqueStep>& step) const {
    step.reset();
    TechniqueGrid after = grid;
    scan(after, [&](const TechniqueGrid& current, LockKind kind, const House& box_house,
                    const House& line, const DigitPositions& locked, Digit digit) {
        const char* step_name = kind == LockKind::Pointing ? POINTING_NAME : CLAIMING_NAME;
        step = TechniqueStep::from_diff(step_name, box_house.positions() | line.positions(),
                                        {{locked, DigitSet::from_elem(digit)}}, grid, current);
        return true;
    });
    return Error::Ok;
}

Error LockedCandidates::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    scan(grid, [&](const TechniqueGrid&, LockKind, const House&, const House&,
                   const DigitPositions&, Digit) {
        changed = true;
        return false;
    });
    return Error::Ok;
}

} // namespace sudokulogic
