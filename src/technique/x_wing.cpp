/**
 * @file x_wing.cpp
 * @brief XWing scan.
 */

#include <sudokulogic/technique/x_wing.hpp>

namespace sudokulogic {

namespace {

// Base lines are rows, cover lines are columns
struct RowAxis {
    static HouseMask line_mask(const TechniqueGrid& grid, std::size_t line, Digit digit) noexcept {
        return grid.row_mask(line, digit);
    }
    static const DigitPositions& line_positions(std::size_t line) noexcept {
        return ROW_POSITIONS[line];
    }
    static const DigitPositions& cross_positions(std::size_t cross) noexcept {
        return COLUMN_POSITIONS[cross];
    }
    static Position make_pos(std::size_t line, std::size_t cross) noexcept {
        return Position(cross, line);
    }
};

// Base lines are columns, cover lines are rows
struct ColumnAxis {
    static HouseMask line_mask(const TechniqueGrid& grid, std::size_t line, Digit digit) noexcept {
        return grid.col_mask(line, digit);
    }
    static const DigitPositions& line_positions(std::size_t line) noexcept {
        return COLUMN_POSITIONS[line];
    }
    static const DigitPositions& cross_positions(std::size_t cross) noexcept {
        return ROW_POSITIONS[cross];
    }
    static Position make_pos(std::size_t line, std::size_t cross) noexcept {
        return Position(line, cross);
    }
};

struct BaseLine {
    std::size_t line;
    std::size_t cross1;
    std::size_t cross2;
};

template <typename Axis, typename OnChange>
Error scan_axis(TechniqueGrid& grid, Digit digit, bool& stop, OnChange& on_change) {
    std::array<BaseLine, BOARD_SIZE> bases{};
    std::size_t base_count = 0;
    for (std::size_t line = 0; line < BOARD_SIZE; ++line) {
        if (auto crosses = Axis::line_mask(grid, line, digit).as_double()) {
            bases[base_count++] = BaseLine{line, crosses->first, crosses->second};
        }
    }

    for (std::size_t i = 0; i < base_count; ++i) {
        for (std::size_t j = i + 1; j < base_count; ++j) {
            const BaseLine& a = bases[i];
            const BaseLine& b = bases[j];
            if (a.cross1 != b.cross1 || a.cross2 != b.cross2) {
                continue;
            }
            // Both diagonals would put the digit twice into one box
            if (a.line / BOX_SIZE == b.line / BOX_SIZE && a.cross1 / BOX_SIZE == a.cross2 / BOX_SIZE) {
                return Error::Inconsistent;
            }

            const DigitPositions cover = Axis::cross_positions(a.cross1) | Axis::cross_positions(a.cross2);
            const DigitPositions eliminations =
                cover.difference(Axis::line_positions(a.line) | Axis::line_positions(b.line));
            if (!grid.remove_candidate_with_mask(eliminations, digit)) {
                continue;
            }

            DigitPositions corners{Axis::make_pos(a.line, a.cross1), Axis::make_pos(a.line, a.cross2),
                                   Axis::make_pos(b.line, b.cross1), Axis::make_pos(b.line, b.cross2)};
            if (on_change(grid, digit, corners)) {
                stop = true;
                return Error::Ok;
            }
        }
    }
    return Error::Ok;
}

template <typename OnChange>
Error scan(TechniqueGrid& grid, OnChange&& on_change) {
    bool stop = false;
    for (Digit digit : ALL_DIGITS) {
        Error result = scan_axis<RowAxis>(grid, digit, stop, on_change);
        if (result != Error::Ok || stop) {
            return result;
        }
        result = scan_axis<ColumnAxis>(grid, digit, stop, on_change);
        if (result != Error::Ok || stop) {
            return result;
        }
    }
    return Error::Ok;
}

} // namespace

Error XWing::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
    step.reset();
    TechniqueGrid after = grid;
    Error result = scan(after, [&](const TechniqueGrid& current, Digit digit,
                                   const DigitPositions& corners) {
        step = TechniqueStep::from_diff(NAME, corners, {{corners, DigitSet::from_elem(digit)}}, grid,
                                        current);
        return true;
    });
    if (result != Error::Ok) {
        step.reset();
    }
    return result;
}

Error XWing::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    return scan(grid, [&](const TechniqueGrid&, Digit, const DigitPositions&) {
        changed = true;
        return false;
    });
}

} // namespace sudokulogic
