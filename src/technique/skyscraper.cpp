/**
 * @file skyscraper.cpp
 * @brief Skyscraper scan.
 */

#include <sudokulogic/technique/skyscraper.hpp>

namespace sudokulogic {

namespace {

// Strong links along columns; crosses are row numbers
struct ColumnAxis {
    static const DigitPositions& line_positions(std::size_t line) noexcept {
        return COLUMN_POSITIONS[line];
    }
    static const DigitPositions& cross_positions(std::size_t cross) noexcept {
        return ROW_POSITIONS[cross];
    }
    static std::size_t cross_index(Position pos) noexcept {
        return pos.y();
    }
    static Position make_pos(std::size_t line, std::size_t cross) noexcept {
        return Position(line, cross);
    }
};

// Strong links along rows; crosses are column numbers
struct RowAxis {
    static const DigitPositions& line_positions(std::size_t line) noexcept {
        return ROW_POSITIONS[line];
    }
    static const DigitPositions& cross_positions(std::size_t cross) noexcept {
        return COLUMN_POSITIONS[cross];
    }
    static std::size_t cross_index(Position pos) noexcept {
        return pos.x();
    }
    static Position make_pos(std::size_t line, std::size_t cross) noexcept {
        return Position(cross, line);
    }
};

struct StrongLink {
    std::size_t line;
    std::size_t cross_a;
    std::size_t cross_b;
};

template <typename Axis, typename OnChange>
bool scan_axis(TechniqueGrid& grid, Digit digit, OnChange& on_change) {
    const DigitPositions positions = grid.digit_positions(digit);

    // Lines holding the digit exactly twice, in two different bands
    std::array<StrongLink, BOARD_SIZE> links{};
    std::size_t link_count = 0;
    for (std::size_t line = 0; line < BOARD_SIZE; ++line) {
        auto pair = (positions & Axis::line_positions(line)).as_double();
        if (!pair) {
            continue;
        }
        std::size_t cross_a = Axis::cross_index(pair->first);
        std::size_t cross_b = Axis::cross_index(pair->second);
        if (cross_a / BOX_SIZE == cross_b / BOX_SIZE) {
            continue;
        }
        links[link_count++] = StrongLink{line, cross_a, cross_b};
    }

    for (std::size_t i = 0; i < link_count; ++i) {
        for (std::size_t j = i + 1; j < link_count; ++j) {
            const StrongLink& first = links[i];
            const StrongLink& second = links[j];
            if (first.line / BOX_SIZE == second.line / BOX_SIZE) {
                continue;
            }
            if (first.cross_a / BOX_SIZE != second.cross_a / BOX_SIZE ||
                first.cross_b / BOX_SIZE != second.cross_b / BOX_SIZE) {
                continue;
            }

            std::size_t base_cross = 0;
            std::size_t first_roof = 0;
            std::size_t second_roof = 0;
            if (first.cross_a == second.cross_a && first.cross_b != second.cross_b) {
                base_cross = first.cross_a;
                first_roof = first.cross_b;
                second_roof = second.cross_b;
            } else if (first.cross_b == second.cross_b && first.cross_a != second.cross_a) {
                base_cross = first.cross_b;
                first_roof = first.cross_a;
                second_roof = second.cross_a;
            } else {
                continue;
            }

            const Position roof1 = Axis::make_pos(first.line, first_roof);
            const Position roof2 = Axis::make_pos(second.line, second_roof);
            const DigitPositions eliminations =
                (Axis::cross_positions(second_roof) & BOX_POSITIONS[roof1.box_index()]) |
                (Axis::cross_positions(first_roof) & BOX_POSITIONS[roof2.box_index()]);
            if (!grid.remove_candidate_with_mask(eliminations, digit)) {
                continue;
            }

            const Position base1 = Axis::make_pos(first.line, base_cross);
            const Position base2 = Axis::make_pos(second.line, base_cross);
            if (on_change(grid, digit, DigitPositions{base1, base2, roof1, roof2})) {
                return true;
            }
        }
    }
    return false;
}

template <typename OnChange>
void scan(TechniqueGrid& grid, OnChange&& on_change) {
    for (Digit digit : ALL_DIGITS) {
        if (scan_axis<ColumnAxis>(grid, digit, on_change) || scan_axis<RowAxis>(grid, digit, on_change)) {
            return;
        }
    }
}

} // namespace

Error Skyscraper::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
    step.reset();
    TechniqueGrid after = grid;
    scan(after, [&](const TechniqueGrid& current, Digit digit, const DigitPositions& cells) {
        step = TechniqueStep::from_diff(NAME, cells, {{cells, DigitSet::from_elem(digit)}}, grid,
                                        current);
        return true;
    });
    return Error::Ok;
}

Error Skyscraper::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    scan(grid, [&](const TechniqueGrid&, Digit, const DigitPositions&) {
        changed = true;
        return false;
    });
    return Error::Ok;
}

} // namespace sudokulogic
