/**
 * @file candidate_grid.cpp
 * @brief CandidateGrid mutation, views and consistency checks.
 */

#include <sudokulogic/candidate_grid.hpp>

namespace sudokulogic {

CandidateGrid::CandidateGrid() noexcept {
    digits_.fill(DigitPositions::full());
}

CandidateGrid CandidateGrid::from_digit_grid(const DigitGrid& digits) noexcept {
    CandidateGrid grid;
    for (std::size_t i = 0; i < CELL_COUNT; ++i) {
        Position pos = Position::from_index(i);
        if (auto digit = digits.get(pos)) {
            grid.place(pos, *digit);
        }
    }
    return grid;
}

DigitGrid CandidateGrid::to_digit_grid() const noexcept {
    DigitGrid result;
    for (Digit digit : ALL_DIGITS) {
        DigitPositions decided = digit_positions(digit) & decided_cells();
        for (Position pos : decided) {
            result.set(pos, digit);
        }
    }
    return result;
}

bool CandidateGrid::place(Position pos, Digit digit) noexcept {
    bool changed = false;
    for (Digit other : ALL_DIGITS) {
        if (other == digit) {
            // A cell that had lost the digit gets it back
            changed |= digits_[DigitSemantics::to_index(other)].insert(pos);
        } else {
            changed |= digits_[DigitSemantics::to_index(other)].remove(pos);
        }
    }
    return changed;
}

bool CandidateGrid::would_place_change(Position pos, Digit digit) const noexcept {
    return candidates_at(pos) != DigitSet::from_elem(digit);
}

bool CandidateGrid::remove_candidate(Position pos, Digit digit) noexcept {
    return digits_[DigitSemantics::to_index(digit)].remove(pos);
}

bool CandidateGrid::would_remove_candidate_change(Position pos, Digit digit) const noexcept {
    return digit_positions(digit).contains(pos);
}

bool CandidateGrid::remove_candidate_with_mask(const DigitPositions& mask, Digit digit) noexcept {
    DigitPositions& positions = digits_[DigitSemantics::to_index(digit)];
    if (positions.is_disjoint(mask)) {
        return false;
    }
    positions = positions.difference(mask);
    return true;
}

bool CandidateGrid::would_remove_candidate_with_mask_change(const DigitPositions& mask,
                                                            Digit digit) const noexcept {
    return !digit_positions(digit).is_disjoint(mask);
}

bool CandidateGrid::remove_candidate_set_with_mask(const DigitPositions& mask,
                                                   const DigitSet& digits) noexcept {
    bool changed = false;
    for (Digit digit : digits) {
        changed |= remove_candidate_with_mask(mask, digit);
    }
    return changed;
}

bool CandidateGrid::would_remove_candidate_set_with_mask_change(const DigitPositions& mask,
                                                                const DigitSet& digits) const noexcept {
    for (Digit digit : digits) {
        if (would_remove_candidate_with_mask_change(mask, digit)) {
            return true;
        }
    }
    return false;
}

DigitSet CandidateGrid::candidates_at(Position pos) const noexcept {
    DigitSet candidates;
    for (Digit digit : ALL_DIGITS) {
        if (digit_positions(digit).contains(pos)) {
            candidates.insert(digit);
        }
    }
    return candidates;
}

HouseMask CandidateGrid::house_mask(const House& house, Digit digit) const noexcept {
    switch (house.kind()) {
    case House::Kind::Row:
        return row_mask(house.index(), digit);
    case House::Kind::Column:
        return col_mask(house.index(), digit);
    case House::Kind::Box:
    default:
        return box_mask(house.index(), digit);
    }
}

HouseMask CandidateGrid::row_mask(std::size_t y, Digit digit) const noexcept {
    return HouseMask::from_bits(digit_positions(digit).bits_at(y * BOARD_SIZE, BOARD_SIZE));
}

HouseMask CandidateGrid::col_mask(std::size_t x, Digit digit) const noexcept {
    const DigitPositions& positions = digit_positions(digit);
    HouseMask mask;
    for (std::size_t y = 0; y < BOARD_SIZE; ++y) {
        if (positions.contains(Position(x, y))) {
            mask.insert_index(y);
        }
    }
    return mask;
}

HouseMask CandidateGrid::box_mask(std::size_t box, Digit digit) const noexcept {
    const DigitPositions& positions = digit_positions(digit);
    Position origin = Position::box_origin(box);
    std::uint64_t bits = 0;
    for (std::size_t row = 0; row < BOX_SIZE; ++row) {
        std::size_t start = (origin.y() + row) * BOARD_SIZE + origin.x();
        bits |= static_cast<std::uint64_t>(positions.bits_at(start, BOX_SIZE)) << (row * BOX_SIZE);
    }
    return HouseMask::from_bits(bits);
}

Error CandidateGrid::check_consistency() const noexcept {
    auto classes = classify_cells<2>();
    if (!classes[0].empty()) {
        return Error::Inconsistent;
    }

    const DigitPositions& decided = classes[1];
    for (Digit digit : ALL_DIGITS) {
        DigitPositions decided_with_digit = decided & digit_positions(digit);
        if (decided_with_digit.size() < 2) {
            continue;
        }
        for (const House& house : ALL_HOUSES) {
            if ((decided_with_digit & house.positions()).size() > 1) {
                return Error::Inconsistent;
            }
        }
    }
    return Error::Ok;
}

Error CandidateGrid::is_solved(bool& solved) const noexcept {
    solved = false;
    Error result = check_consistency();
    if (result != Error::Ok) {
        return result;
    }
    solved = decided_cells().size() == CELL_COUNT;
    return Error::Ok;
}

} // namespace sudokulogic
