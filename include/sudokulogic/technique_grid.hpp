/**
 * @file technique_grid.hpp
 * @brief Candidate grid plus the solver's propagation bookkeeping.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_GRID_HPP
#define SUDOKULOGIC_TECHNIQUE_GRID_HPP

#include "candidate_grid.hpp"

namespace sudokulogic {

/**
 * @brief The working grid every technique reads and mutates.
 *
 * Besides the candidates it records which decided cells have already had
 * their digit removed from all peers (`decided_propagated`), so propagation
 * visits each decided cell once.
 */
class TechniqueGrid {
public:
    /**
     * @brief Grid with every candidate present.
     */
    TechniqueGrid() noexcept = default;

    explicit TechniqueGrid(const CandidateGrid& candidates) noexcept : candidates_(candidates) {}

    [[nodiscard]] static TechniqueGrid from_digit_grid(const DigitGrid& digits) noexcept {
        return TechniqueGrid(CandidateGrid::from_digit_grid(digits));
    }

    [[nodiscard]] const CandidateGrid& candidates() const noexcept {
        return candidates_;
    }

    /**
     * @brief Give up the propagation bookkeeping, keep the candidates.
     */
    [[nodiscard]] CandidateGrid into_candidates() const noexcept {
        return candidates_;
    }

    [[nodiscard]] DigitGrid to_digit_grid() const noexcept {
        return candidates_.to_digit_grid();
    }

    bool place(Position pos, Digit digit) noexcept {
        return candidates_.place(pos, digit);
    }

    [[nodiscard]] bool would_place_change(Position pos, Digit digit) const noexcept {
        return candidates_.would_place_change(pos, digit);
    }

    bool remove_candidate(Position pos, Digit digit) noexcept {
        return candidates_.remove_candidate(pos, digit);
    }

    [[nodiscard]] bool would_remove_candidate_change(Position pos, Digit digit) const noexcept {
        return candidates_.would_remove_candidate_change(pos, digit);
    }

    bool remove_candidate_with_mask(const DigitPositions& mask, Digit digit) noexcept {
        return candidates_.remove_candidate_with_mask(mask, digit);
    }

    [[nodiscard]] bool would_remove_candidate_with_mask_change(const DigitPositions& mask,
                                                               Digit digit) const noexcept {
        return candidates_.would_remove_candidate_with_mask_change(mask, digit);
    }

    bool remove_candidate_set_with_mask(const DigitPositions& mask, const DigitSet& digits) noexcept {
        return candidates_.remove_candidate_set_with_mask(mask, digits);
    }

    [[nodiscard]] const DigitPositions& digit_positions(Digit digit) const noexcept {
        return candidates_.digit_positions(digit);
    }

    [[nodiscard]] DigitSet candidates_at(Position pos) const noexcept {
        return candidates_.candidates_at(pos);
    }

    [[nodiscard]] HouseMask house_mask(const House& house, Digit digit) const noexcept {
        return candidates_.house_mask(house, digit);
    }

    [[nodiscard]] HouseMask row_mask(std::size_t y, Digit digit) const noexcept {
        return candidates_.row_mask(y, digit);
    }

    [[nodiscard]] HouseMask col_mask(std::size_t x, Digit digit) const noexcept {
        return candidates_.col_mask(x, digit);
    }

    [[nodiscard]] HouseMask box_mask(std::size_t box, Digit digit) const noexcept {
        return candidates_.box_mask(box, digit);
    }

    [[nodiscard]] DigitPositions decided_cells() const noexcept {
        return candidates_.decided_cells();
    }

    template <std::size_t N>
    [[nodiscard]] std::array<DigitPositions, N> classify_cells() const noexcept {
        return candidates_.template classify_cells<N>();
    }

    [[nodiscard]] Error check_consistency() const noexcept {
        return candidates_.check_consistency();
    }

    Error is_solved(bool& solved) const noexcept {
        return candidates_.is_solved(solved);
    }

    /// Decided cells whose digit has already been removed from their peers
    [[nodiscard]] const DigitPositions& decided_propagated() const noexcept {
        return decided_propagated_;
    }

    void insert_decided_propagated(Position pos) noexcept {
        decided_propagated_.insert(pos);
    }

    bool operator==(const TechniqueGrid& other) const noexcept {
        return candidates_ == other.candidates_ && decided_propagated_ == other.decided_propagated_;
    }

    bool operator!=(const TechniqueGrid& other) const noexcept {
        return !(*this == other);
    }

private:
    CandidateGrid candidates_;
    DigitPositions decided_propagated_;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_GRID_HPP
