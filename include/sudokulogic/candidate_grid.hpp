/**
 * @file candidate_grid.hpp
 * @brief Board-wide candidate bitboards.
 *
 * The grid stores one DigitPositions per digit: bit `y * 9 + x` of the
 * digit's bitboard is set while the digit is still possible at (x, y).
 * Candidates of a single cell are therefore a transposed view, and
 * "decided" (exactly one candidate) is always derived, never stored.
 *
 * @par Invariants
 * - A cell with no candidate makes the grid inconsistent
 * - In a consistent grid no two decided cells of one house share a digit
 */

#ifndef SUDOKULOGIC_CANDIDATE_GRID_HPP
#define SUDOKULOGIC_CANDIDATE_GRID_HPP

#include <array>

#include "digit_grid.hpp"
#include "digit_set.hpp"
#include "error.hpp"
#include "house.hpp"

namespace sudokulogic {

/**
 * @brief Candidate digits for every cell.
 */
class CandidateGrid {
public:
    /**
     * @brief Grid where every digit is possible everywhere.
     */
    CandidateGrid() noexcept;

    /**
     * @brief Grid whose givens are placed.
     *
     * Each given digit restricts its cell to that single candidate; peers
     * keep their candidates until propagation removes them.
     */
    [[nodiscard]] static CandidateGrid from_digit_grid(const DigitGrid& digits) noexcept;

    /**
     * @brief Decided cells as digits, every other cell empty.
     */
    [[nodiscard]] DigitGrid to_digit_grid() const noexcept;

    /**
     * @brief Restrict a cell to @p digit alone (peers are not touched).
     * @return true if the cell's candidates changed
     */
    bool place(Position pos, Digit digit) noexcept;
    [[nodiscard]] bool would_place_change(Position pos, Digit digit) const noexcept;

    /**
     * @brief Remove one candidate from one cell.
     * @return true if the candidate was present
     */
    bool remove_candidate(Position pos, Digit digit) noexcept;
    [[nodiscard]] bool would_remove_candidate_change(Position pos, Digit digit) const noexcept;

    /**
     * @brief Remove @p digit from every cell of @p mask.
     * @return true if any candidate was removed
     */
    bool remove_candidate_with_mask(const DigitPositions& mask, Digit digit) noexcept;
    [[nodiscard]] bool would_remove_candidate_with_mask_change(const DigitPositions& mask,
                                                               Digit digit) const noexcept;

    /**
     * @brief Remove every digit of @p digits from every cell of @p mask.
     * @return true if any candidate was removed
     */
    bool remove_candidate_set_with_mask(const DigitPositions& mask, const DigitSet& digits) noexcept;
    [[nodiscard]] bool would_remove_candidate_set_with_mask_change(
        const DigitPositions& mask, const DigitSet& digits) const noexcept;

    /**
     * @brief Cells where @p digit is still a candidate.
     */
    [[nodiscard]] const DigitPositions& digit_positions(Digit digit) const noexcept {
        return digits_[DigitSemantics::to_index(digit)];
    }

    /**
     * @brief Candidates of one cell.
     */
    [[nodiscard]] DigitSet candidates_at(Position pos) const noexcept;

    /**
     * @brief Candidate cells of @p digit inside @p house, as a house mask.
     */
    [[nodiscard]] HouseMask house_mask(const House& house, Digit digit) const noexcept;
    [[nodiscard]] HouseMask row_mask(std::size_t y, Digit digit) const noexcept;
    [[nodiscard]] HouseMask col_mask(std::size_t x, Digit digit) const noexcept;
    [[nodiscard]] HouseMask box_mask(std::size_t box, Digit digit) const noexcept;

    /**
     * @brief Cells with exactly one candidate.
     */
    [[nodiscard]] DigitPositions decided_cells() const noexcept {
        return classify_cells<2>()[1];
    }

    /**
     * @brief Group cells by candidate count.
     *
     * Entry k holds the cells with exactly k candidates; cells with N or more
     * candidates appear in no entry. Runs one bit-parallel saturating
     * counter per k over the nine digit bitboards.
     *
     * @tparam N Number of entries (1-10)
     */
    template <std::size_t N>
    [[nodiscard]] std::array<DigitPositions, N> classify_cells() const noexcept {
        static_assert(N >= 1 && N <= BOARD_SIZE + 1, "classify_cells supports 1-10 classes");

        // at_least[k]: cells with at least k candidates seen so far
        std::array<DigitPositions, N + 1> at_least{};
        at_least[0] = DigitPositions::full();
        for (const DigitPositions& positions : digits_) {
            for (std::size_t k = N; k >= 1; --k) {
                at_least[k] |= at_least[k - 1] & positions;
            }
        }

        std::array<DigitPositions, N> result{};
        for (std::size_t k = 0; k < N; ++k) {
            result[k] = at_least[k].difference(at_least[k + 1]);
        }
        return result;
    }

    /**
     * @brief Check both grid invariants.
     * @return Error::Inconsistent if a cell has no candidate or a house has
     *         two decided cells with the same digit, Error::Ok otherwise
     */
    [[nodiscard]] Error check_consistency() const noexcept;

    /**
     * @brief Consistency check followed by a completeness check.
     *
     * @param solved Receives whether every cell is decided
     * @return Error from check_consistency()
     */
    Error is_solved(bool& solved) const noexcept;

    bool operator==(const CandidateGrid& other) const noexcept {
        return digits_ == other.digits_;
    }

    bool operator!=(const CandidateGrid& other) const noexcept {
        return !(*this == other);
    }

private:
    std::array<DigitPositions, BOARD_SIZE> digits_;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_CANDIDATE_GRID_HPP
