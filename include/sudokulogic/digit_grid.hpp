/**
 * @file digit_grid.hpp
 * @brief 81 cells of optional digits, with text parsing and formatting.
 */

#ifndef SUDOKULOGIC_DIGIT_GRID_HPP
#define SUDOKULOGIC_DIGIT_GRID_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "digit.hpp"
#include "error.hpp"
#include "position.hpp"

namespace sudokulogic {

/**
 * @brief A board of givens (or a partial / complete solution).
 *
 * Text form: `1`-`9` are digits, `.`, `_` and `0` are empty cells and
 * whitespace is ignored. Exactly 81 cells must be present.
 */
class DigitGrid {
public:
    DigitGrid() noexcept = default;

    /**
     * @brief Parse the text form.
     *
     * @param text Puzzle text
     * @param grid Receives the parsed grid (unchanged on error)
     * @return Error::Ok, or Error::InvalidArg on an unexpected character or
     *         a cell count other than 81
     */
    static Error parse(std::string_view text, DigitGrid& grid) noexcept;

#if !SUDOKULOGIC_NO_EXCEPTIONS
    /**
     * @brief Throwing variant of parse().
     * @throws InvalidArgumentException on malformed text
     */
    [[nodiscard]] static DigitGrid from_string(std::string_view text);
#endif

    [[nodiscard]] std::optional<Digit> get(Position pos) const noexcept {
        return cells_[pos.index()];
    }

    void set(Position pos, std::optional<Digit> digit) noexcept {
        cells_[pos.index()] = digit;
    }

    /// Number of filled cells
    [[nodiscard]] std::size_t filled_count() const noexcept;

    [[nodiscard]] bool is_complete() const noexcept {
        return filled_count() == CELL_COUNT;
    }

    /**
     * @brief Single 81-character line, `.` for empty cells.
     */
    [[nodiscard]] std::string to_line() const;

    /**
     * @brief Nine lines with box separators.
     */
    [[nodiscard]] std::string to_pretty_string() const;

    bool operator==(const DigitGrid& other) const noexcept {
        return cells_ == other.cells_;
    }

    bool operator!=(const DigitGrid& other) const noexcept {
        return !(*this == other);
    }

private:
    std::array<std::optional<Digit>, CELL_COUNT> cells_{};
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_DIGIT_GRID_HPP
