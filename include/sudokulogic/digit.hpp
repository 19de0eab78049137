/**
 * @file digit.hpp
 * @brief Sudoku digits 1-9.
 */

#ifndef SUDOKULOGIC_DIGIT_HPP
#define SUDOKULOGIC_DIGIT_HPP

#include <array>
#include <optional>

#include "config.hpp"

namespace sudokulogic {

/**
 * @brief A digit that can occupy a cell.
 *
 * The underlying value is the printed digit, so `static_cast<int>(Digit::D5)`
 * is 5.
 */
enum class Digit : std::uint8_t {
    D1 = 1,
    D2 = 2,
    D3 = 3,
    D4 = 4,
    D5 = 5,
    D6 = 6,
    D7 = 7,
    D8 = 8,
    D9 = 9
};

/// Every digit in ascending order
inline constexpr std::array<Digit, BOARD_SIZE> ALL_DIGITS = {
    Digit::D1, Digit::D2, Digit::D3, Digit::D4, Digit::D5,
    Digit::D6, Digit::D7, Digit::D8, Digit::D9};

/**
 * @brief Numeric value (1-9) of a digit.
 */
[[nodiscard]] constexpr int digit_value(Digit digit) noexcept {
    return static_cast<int>(digit);
}

/**
 * @brief Digit with the given numeric value.
 * @param value Value to convert
 * @return The digit, or nullopt when @p value is outside 1-9
 */
[[nodiscard]] constexpr std::optional<Digit> digit_from_value(int value) noexcept {
    if (value < 1 || value > static_cast<int>(BOARD_SIZE)) {
        return std::nullopt;
    }
    return static_cast<Digit>(value);
}

/**
 * @brief Digit <-> bit index mapping (bit 0 is D1).
 */
struct DigitSemantics {
    using value_type = Digit;

    static constexpr std::size_t to_index(Digit digit) noexcept {
        return static_cast<std::size_t>(digit) - 1U;
    }

    static constexpr Digit from_index(std::size_t index) noexcept {
        return static_cast<Digit>(index + 1U);
    }
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_DIGIT_HPP
