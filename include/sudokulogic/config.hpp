/**
 * @file config.hpp
 * @brief sudokulogic compile-time configuration.
 *
 * Board geometry, storage word type and exception configuration shared by
 * every component of the deduction engine.
 */

#ifndef SUDOKULOGIC_CONFIG_HPP
#define SUDOKULOGIC_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace sudokulogic {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;

/**
 * @brief Get the library version string.
 * @return Version in "major.minor.patch" form
 */
inline const char* version() noexcept {
    return "1.0.0";
}
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Side length of a box (3x3)
inline constexpr std::size_t BOX_SIZE = 3U;

/// Cells per house, digits per cell, rows and columns per board
inline constexpr std::size_t BOARD_SIZE = BOX_SIZE * BOX_SIZE;

/// Total number of cells on the board
inline constexpr std::size_t CELL_COUNT = BOARD_SIZE * BOARD_SIZE;

/// Rows, columns and boxes
inline constexpr std::size_t HOUSE_COUNT = BOARD_SIZE * 3U;

/// Peers of any cell (8 in row + 8 in column + 4 remaining in box)
inline constexpr std::size_t PEER_COUNT = 20U;

/// 32-bit word type for bit set storage
using word_t = std::uint32_t;
inline constexpr std::size_t BITS_PER_WORD = 32U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define SUDOKULOGIC_NO_EXCEPTIONS=1 to build without exception support.
 * All engine entry points report errors through Error codes either way.
 * @{
 */
#ifndef SUDOKULOGIC_NO_EXCEPTIONS
#define SUDOKULOGIC_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace sudokulogic

#endif // SUDOKULOGIC_CONFIG_HPP
