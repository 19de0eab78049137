/**
 * @file digit_set.hpp
 * @brief Concrete set types and fixed board tables.
 *
 * - DigitSet: candidates of one cell (bit i <=> digit i + 1)
 * - DigitPositions: cells of the board, usually for one digit (bit y * 9 + x)
 * - HouseMask: cells inside one house (bit i <=> i-th cell of the house)
 *
 * The row, column, box and peer tables are computed at compile time.
 */

#ifndef SUDOKULOGIC_DIGIT_SET_HPP
#define SUDOKULOGIC_DIGIT_SET_HPP

#include "bitset.hpp"
#include "digit.hpp"
#include "position.hpp"

namespace sudokulogic {

using DigitSet = BitSet<BOARD_SIZE, DigitSemantics>;
using DigitPositions = BitSet<CELL_COUNT, PositionSemantics>;
using HouseMask = BitSet<BOARD_SIZE, CellIndexSemantics>;

namespace detail {

constexpr std::array<DigitPositions, BOARD_SIZE> make_row_positions() noexcept {
    std::array<DigitPositions, BOARD_SIZE> rows{};
    for (std::size_t y = 0; y < BOARD_SIZE; ++y) {
        for (std::size_t x = 0; x < BOARD_SIZE; ++x) {
            rows[y].insert(Position(x, y));
        }
    }
    return rows;
}

constexpr std::array<DigitPositions, BOARD_SIZE> make_column_positions() noexcept {
    std::array<DigitPositions, BOARD_SIZE> columns{};
    for (std::size_t x = 0; x < BOARD_SIZE; ++x) {
        for (std::size_t y = 0; y < BOARD_SIZE; ++y) {
            columns[x].insert(Position(x, y));
        }
    }
    return columns;
}

constexpr std::array<DigitPositions, BOARD_SIZE> make_box_positions() noexcept {
    std::array<DigitPositions, BOARD_SIZE> boxes{};
    for (std::size_t box = 0; box < BOARD_SIZE; ++box) {
        for (std::size_t i = 0; i < BOARD_SIZE; ++i) {
            boxes[box].insert(Position::from_box(box, i));
        }
    }
    return boxes;
}

} // namespace detail

/// Cells of each row, indexed by y
inline constexpr std::array<DigitPositions, BOARD_SIZE> ROW_POSITIONS =
    detail::make_row_positions();

/// Cells of each column, indexed by x
inline constexpr std::array<DigitPositions, BOARD_SIZE> COLUMN_POSITIONS =
    detail::make_column_positions();

/// Cells of each box, indexed by box number
inline constexpr std::array<DigitPositions, BOARD_SIZE> BOX_POSITIONS =
    detail::make_box_positions();

namespace detail {

constexpr std::array<DigitPositions, CELL_COUNT> make_peer_positions() noexcept {
    std::array<DigitPositions, CELL_COUNT> peers{};
    for (std::size_t i = 0; i < CELL_COUNT; ++i) {
        Position pos = Position::from_index(i);
        peers[i] = ROW_POSITIONS[pos.y()] | COLUMN_POSITIONS[pos.x()] | BOX_POSITIONS[pos.box_index()];
        peers[i].remove(pos);
    }
    return peers;
}

} // namespace detail

/// Peers of each cell, indexed by row-major board index
inline constexpr std::array<DigitPositions, CELL_COUNT> PEER_POSITIONS =
    detail::make_peer_positions();

} // namespace sudokulogic

#endif // SUDOKULOGIC_DIGIT_SET_HPP
