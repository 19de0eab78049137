/**
 * @file position.hpp
 * @brief Cell addresses on the 9x9 board.
 *
 * A Position is an (x, y) pair with x the column and y the row, both 0-8.
 * Board-wide bit sets index cells row-major (`y * 9 + x`); boxes are
 * numbered the same way (`(y / 3) * 3 + x / 3`), and so are cells inside a
 * box.
 */

#ifndef SUDOKULOGIC_POSITION_HPP
#define SUDOKULOGIC_POSITION_HPP

#include "bitset.hpp"
#include "config.hpp"

namespace sudokulogic {

struct PositionSemantics;

/**
 * @brief Cell address.
 */
class Position {
public:
    constexpr Position() noexcept = default;

    /**
     * @param x Column (0-8)
     * @param y Row (0-8)
     */
    constexpr Position(std::size_t x, std::size_t y) noexcept
        : x_(static_cast<std::uint8_t>(x)), y_(static_cast<std::uint8_t>(y)) {}

    /**
     * @brief Position of a row-major board index (0-80).
     */
    [[nodiscard]] static constexpr Position from_index(std::size_t index) noexcept {
        return Position(index % BOARD_SIZE, index / BOARD_SIZE);
    }

    /**
     * @brief Position of the @p cell_index-th cell (0-8) of box @p box.
     */
    [[nodiscard]] static constexpr Position from_box(std::size_t box,
                                                     std::size_t cell_index) noexcept {
        Position origin = box_origin(box);
        return Position(origin.x() + cell_index % BOX_SIZE, origin.y() + cell_index / BOX_SIZE);
    }

    /**
     * @brief Top-left cell of box @p box.
     */
    [[nodiscard]] static constexpr Position box_origin(std::size_t box) noexcept {
        return Position((box % BOX_SIZE) * BOX_SIZE, (box / BOX_SIZE) * BOX_SIZE);
    }

    [[nodiscard]] constexpr std::size_t x() const noexcept {
        return x_;
    }

    [[nodiscard]] constexpr std::size_t y() const noexcept {
        return y_;
    }

    /// Row-major board index
    [[nodiscard]] constexpr std::size_t index() const noexcept {
        return static_cast<std::size_t>(y_) * BOARD_SIZE + x_;
    }

    [[nodiscard]] constexpr std::size_t box_index() const noexcept {
        return (y_ / BOX_SIZE) * BOX_SIZE + x_ / BOX_SIZE;
    }

    /// Index of this cell inside its box
    [[nodiscard]] constexpr std::size_t box_cell_index() const noexcept {
        return (y_ % BOX_SIZE) * BOX_SIZE + x_ % BOX_SIZE;
    }

    /**
     * @brief The 20 cells sharing a row, column or box with this one.
     *
     * The cell itself is excluded.
     */
    [[nodiscard]] BitSet<CELL_COUNT, PositionSemantics> house_peers() const noexcept;

    [[nodiscard]] constexpr bool operator==(const Position& other) const noexcept {
        return x_ == other.x_ && y_ == other.y_;
    }

    [[nodiscard]] constexpr bool operator!=(const Position& other) const noexcept {
        return !(*this == other);
    }

    /// Row-major order
    [[nodiscard]] constexpr bool operator<(const Position& other) const noexcept {
        return index() < other.index();
    }

private:
    std::uint8_t x_ = 0;
    std::uint8_t y_ = 0;
};

/**
 * @brief Position <-> row-major bit index mapping.
 */
struct PositionSemantics {
    using value_type = Position;

    static constexpr std::size_t to_index(Position pos) noexcept {
        return pos.index();
    }

    static constexpr Position from_index(std::size_t index) noexcept {
        return Position::from_index(index);
    }
};

/**
 * @brief Identity mapping for cell indices inside one house (0-8).
 */
struct CellIndexSemantics {
    using value_type = std::uint8_t;

    static constexpr std::size_t to_index(std::uint8_t cell_index) noexcept {
        return cell_index;
    }

    static constexpr std::uint8_t from_index(std::size_t index) noexcept {
        return static_cast<std::uint8_t>(index);
    }
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_POSITION_HPP
