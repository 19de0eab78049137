/**
 * @file house.hpp
 * @brief Rows, columns and boxes.
 */

#ifndef SUDOKULOGIC_HOUSE_HPP
#define SUDOKULOGIC_HOUSE_HPP

#include "digit_set.hpp"

namespace sudokulogic {

/**
 * @brief One of the 27 houses of the board.
 *
 * Cells inside a house are numbered 0-8: left to right for rows, top to
 * bottom for columns, row-major for boxes. HouseMask bits use that
 * numbering.
 */
class House {
public:
    enum class Kind : std::uint8_t { Row, Column, Box };

    constexpr House() noexcept = default;
    constexpr House(Kind kind, std::size_t index) noexcept
        : kind_(kind), index_(static_cast<std::uint8_t>(index)) {}

    [[nodiscard]] static constexpr House row(std::size_t y) noexcept {
        return House(Kind::Row, y);
    }

    [[nodiscard]] static constexpr House column(std::size_t x) noexcept {
        return House(Kind::Column, x);
    }

    [[nodiscard]] static constexpr House box(std::size_t box) noexcept {
        return House(Kind::Box, box);
    }

    [[nodiscard]] constexpr Kind kind() const noexcept {
        return kind_;
    }

    [[nodiscard]] constexpr std::size_t index() const noexcept {
        return index_;
    }

    /**
     * @brief Board position of the @p cell_index-th cell of this house.
     */
    [[nodiscard]] constexpr Position position_from_cell_index(std::size_t cell_index) const noexcept {
        switch (kind_) {
        case Kind::Row:
            return Position(cell_index, index_);
        case Kind::Column:
            return Position(index_, cell_index);
        case Kind::Box:
        default:
            return Position::from_box(index_, cell_index);
        }
    }

    /**
     * @brief Board positions of every cell in a house mask.
     */
    [[nodiscard]] constexpr DigitPositions positions_from_mask(const HouseMask& mask) const noexcept {
        DigitPositions positions;
        for (std::uint8_t cell_index : mask) {
            positions.insert(position_from_cell_index(cell_index));
        }
        return positions;
    }

    /**
     * @brief All nine cells of this house.
     */
    [[nodiscard]] constexpr const DigitPositions& positions() const noexcept {
        switch (kind_) {
        case Kind::Row:
            return ROW_POSITIONS[index_];
        case Kind::Column:
            return COLUMN_POSITIONS[index_];
        case Kind::Box:
        default:
            return BOX_POSITIONS[index_];
        }
    }

    /**
     * @brief "row", "column" or "box".
     */
    [[nodiscard]] const char* kind_name() const noexcept;

    [[nodiscard]] constexpr bool operator==(const House& other) const noexcept {
        return kind_ == other.kind_ && index_ == other.index_;
    }

    [[nodiscard]] constexpr bool operator!=(const House& other) const noexcept {
        return !(*this == other);
    }

private:
    Kind kind_ = Kind::Row;
    std::uint8_t index_ = 0;
};

namespace detail {

constexpr std::array<House, HOUSE_COUNT> make_all_houses() noexcept {
    std::array<House, HOUSE_COUNT> houses{};
    for (std::size_t i = 0; i < BOARD_SIZE; ++i) {
        houses[i] = House::row(i);
        houses[BOARD_SIZE + i] = House::column(i);
        houses[2 * BOARD_SIZE + i] = House::box(i);
    }
    return houses;
}

} // namespace detail

/// Rows 0-8, then columns 0-8, then boxes 0-8
inline constexpr std::array<House, HOUSE_COUNT> ALL_HOUSES = detail::make_all_houses();

} // namespace sudokulogic

#endif // SUDOKULOGIC_HOUSE_HPP
