/**
 * @file digit_grid.cpp
 * @brief DigitGrid text parsing and formatting.
 */

#include <sudokulogic/digit_grid.hpp>

namespace sudokulogic {

Error DigitGrid::parse(std::string_view text, DigitGrid& grid) noexcept {
    DigitGrid parsed;
    std::size_t count = 0;

    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            continue;
        }
        if (count >= CELL_COUNT) {
            return Error::InvalidArg;
        }

        if (c >= '1' && c <= '9') {
            parsed.cells_[count] = digit_from_value(c - '0');
        } else if (c != '.' && c != '_' && c != '0') {
            return Error::InvalidArg;
        }
        ++count;
    }

    if (count != CELL_COUNT) {
        return Error::InvalidArg;
    }

    grid = parsed;
    return Error::Ok;
}

#if !SUDOKULOGIC_NO_EXCEPTIONS
DigitGrid DigitGrid::from_string(std::string_view text) {
    DigitGrid grid;
    Error result = parse(text, grid);
    if (result != Error::Ok) {
        throw InvalidArgumentException("Malformed puzzle text (expected 81 cells of 1-9 or .)");
    }
    return grid;
}
#endif

std::size_t DigitGrid::filled_count() const noexcept {
    std::size_t count = 0;
    for (const auto& cell : cells_) {
        if (cell.has_value()) {
            ++count;
        }
    }
    return count;
}

std::string DigitGrid::to_line() const {
    std::string line;
    line.reserve(CELL_COUNT);
    for (const auto& cell : cells_) {
        line.push_back(cell ? static_cast<char>('0' + digit_value(*cell)) : '.');
    }
    return line;
}

std::string DigitGrid::to_pretty_string() const {
    std::string out;
    for (std::size_t y = 0; y < BOARD_SIZE; ++y) {
        if (y != 0 && y % BOX_SIZE == 0) {
            out += "------+-------+------\n";
        }
        for (std::size_t x = 0; x < BOARD_SIZE; ++x) {
            if (x != 0 && x % BOX_SIZE == 0) {
                out += "| ";
            }
            auto cell = get(Position(x, y));
            out.push_back(cell ? static_cast<char>('0' + digit_value(*cell)) : '.');
            if (x + 1 < BOARD_SIZE) {
                out.push_back(' ');
            }
        }
        out.push_back('\n');
    }
    return out;
}

} // namespace sudokulogic
