/**
 * @file position.cpp
 * @brief Position peer lookup.
 */

#include <sudokulogic/digit_set.hpp>

namespace sudokulogic {

DigitPositions Position::house_peers() const noexcept {
    return PEER_POSITIONS[index()];
}

} // namespace sudokulogic
