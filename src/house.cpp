/**
 * @file house.cpp
 * @brief House display names.
 */

#include <sudokulogic/house.hpp>

namespace sudokulogic {

const char* House::kind_name() const noexcept {
    switch (kind_) {
    case Kind::Row:
        return "row";
    case Kind::Column:
        return "column";
    case Kind::Box:
        return "box";
    default:
        return "house";
    }
}

} // namespace sudokulogic
