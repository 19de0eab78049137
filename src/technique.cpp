/**
 * @file technique.cpp
 * @brief Technique tier names.
 */

#include <sudokulogic/technique.hpp>

namespace sudokulogic {

const char* tier_name(TechniqueTier tier) noexcept {
    switch (tier) {
    case TechniqueTier::Fundamental:
        return "Fundamental";
    case TechniqueTier::Basic:
        return "Basic";
    case TechniqueTier::Intermediate:
        return "Intermediate";
    case TechniqueTier::UpperIntermediate:
        return "Upper Intermediate";
    case TechniqueTier::Advanced:
        return "Advanced";
    case TechniqueTier::Expert:
        return "Expert";
    default:
        return "Unknown";
    }
}

} // namespace sudokulogic
