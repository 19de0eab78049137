/**
 * @file hidden_single.hpp
 * @brief Digits with a single possible cell in a house.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_HIDDEN_SINGLE_HPP
#define SUDOKULOGIC_TECHNIQUE_HIDDEN_SINGLE_HPP

#include "../technique.hpp"

namespace sudokulogic {

/**
 * @brief Places a digit that has exactly one candidate cell in some house.
 *
 * Houses are scanned digit by digit, rows then columns then boxes.
 */
class HiddenSingle final : public Technique {
public:
    static constexpr const char* NAME = "Hidden Single";

    [[nodiscard]] const char* name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] TechniqueTier tier() const noexcept override {
        return TechniqueTier::Fundamental;
    }

    [[nodiscard]] BoxedTechnique clone() const override {
        return std::make_unique<HiddenSingle>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_HIDDEN_SINGLE_HPP
