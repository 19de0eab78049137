/**
 * @file skyscraper.hpp
 * @brief Skyscraper (two strong links sharing one base line).
 */

#ifndef SUDOKULOGIC_TECHNIQUE_SKYSCRAPER_HPP
#define SUDOKULOGIC_TECHNIQUE_SKYSCRAPER_HPP

#include "../technique.hpp"

namespace sudokulogic {

/**
 * @brief Two lines where a digit has exactly two candidates each, one pair
 *        of them aligned (the base) and the other pair not (the roofs).
 *
 * One roof always holds the digit, so it is removed from every cell that
 * sees both roofs. Columns are searched before rows for each digit.
 */
class Skyscraper final : public Technique {
public:
    static constexpr const char* NAME = "Skyscraper";

    [[nodiscard]] const char* name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] TechniqueTier tier() const noexcept override {
        return TechniqueTier::UpperIntermediate;
    }

    [[nodiscard]] BoxedTechnique clone() const override {
        return std::make_unique<Skyscraper>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_SKYSCRAPER_HPP
