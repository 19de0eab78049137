/**
 * @file x_wing.hpp
 * @brief X-Wing on rows and columns.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_X_WING_HPP
#define SUDOKULOGIC_TECHNIQUE_X_WING_HPP

#include "../technique.hpp"

namespace sudokulogic {

/**
 * @brief Two lines whose only candidates for a digit sit in the same two
 *        cross lines.
 *
 * The digit must occupy two opposite corners of the rectangle, so it is
 * removed from the two cross lines outside the base lines. When all four
 * corners fall into one box the digit would appear twice in that box, which
 * is reported as Error::Inconsistent.
 */
class XWing final : public Technique {
public:
    static constexpr const char* NAME = "X-Wing";

    [[nodiscard]] const char* name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] TechniqueTier tier() const noexcept override {
        return TechniqueTier::UpperIntermediate;
    }

    [[nodiscard]] BoxedTechnique clone() const override {
        return std::make_unique<XWing>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_X_WING_HPP
