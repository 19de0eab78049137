/**
 * @file y_wing.hpp
 * @brief Y-Wing (XY-Wing).
 */

#ifndef SUDOKULOGIC_TECHNIQUE_Y_WING_HPP
#define SUDOKULOGIC_TECHNIQUE_Y_WING_HPP

#include "../technique.hpp"

namespace sudokulogic {

/**
 * @brief Pivot {A,B} seeing wings {A,C} and {B,C}.
 *
 * Whatever the pivot takes, one wing becomes C, so C is removed from the
 * cells that see both wings.
 */
class YWing final : public Technique {
public:
    static constexpr const char* NAME = "Y-Wing";

    [[nodiscard]] const char* name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] TechniqueTier tier() const noexcept override {
        return TechniqueTier::Advanced;
    }

    [[nodiscard]] BoxedTechnique clone() const override {
        return std::make_unique<YWing>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_Y_WING_HPP
