/**
 * @file naked_single.hpp
 * @brief Propagation of decided cells.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_NAKED_SINGLE_HPP
#define SUDOKULOGIC_TECHNIQUE_NAKED_SINGLE_HPP

#include "../technique.hpp"

namespace sudokulogic {

/**
 * @brief Removes the digit of every decided cell from its 20 peers.
 *
 * Each decided cell is handled once: after its peers are cleared it is
 * recorded in TechniqueGrid::decided_propagated() and skipped afterwards.
 */
class NakedSingle final : public Technique {
public:
    static constexpr const char* NAME = "Naked Single";

    [[nodiscard]] const char* name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] TechniqueTier tier() const noexcept override {
        return TechniqueTier::Fundamental;
    }

    [[nodiscard]] BoxedTechnique clone() const override {
        return std::make_unique<NakedSingle>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_NAKED_SINGLE_HPP
