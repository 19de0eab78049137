/**
 * @file locked_candidates.hpp
 * @brief Box/line intersections (pointing and claiming).
 *
 * For a box B, a line L crossing it and a digit d with candidates in B & L:
 * - Pointing: d has no candidate in B outside L, so d leaves L outside B
 * - Claiming: d has no candidate in L outside B, so d leaves B outside L
 */

#ifndef SUDOKULOGIC_TECHNIQUE_LOCKED_CANDIDATES_HPP
#define SUDOKULOGIC_TECHNIQUE_LOCKED_CANDIDATES_HPP

#include "../technique.hpp"

namespace sudokulogic {

class LockedCandidates final : public Technique {
public:
    static constexpr const char* NAME = "Locked Candidates";
    static constexpr const char* POINTING_NAME = "Locked Candidates (Pointing)";
    static constexpr const char* CLAIMING_NAME = "Locked Candidates (Claiming)";

    [[nodiscard]] const char* name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] TechniqueTier tier() const noexcept override {
        return TechniqueTier::Basic;
    }

    [[nodiscard]] BoxedTechnique clone() const override {
        return std::make_unique<LockedCandidates>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_LOCKED_CANDIDATES_HPP
