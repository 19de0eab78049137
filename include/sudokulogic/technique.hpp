/**
 * @file technique.hpp
 * @brief Common interface of all deduction techniques.
 *
 * Every technique can be queried without side effects (find_step, for
 * hints) and applied in place (apply, for solving). Implementations run
 * the same scan routine for both entry points: on a scratch copy stopping
 * at the first change for find_step, on the caller's grid to completion for
 * apply. Any step find_step reports is therefore realised by apply.
 *
 * This holds on consistent grids. On a grid that is already contradictory
 * find_step may stop at a step before the scan reaches the contradiction,
 * while apply continues and returns Error::Inconsistent.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_HPP
#define SUDOKULOGIC_TECHNIQUE_HPP

#include <memory>
#include <optional>

#include "error.hpp"
#include "technique_grid.hpp"
#include "technique_step.hpp"

namespace sudokulogic {

/**
 * @brief Difficulty rank of a technique (ascending).
 */
enum class TechniqueTier : std::uint8_t {
    Fundamental = 0,
    Basic,
    Intermediate,
    UpperIntermediate,
    Advanced,
    Expert
};

/**
 * @brief Display name of a tier ("Upper Intermediate", ...).
 */
const char* tier_name(TechniqueTier tier) noexcept;

class Technique;

/// Owning handle to a technique
using BoxedTechnique = std::unique_ptr<Technique>;

/**
 * @brief A named deduction rule.
 */
class Technique {
public:
    virtual ~Technique() = default;

    /// Stable label used for statistics, hint text and CLI selection
    [[nodiscard]] virtual const char* name() const noexcept = 0;

    [[nodiscard]] virtual TechniqueTier tier() const noexcept = 0;

    [[nodiscard]] virtual BoxedTechnique clone() const = 0;

    /**
     * @brief Find the first deduction in scan order without touching @p grid.
     *
     * @param grid Grid to inspect
     * @param step Receives the step, or nullopt when the technique does not apply
     * @return Error::Ok, or Error::Inconsistent when the scan proves the grid
     *         cannot be completed
     */
    virtual Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const = 0;

    /**
     * @brief Apply every deduction the scan finds.
     *
     * @param grid Grid to update
     * @param changed Receives whether any candidate changed
     * @return Error::Ok, or Error::Inconsistent (the grid may be partially
     *         updated)
     */
    virtual Error apply(TechniqueGrid& grid, bool& changed) const = 0;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_HPP
