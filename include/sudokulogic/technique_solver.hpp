/**
 * @file technique_solver.hpp
 * @brief Ordered application of techniques until solved or stuck.
 *
 * The solver holds an explicit, ordered technique list. Each step applies
 * the first technique (in list order) that changes the grid, so earlier
 * techniques are always exhausted before later ones run, and identical
 * inputs always give identical step sequences.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_SOLVER_HPP
#define SUDOKULOGIC_TECHNIQUE_SOLVER_HPP

#include <optional>
#include <string_view>
#include <vector>

#include "technique.hpp"

namespace sudokulogic {

class TechniqueSolver;

/**
 * @brief How often each technique of a solver made progress.
 */
class TechniqueSolverStats {
public:
    TechniqueSolverStats() = default;

    /// Progress count per technique, in solver order
    [[nodiscard]] const std::vector<std::size_t>& applications() const noexcept {
        return applications_;
    }

    [[nodiscard]] std::size_t total_steps() const noexcept {
        return total_steps_;
    }

    [[nodiscard]] bool has_progress() const noexcept {
        return total_steps_ > 0;
    }

    /**
     * @brief Progress count of the technique called @p name (0 if absent).
     */
    [[nodiscard]] std::size_t count_for(std::string_view name) const noexcept;

    /**
     * @brief Hardest tier among the techniques that made progress.
     *
     * @param solver Solver these stats were produced by
     * @return The tier, or nullopt when nothing progressed
     */
    [[nodiscard]] std::optional<TechniqueTier> max_tier(const TechniqueSolver& solver) const noexcept;

private:
    friend class TechniqueSolver;

    std::vector<const char*> names_;
    std::vector<std::size_t> applications_;
    std::size_t total_steps_ = 0;
};

/**
 * @brief Deterministic human-style solver.
 */
class TechniqueSolver {
public:
    explicit TechniqueSolver(std::vector<BoxedTechnique> techniques) noexcept
        : techniques_(std::move(techniques)) {}

    TechniqueSolver(const TechniqueSolver& other);
    TechniqueSolver& operator=(const TechniqueSolver& other);
    TechniqueSolver(TechniqueSolver&&) noexcept = default;
    TechniqueSolver& operator=(TechniqueSolver&&) noexcept = default;
    ~TechniqueSolver() = default;

    /// Solver using all_techniques()
    [[nodiscard]] static TechniqueSolver with_all_techniques();

    /// Solver using fundamental_techniques()
    [[nodiscard]] static TechniqueSolver with_fundamental_techniques();

    [[nodiscard]] const std::vector<BoxedTechnique>& techniques() const noexcept {
        return techniques_;
    }

    /**
     * @brief Zeroed statistics matching this solver's technique order.
     */
    [[nodiscard]] TechniqueSolverStats new_stats() const;

    /**
     * @brief Apply the first technique that changes the grid.
     *
     * @param grid Grid to update
     * @param stats Statistics from new_stats(), updated on progress
     * @param progressed Receives whether a technique changed the grid
     * @return Error::Inconsistent when the grid is (or becomes) inconsistent,
     *         Error::InvalidArg when @p stats does not match this solver
     */
    Error step(TechniqueGrid& grid, TechniqueSolverStats& stats, bool& progressed) const;

    /**
     * @brief As step(), also reporting everything the step changed.
     *
     * A technique's apply() runs to completion, so one step can hold many
     * deductions. @p applied receives all of them as a single step named
     * after the technique: an elimination per shrunk digit followed by a
     * placement per newly decided cell. It is empty when nothing progressed.
     */
    Error step_explained(TechniqueGrid& grid, TechniqueSolverStats& stats,
                         std::optional<TechniqueStep>& applied) const;

    /**
     * @brief First step any technique can explain, without changing the grid.
     */
    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const;

    /**
     * @brief Step until the grid is solved or no technique progresses.
     *
     * @param grid Grid to solve in place
     * @param solved Receives whether every cell ended up decided
     * @param stats Receives fresh statistics of this run
     */
    Error solve(TechniqueGrid& grid, bool& solved, TechniqueSolverStats& stats) const;

    /**
     * @brief As solve(), accumulating into existing statistics.
     */
    Error solve_with_stats(TechniqueGrid& grid, TechniqueSolverStats& stats, bool& solved) const;

private:
    std::vector<BoxedTechnique> techniques_;
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_SOLVER_HPP
