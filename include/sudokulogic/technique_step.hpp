/**
 * @file technique_step.hpp
 * @brief Explanations of single deductions.
 *
 * A TechniqueStep is what a hint shows to a player: which technique fired,
 * which cells (and which digits in them) justify it, and the primitive
 * effects it has on the grid. Steps are plain values; the grid never keeps
 * them.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_STEP_HPP
#define SUDOKULOGIC_TECHNIQUE_STEP_HPP

#include <string>
#include <utility>
#include <vector>

#include "technique_grid.hpp"

namespace sudokulogic {

/**
 * @brief One primitive effect of a technique.
 *
 * Either a placement (`position`, `digit`) or a candidate elimination
 * (`positions`, `digits`); the fields of the other kind are unused.
 */
struct TechniqueApplication {
    enum class Kind : std::uint8_t {
        Placement,           ///< Decide a cell
        CandidateElimination ///< Remove digits from cells
    };

    Kind kind = Kind::CandidateElimination;
    Position position{};
    Digit digit = Digit::D1;
    DigitPositions positions{};
    DigitSet digits{};

    [[nodiscard]] static TechniqueApplication placement(Position position, Digit digit) noexcept {
        TechniqueApplication app;
        app.kind = Kind::Placement;
        app.position = position;
        app.digit = digit;
        return app;
    }

    [[nodiscard]] static TechniqueApplication elimination(const DigitPositions& positions,
                                                          const DigitSet& digits) noexcept {
        TechniqueApplication app;
        app.kind = Kind::CandidateElimination;
        app.positions = positions;
        app.digits = digits;
        return app;
    }

    [[nodiscard]] bool is_placement() const noexcept {
        return kind == Kind::Placement;
    }

    bool operator==(const TechniqueApplication& other) const noexcept;
    bool operator!=(const TechniqueApplication& other) const noexcept {
        return !(*this == other);
    }
};

/// Cells justifying a deduction
using ConditionCells = DigitPositions;

/// (cells, digits) pairs justifying a deduction
using ConditionDigitCells = std::vector<std::pair<DigitPositions, DigitSet>>;

/**
 * @brief A technique's explanation of one deduction.
 */
class TechniqueStep {
public:
    TechniqueStep(std::string technique_name, const ConditionCells& condition_cells,
                  ConditionDigitCells condition_digit_cells,
                  std::vector<TechniqueApplication> application)
        : technique_name_(std::move(technique_name)), condition_cells_(condition_cells),
          condition_digit_cells_(std::move(condition_digit_cells)),
          application_(std::move(application)) {}

    /**
     * @brief Build a step whose application is the candidate diff of two
     *        grids, followed by @p extra_application.
     *
     * @param before Grid before the deduction
     * @param after Grid after the deduction (candidates are a subset of
     *        @p before's)
     */
    [[nodiscard]] static TechniqueStep from_diff(std::string technique_name,
                                                 const ConditionCells& condition_cells,
                                                 ConditionDigitCells condition_digit_cells,
                                                 const TechniqueGrid& before,
                                                 const TechniqueGrid& after,
                                                 std::vector<TechniqueApplication> extra_application = {});

    [[nodiscard]] const std::string& technique_name() const noexcept {
        return technique_name_;
    }

    [[nodiscard]] const ConditionCells& condition_cells() const noexcept {
        return condition_cells_;
    }

    [[nodiscard]] const ConditionDigitCells& condition_digit_cells() const noexcept {
        return condition_digit_cells_;
    }

    [[nodiscard]] const std::vector<TechniqueApplication>& application() const noexcept {
        return application_;
    }

    /**
     * @brief One-line human readable description, e.g.
     *        "Naked Pair: remove 1,2 from r1c3 r1c5".
     */
    [[nodiscard]] std::string describe() const;

private:
    std::string technique_name_;
    ConditionCells condition_cells_;
    ConditionDigitCells condition_digit_cells_;
    std::vector<TechniqueApplication> application_;
};

/**
 * @brief One elimination per digit whose candidate cells shrank between
 *        @p before and @p after, in digit order.
 */
[[nodiscard]] std::vector<TechniqueApplication> collect_applications_from_diff(
    const TechniqueGrid& before, const TechniqueGrid& after);

/**
 * @brief "r1c1 r1c5" style listing of cells (1-based rows and columns).
 */
[[nodiscard]] std::string format_positions(const DigitPositions& positions);

/**
 * @brief "1,2,9" style listing of digits.
 */
[[nodiscard]] std::string format_digits(const DigitSet& digits);

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_STEP_HPP
