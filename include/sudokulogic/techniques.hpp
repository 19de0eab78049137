/**
 * @file techniques.hpp
 * @brief The technique library and its standard orderings.
 */

#ifndef SUDOKULOGIC_TECHNIQUES_HPP
#define SUDOKULOGIC_TECHNIQUES_HPP

#include <string_view>
#include <vector>

#include "technique.hpp"
#include "technique/hidden_single.hpp"
#include "technique/hidden_subset.hpp"
#include "technique/locked_candidates.hpp"
#include "technique/naked_single.hpp"
#include "technique/naked_subset.hpp"
#include "technique/skyscraper.hpp"
#include "technique/x_wing.hpp"
#include "technique/y_wing.hpp"

namespace sudokulogic {

/**
 * @brief Every technique, easiest first.
 *
 * Naked Single, Hidden Single, Locked Candidates, Naked Pair, Hidden Pair,
 * Naked Triple, Hidden Triple, Naked Quad, Hidden Quad, X-Wing, Skyscraper,
 * Y-Wing.
 */
[[nodiscard]] std::vector<BoxedTechnique> all_techniques();

/**
 * @brief Naked Single and Hidden Single only.
 */
[[nodiscard]] std::vector<BoxedTechnique> fundamental_techniques();

/**
 * @brief Look up a technique by name, ignoring case.
 * @return A new instance, or nullptr when no technique has that name
 */
[[nodiscard]] BoxedTechnique technique_by_name(std::string_view name);

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUES_HPP
