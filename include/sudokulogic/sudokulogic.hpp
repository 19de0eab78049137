/**
 * @file sudokulogic.hpp
 * @brief sudokulogic public API.
 *
 * Typical use:
 * @code
 * DigitGrid puzzle;
 * if (DigitGrid::parse(text, puzzle) != Error::Ok) { ... }
 * TechniqueGrid grid = TechniqueGrid::from_digit_grid(puzzle);
 * TechniqueSolver solver = TechniqueSolver::with_all_techniques();
 * bool solved = false;
 * TechniqueSolverStats stats;
 * Error result = solver.solve(grid, solved, stats);
 * @endcode
 */

#ifndef SUDOKULOGIC_HPP
#define SUDOKULOGIC_HPP

#include "bitset.hpp"
#include "candidate_grid.hpp"
#include "config.hpp"
#include "digit.hpp"
#include "digit_grid.hpp"
#include "digit_set.hpp"
#include "error.hpp"
#include "house.hpp"
#include "position.hpp"
#include "technique.hpp"
#include "technique_grid.hpp"
#include "technique_solver.hpp"
#include "technique_step.hpp"
#include "techniques.hpp"

#endif // SUDOKULOGIC_HPP
