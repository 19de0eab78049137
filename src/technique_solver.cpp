/**
 * @file technique_solver.cpp
 * @brief TechniqueSolver stepping and solving loops.
 */

#include <sudokulogic/technique_solver.hpp>
#include <sudokulogic/techniques.hpp>

namespace sudokulogic {

std::size_t TechniqueSolverStats::count_for(std::string_view name) const noexcept {
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (name == names_[i]) {
            return applications_[i];
        }
    }
    return 0;
}

std::optional<TechniqueTier> TechniqueSolverStats::max_tier(const TechniqueSolver& solver) const noexcept {
    std::optional<TechniqueTier> hardest;
    const auto& techniques = solver.techniques();
    for (std::size_t i = 0; i < applications_.size() && i < techniques.size(); ++i) {
        if (applications_[i] == 0) {
            continue;
        }
        TechniqueTier tier = techniques[i]->tier();
        if (!hardest || tier > *hardest) {
            hardest = tier;
        }
    }
    return hardest;
}

TechniqueSolver::TechniqueSolver(const TechniqueSolver& other) {
    techniques_.reserve(other.techniques_.size());
    for (const BoxedTechnique& technique : other.techniques_) {
        techniques_.push_back(technique->clone());
    }
}

TechniqueSolver& TechniqueSolver::operator=(const TechniqueSolver& other) {
    if (this != &other) {
        TechniqueSolver copy(other);
        techniques_ = std::move(copy.techniques_);
    }
    return *this;
}

TechniqueSolver TechniqueSolver::with_all_techniques() {
    return TechniqueSolver(all_techniques());
}

TechniqueSolver TechniqueSolver::with_fundamental_techniques() {
    return TechniqueSolver(fundamental_techniques());
}

TechniqueSolverStats TechniqueSolver::new_stats() const {
    TechniqueSolverStats stats;
    stats.names_.reserve(techniques_.size());
    for (const BoxedTechnique& technique : techniques_) {
        stats.names_.push_back(technique->name());
    }
    stats.applications_.assign(techniques_.size(), 0);
    return stats;
}

Error TechniqueSolver::step(TechniqueGrid& grid, TechniqueSolverStats& stats, bool& progressed) const {
    progressed = false;
    if (stats.applications_.size() != techniques_.size()) [[unlikely]] {
        return Error::InvalidArg;
    }

    Error result = grid.check_consistency();
    if (result != Error::Ok) {
        return result;
    }

    for (std::size_t i = 0; i < techniques_.size(); ++i) {
        bool changed = false;
        result = techniques_[i]->apply(grid, changed);
        if (result != Error::Ok) {
            return result;
        }
        if (changed) {
            stats.applications_[i] += 1;
            stats.total_steps_ += 1;
            progressed = true;
            return grid.check_consistency();
        }
    }
    return Error::Ok;
}

Error TechniqueSolver::step_explained(TechniqueGrid& grid, TechniqueSolverStats& stats,
                                      std::optional<TechniqueStep>& applied) const {
    applied.reset();
    const TechniqueGrid before = grid;
    const std::vector<std::size_t> counts = stats.applications_;

    bool progressed = false;
    Error result = step(grid, stats, progressed);
    if (result != Error::Ok || !progressed) {
        return result;
    }

    std::size_t index = 0;
    while (index < counts.size() && counts[index] == stats.applications_[index]) {
        ++index;
    }

    std::vector<TechniqueApplication> placements;
    for (Position pos : grid.decided_cells().difference(before.decided_cells())) {
        placements.push_back(TechniqueApplication::placement(pos, *grid.candidates_at(pos).first()));
    }
    applied = TechniqueStep::from_diff(techniques_[index]->name(), ConditionCells{}, {}, before, grid,
                                       std::move(placements));
    return result;
}

Error TechniqueSolver::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
    step.reset();
    Error result = grid.check_consistency();
    if (result != Error::Ok) {
        return result;
    }

    for (const BoxedTechnique& technique : techniques_) {
        result = technique->find_step(grid, step);
        if (result != Error::Ok || step) {
            return result;
        }
    }
    return Error::Ok;
}

Error TechniqueSolver::solve(TechniqueGrid& grid, bool& solved, TechniqueSolverStats& stats) const {
    stats = new_stats();
    return solve_with_stats(grid, stats, solved);
}

Error TechniqueSolver::solve_with_stats(TechniqueGrid& grid, TechniqueSolverStats& stats,
                                        bool& solved) const {
    solved = false;
    bool progressed = true;
    while (progressed) {
        Error result = step(grid, stats, progressed);
        if (result != Error::Ok) {
            return result;
        }
        if (progressed) {
            result = grid.is_solved(solved);
            if (result != Error::Ok || solved) {
                return result;
            }
        }
    }
    return grid.is_solved(solved);
}

} // namespace sudokulogic
