/**
 * @file naked_subset.cpp
 * @brief NakedSubset scan for pairs, triples and quads.
 */

#include <sudokulogic/technique/naked_subset.hpp>

namespace sudokulogic {

namespace {

/*
 * Extends a partial subset (`cells`, holding `digits`) with one more cell
 * taken from `available`, recursing until N cells are chosen. Branches
 * whose digits already exceed N are cut.
 */
template <std::size_t N, typename OnChange>
Error extend(TechniqueGrid& grid, const House& house, const DigitPositions& available,
             const DigitPositions& cells, const DigitSet& digits, bool& stop, OnChange& on_change) {
    for (auto [pos, following] : available.pivots_with_following()) {
        const DigitSet united = digits | grid.candidates_at(pos);
        if (united.size() > N) {
            continue;
        }
        DigitPositions subset = cells;
        subset.insert(pos);

        if (subset.size() < N) {
            Error result = extend<N>(grid, house, following, subset, united, stop, on_change);
            if (result != Error::Ok || stop) {
                return result;
            }
            continue;
        }

        // N cells with fewer than N digits, or an (N+1)-th cell inside them
        if (united.size() < N) {
            return Error::Inconsistent;
        }
        for (Position other : following) {
            if (grid.candidates_at(other).is_subset(united)) {
                return Error::Inconsistent;
            }
        }

        const DigitPositions others = house.positions().difference(subset);
        if (grid.remove_candidate_set_with_mask(others, united) && on_change(grid, subset, united)) {
            stop = true;
            return Error::Ok;
        }
    }
    return Error::Ok;
}

template <std::size_t N, typename OnChange>
Error scan(TechniqueGrid& grid, OnChange&& on_change) {
    // Cells with 2..N candidates
    const auto classes = grid.classify_cells<N + 1>();
    DigitPositions subset_cells;
    for (std::size_t k = 2; k <= N; ++k) {
        subset_cells |= classes[k];
    }
    if (subset_cells.size() < N) {
        return Error::Ok;
    }

    bool stop = false;
    for (const House& house : ALL_HOUSES) {
        const DigitPositions available = subset_cells & house.positions();
        if (available.size() < N) {
            continue;
        }
        Error result = extend<N>(grid, house, available, DigitPositions{}, DigitSet{}, stop, on_change);
        if (result != Error::Ok || stop) {
            return result;
        }
    }
    return Error::Ok;
}

} // namespace

template <std::size_t N>
Error NakedSubset<N>::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
    step.reset();
    TechniqueGrid after = grid;
    auto on_change = [&](const TechniqueGrid& current, const DigitPositions& cells,
                         const DigitSet& digits) {
        step = TechniqueStep::from_diff(NAME, cells, {{cells, digits}}, grid, current);
        return true;
    };
    Error result = scan<N>(after, on_change);
    if (result != Error::Ok) {
        step.reset();
    }
    return result;
}

template <std::size_t N>
Error NakedSubset<N>::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    auto on_change = [&](const TechniqueGrid&, const DigitPositions&, const DigitSet&) {
        changed = true;
        return false;
    };
    return scan<N>(grid, on_change);
}

template class NakedSubset<2>;
template class NakedSubset<3>;
template class NakedSubset<4>;

} // namespace sudokulogic
