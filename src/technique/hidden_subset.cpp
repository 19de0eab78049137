/**
 * @file hidden_subset.cpp
 * @brief HiddenSubset scan for pairs, triples and quads.
 */

#include <sudokulogic/technique/hidden_subset.hpp>

namespace sudokulogic {

namespace {

/*
 * Extends a partial subset of digits whose house cells so far are `cells`
 * with one more digit from `available`. Digits without a candidate in the
 * house are skipped; branches spanning more than N cells are cut.
 */
template <std::size_t N, typename OnChange>
Error extend(TechniqueGrid& grid, const House& house, const DigitSet& available,
             const DigitSet& digits, const DigitPositions& cells, bool& stop, OnChange& on_change) {
    for (auto [digit, following] : available.pivots_with_following()) {
        const DigitPositions in_house = grid.digit_positions(digit) & house.positions();
        if (in_house.empty()) {
            continue;
        }
        const DigitPositions united = cells | in_house;
        if (united.size() > N) {
            continue;
        }
        DigitSet subset = digits;
        subset.insert(digit);

        if (subset.size() < N) {
            Error result = extend<N>(grid, house, following, subset, united, stop, on_change);
            if (result != Error::Ok || stop) {
                return result;
            }
            continue;
        }

        // N digits confined to fewer than N cells, or an (N+1)-th digit inside them
        if (united.size() < N) {
            return Error::Inconsistent;
        }
        for (Digit other : following) {
            const DigitPositions other_in_house = grid.digit_positions(other) & house.positions();
            if (!other_in_house.empty() && other_in_house.is_subset(united)) {
                return Error::Inconsistent;
            }
        }

        if (grid.remove_candidate_set_with_mask(united, ~subset) && on_change(grid, united, subset)) {
            stop = true;
            return Error::Ok;
        }
    }
    return Error::Ok;
}

template <std::size_t N, typename OnChange>
Error scan(TechniqueGrid& grid, OnChange&& on_change) {
    bool stop = false;
    for (const House& house : ALL_HOUSES) {
        Error result = extend<N>(grid, house, DigitSet::full(), DigitSet{}, DigitPositions{}, stop,
                                 on_change);
        if (result != Error::Ok || stop) {
            return result;
        }
    }
    return Error::Ok;
}

} // namespace

template <std::size_t N>
Error HiddenSubset<N>::find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const {
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
Error HiddenSubset<N>::apply(TechniqueGrid& grid, bool& changed) const {
    changed = false;
    auto on_change = [&](const TechniqueGrid&, const DigitPositions&, const DigitSet&) {
        changed = true;
        return false;
    };
    return scan<N>(grid, on_change);
}

template class HiddenSubset<2>;
template class HiddenSubset<3>;
template class HiddenSubset<4>;

} // namespace sudokulogic
