/**
 * @file hidden_subset.hpp
 * @brief Hidden pairs, triples and quads.
 *
 * N digits whose candidate cells in one house span only N cells must
 * occupy those cells, so every other digit leaves them. The pigeonhole
 * checks mirror NakedSubset with the roles of cells and digits swapped.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_HIDDEN_SUBSET_HPP
#define SUDOKULOGIC_TECHNIQUE_HIDDEN_SUBSET_HPP

#include "../technique.hpp"

namespace sudokulogic {

/**
 * @tparam N Subset size (2, 3 or 4)
 */
template <std::size_t N>
class HiddenSubset final : public Technique {
    static_assert(N >= 2 && N <= 4, "hidden subsets are pairs, triples or quads");

public:
    static constexpr const char* NAME =
        N == 2 ? "Hidden Pair" : N == 3 ? "Hidden Triple" : "Hidden Quad";

    [[nodiscard]] const char* name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] TechniqueTier tier() const noexcept override {
        if constexpr (N == 2) {
            return TechniqueTier::Basic;
        } else if constexpr (N == 3) {
            return TechniqueTier::Intermediate;
        } else {
            return TechniqueTier::UpperIntermediate;
        }
    }

    [[nodiscard]] BoxedTechnique clone() const override {
        return std::make_unique<HiddenSubset>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

extern template class HiddenSubset<2>;
extern template class HiddenSubset<3>;
extern template class HiddenSubset<4>;

using HiddenPair = HiddenSubset<2>;
using HiddenTriple = HiddenSubset<3>;
using HiddenQuad = HiddenSubset<4>;

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_HIDDEN_SUBSET_HPP
