/**
 * @file naked_subset.hpp
 * @brief Naked pairs, triples and quads.
 *
 * N cells of one house whose candidates together hold only N digits must
 * take exactly those digits, so the digits leave every other cell of the
 * house. Fewer than N digits across N cells, or one more cell inside the
 * same digits, is a pigeonhole violation and reported as Error::Inconsistent.
 */

#ifndef SUDOKULOGIC_TECHNIQUE_NAKED_SUBSET_HPP
#define SUDOKULOGIC_TECHNIQUE_NAKED_SUBSET_HPP

#include "../technique.hpp"

namespace sudokulogic {

/**
 * @tparam N Subset size (2, 3 or 4)
 */
template <std::size_t N>
class NakedSubset final : public Technique {
    static_assert(N >= 2 && N <= 4, "naked subsets are pairs, triples or quads");

public:
    static constexpr const char* NAME = N == 2 ? "Naked Pair" : N == 3 ? "Naked Triple" : "Naked Quad";

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
        return std::make_unique<NakedSubset>(*this);
    }

    Error find_step(const TechniqueGrid& grid, std::optional<TechniqueStep>& step) const override;
    Error apply(TechniqueGrid& grid, bool& changed) const override;
};

extern template class NakedSubset<2>;
extern template class NakedSubset<3>;
extern template class NakedSubset<4>;

using NakedPair = NakedSubset<2>;
using NakedTriple = NakedSubset<3>;
using NakedQuad = NakedSubset<4>;

} // namespace sudokulogic

#endif // SUDOKULOGIC_TECHNIQUE_NAKED_SUBSET_HPP
