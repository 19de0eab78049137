/**
 * @file bitset.hpp
 * @brief Fixed-width bit set with value semantics.
 *
 * This module provides the packed set representation used for every
 * candidate computation in the engine. A BitSet is parameterised by a
 * "semantics" type that maps a domain value (digit, board position, in-house
 * cell index) to a bit index and back, so the same storage and set algebra
 * serve digit sets (9 bits), house masks (9 bits) and board-wide position
 * sets (81 bits).
 *
 * @par Bit Numbering Convention
 * - Bit 0 is the least significant bit of word 0
 * - Iteration always visits set bits in ascending index order
 *
 * @par Semantics Requirements
 * @code
 * struct MySemantics {
 *     using value_type = ...;
 *     static constexpr std::size_t to_index(value_type value) noexcept;
 *     static constexpr value_type from_index(std::size_t index) noexcept;
 * };
 * @endcode
 */

#ifndef SUDOKULOGIC_BITSET_HPP
#define SUDOKULOGIC_BITSET_HPP

#include <array>
#include <initializer_list>
#include <optional>
#include <utility>

#include "config.hpp"

namespace sudokulogic {

namespace detail {

/**
 * @brief Index of the least significant set bit.
 *
 * @param word Word to inspect (must be non-zero)
 * @return Bit position (0-31)
 */
constexpr int lowest_bit(word_t word) noexcept {
    return __builtin_ctz(word);
}

/**
 * @brief Count the set bits of a word.
 * @param word Word to inspect
 * @return Number of bits set to 1
 */
constexpr std::size_t popcount(word_t word) noexcept {
    return static_cast<std::size_t>(__builtin_popcount(word));
}

} // namespace detail

template <std::size_t N, typename Semantics> class BitSet;

/**
 * @brief Range over (pivot, following) pairs of a BitSet.
 *
 * Each element yields a set member together with the set of members strictly
 * after it. Nesting this range k times visits every k-subset exactly once, in
 * ascending order, which is the enumeration every combination search in the
 * technique library is built on.
 */
template <std::size_t N, typename Semantics> class PivotRange {
public:
    using set_type = BitSet<N, Semantics>;
    using value_type = typename Semantics::value_type;

    class iterator {
    public:
        constexpr iterator() noexcept = default;
        constexpr explicit iterator(set_type remaining) noexcept : remaining_(remaining) {}

        constexpr std::pair<value_type, set_type> operator*() const noexcept {
            set_type following = remaining_;
            value_type pivot = *following.pop_first();
            return {pivot, following};
        }

        constexpr iterator& operator++() noexcept {
            remaining_.pop_first();
            return *this;
        }

        constexpr bool operator==(const iterator& other) const noexcept {
            return remaining_ == other.remaining_;
        }

        constexpr bool operator!=(const iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        set_type remaining_{};
    };

    constexpr explicit PivotRange(set_type set) noexcept : set_(set) {}

    constexpr iterator begin() const noexcept {
        return iterator(set_);
    }

    constexpr iterator end() const noexcept {
        return iterator();
    }

private:
    set_type set_;
};

/**
 * @brief Fixed-width bit set with compile-time size.
 *
 * @tparam N Number of bits in the set
 * @tparam Semantics Mapping between domain values and bit indices
 *
 * Storage is static (no heap allocation) and unused bits of the last word
 * are always kept clear, so cardinality and equality work on raw words.
 */
template <std::size_t N, typename Semantics> class BitSet {
public:
    using value_type = typename Semantics::value_type;
    using semantics_type = Semantics;

    /// Number of 32-bit words needed
    static constexpr std::size_t NUM_WORDS = (N + BITS_PER_WORD - 1) / BITS_PER_WORD;

    /**
     * @brief Forward iterator over set members in ascending order.
     */
    class iterator {
    public:
        constexpr iterator() noexcept = default;
        constexpr explicit iterator(BitSet remaining) noexcept : remaining_(remaining) {}

        constexpr value_type operator*() const noexcept {
            return *remaining_.first();
        }

        constexpr iterator& operator++() noexcept {
            remaining_.pop_first();
            return *this;
        }

        constexpr bool operator==(const iterator& other) const noexcept {
            return remaining_ == other.remaining_;
        }

        constexpr bool operator!=(const iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        BitSet remaining_{};
    };

    /**
     * @brief Default constructor - the empty set.
     */
    constexpr BitSet() noexcept : data_{} {}

    /**
     * @brief Construct from a list of members.
     * @param values Members to insert
     */
    constexpr BitSet(std::initializer_list<value_type> values) noexcept : data_{} {
        for (value_type value : values) {
            insert(value);
        }
    }

    /**
     * @brief Set containing every representable member.
     */
    [[nodiscard]] static constexpr BitSet full() noexcept {
        BitSet set;
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            set.data_[i] = ~word_t{0};
        }
        set.mask_unused_bits();
        return set;
    }

    /**
     * @brief Set containing exactly one member.
     * @param value Member
     */
    [[nodiscard]] static constexpr BitSet from_elem(value_type value) noexcept {
        BitSet set;
        set.insert(value);
        return set;
    }

    /**
     * @brief Build from raw bits (bit i of @p low is bit i of the set).
     *
     * @param low Bits 0-63
     * @param high Bits 64-127
     */
    [[nodiscard]] static constexpr BitSet from_bits(std::uint64_t low,
                                                    std::uint64_t high = 0) noexcept {
        BitSet set;
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            std::uint64_t source = (i < 2) ? low : high;
            std::size_t shift = (i % 2) * BITS_PER_WORD;
            set.data_[i] = static_cast<word_t>(source >> shift);
        }
        set.mask_unused_bits();
        return set;
    }

    /**
     * @brief Get the capacity in bits.
     */
    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return N;
    }

    /**
     * @brief Insert a member.
     * @return true if the member was not present before
     */
    constexpr bool insert(value_type value) noexcept {
        return insert_index(Semantics::to_index(value));
    }

    /**
     * @brief Remove a member.
     * @return true if the member was present before
     */
    constexpr bool remove(value_type value) noexcept {
        return remove_index(Semantics::to_index(value));
    }

    /**
     * @brief Test membership.
     */
    [[nodiscard]] constexpr bool contains(value_type value) const noexcept {
        return contains_index(Semantics::to_index(value));
    }

    /**
     * @brief Insert by raw bit index (ignored when out of range).
     * @return true if the bit was clear before
     */
    constexpr bool insert_index(std::size_t index) noexcept {
        if (index >= N) [[unlikely]]
            return false;
        word_t bit = word_t{1} << (index % BITS_PER_WORD);
        word_t& word = data_[index / BITS_PER_WORD];
        bool inserted = (word & bit) == 0;
        word |= bit;
        return inserted;
    }

    /**
     * @brief Remove by raw bit index (ignored when out of range).
     * @return true if the bit was set before
     */
    constexpr bool remove_index(std::size_t index) noexcept {
        if (index >= N) [[unlikely]]
            return false;
        word_t bit = word_t{1} << (index % BITS_PER_WORD);
        word_t& word = data_[index / BITS_PER_WORD];
        bool removed = (word & bit) != 0;
        word &= ~bit;
        return removed;
    }

    /**
     * @brief Test a raw bit index.
     */
    [[nodiscard]] constexpr bool contains_index(std::size_t index) const noexcept {
        if (index >= N) [[unlikely]]
            return false;
        return ((data_[index / BITS_PER_WORD] >> (index % BITS_PER_WORD)) & 1U) != 0;
    }

    /**
     * @brief Extract up to 32 consecutive bits starting at @p start.
     *
     * @param start First bit index
     * @param count Number of bits (1-32)
     * @return Bits packed from bit 0 upwards
     */
    [[nodiscard]] constexpr word_t bits_at(std::size_t start, std::size_t count) const noexcept {
        std::size_t word_idx = start / BITS_PER_WORD;
        std::size_t offset = start % BITS_PER_WORD;
        std::uint64_t window = data_[word_idx];
        if (word_idx + 1 < NUM_WORDS) {
            window |= static_cast<std::uint64_t>(data_[word_idx + 1]) << BITS_PER_WORD;
        }
        window >>= offset;
        std::uint64_t mask = (count >= 64) ? ~std::uint64_t{0} : ((std::uint64_t{1} << count) - 1U);
        return static_cast<word_t>(window & mask);
    }

    /**
     * @brief Remove every member.
     */
    constexpr void clear() noexcept {
        data_.fill(0);
    }

    /**
     * @brief Count members (Hamming weight).
     */
    [[nodiscard]] constexpr std::size_t size() const noexcept {
        std::size_t count = 0;
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            count += detail::popcount(data_[i]);
        }
        return count;
    }

    /**
     * @brief Test for the empty set.
     */
    [[nodiscard]] constexpr bool empty() const noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            if (data_[i] != 0) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief Smallest member, if any.
     */
    [[nodiscard]] constexpr std::optional<value_type> first() const noexcept {
        if (empty()) {
            return std::nullopt;
        }
        return Semantics::from_index(first_index_unchecked());
    }

    /**
     * @brief Remove and return the smallest member, if any.
     */
    constexpr std::optional<value_type> pop_first() noexcept {
        if (empty()) {
            return std::nullopt;
        }
        return pop_first_unchecked();
    }

    /**
     * @brief The only member, when the set has exactly one.
     */
    [[nodiscard]] constexpr std::optional<value_type> as_single() const noexcept {
        if (size() != 1) {
            return std::nullopt;
        }
        return Semantics::from_index(first_index_unchecked());
    }

    /**
     * @brief The two members in ascending order, when the set has exactly two.
     */
    [[nodiscard]] constexpr std::optional<std::pair<value_type, value_type>>
    as_double() const noexcept {
        if (size() != 2) {
            return std::nullopt;
        }
        BitSet rest = *this;
        value_type a = rest.pop_first_unchecked();
        value_type b = rest.pop_first_unchecked();
        return std::make_pair(a, b);
    }

    /**
     * @brief Members not in @p other.
     */
    [[nodiscard]] constexpr BitSet difference(const BitSet& other) const noexcept {
        BitSet result;
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            result.data_[i] = data_[i] & ~other.data_[i];
        }
        return result;
    }

    [[nodiscard]] constexpr bool is_subset(const BitSet& other) const noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            if ((data_[i] & ~other.data_[i]) != 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] constexpr bool is_superset(const BitSet& other) const noexcept {
        return other.is_subset(*this);
    }

    [[nodiscard]] constexpr bool is_disjoint(const BitSet& other) const noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            if ((data_[i] & other.data_[i]) != 0) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief Iterate (pivot, following) pairs.
     * @see PivotRange
     */
    [[nodiscard]] constexpr PivotRange<N, Semantics> pivots_with_following() const noexcept {
        return PivotRange<N, Semantics>(*this);
    }

    constexpr iterator begin() const noexcept {
        return iterator(*this);
    }

    constexpr iterator end() const noexcept {
        return iterator();
    }

    constexpr BitSet& operator|=(const BitSet& other) noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            data_[i] |= other.data_[i];
        }
        return *this;
    }

    constexpr BitSet& operator&=(const BitSet& other) noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            data_[i] &= other.data_[i];
        }
        return *this;
    }

    constexpr BitSet& operator^=(const BitSet& other) noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            data_[i] ^= other.data_[i];
        }
        return *this;
    }

    [[nodiscard]] constexpr BitSet operator~() const noexcept {
        BitSet result;
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            result.data_[i] = ~data_[i];
        }
        result.mask_unused_bits();
        return result;
    }

    [[nodiscard]] friend constexpr BitSet operator|(BitSet a, const BitSet& b) noexcept {
        a |= b;
        return a;
    }

    [[nodiscard]] friend constexpr BitSet operator&(BitSet a, const BitSet& b) noexcept {
        a &= b;
        return a;
    }

    [[nodiscard]] friend constexpr BitSet operator^(BitSet a, const BitSet& b) noexcept {
        a ^= b;
        return a;
    }

    [[nodiscard]] constexpr bool operator==(const BitSet& other) const noexcept {
        return data_ == other.data_;
    }

    [[nodiscard]] constexpr bool operator!=(const BitSet& other) const noexcept {
        return data_ != other.data_;
    }

    /**
     * @brief Get a raw storage word (for advanced use).
     */
    [[nodiscard]] constexpr word_t word(std::size_t index) const noexcept {
        return data_[index];
    }

private:
    std::array<word_t, NUM_WORDS> data_;

    // Caller guarantees the set is non-empty.
    [[nodiscard]] constexpr std::size_t first_index_unchecked() const noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            if (data_[i] != 0) {
                return i * BITS_PER_WORD + static_cast<std::size_t>(detail::lowest_bit(data_[i]));
            }
        }
        return N;
    }

    constexpr value_type pop_first_unchecked() noexcept {
        for (std::size_t i = 0; i < NUM_WORDS; ++i) {
            if (data_[i] != 0) {
                std::size_t index =
                    i * BITS_PER_WORD + static_cast<std::size_t>(detail::lowest_bit(data_[i]));
                data_[i] &= data_[i] - 1; // Clear LSB
                return Semantics::from_index(index);
            }
        }
        return Semantics::from_index(0);
    }

    constexpr void mask_unused_bits() noexcept {
        constexpr std::size_t extra_bits = (NUM_WORDS * BITS_PER_WORD) - N;
        if constexpr (extra_bits > 0 && NUM_WORDS > 0) {
            word_t mask = ~word_t{0} >> extra_bits;
            data_[NUM_WORDS - 1] &= mask;
        }
    }
};

} // namespace sudokulogic

#endif // SUDOKULOGIC_BITSET_HPP
