// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace rankflow::util {

/**
 * @brief Growable bit set backed by a uint64_t array.
 *
 * Based on: org.apache.lucene.util.FixedBitSet
 *
 * Used for:
 * - Document id sets (universes, buckets, condition docids)
 * - Sets of interned handles (query nodes, conditions)
 *
 * Design decisions:
 * - Uses 64-bit words for efficient bitwise operations
 * - Grows on insert; operations between sets of different lengths behave as if
 *   the shorter one was padded with zeros
 * - Value semantics: universes are handed down the ranking-rule chain by copy
 * - Iteration is always in ascending order, which gives the final tie-break
 *
 * Performance characteristics:
 * - insert/contains: O(1) amortized
 * - nextSetBit: O(64) average (skips zero words)
 * - cardinality: O(n/64) where n is the highest set bit
 *
 * @note Ghost bits (past the last word in use) are always clear.
 */
class BitSet {
public:
    BitSet() = default;

    /**
     * @brief Creates a BitSet able to hold values below numBits without growing.
     */
    explicit BitSet(size_t numBits);

    BitSet(std::initializer_list<uint32_t> values);

    BitSet(const BitSet&) = default;
    BitSet& operator=(const BitSet&) = default;
    BitSet(BitSet&&) noexcept = default;
    BitSet& operator=(BitSet&&) noexcept = default;

    /**
     * @brief Builds a set from arbitrary (possibly unsorted, duplicated) values.
     */
    [[nodiscard]] static BitSet fromValues(const std::vector<uint32_t>& values);

    /**
     * @brief Builds the set [start, end).
     */
    [[nodiscard]] static BitSet fromRange(uint32_t start, uint32_t end);

    [[nodiscard]] bool contains(size_t index) const noexcept;

    /**
     * @brief Sets the bit at index, growing the storage if needed.
     * @return true if the bit was previously clear
     */
    bool insert(size_t index);

    /**
     * @brief Clears the bit at index.
     * @return true if the bit was previously set
     */
    bool remove(size_t index) noexcept;

    /**
     * @brief Clears all bits (keeps the storage).
     */
    void clear() noexcept;

    /**
     * @brief Returns the number of set bits (population count).
     */
    [[nodiscard]] size_t cardinality() const noexcept;

    [[nodiscard]] size_t size() const noexcept { return cardinality(); }

    [[nodiscard]] bool empty() const noexcept;

    /**
     * @brief Finds the next set bit starting from index (inclusive).
     * @return Index of next set bit, or NO_MORE_BITS if none found
     */
    [[nodiscard]] size_t nextSetBit(size_t index) const noexcept;

    /**
     * @brief Smallest set bit, or NO_MORE_BITS when empty.
     */
    [[nodiscard]] size_t first() const noexcept { return nextSetBit(0); }

    /**
     * @brief this |= other
     */
    void OR(const BitSet& other);

    /**
     * @brief this &= other
     */
    void AND(const BitSet& other) noexcept;

    /**
     * @brief this &= ~other
     */
    void ANDNOT(const BitSet& other) noexcept;

    [[nodiscard]] bool intersects(const BitSet& other) const noexcept;

    [[nodiscard]] bool isSubsetOf(const BitSet& other) const noexcept;

    [[nodiscard]] bool isDisjoint(const BitSet& other) const noexcept { return !intersects(other); }

    /**
     * @brief Values in ascending order.
     */
    [[nodiscard]] std::vector<uint32_t> toVector() const;

    template<typename Fn>
    void forEach(Fn&& fn) const {
        for (size_t w = 0; w < bits_.size(); w++) {
            uint64_t word = bits_[w];
            while (word != 0) {
                const int bit = std::countr_zero(word);
                fn(static_cast<uint32_t>((w << 6) + bit));
                word &= word - 1;
            }
        }
    }

    BitSet& operator|=(const BitSet& other) {
        OR(other);
        return *this;
    }
    BitSet& operator&=(const BitSet& other) noexcept {
        AND(other);
        return *this;
    }
    BitSet& operator-=(const BitSet& other) noexcept {
        ANDNOT(other);
        return *this;
    }

    friend BitSet operator|(BitSet a, const BitSet& b) {
        a.OR(b);
        return a;
    }
    friend BitSet operator&(BitSet a, const BitSet& b) {
        a.AND(b);
        return a;
    }
    friend BitSet operator-(BitSet a, const BitSet& b) {
        a.ANDNOT(b);
        return a;
    }

    /**
     * @brief Set equality; trailing zero words are ignored.
     */
    bool operator==(const BitSet& other) const noexcept;
    bool operator!=(const BitSet& other) const noexcept { return !(*this == other); }

    // Static utility methods

    /**
     * @brief Computes the number of 64-bit words needed for numBits.
     */
    [[nodiscard]] static constexpr size_t bits2words(size_t numBits) noexcept {
        return numBits == 0 ? 0 : ((numBits - 1) >> 6) + 1;
    }

    /**
     * @brief Sentinel value indicating no more set bits.
     */
    static constexpr size_t NO_MORE_BITS = static_cast<size_t>(-1);

private:
    std::vector<uint64_t> bits_;

    void ensureCapacity(size_t numBits);
    void trim() noexcept;
};

}  // namespace rankflow::util
