// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/util/BitSet.h"

#include <algorithm>
#include <bit>

namespace rankflow::util {

BitSet::BitSet(size_t numBits)
    : bits_(bits2words(numBits), 0) {}

BitSet::BitSet(std::initializer_list<uint32_t> values) {
    for (uint32_t v : values) {
        insert(v);
    }
}

BitSet BitSet::fromValues(const std::vector<uint32_t>& values) {
    BitSet result;
    if (!values.empty()) {
        result.ensureCapacity(static_cast<size_t>(*std::max_element(values.begin(), values.end())) + 1);
    }
    for (uint32_t v : values) {
        result.insert(v);
    }
    return result;
}

BitSet BitSet::fromRange(uint32_t start, uint32_t end) {
    BitSet result(end);
    for (uint32_t v = start; v < end; v++) {
        result.insert(v);
    }
    return result;
}

void BitSet::ensureCapacity(size_t numBits) {
    const size_t words = bits2words(numBits);
    if (words > bits_.size()) {
        bits_.resize(std::max(words, bits_.size() * 2), 0);
    }
}

void BitSet::trim() noexcept {
    while (!bits_.empty() && bits_.back() == 0) {
        bits_.pop_back();
    }
}

bool BitSet::contains(size_t index) const noexcept {
    const size_t wordIndex = index >> 6;  // index / 64
    if (wordIndex >= bits_.size()) {
        return false;
    }
    const size_t bitIndex = index & 63;   // index % 64
    return (bits_[wordIndex] & (1ULL << bitIndex)) != 0;
}

bool BitSet::insert(size_t index) {
    ensureCapacity(index + 1);
    const size_t wordIndex = index >> 6;
    const uint64_t mask = 1ULL << (index & 63);
    const bool previous = (bits_[wordIndex] & mask) != 0;
    bits_[wordIndex] |= mask;
    return !previous;
}

bool BitSet::remove(size_t index) noexcept {
    const size_t wordIndex = index >> 6;
    if (wordIndex >= bits_.size()) {
        return false;
    }
    const uint64_t mask = 1ULL << (index & 63);
    const bool previous = (bits_[wordIndex] & mask) != 0;
    bits_[wordIndex] &= ~mask;
    return previous;
}

void BitSet::clear() noexcept {
    std::fill(bits_.begin(), bits_.end(), 0);
}

size_t BitSet::cardinality() const noexcept {
    size_t count = 0;
    for (uint64_t word : bits_) {
        count += std::popcount(word);
    }
    return count;
}

bool BitSet::empty() const noexcept {
    for (uint64_t word : bits_) {
        if (word != 0) {
            return false;
        }
    }
    return true;
}

size_t BitSet::nextSetBit(size_t index) const noexcept {
    size_t wordIndex = index >> 6;
    if (wordIndex >= bits_.size()) {
        return NO_MORE_BITS;
    }

    // Check remaining bits in current word
    uint64_t word = bits_[wordIndex] >> (index & 63);
    if (word != 0) {
        return index + std::countr_zero(word);
    }

    // Scan subsequent words
    for (wordIndex++; wordIndex < bits_.size(); wordIndex++) {
        word = bits_[wordIndex];
        if (word != 0) {
            return (wordIndex << 6) + std::countr_zero(word);
        }
    }

    return NO_MORE_BITS;
}

void BitSet::OR(const BitSet& other) {
    if (other.bits_.size() > bits_.size()) {
        bits_.resize(other.bits_.size(), 0);
    }
    for (size_t i = 0; i < other.bits_.size(); i++) {
        bits_[i] |= other.bits_[i];
    }
}

void BitSet::AND(const BitSet& other) noexcept {
    const size_t minWords = std::min(bits_.size(), other.bits_.size());
    for (size_t i = 0; i < minWords; i++) {
        bits_[i] &= other.bits_[i];
    }
    // Clear remaining words
    for (size_t i = minWords; i < bits_.size(); i++) {
        bits_[i] = 0;
    }
    trim();
}

void BitSet::ANDNOT(const BitSet& other) noexcept {
    const size_t minWords = std::min(bits_.size(), other.bits_.size());
    for (size_t i = 0; i < minWords; i++) {
        bits_[i] &= ~other.bits_[i];
    }
    trim();
}

bool BitSet::intersects(const BitSet& other) const noexcept {
    const size_t minWords = std::min(bits_.size(), other.bits_.size());
    for (size_t i = 0; i < minWords; i++) {
        if ((bits_[i] & other.bits_[i]) != 0) {
            return true;
        }
    }
    return false;
}

bool BitSet::isSubsetOf(const BitSet& other) const noexcept {
    for (size_t i = 0; i < bits_.size(); i++) {
        const uint64_t theirs = i < other.bits_.size() ? other.bits_[i] : 0;
        if ((bits_[i] & ~theirs) != 0) {
            return false;
        }
    }
    return true;
}

std::vector<uint32_t> BitSet::toVector() const {
    std::vector<uint32_t> values;
    values.reserve(cardinality());
    forEach([&values](uint32_t v) { values.push_back(v); });
    return values;
}

bool BitSet::operator==(const BitSet& other) const noexcept {
    const size_t maxWords = std::max(bits_.size(), other.bits_.size());
    for (size_t i = 0; i < maxWords; i++) {
        const uint64_t mine = i < bits_.size() ? bits_[i] : 0;
        const uint64_t theirs = i < other.bits_.size() ? other.bits_[i] : 0;
        if (mine != theirs) {
            return false;
        }
    }
    return true;
}

}  // namespace rankflow::util
