// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/util/Exceptions.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rankflow::util {

/**
 * @brief Small integer handle to a value stored in an Interner.
 *
 * A handle is only meaningful for the interner that issued it. Handles are
 * totally ordered by insertion order, which keeps every ordered container
 * keyed by handles deterministic.
 */
template<typename T>
class Interned {
public:
    Interned() = default;

    explicit constexpr Interned(uint32_t raw) noexcept
        : raw_(raw) {}

    [[nodiscard]] constexpr uint32_t raw() const noexcept { return raw_; }

    constexpr bool operator==(const Interned& other) const noexcept { return raw_ == other.raw_; }
    constexpr bool operator!=(const Interned& other) const noexcept { return raw_ != other.raw_; }
    constexpr bool operator<(const Interned& other) const noexcept { return raw_ < other.raw_; }
    constexpr bool operator>(const Interned& other) const noexcept { return raw_ > other.raw_; }
    constexpr bool operator<=(const Interned& other) const noexcept { return raw_ <= other.raw_; }
    constexpr bool operator>=(const Interned& other) const noexcept { return raw_ >= other.raw_; }

private:
    uint32_t raw_ = 0;
};

/**
 * @brief Append-only deduplicating store.
 *
 * insert() returns the existing handle when an equal value is already
 * present, otherwise it stores a copy and returns a handle equal to the
 * previous size. Values are never removed; the whole interner is dropped at
 * the end of the search request that owns it.
 *
 * Not thread-safe for writes.
 */
template<typename T, typename Hash = std::hash<T>>
class Interner {
public:
    Interner() = default;

    Interned<T> insert(const T& value) {
        auto it = lookup_.find(value);
        if (it != lookup_.end()) {
            return Interned<T>(it->second);
        }
        const auto raw = static_cast<uint32_t>(values_.size());
        values_.push_back(value);
        lookup_.emplace(value, raw);
        return Interned<T>(raw);
    }

    Interned<T> insert(T&& value) {
        auto it = lookup_.find(value);
        if (it != lookup_.end()) {
            return Interned<T>(it->second);
        }
        const auto raw = static_cast<uint32_t>(values_.size());
        lookup_.emplace(value, raw);
        values_.push_back(std::move(value));
        return Interned<T>(raw);
    }

    /**
     * @brief Returns the handle of value if it was interned before.
     */
    [[nodiscard]] bool find(const T& value, Interned<T>& out) const {
        auto it = lookup_.find(value);
        if (it == lookup_.end()) {
            return false;
        }
        out = Interned<T>(it->second);
        return true;
    }

    /**
     * @throws InternalException if the handle was not issued by this interner
     */
    const T& get(Interned<T> handle) const {
        if (handle.raw() >= values_.size()) {
            throw InternalException(InternalErrorCode::InvalidInternedHandle,
                                    "Interned handle " + std::to_string(handle.raw()) +
                                        " out of range (size " +
                                        std::to_string(values_.size()) + ")");
        }
        return values_[handle.raw()];
    }

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }

    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

private:
    std::vector<T> values_;
    std::unordered_map<T, uint32_t, Hash> lookup_;
};

/**
 * @brief Append-only store without deduplication.
 *
 * Used for values that are unique by construction (query terms built once
 * per query position) and whose equality would be costly to compute.
 * getMut() allows lazily completed values.
 */
template<typename T>
class FixedInterner {
public:
    Interned<T> push(T value) {
        const auto raw = static_cast<uint32_t>(values_.size());
        values_.push_back(std::move(value));
        return Interned<T>(raw);
    }

    const T& get(Interned<T> handle) const {
        check(handle);
        return values_[handle.raw()];
    }

    T& getMut(Interned<T> handle) {
        check(handle);
        return values_[handle.raw()];
    }

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }

private:
    void check(Interned<T> handle) const {
        if (handle.raw() >= values_.size()) {
            throw InternalException(InternalErrorCode::InvalidInternedHandle,
                                    "Interned handle " + std::to_string(handle.raw()) +
                                        " out of range (size " +
                                        std::to_string(values_.size()) + ")");
        }
    }

    std::vector<T> values_;
};

/**
 * @brief Mixes a hash into a seed (boost::hash_combine constants).
 */
inline void hashCombine(size_t& seed, size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace rankflow::util

namespace std {
template<typename T>
struct hash<rankflow::util::Interned<T>> {
    size_t operator()(const rankflow::util::Interned<T>& handle) const noexcept {
        return std::hash<uint32_t>()(handle.raw());
    }
};
}  // namespace std
