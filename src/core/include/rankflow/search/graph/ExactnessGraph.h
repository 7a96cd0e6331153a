// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/graph/RankingRuleGraph.h"

#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

struct ExactnessCondition {
    enum class Kind : uint8_t {
        /** Only the exact original word or phrase */
        ExactInAttribute,
        /** Any derivation */
        Any
    };

    Kind kind = Kind::Any;
    LocatedQueryTermSubset term;

    bool operator==(const ExactnessCondition& other) const {
        return kind == other.kind && term == other.term;
    }
};

struct ExactnessConditionHash {
    size_t operator()(const ExactnessCondition& condition) const noexcept {
        size_t seed = condition.term.hash();
        util::hashCombine(seed, static_cast<size_t>(condition.kind));
        return seed;
    }
};

/**
 * @brief Exactness criterion: the exact query words rank before their
 * derivations.
 */
struct ExactnessGraph {
    using Condition = ExactnessCondition;
    using ConditionHash = ExactnessConditionHash;
    using Interner = util::Interner<Condition, ConditionHash>;

    static constexpr const char* NAME = "exactness";

    static std::vector<std::pair<uint32_t, util::Interned<Condition>>> buildEdges(
        SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* source,
        const LocatedQueryTermSubset& dest);

    static ComputedCondition resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe);

    static std::string label(const SearchContext& ctx, const Condition& condition);
};

}  // namespace search
}  // namespace rankflow
