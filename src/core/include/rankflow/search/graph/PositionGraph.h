// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/graph/RankingRuleGraph.h"

#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

struct PositionCondition {
    LocatedQueryTermSubset term;
    /** Position bucket, see positionBucket() */
    uint16_t position = 0;

    bool operator==(const PositionCondition& other) const {
        return position == other.position && term == other.term;
    }
};

struct PositionConditionHash {
    size_t operator()(const PositionCondition& condition) const noexcept {
        size_t seed = condition.term.hash();
        util::hashCombine(seed, condition.position);
        return seed;
    }
};

/**
 * @brief Position criterion: documents matching a term closer to the start
 * of a field rank first.
 */
struct PositionGraph {
    using Condition = PositionCondition;
    using ConditionHash = PositionConditionHash;
    using Interner = util::Interner<Condition, ConditionHash>;

    static constexpr const char* NAME = "position";

    static std::vector<std::pair<uint32_t, util::Interned<Condition>>> buildEdges(
        SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* source,
        const LocatedQueryTermSubset& dest);

    static ComputedCondition resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe);

    static std::string label(const SearchContext& ctx, const Condition& condition);
};

}  // namespace search
}  // namespace rankflow
