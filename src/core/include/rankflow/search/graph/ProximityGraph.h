// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/graph/RankingRuleGraph.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Condition of the proximity graph.
 *
 * Pair: the last word of left and the first word of right are proximity
 * positions apart. Term: right only has to match, anywhere.
 */
struct ProximityCondition {
    enum class Kind : uint8_t { Pair, Term };

    Kind kind = Kind::Term;
    std::optional<LocatedQueryTermSubset> left;
    LocatedQueryTermSubset right;
    uint8_t proximity = 0;

    bool operator==(const ProximityCondition& other) const {
        return kind == other.kind && proximity == other.proximity && left == other.left &&
               right == other.right;
    }
};

struct ProximityConditionHash {
    size_t operator()(const ProximityCondition& condition) const noexcept;
};

/**
 * @brief Proximity criterion.
 *
 * Between two terms covering contiguous positions there is one edge per
 * proximity 1 to MAX_DISTANCE - 1, costing proximity - 1, plus an edge
 * accepting any distance at cost MAX_DISTANCE - 1. Costs are shifted by the
 * number of words merged into the right term. Terms that are not contiguous
 * (after Start, or once the words rule dropped a term in between) get a
 * single any-distance edge.
 */
struct ProximityGraph {
    using Condition = ProximityCondition;
    using ConditionHash = ProximityConditionHash;
    using Interner = util::Interner<Condition, ConditionHash>;

    static constexpr const char* NAME = "proximity";

    static std::vector<std::pair<uint32_t, util::Interned<Condition>>> buildEdges(
        SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* source,
        const LocatedQueryTermSubset& dest);

    static ComputedCondition resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe);

    static std::string label(const SearchContext& ctx, const Condition& condition);
};

}  // namespace search
}  // namespace rankflow
