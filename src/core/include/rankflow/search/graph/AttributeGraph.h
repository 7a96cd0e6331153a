// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/graph/RankingRuleGraph.h"

#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

struct AttributeCondition {
    LocatedQueryTermSubset term;
    uint8_t nbrTypos = 0;

    bool operator==(const AttributeCondition& other) const {
        return nbrTypos == other.nbrTypos && term == other.term;
    }
};

struct AttributeConditionHash {
    size_t operator()(const AttributeCondition& condition) const noexcept {
        size_t seed = condition.term.hash();
        util::hashCombine(seed, condition.nbrTypos);
        util::hashCombine(seed, 0x61);
        return seed;
    }
};

/**
 * @brief Attribute criterion, first stage.
 *
 * Costs follow the typo criterion (typos plus the ngram base cost) but
 * matches only count inside the searchable fields of the search. The
 * per-field weight ordering is applied by the Fid and Position rules the
 * `attribute` criterion expands to.
 */
struct AttributeGraph {
    using Condition = AttributeCondition;
    using ConditionHash = AttributeConditionHash;
    using Interner = util::Interner<Condition, ConditionHash>;

    static constexpr const char* NAME = "attribute";

    static std::vector<std::pair<uint32_t, util::Interned<Condition>>> buildEdges(
        SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* source,
        const LocatedQueryTermSubset& dest);

    static ComputedCondition resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe);

    static std::string label(const SearchContext& ctx, const Condition& condition);
};

}  // namespace search
}  // namespace rankflow
