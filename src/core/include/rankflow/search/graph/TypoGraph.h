// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/graph/RankingRuleGraph.h"

#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Condition of the typo graph: the term restricted to the
 * derivations with exactly nbrTypos typos.
 */
struct TypoCondition {
    LocatedQueryTermSubset term;
    uint8_t nbrTypos = 0;

    bool operator==(const TypoCondition& other) const {
        return nbrTypos == other.nbrTypos && term == other.term;
    }
};

struct TypoConditionHash {
    size_t operator()(const TypoCondition& condition) const noexcept {
        size_t seed = condition.term.hash();
        util::hashCombine(seed, condition.nbrTypos);
        return seed;
    }
};

/**
 * @brief Keeps only the derivations of one typo level in a term subset.
 */
void keepOnlyTypoLevel(QueryTermSubset& subset, uint8_t nbrTypos);

/**
 * @brief Typo criterion.
 *
 * One edge per typo level the term has derivations for, costing the number
 * of typos. Ngrams start at one extra cost per merged word:
 *
 *   sun flower -> sunflower (2-gram): 1 + typos
 */
struct TypoGraph {
    using Condition = TypoCondition;
    using ConditionHash = TypoConditionHash;
    using Interner = util::Interner<Condition, ConditionHash>;

    static constexpr const char* NAME = "typo";

    static std::vector<std::pair<uint32_t, util::Interned<Condition>>> buildEdges(
        SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* source,
        const LocatedQueryTermSubset& dest);

    static ComputedCondition resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe);

    static std::string label(const SearchContext& ctx, const Condition& condition);
};

}  // namespace search
}  // namespace rankflow
