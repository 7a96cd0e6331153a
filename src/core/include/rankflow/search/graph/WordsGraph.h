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
 * @brief Condition of the words graph: the destination term must match.
 */
struct WordsCondition {
    LocatedQueryTermSubset term;

    bool operator==(const WordsCondition& other) const { return term == other.term; }
};

struct WordsConditionHash {
    size_t operator()(const WordsCondition& condition) const noexcept {
        return condition.term.hash();
    }
};

/**
 * @brief Words criterion: every edge costs 0.
 *
 * Ranking comes entirely from the skip edges added by the terms matching
 * strategy: a path that skips terms costs more than one matching them.
 */
struct WordsGraph {
    using Condition = WordsCondition;
    using ConditionHash = WordsConditionHash;
    using Interner = util::Interner<Condition, ConditionHash>;

    static constexpr const char* NAME = "words";

    static std::vector<std::pair<uint32_t, util::Interned<Condition>>> buildEdges(
        SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* source,
        const LocatedQueryTermSubset& dest);

    static ComputedCondition resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe);

    static std::string label(const SearchContext& ctx, const Condition& condition);
};

}  // namespace search
}  // namespace rankflow
