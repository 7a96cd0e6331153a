// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/index/IndexSource.h"
#include "rankflow/search/graph/RankingRuleGraph.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Condition of the fid graph: the term matches in field fid. No fid
 * marks the artificial condition matching nothing.
 */
struct FidCondition {
    LocatedQueryTermSubset term;
    std::optional<index::FieldId> fid;

    bool operator==(const FidCondition& other) const {
        return fid == other.fid && term == other.term;
    }
};

struct FidConditionHash {
    size_t operator()(const FidCondition& condition) const noexcept {
        size_t seed = condition.term.hash();
        util::hashCombine(seed, condition.fid ? *condition.fid + 1u : 0u);
        return seed;
    }
};

/**
 * @brief Fid criterion: documents matching a term in a more important
 * searchable field rank first.
 *
 * One edge per field the term's words occur in, costing the field weight
 * times the number of words the term covers.
 */
struct FidGraph {
    using Condition = FidCondition;
    using ConditionHash = FidConditionHash;
    using Interner = util::Interner<Condition, ConditionHash>;

    static constexpr const char* NAME = "fid";

    /**
     * @throws InternalException(FieldIdMapMissingEntry) if a word occurs in a
     *         field without weight
     */
    static std::vector<std::pair<uint32_t, util::Interned<Condition>>> buildEdges(
        SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* source,
        const LocatedQueryTermSubset& dest);

    static ComputedCondition resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe);

    static std::string label(const SearchContext& ctx, const Condition& condition);
};

}  // namespace search
}  // namespace rankflow
