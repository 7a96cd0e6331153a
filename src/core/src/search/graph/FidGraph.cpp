// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/FidGraph.h"

#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"

#include <algorithm>
#include <set>

namespace rankflow {
namespace search {

std::vector<std::pair<uint32_t, util::Interned<FidCondition>>> FidGraph::buildEdges(
    SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* /*source*/,
    const LocatedQueryTermSubset& dest) {
    std::set<index::FieldId> fids;
    for (WordId word : locatingWords(ctx, dest.termSubset)) {
        const auto& wordFids = ctx.wordFids(word);
        fids.insert(wordFids.begin(), wordFids.end());
    }

    std::vector<std::pair<uint16_t, index::FieldId>> weighted;
    for (index::FieldId fid : fids) {
        weighted.emplace_back(ctx.fieldWeight(fid), fid);
    }
    std::sort(weighted.begin(), weighted.end());

    const uint32_t len = static_cast<uint32_t>(dest.termIdsLen());
    std::vector<std::pair<uint32_t, util::Interned<FidCondition>>> edges;
    for (const auto& [weight, fid] : weighted) {
        edges.emplace_back(weight * len, conditions.insert(FidCondition{dest, fid}));
    }

    // Keeps a cost above every matched field when less important fields exist
    if (!weighted.empty()) {
        const uint16_t maxWeight = weighted.back().first;
        const auto searchableMax = ctx.maxSearchableWeight();
        if (searchableMax && maxWeight < *searchableMax) {
            edges.emplace_back((maxWeight + 1u) * len,
                               conditions.insert(FidCondition{dest, std::nullopt}));
        }
    }
    return edges;
}

ComputedCondition FidGraph::resolveCondition(SearchContext& ctx, const Condition& condition,
                                             const util::BitSet& universe) {
    ComputedCondition computed;
    computed.endTermSubset = condition.term;
    if (condition.fid) {
        computed.docids = computeQueryTermSubsetDocidsWithinFieldId(
            ctx, &universe, condition.term.termSubset, *condition.fid);
    }
    return computed;
}

std::string FidGraph::label(const SearchContext& ctx, const Condition& condition) {
    const std::string term = condition.term.termSubset.description(ctx);
    if (!condition.fid) {
        return term + " : no field";
    }
    return term + " : in field " + std::to_string(*condition.fid);
}

}  // namespace search
}  // namespace rankflow
