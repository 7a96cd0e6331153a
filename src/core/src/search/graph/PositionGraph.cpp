// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/PositionGraph.h"

#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"

#include <set>

namespace rankflow {
namespace search {

std::vector<std::pair<uint32_t, util::Interned<PositionCondition>>> PositionGraph::buildEdges(
    SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* /*source*/,
    const LocatedQueryTermSubset& dest) {
    std::set<uint16_t> buckets;
    for (WordId word : locatingWords(ctx, dest.termSubset)) {
        for (uint16_t position : ctx.wordPositions(word)) {
            buckets.insert(positionBucket(position));
        }
    }

    const uint32_t len = static_cast<uint32_t>(dest.termIdsLen());
    std::vector<std::pair<uint32_t, util::Interned<PositionCondition>>> edges;
    for (uint16_t bucket : buckets) {
        edges.emplace_back(bucket * len, conditions.insert(PositionCondition{dest, bucket}));
    }
    return edges;
}

ComputedCondition PositionGraph::resolveCondition(SearchContext& ctx,
                                                  const Condition& condition,
                                                  const util::BitSet& universe) {
    ComputedCondition computed;
    computed.docids = computeQueryTermSubsetDocidsWithinPosition(
        ctx, &universe, condition.term.termSubset, condition.position);
    computed.endTermSubset = condition.term;
    return computed;
}

std::string PositionGraph::label(const SearchContext& ctx, const Condition& condition) {
    return condition.term.termSubset.description(ctx) + " : position " +
           std::to_string(condition.position);
}

}  // namespace search
}  // namespace rankflow
