// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/AttributeGraph.h"

#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/graph/TypoGraph.h"

namespace rankflow {
namespace search {

std::vector<std::pair<uint32_t, util::Interned<AttributeCondition>>> AttributeGraph::buildEdges(
    SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* /*source*/,
    const LocatedQueryTermSubset& dest) {
    std::vector<std::pair<uint32_t, util::Interned<AttributeCondition>>> edges;
    const uint32_t baseCost = static_cast<uint32_t>(dest.termIdsLen()) - 1;
    const uint8_t maxTypos = dest.termSubset.maxTypoCost(ctx);

    for (uint8_t nbrTypos = 0; nbrTypos <= maxTypos; nbrTypos++) {
        LocatedQueryTermSubset term = dest;
        keepOnlyTypoLevel(term.termSubset, nbrTypos);
        if (term.termSubset.isEmpty(ctx)) {
            continue;
        }
        edges.emplace_back(baseCost + nbrTypos,
                           conditions.insert(AttributeCondition{std::move(term), nbrTypos}));
    }
    return edges;
}

ComputedCondition AttributeGraph::resolveCondition(SearchContext& ctx,
                                                   const Condition& condition,
                                                   const util::BitSet& universe) {
    // Word lookups of the context are already limited to the searchable fields
    ComputedCondition computed;
    computed.docids = computeQueryTermSubsetDocids(ctx, &universe, condition.term.termSubset);
    computed.endTermSubset = condition.term;
    return computed;
}

std::string AttributeGraph::label(const SearchContext& ctx, const Condition& condition) {
    return condition.term.termSubset.description(ctx) + " : " +
           std::to_string(condition.nbrTypos) + " typo" + (condition.nbrTypos == 1 ? "" : "s");
}

}  // namespace search
}  // namespace rankflow
