// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/TypoGraph.h"

#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"

namespace rankflow {
namespace search {

void keepOnlyTypoLevel(QueryTermSubset& subset, uint8_t nbrTypos) {
    switch (nbrTypos) {
        case 0:
            subset.clearOneTypoSubset();
            subset.clearTwoTypoSubset();
            break;
        case 1:
            subset.clearZeroTypoSubset();
            subset.clearTwoTypoSubset();
            break;
        case 2:
            subset.clearZeroTypoSubset();
            subset.clearOneTypoSubset();
            break;
        default:
            throw InternalException(InternalErrorCode::InvariantViolation,
                                    "No typo level " + std::to_string(nbrTypos));
    }
}

std::vector<std::pair<uint32_t, util::Interned<TypoCondition>>> TypoGraph::buildEdges(
    SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* /*source*/,
    const LocatedQueryTermSubset& dest) {
    std::vector<std::pair<uint32_t, util::Interned<TypoCondition>>> edges;
    const uint32_t baseCost = static_cast<uint32_t>(dest.termIdsLen()) - 1;
    const uint8_t maxTypos = dest.termSubset.maxTypoCost(ctx);

    for (uint8_t nbrTypos = 0; nbrTypos <= maxTypos; nbrTypos++) {
        LocatedQueryTermSubset term = dest;
        keepOnlyTypoLevel(term.termSubset, nbrTypos);
        if (term.termSubset.isEmpty(ctx)) {
            continue;
        }
        edges.emplace_back(baseCost + nbrTypos,
                           conditions.insert(TypoCondition{std::move(term), nbrTypos}));
    }
    return edges;
}

ComputedCondition TypoGraph::resolveCondition(SearchContext& ctx, const Condition& condition,
                                              const util::BitSet& universe) {
    ComputedCondition computed;
    computed.docids = computeQueryTermSubsetDocids(ctx, &universe, condition.term.termSubset);
    computed.endTermSubset = condition.term;
    return computed;
}

std::string TypoGraph::label(const SearchContext& ctx, const Condition& condition) {
    return condition.term.termSubset.description(ctx) + " : " +
           std::to_string(condition.nbrTypos) + " typo" + (condition.nbrTypos == 1 ? "" : "s");
}

}  // namespace search
}  // namespace rankflow
