// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/ExactnessGraph.h"

#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"

namespace rankflow {
namespace search {

std::vector<std::pair<uint32_t, util::Interned<ExactnessCondition>>> ExactnessGraph::buildEdges(
    SearchContext& ctx, Interner& conditions, const LocatedQueryTermSubset* /*source*/,
    const LocatedQueryTermSubset& dest) {
    std::vector<std::pair<uint32_t, util::Interned<ExactnessCondition>>> edges;

    // Ngrams have no exact form
    if (dest.termSubset.exactTerm(ctx)) {
        LocatedQueryTermSubset exact = dest;
        exact.termSubset.keepOnlyExactTerm(ctx);
        if (!exact.termSubset.isEmpty(ctx)) {
            edges.emplace_back(0, conditions.insert(ExactnessCondition{
                                      ExactnessCondition::Kind::ExactInAttribute, exact}));
        }
    }
    edges.emplace_back(static_cast<uint32_t>(dest.termIdsLen()),
                       conditions.insert(ExactnessCondition{ExactnessCondition::Kind::Any, dest}));
    return edges;
}

ComputedCondition ExactnessGraph::resolveCondition(SearchContext& ctx,
                                                   const Condition& condition,
                                                   const util::BitSet& universe) {
    ComputedCondition computed;
    computed.docids = computeQueryTermSubsetDocids(ctx, &universe, condition.term.termSubset);
    computed.endTermSubset = condition.term;
    return computed;
}

std::string ExactnessGraph::label(const SearchContext& ctx, const Condition& condition) {
    const std::string term = condition.term.termSubset.description(ctx);
    return condition.kind == ExactnessCondition::Kind::ExactInAttribute ? term + " : exact"
                                                                        : term + " : any";
}

}  // namespace search
}  // namespace rankflow
