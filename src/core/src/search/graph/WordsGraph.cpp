// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/WordsGraph.h"

#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"

namespace rankflow {
namespace search {

std::vector<std::pair<uint32_t, util::Interned<WordsCondition>>> WordsGraph::buildEdges(
    SearchContext& /*ctx*/, Interner& conditions, const LocatedQueryTermSubset* /*source*/,
    const LocatedQueryTermSubset& dest) {
    return {{0, conditions.insert(WordsCondition{dest})}};
}

ComputedCondition WordsGraph::resolveCondition(SearchContext& ctx, const Condition& condition,
                                               const util::BitSet& universe) {
    ComputedCondition computed;
    computed.docids = computeQueryTermSubsetDocids(ctx, &universe, condition.term.termSubset);
    computed.endTermSubset = condition.term;
    return computed;
}

std::string WordsGraph::label(const SearchContext& ctx, const Condition& condition) {
    return condition.term.termSubset.description(ctx);
}

}  // namespace search
}  // namespace rankflow
