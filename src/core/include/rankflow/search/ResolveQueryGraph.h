// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/index/IndexSource.h"
#include "rankflow/search/QueryGraph.h"
#include "rankflow/search/QueryTerm.h"
#include "rankflow/util/BitSet.h"

#include <set>

namespace rankflow {
namespace search {

class SearchContext;

/**
 * @brief Documents matching any selected derivation of a term subset.
 * @param universe restricts the result when not null
 */
util::BitSet computeQueryTermSubsetDocids(SearchContext& ctx, const util::BitSet* universe,
                                          const QueryTermSubset& subset);

/**
 * @brief Words whose fields and positions locate the matches of a subset:
 * its single words, the expansions of its prefix and the first word of
 * each phrase.
 */
std::set<WordId> locatingWords(SearchContext& ctx, const QueryTermSubset& subset);

/**
 * @brief Same as computeQueryTermSubsetDocids, counting only matches in field fid.
 */
util::BitSet computeQueryTermSubsetDocidsWithinFieldId(SearchContext& ctx,
                                                       const util::BitSet* universe,
                                                       const QueryTermSubset& subset,
                                                       index::FieldId fid);

/**
 * @brief Same as computeQueryTermSubsetDocids, counting only matches at a
 * position of the given bucket (see positionBucket()).
 */
util::BitSet computeQueryTermSubsetDocidsWithinPosition(SearchContext& ctx,
                                                        const util::BitSet* universe,
                                                        const QueryTermSubset& subset,
                                                        uint16_t bucket);

/**
 * @brief Documents of universe matching at least one Start-to-End path.
 *
 * Nodes are resolved in topological order; each node only considers the
 * documents matched by some path leading to it.
 *
 * @throws InternalException(InvariantViolation) if End is unreachable
 */
util::BitSet computeQueryGraphDocids(SearchContext& ctx, const QueryGraph& graph,
                                     const util::BitSet& universe);

/**
 * @brief Positions 0 to 15 are their own bucket; larger positions fall in
 * the bucket of the highest power of two not above them.
 */
uint16_t positionBucket(uint16_t position);

}  // namespace search
}  // namespace rankflow
