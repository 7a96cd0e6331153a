// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/index/IndexSource.h"
#include "rankflow/search/BucketSort.h"
#include "rankflow/search/SearchConfig.h"
#include "rankflow/util/BitSet.h"

#include <cstdint>
#include <vector>

namespace rankflow {
namespace search {

class SearchContext;

/**
 * @brief Results of one search.
 */
struct SearchResult {
    /** The requested page, best first */
    std::vector<uint32_t> documentIds;

    /** Every document matching the query and the filter */
    util::BitSet candidates;

    /** Outermost buckets the page was taken from */
    std::vector<OutermostBucket> buckets;
};

/**
 * @brief Executes a search request against an index snapshot.
 *
 * Steps:
 * 1. Evaluate the filter, if any, into the initial universe
 * 2. Tokenize the query; negated words and phrases leave the universe
 * 3. Build the query graph and keep the documents matching it once the
 *    terms matching strategy removed every removable term
 * 4. Rank the universe with the configured ranking rules
 *
 * A query without words is a placeholder search: only boost and sort rules
 * apply and documents are otherwise returned by ascending id.
 *
 * Usage:
 * ```cpp
 * MemoryIndex index = ...;
 * SearchConfig config;
 * config.query = "hello world";
 * SearchResult result = Search(index, config).execute();
 * ```
 *
 * @note Not thread-safe; run one Search per thread. The index must not
 * change while a search runs.
 */
class Search {
public:
    Search(const index::IndexSource& index, SearchConfig config);

    /**
     * @throws UserException for invalid filters, ranking rules, sorts,
     *         distinct fields or searchable attributes and for queries over
     *         the complexity limits
     * @throws SearchTimedOutException when the time budget runs out
     */
    SearchResult execute();

private:
    util::BitSet initialUniverse();
    void restrictSearchableAttributes(SearchContext& ctx);
    void checkDistinctAttribute() const;

    const index::IndexSource& index_;
    SearchConfig config_;
};

}  // namespace search
}  // namespace rankflow
