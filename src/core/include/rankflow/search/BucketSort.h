// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/QueryGraph.h"
#include "rankflow/search/rules/RankingRule.h"
#include "rankflow/util/BitSet.h"
#include "rankflow/util/TimeBudget.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rankflow {
namespace search {

class SearchContext;
class SearchLogger;

/**
 * @brief A bucket of the first ranking rule that contributed results.
 */
struct OutermostBucket {
    util::BitSet candidates;

    /** Index in BucketSortOutput::docids of the first result of the bucket */
    size_t firstResult = 0;

    size_t resultCount = 0;
};

struct BucketSortOutput {
    /** The requested page of results, best first */
    std::vector<uint32_t> docids;

    /** The universe minus the documents removed by distinct, the total number of hits */
    util::BitSet allCandidates;

    std::vector<OutermostBucket> buckets;
};

/**
 * @brief Ranks the universe with a chain of ranking rules and returns the
 * results [from, from + length).
 *
 * Each bucket of rule i is refined by rule i + 1, depth first, until the
 * last rule is reached or the bucket holds at most one document. Buckets
 * that end before `from` are skipped without being refined. Documents
 * still tied after the last rule are ordered by ascending id.
 *
 * The time budget is checked before every nextBucket() call.
 *
 * With a distinct field, each bucket about to reach the results keeps, in
 * ascending id order, only the first document of every value of the field.
 * The documents sharing a value with a kept document are removed from the
 * bucket, from every pending universe and from allCandidates. This happens
 * before the offset is applied, so skipped pages are deduplicated too.
 *
 * @throws SearchTimedOutException when the budget is exhausted or cancelled
 */
BucketSortOutput bucketSort(SearchContext& ctx, std::vector<std::unique_ptr<RankingRule>>& rules,
                            const QueryGraph& query, const util::BitSet& universe, size_t from,
                            size_t length, SearchLogger& logger,
                            const util::TimeBudget& timeBudget = util::TimeBudget::unlimited(),
                            const std::optional<std::string>& distinct = std::nullopt);

}  // namespace search
}  // namespace rankflow
