// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/QueryGraph.h"
#include "rankflow/util/BitSet.h"

#include <cstdint>
#include <optional>
#include <string>

namespace rankflow {
namespace search {

class SearchContext;
class SearchLogger;

/**
 * @brief A bucket produced by a ranking rule.
 */
struct RankingRuleOutput {
    /** Residual query graph handed to the next rule */
    QueryGraph query;

    /** Documents of the bucket, a subset of the universe */
    util::BitSet candidates;

    /** Cost of the bucket for this rule; non-decreasing across buckets */
    uint64_t cost = 0;
};

/**
 * @brief A criterion splitting a universe into ordered buckets.
 *
 * Lifecycle, driven by bucketSort():
 * ```
 * startIteration(universe, query)
 * while (auto bucket = nextBucket(universe')) { ... }   // universe' shrinks
 * endIteration()
 * ```
 * The buckets returned between startIteration() and endIteration() are
 * pairwise disjoint, best first, and together cover the universe given to
 * startIteration(). nextBucket() returns nullopt once the rule is exhausted.
 * A rule can be restarted with startIteration() after endIteration().
 */
class RankingRule {
public:
    virtual ~RankingRule() = default;

    /**
     * Name of the rule, as used in logs.
     */
    virtual std::string id() const = 0;

    virtual void startIteration(SearchContext& ctx, SearchLogger& logger,
                                const util::BitSet& universe, const QueryGraph& query) = 0;

    /**
     * @param universe the documents of the parent bucket not returned yet
     */
    virtual std::optional<RankingRuleOutput> nextBucket(SearchContext& ctx, SearchLogger& logger,
                                                        const util::BitSet& universe) = 0;

    /**
     * Releases the iteration state. Calling it twice is harmless.
     */
    virtual void endIteration(SearchContext& ctx, SearchLogger& logger) = 0;
};

}  // namespace search
}  // namespace rankflow
