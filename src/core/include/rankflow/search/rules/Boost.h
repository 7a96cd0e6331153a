// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/filter/Filter.h"
#include "rankflow/search/rules/RankingRule.h"

#include <optional>
#include <string>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Promotes the documents matching each filter, in filter order.
 *
 * The first bucket holds the universe documents matching the first filter,
 * the next one those matching the second filter and not the first, and so
 * on; the documents matching no filter come last. Empty buckets are
 * skipped. The query graph is passed through unchanged.
 *
 * Filters are evaluated against the whole index at every startIteration().
 */
class FilterBoostingRule : public RankingRule {
public:
    FilterBoostingRule(std::string id, std::vector<filter::Filter> filters);

    std::string id() const override { return id_; }

    void startIteration(SearchContext& ctx, SearchLogger& logger, const util::BitSet& universe,
                        const QueryGraph& query) override;

    std::optional<RankingRuleOutput> nextBucket(SearchContext& ctx, SearchLogger& logger,
                                                const util::BitSet& universe) override;

    void endIteration(SearchContext& ctx, SearchLogger& logger) override;

private:
    std::string id_;
    std::vector<filter::Filter> filters_;

    struct State {
        QueryGraph query;
        /** Matches of each filter, then everything */
        std::vector<util::BitSet> buckets;
        size_t next = 0;
    };
    std::optional<State> state_;
};

/**
 * @brief Two buckets: the documents matching the filter, then the others.
 *
 * Identified as `boost:<filter>` in logs.
 */
class BoostRule : public FilterBoostingRule {
public:
    explicit BoostRule(filter::Filter filter);
};

}  // namespace search
}  // namespace rankflow
