// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/rules/RankingRule.h"

#include <optional>
#include <string>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Orders the universe by the facet values of one field.
 *
 * One bucket per distinct value: numeric values first, then string values,
 * each ascending (or both descending when ascending is false). A document
 * holding several values lands in the bucket of its best one. Documents
 * without a value for the field form the last bucket. Empty buckets are
 * skipped and the query graph is passed through unchanged.
 *
 * Identified as `<field>:asc` or `<field>:desc` in logs.
 */
class SortRule : public RankingRule {
public:
    SortRule(std::string field, bool ascending);

    std::string id() const override;

    void startIteration(SearchContext& ctx, SearchLogger& logger, const util::BitSet& universe,
                        const QueryGraph& query) override;

    std::optional<RankingRuleOutput> nextBucket(SearchContext& ctx, SearchLogger& logger,
                                                const util::BitSet& universe) override;

    void endIteration(SearchContext& ctx, SearchLogger& logger) override;

private:
    std::string field_;
    bool ascending_;

    struct State {
        QueryGraph query;
        /** Documents of each value in sort order, then those without one */
        std::vector<util::BitSet> buckets;
        size_t next = 0;
    };
    std::optional<State> state_;
};

}  // namespace search
}  // namespace rankflow
