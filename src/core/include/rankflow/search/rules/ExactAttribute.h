// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/rules/RankingRule.h"

#include <optional>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Promotes documents having a searchable field that is, or starts
 * with, the query.
 *
 * Buckets, best first:
 * 0. a field holds exactly the exact words of the query, in query order
 * 1. a field starts with them
 * 2. everything else
 *
 * The words are the exact forms (original word or quoted phrase) of the
 * query graph's terms. When a term has no exact form, or the remaining term
 * ids do not form a sequence starting at 0, the whole universe is a single
 * bucket. The query graph is passed through unchanged.
 */
class ExactAttributeRule : public RankingRule {
public:
    std::string id() const override { return "exact_attribute"; }

    void startIteration(SearchContext& ctx, SearchLogger& logger, const util::BitSet& universe,
                        const QueryGraph& query) override;

    std::optional<RankingRuleOutput> nextBucket(SearchContext& ctx, SearchLogger& logger,
                                                const util::BitSet& universe) override;

    void endIteration(SearchContext& ctx, SearchLogger& logger) override;

private:
    struct State {
        QueryGraph query;
        std::vector<util::BitSet> buckets;
        size_t next = 0;
    };
    std::optional<State> state_;
};

}  // namespace search
}  // namespace rankflow
