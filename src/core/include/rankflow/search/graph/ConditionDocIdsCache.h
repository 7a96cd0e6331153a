// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/observability/Metrics.h"
#include "rankflow/search/graph/RankingRuleGraph.h"
#include "rankflow/util/BitSet.h"

#include <map>
#include <memory>
#include <utility>

namespace rankflow {
namespace search {

/**
 * @brief Memoizes the documents of each condition of one ranking rule graph.
 *
 * A condition is resolved against the index once per cache. Later requests
 * with a smaller universe narrow the cached set in place; universes never
 * grow during one search, so the cached set stays a subset of the last
 * universe it was asked for.
 */
template<typename G>
class ConditionDocIdsCache {
public:
    using Graph = RankingRuleGraph<G>;
    using ConditionId = typename Graph::ConditionId;

    ConditionDocIdsCache()
        : resolved_(observability::MetricsRegistry::instance().getCounter(
              observability::metric_names::CONDITIONS_RESOLVED))
        , hits_(observability::MetricsRegistry::instance().getCounter(
              observability::metric_names::CONDITIONS_CACHE_HITS))
        , narrowed_(observability::MetricsRegistry::instance().getCounter(
              observability::metric_names::CONDITIONS_NARROWED)) {}

    const ComputedCondition& getComputedCondition(SearchContext& ctx, ConditionId condition,
                                                  const Graph& graph,
                                                  const util::BitSet& universe) {
        const size_t universeLen = universe.cardinality();
        auto it = cache_.find(condition);
        if (it != cache_.end()) {
            ComputedCondition& computed = it->second;
            if (computed.universeLen == universeLen) {
                hits_->inc();
            } else {
                computed.docids &= universe;
                computed.universeLen = universeLen;
                narrowed_->inc();
            }
            return computed;
        }

        ComputedCondition computed =
            G::resolveCondition(ctx, graph.conditions.get(condition), universe);
        computed.universeLen = universeLen;
        resolved_->inc();
        return cache_.emplace(condition, std::move(computed)).first->second;
    }

    /**
     * @brief The term subsets selected by a resolved condition.
     * @throws InternalException(InvariantViolation) if it was never resolved
     */
    std::pair<const std::optional<LocatedQueryTermSubset>&, const LocatedQueryTermSubset&>
    getSubsetsUsedByCondition(ConditionId condition) const {
        auto it = cache_.find(condition);
        if (it == cache_.end()) {
            throw InternalException(InternalErrorCode::InvariantViolation,
                                    "Condition " + std::to_string(condition.raw()) +
                                        " used before being resolved");
        }
        return {it->second.startTermSubset, it->second.endTermSubset};
    }

    size_t size() const { return cache_.size(); }

private:
    std::map<ConditionId, ComputedCondition> cache_;

    std::shared_ptr<observability::Counter> resolved_;
    std::shared_ptr<observability::Counter> hits_;
    std::shared_ptr<observability::Counter> narrowed_;
};

}  // namespace search
}  // namespace rankflow
