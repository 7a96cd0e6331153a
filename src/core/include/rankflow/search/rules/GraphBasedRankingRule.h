// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/SearchConfig.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/SearchLogger.h"
#include "rankflow/search/graph/ConditionDocIdsCache.h"
#include "rankflow/search/graph/DeadEndsCache.h"
#include "rankflow/search/graph/PathVisitor.h"
#include "rankflow/search/graph/RankingRuleGraph.h"
#include "rankflow/search/rules/RankingRule.h"
#include "rankflow/util/SearchProfiler.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Ranking rule walking the graph of criterion G by increasing cost.
 *
 * Each bucket holds the documents of the universe matched by some path of
 * the current cost and not by a cheaper one. Documents no path matches are
 * returned together in a last bucket.
 *
 * With a terms matching strategy (words rule), terms may be skipped at a
 * cost of one per query word, in the order the strategy removes them.
 */
template<typename G>
class GraphBasedRankingRule : public RankingRule {
public:
    using Graph = RankingRuleGraph<G>;
    using Condition = typename G::Condition;
    using ConditionId = typename Graph::ConditionId;

    GraphBasedRankingRule(std::string id, std::optional<TermsMatchingStrategy> strategy)
        : id_(std::move(id))
        , strategy_(strategy) {}

    std::string id() const override { return id_; }

    void startIteration(SearchContext& ctx, SearchLogger& /*logger*/,
                        const util::BitSet& /*universe*/, const QueryGraph& query) override {
        PROFILE_SCOPE("graphRule::startIteration");
        std::vector<NodeRemovalCost> removalCosts;
        if (strategy_) {
            std::vector<util::BitSet> groups;
            switch (*strategy_) {
                case TermsMatchingStrategy::Last: groups = query.removalOrderLast(ctx); break;
                case TermsMatchingStrategy::Frequency:
                    groups = query.removalOrderFrequency(ctx);
                    break;
                case TermsMatchingStrategy::All: break;
            }
            removalCosts.resize(query.size());
            util::BitSet forbidden;
            for (const util::BitSet& group : groups) {
                group.forEach(
                    [&](uint32_t node) { removalCosts[node] = std::make_pair(1u, forbidden); });
                forbidden |= group;
            }
        }

        State state{Graph::build(ctx, query, removalCosts), {}, {}, {}};
        state.allCosts = state.graph.findAllCostsToEnd();
        state_.emplace(std::move(state));
        curCost_ = 0;
    }

    std::optional<RankingRuleOutput> nextBucket(SearchContext& ctx, SearchLogger& logger,
                                                const util::BitSet& universe) override {
        if (!state_) {
            return std::nullopt;
        }
        PROFILE_SCOPE("graphRule::nextBucket");
        State& state = *state_;
        const auto& rootCosts = state.allCosts[state.graph.queryGraph.rootNode()];
        auto next = std::lower_bound(rootCosts.begin(), rootCosts.end(), curCost_);
        if (next == rootCosts.end()) {
            // Whatever no path matched forms the last bucket
            QueryGraph query = state.graph.queryGraph;
            state_.reset();
            if (universe.empty()) {
                return std::nullopt;
            }
            return RankingRuleOutput{std::move(query), universe, curCost_};
        }
        const uint64_t cost = *next;
        curCost_ = cost + 1;

        util::BitSet remaining = universe;
        util::BitSet bucket;
        std::vector<std::vector<ConditionId>> goodPaths;
        util::BitSet nodesWithRemovedConditions;
        std::vector<std::pair<ConditionId, util::BitSet>> subpaths;

        PathVisitor<G> visitor(cost, state.graph, state.allCosts, state.deadEnds);
        visitor.visitPaths([&](const std::vector<ConditionId>& path, Graph& graph,
                               DeadEndsCache<Condition>& deadEnds) -> VisitFlow {
            if (remaining.empty()) {
                return VisitFlow::Break;
            }
            // Reuse the docids of the prefix shared with the previous path
            size_t common = 0;
            while (common < path.size() && common < subpaths.size() &&
                   subpaths[common].first == path[common]) {
                common++;
            }
            subpaths.erase(subpaths.begin() + static_cast<std::ptrdiff_t>(common),
                           subpaths.end());

            for (size_t i = common; i < path.size(); i++) {
                if (!visitPathCondition(ctx, graph, remaining, deadEnds, state.conditionsCache,
                                        subpaths, nodesWithRemovedConditions, path[i])) {
                    return VisitFlow::Continue;
                }
            }

            util::BitSet pathDocids;
            if (subpaths.empty()) {
                pathDocids = remaining;
            } else {
                pathDocids = std::move(subpaths.back().second);
                subpaths.pop_back();
            }
            goodPaths.push_back(path);
            bucket |= pathDocids;
            remaining -= pathDocids;
            for (auto& subpath : subpaths) {
                subpath.second -= pathDocids;
            }
            return remaining.empty() ? VisitFlow::Break : VisitFlow::Continue;
        });

        if (logger.wantsInternalState()) {
            std::vector<std::vector<std::string>> labels;
            for (const auto& path : goodPaths) {
                std::vector<std::string> pathLabels;
                for (ConditionId condition : path) {
                    pathLabels.push_back(G::label(ctx, state.graph.conditions.get(condition)));
                }
                labels.push_back(std::move(pathLabels));
            }
            logger.logInternalState(id_, cost, labels);
        }

        std::vector<std::vector<QueryGraph::PathStep>> steps;
        steps.reserve(goodPaths.size());
        for (const auto& path : goodPaths) {
            std::vector<QueryGraph::PathStep> pathSteps;
            for (ConditionId condition : path) {
                auto [start, end] = state.conditionsCache.getSubsetsUsedByCondition(condition);
                pathSteps.emplace_back(start, end);
            }
            steps.push_back(std::move(pathSteps));
        }
        QueryGraph nextQuery = QueryGraph::buildFromPaths(steps);

        const size_t removedCount = nodesWithRemovedConditions.cardinality();
        if (removedCount == 1) {
            state.graph.updateAllCostsBeforeNode(
                static_cast<QueryNodeId>(nodesWithRemovedConditions.first()), state.allCosts);
        } else if (removedCount > 1) {
            state.allCosts = state.graph.findAllCostsToEnd();
        }

        return RankingRuleOutput{std::move(nextQuery), std::move(bucket), cost};
    }

    void endIteration(SearchContext& /*ctx*/, SearchLogger& /*logger*/) override {
        state_.reset();
    }

private:
    struct State {
        Graph graph;
        ConditionDocIdsCache<G> conditionsCache;
        DeadEndsCache<Condition> deadEnds;
        typename Graph::CostsToEnd allCosts;
    };

    /**
     * Extends the subpath docids with the next condition of the path.
     * Returns false, after recording the dead end, if no document is left.
     */
    static bool visitPathCondition(SearchContext& ctx, Graph& graph,
                                   const util::BitSet& universe,
                                   DeadEndsCache<Condition>& deadEnds,
                                   ConditionDocIdsCache<G>& cache,
                                   std::vector<std::pair<ConditionId, util::BitSet>>& subpaths,
                                   util::BitSet& nodesWithRemovedConditions,
                                   ConditionId condition) {
        const ComputedCondition& computed =
            cache.getComputedCondition(ctx, condition, graph, universe);
        if (computed.docids.empty()) {
            deadEnds.forbidCondition(condition);
            nodesWithRemovedConditions |= graph.removeEdgesWithCondition(condition);
            return false;
        }

        util::BitSet latest =
            subpaths.empty() ? computed.docids : (subpaths.back().second & computed.docids);
        if (!latest.empty()) {
            subpaths.emplace_back(condition, std::move(latest));
            return true;
        }

        std::vector<ConditionId> prefix;
        prefix.reserve(subpaths.size());
        for (const auto& subpath : subpaths) {
            prefix.push_back(subpath.first);
        }
        deadEnds.forbidConditionAfterPrefix(prefix.begin(), prefix.end(), condition);

        // Also a dead end after any shorter prefix whose docids it misses
        if (prefix.size() > 1) {
            for (size_t i = 0; i + 1 < subpaths.size(); i++) {
                if (computed.docids.isDisjoint(subpaths[i].second)) {
                    deadEnds.forbidConditionAfterPrefix(
                        prefix.begin(), prefix.begin() + static_cast<std::ptrdiff_t>(i + 1),
                        condition);
                }
            }
        }
        return false;
    }

    std::string id_;
    std::optional<TermsMatchingStrategy> strategy_;
    std::optional<State> state_;
    uint64_t curCost_ = 0;
};

}  // namespace search
}  // namespace rankflow
