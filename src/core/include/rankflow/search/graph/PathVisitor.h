// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/graph/DeadEndsCache.h"
#include "rankflow/search/graph/RankingRuleGraph.h"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief What a path callback asks of the enumeration.
 */
enum class VisitFlow { Continue, Break };

/**
 * @brief Enumerates the Start-to-End paths of a ranking rule graph whose
 * total cost is exactly the requested cost.
 *
 * Only the conditions of a path are reported. The callback may mutate the
 * graph (remove edges) and the dead-ends cache; the enumeration takes both
 * into account for the rest of the walk:
 * - a condition forbidden after the current prefix is not followed
 * - once a path was reported, the walk backtracks past any prefix that became
 *   forbidden
 * - an edge is only followed if the remaining cost is a cost of its
 *   destination (see RankingRuleGraph::findAllCostsToEnd)
 *
 * The callback signature is
 * `VisitFlow(const std::vector<ConditionId>&, RankingRuleGraph<G>&, DeadEndsCache<Condition>&)`.
 */
template<typename G>
class PathVisitor {
public:
    using Graph = RankingRuleGraph<G>;
    using Condition = typename Graph::Condition;
    using ConditionId = typename Graph::ConditionId;

    PathVisitor(uint64_t cost, Graph& graph, const typename Graph::CostsToEnd& allCosts,
                DeadEndsCache<Condition>& deadEnds)
        : remainingCost_(cost)
        , graph_(graph)
        , allCosts_(allCosts)
        , deadEnds_(deadEnds) {}

    template<typename Visit>
    void visitPaths(Visit&& visit) {
        forbiddenConditions_ = deadEnds_.forbidden();
        visitNode(graph_.queryGraph.rootNode(), visit);
    }

private:
    // stop: the callback asked to break; anyValid: some path was reported
    struct Outcome {
        bool stop = false;
        bool anyValid = false;
    };

    template<typename Visit>
    Outcome visitNode(QueryNodeId from, Visit& visit) {
        bool anyValid = false;
        // The callback may remove edges of this node while we iterate
        const std::vector<uint32_t> edgeIds = graph_.edgesOfNode[from].toVector();
        for (uint32_t edgeId : edgeIds) {
            if (!graph_.edges[edgeId]) {
                continue;
            }
            const auto edge = *graph_.edges[edgeId];
            if (remainingCost_ < edge.cost) {
                continue;
            }
            remainingCost_ -= edge.cost;
            Outcome outcome = edge.condition
                                  ? visitCondition(*edge.condition, edge.destNode,
                                                   edge.nodesToSkip, visit)
                                  : visitNoCondition(edge.destNode, edge.nodesToSkip, visit);
            remainingCost_ += edge.cost;

            if (outcome.stop) {
                return outcome;
            }
            anyValid |= outcome.anyValid;
            if (outcome.anyValid) {
                // Backtrack as far as the updated dead ends require
                forbiddenConditions_ =
                    deadEnds_.forbiddenConditionsForAllPrefixesUpTo(path_.begin(), path_.end());
                if (visitedConditions_.intersects(forbiddenConditions_)) {
                    return Outcome{false, true};
                }
            }
        }
        return Outcome{false, anyValid};
    }

    template<typename Visit>
    Outcome visitNoCondition(QueryNodeId dest, const util::BitSet& edgeNodesToSkip,
                             Visit& visit) {
        if (!reachesEndWithRemainingCost(dest)) {
            return Outcome{};
        }
        if (dest == graph_.queryGraph.endNode()) {
            const VisitFlow flow = visit(path_, graph_, deadEnds_);
            return Outcome{flow == VisitFlow::Break, true};
        }
        const util::BitSet savedNodesToSkip = nodesToSkip_;
        nodesToSkip_ |= edgeNodesToSkip;
        Outcome outcome = visitNode(dest, visit);
        nodesToSkip_ = savedNodesToSkip;
        return outcome;
    }

    template<typename Visit>
    Outcome visitCondition(ConditionId condition, QueryNodeId dest,
                           const util::BitSet& edgeNodesToSkip, Visit& visit) {
        if (forbiddenConditions_.contains(condition.raw()) || nodesToSkip_.contains(dest) ||
            edgeNodesToSkip.intersects(visitedNodes_)) {
            return Outcome{};
        }
        if (!reachesEndWithRemainingCost(dest)) {
            return Outcome{};
        }

        path_.push_back(condition);
        visitedNodes_.insert(dest);
        visitedConditions_.insert(condition.raw());

        const util::BitSet savedForbidden = forbiddenConditions_;
        if (const util::BitSet* next =
                deadEnds_.forbiddenConditionsAfterPrefix(path_.begin(), path_.end())) {
            forbiddenConditions_ |= *next;
        }
        const util::BitSet savedNodesToSkip = nodesToSkip_;
        nodesToSkip_ |= edgeNodesToSkip;

        Outcome outcome = visitNode(dest, visit);

        nodesToSkip_ = savedNodesToSkip;
        forbiddenConditions_ = savedForbidden;
        visitedConditions_.remove(condition.raw());
        visitedNodes_.remove(dest);
        path_.pop_back();
        return outcome;
    }

    bool reachesEndWithRemainingCost(QueryNodeId node) const {
        const auto& costs = allCosts_[node];
        return std::binary_search(costs.begin(), costs.end(), remainingCost_);
    }

    uint64_t remainingCost_;
    std::vector<ConditionId> path_;
    util::BitSet visitedConditions_;
    util::BitSet visitedNodes_;
    util::BitSet forbiddenConditions_;
    util::BitSet nodesToSkip_;

    Graph& graph_;
    const typename Graph::CostsToEnd& allCosts_;
    DeadEndsCache<Condition>& deadEnds_;
};

}  // namespace search
}  // namespace rankflow
