// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/Limits.h"
#include "rankflow/search/QueryGraph.h"
#include "rankflow/search/QueryTerm.h"
#include "rankflow/util/BitSet.h"
#include "rankflow/util/Exceptions.h"
#include "rankflow/util/Interner.h"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

class SearchContext;

/**
 * @brief Documents of a condition, restricted to a universe, and the term
 * subsets a path through the condition selects.
 */
struct ComputedCondition {
    util::BitSet docids;
    /** Cardinality of the universe docids was last restricted to */
    size_t universeLen = 0;
    /** Absent for conditions leaving the Start node */
    std::optional<LocatedQueryTermSubset> startTermSubset;
    LocatedQueryTermSubset endTermSubset;
};

/**
 * @brief Edge of a ranking rule graph.
 *
 * An edge without condition is unconditional: an edge to End, or an edge
 * skipping its destination term (then nodesToSkip lists the nodes a path
 * through it may no longer visit).
 */
template<typename Condition>
struct Edge {
    QueryNodeId sourceNode = 0;
    QueryNodeId destNode = 0;
    uint32_t cost = 0;
    std::optional<util::Interned<Condition>> condition;
    util::BitSet nodesToSkip;
};

/**
 * @brief Cost of skipping a node, and the nodes that must be skipped with it.
 */
using NodeRemovalCost = std::optional<std::pair<uint32_t, util::BitSet>>;

/**
 * @brief The query graph of a ranking rule, with one weighted edge per
 * (cost, condition) pair of its criterion between consecutive nodes.
 *
 * G is the criterion policy. It provides:
 * - `Condition`, `ConditionHash` and `NAME`
 * - `buildEdges(ctx, conditions, source, dest)` listing the (cost, condition)
 *   pairs between two terms; source is null after Start
 * - `resolveCondition(ctx, condition, universe)` returning a ComputedCondition
 * - `label(ctx, condition)` describing a condition for loggers
 *
 * Removed edges leave an empty slot so edge ids stay valid.
 */
template<typename G>
class RankingRuleGraph {
public:
    using Condition = typename G::Condition;
    using ConditionId = util::Interned<Condition>;
    using ConditionInterner = util::Interner<Condition, typename G::ConditionHash>;
    using EdgeType = Edge<Condition>;
    /** Sorted, deduplicated costs of the paths from a node to End, per node */
    using CostsToEnd = std::vector<std::vector<uint64_t>>;

    QueryGraph queryGraph;
    std::vector<std::optional<EdgeType>> edges;
    /** Ids of the live edges leaving each node */
    std::vector<util::BitSet> edgesOfNode;
    ConditionInterner conditions;

    /**
     * @brief Builds the graph of a query graph.
     *
     * @param costOfRemovingNode per query node, the cost and forbidden nodes of
     *        a skip edge towards it; may be empty
     * @throws UserException(QueryTooComplex) above Limits::MAX_GRAPH_CONDITIONS
     */
    static RankingRuleGraph build(SearchContext& ctx, const QueryGraph& graph,
                                  const std::vector<NodeRemovalCost>& costOfRemovingNode) {
        RankingRuleGraph result;
        result.queryGraph = graph;
        result.edgesOfNode.resize(graph.size());

        for (size_t sourceId = 0; sourceId < graph.size(); sourceId++) {
            const QueryNode& source = graph.node(static_cast<QueryNodeId>(sourceId));
            const LocatedQueryTermSubset* sourceTerm = nullptr;
            if (source.kind == QueryNode::Kind::Term) {
                sourceTerm = &*source.term;
            } else if (source.kind != QueryNode::Kind::Start) {
                continue;
            }

            for (uint32_t destId : source.successors.toVector()) {
                const QueryNode& dest = graph.node(static_cast<QueryNodeId>(destId));
                if (dest.kind == QueryNode::Kind::End) {
                    result.pushEdge(EdgeType{static_cast<QueryNodeId>(sourceId),
                                             static_cast<QueryNodeId>(destId), 0, std::nullopt,
                                             util::BitSet()});
                    continue;
                }
                if (dest.kind != QueryNode::Kind::Term) {
                    throw InternalException(InternalErrorCode::InvariantViolation,
                                            "Query node " + std::to_string(destId) +
                                                " is a successor but not a term");
                }

                if (destId < costOfRemovingNode.size() && costOfRemovingNode[destId]) {
                    const auto& [cost, forbidden] = *costOfRemovingNode[destId];
                    result.pushEdge(EdgeType{static_cast<QueryNodeId>(sourceId),
                                             static_cast<QueryNodeId>(destId),
                                             cost * static_cast<uint32_t>(dest.term->termIdsLen()),
                                             std::nullopt, forbidden});
                }

                auto built = G::buildEdges(ctx, result.conditions, sourceTerm, *dest.term);
                for (auto& [cost, condition] : built) {
                    result.pushEdge(EdgeType{static_cast<QueryNodeId>(sourceId),
                                             static_cast<QueryNodeId>(destId), cost, condition,
                                             util::BitSet()});
                }
                if (result.conditions.size() > Limits::MAX_GRAPH_CONDITIONS) {
                    throw UserException(UserErrorCode::QueryTooComplex,
                                        std::string("Too many conditions in the ") + G::NAME +
                                            " graph: the query is too complex");
                }
            }
        }
        return result;
    }

    /**
     * @brief Removes every edge carrying condition.
     * @return the source nodes of the removed edges
     */
    util::BitSet removeEdgesWithCondition(ConditionId condition) {
        util::BitSet sourceNodes;
        for (size_t edgeId = 0; edgeId < edges.size(); edgeId++) {
            auto& edge = edges[edgeId];
            if (!edge || !edge->condition || *edge->condition != condition) {
                continue;
            }
            edgesOfNode[edge->sourceNode].remove(edgeId);
            sourceNodes.insert(edge->sourceNode);
            edge.reset();
        }
        return sourceNodes;
    }

    /**
     * @brief Every cost of a path from each node to End.
     */
    CostsToEnd findAllCostsToEnd() const {
        CostsToEnd costs(queryGraph.size());
        traverseBreadthFirstBackward(queryGraph.endNode(), [&](QueryNodeId node) {
            if (node == queryGraph.endNode()) {
                costs[node] = {0};
                return;
            }
            std::vector<uint64_t> nodeCosts;
            edgesOfNode[node].forEach([&](uint32_t edgeId) {
                const EdgeType& edge = *edges[edgeId];
                for (uint64_t destCost : costs[edge.destNode]) {
                    nodeCosts.push_back(edge.cost + destCost);
                }
            });
            std::sort(nodeCosts.begin(), nodeCosts.end());
            nodeCosts.erase(std::unique(nodeCosts.begin(), nodeCosts.end()), nodeCosts.end());
            costs[node] = std::move(nodeCosts);
        });
        return costs;
    }

    /**
     * @brief Drops the costs that became unreachable after edges leaving node
     * were removed, for node and every node before it.
     */
    void updateAllCostsBeforeNode(QueryNodeId node, CostsToEnd& costs) const {
        traverseBreadthFirstBackward(node, [&](QueryNodeId current) {
            std::set<uint64_t> toRemove(costs[current].begin(), costs[current].end());
            edgesOfNode[current].forEach([&](uint32_t edgeId) {
                const EdgeType& edge = *edges[edgeId];
                for (uint64_t destCost : costs[edge.destNode]) {
                    toRemove.erase(destCost + edge.cost);
                }
            });
            if (toRemove.empty()) {
                return;
            }
            auto& nodeCosts = costs[current];
            nodeCosts.erase(std::remove_if(nodeCosts.begin(), nodeCosts.end(),
                                           [&](uint64_t cost) { return toRemove.count(cost) > 0; }),
                            nodeCosts.end());
        });
    }

    /**
     * @brief Visits from and every node that can reach it, each node after
     * all of its successors that can reach from.
     */
    template<typename Visit>
    void traverseBreadthFirstBackward(QueryNodeId from, Visit&& visit) const {
        util::BitSet reachable;
        {
            util::BitSet checking{from};
            while (!checking.empty()) {
                util::BitSet next;
                checking.forEach([&](uint32_t node) {
                    if (reachable.insert(node)) {
                        next |= queryGraph.node(static_cast<QueryNodeId>(node)).predecessors;
                    }
                });
                checking = std::move(next);
            }
        }

        util::BitSet unreachableOrVisited;
        for (size_t node = 0; node < queryGraph.size(); node++) {
            if (!reachable.contains(node)) {
                unreachableOrVisited.insert(node);
            }
        }

        util::BitSet enqueued{from};
        std::deque<QueryNodeId> toVisit{from};
        while (!toVisit.empty()) {
            const QueryNodeId node = toVisit.front();
            toVisit.pop_front();
            if (unreachableOrVisited.contains(node)) {
                continue;
            }
            const QueryNode& queryNode = queryGraph.node(node);
            if (!queryNode.successors.isSubsetOf(unreachableOrVisited)) {
                toVisit.push_back(node);
                continue;
            }
            unreachableOrVisited.insert(node);
            visit(node);
            queryNode.predecessors.forEach([&](uint32_t pred) {
                if (!enqueued.contains(pred) && !unreachableOrVisited.contains(pred)) {
                    enqueued.insert(pred);
                    toVisit.push_back(static_cast<QueryNodeId>(pred));
                }
            });
        }
    }

    /**
     * @brief Number of live edges.
     */
    size_t liveEdgeCount() const {
        return static_cast<size_t>(
            std::count_if(edges.begin(), edges.end(), [](const auto& edge) { return edge.has_value(); }));
    }

private:
    void pushEdge(EdgeType edge) {
        const QueryNodeId source = edge.sourceNode;
        edgesOfNode[source].insert(edges.size());
        edges.push_back(std::move(edge));
    }
};

}  // namespace search
}  // namespace rankflow
