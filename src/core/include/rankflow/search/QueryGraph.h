// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/QueryTerm.h"
#include "rankflow/util/BitSet.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

class SearchContext;
class QueryTermBuilder;

using QueryNodeId = uint16_t;

/**
 * @brief A node of the query graph.
 *
 * Deleted nodes keep their slot so node ids stay valid; they have no
 * predecessors or successors.
 */
struct QueryNode {
    enum class Kind : uint8_t { Term, Deleted, Start, End };

    Kind kind = Kind::Deleted;

    /** Set for Term nodes only */
    std::optional<LocatedQueryTermSubset> term;

    util::BitSet predecessors;
    util::BitSet successors;

    bool isTerm() const { return kind == Kind::Term; }
};

/**
 * @brief Every interpretation of the query as paths from Start to End.
 *
 * For the query `summer house by`, the graph holds one node per word plus
 * the ngram nodes `summerhouse`, `houseby` and `summerhouseby`. A node links
 * to the nodes starting at the first query word after its own last word, so
 * each Start-to-End path covers every query word exactly once.
 *
 * QueryGraph is a value type: ranking rules copy it, narrow the copy and hand
 * it to the next rule.
 */
class QueryGraph {
public:
    /** A step of a path: the term before an edge (absent after Start) and the term after it */
    using PathStep = std::pair<std::optional<LocatedQueryTermSubset>, LocatedQueryTermSubset>;

    static constexpr QueryNodeId ROOT_NODE = 0;
    static constexpr QueryNodeId END_NODE = 1;

    QueryGraph() = default;

    /**
     * @brief Builds the graph of consecutive query terms, adding 2-gram and
     * 3-gram nodes.
     *
     * @param ngrams receives the located ngram terms created, may be null
     * @throws UserException(QueryTooComplex) above Limits::MAX_QUERY_GRAPH_NODES
     */
    static QueryGraph fromQuery(SearchContext& ctx, const std::vector<LocatedQueryTerm>& terms,
                                QueryTermBuilder& builder,
                                std::vector<LocatedQueryTerm>* ngrams = nullptr);

    /**
     * @brief The Start -> End graph of a search without query words.
     */
    static QueryGraph placeholder();

    /**
     * @brief Rebuilds a graph from the steps of the paths a ranking rule kept.
     *
     * Consecutive steps sharing a term (same term ids) intersect their
     * subsets. Nodes are shared between paths only when the term and the
     * whole rest of the path are identical.
     */
    static QueryGraph buildFromPaths(const std::vector<std::vector<PathStep>>& paths);

    QueryNodeId rootNode() const { return ROOT_NODE; }
    QueryNodeId endNode() const { return END_NODE; }

    size_t size() const { return nodes_.size(); }

    const QueryNode& node(QueryNodeId id) const { return nodes_.at(id); }

    QueryNode& mutableNode(QueryNodeId id) { return nodes_.at(id); }

    const std::vector<QueryNode>& nodes() const { return nodes_; }

    /**
     * @brief Deletes nodes, linking each of their predecessors to each of
     * their successors.
     */
    void removeNodesKeepEdges(const std::vector<QueryNodeId>& ids);

    /**
     * @brief Deletes nodes and their edges.
     */
    void removeNodes(const std::vector<QueryNodeId>& ids);

    /**
     * @brief Deletes nodes that can no longer reach End or be reached from Start.
     */
    void simplify();

    /**
     * @brief Groups of nodes removed together, in removal order, for the
     * Last matching strategy.
     */
    std::vector<util::BitSet> removalOrderLast(const SearchContext& ctx) const;

    /**
     * @brief Removal groups for the Frequency matching strategy: terms
     * matching the most documents go first.
     */
    std::vector<util::BitSet> removalOrderFrequency(SearchContext& ctx) const;

    /**
     * @brief Groups nodes by the highest cost of their term ids under order.
     *
     * Phrases and mandatory terms are never removed. Without any of those,
     * the last group is kept so that at least one term remains.
     */
    std::vector<util::BitSet> removalOrder(const SearchContext& ctx,
                                           const std::function<uint16_t(uint8_t)>& order) const;

    /**
     * @brief Number of words (gaps excluded) in the phrases of the graph.
     */
    size_t wordsInPhrasesCount(const SearchContext& ctx) const;

    /**
     * @brief One line per live node: id, term and successors.
     */
    std::string describe(const SearchContext& ctx) const;

    bool operator==(const QueryGraph& other) const;
    bool operator!=(const QueryGraph& other) const { return !(*this == other); }

private:
    void buildInitialEdges();

    std::vector<QueryNode> nodes_;
};

}  // namespace search
}  // namespace rankflow
