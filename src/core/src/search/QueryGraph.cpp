// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/QueryGraph.h"

#include "rankflow/search/Limits.h"
#include "rankflow/search/QueryTermBuilder.h"
#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/util/Exceptions.h"

#include <algorithm>
#include <limits>
#include <map>
#include <sstream>
#include <unordered_map>

namespace rankflow {
namespace search {

using util::BitSet;

namespace {

void checkNodeCount(size_t count) {
    if (count > Limits::MAX_QUERY_GRAPH_NODES) {
        throw UserException(UserErrorCode::QueryTooComplex,
                            "Query graph has " + std::to_string(count) + " nodes, limit is " +
                                std::to_string(Limits::MAX_QUERY_GRAPH_NODES));
    }
}

QueryNode makeNode(QueryNode::Kind kind, std::optional<LocatedQueryTermSubset> term = {}) {
    QueryNode node;
    node.kind = kind;
    node.term = std::move(term);
    return node;
}

struct TermAndSuffix {
    LocatedQueryTermSubset term;
    size_t suffixHash;

    bool operator==(const TermAndSuffix& other) const {
        return suffixHash == other.suffixHash && term == other.term;
    }
};

struct TermAndSuffixHash {
    size_t operator()(const TermAndSuffix& key) const noexcept {
        size_t seed = key.term.hash();
        util::hashCombine(seed, key.suffixHash);
        return seed;
    }
};

}  // namespace

QueryGraph QueryGraph::fromQuery(SearchContext& ctx, const std::vector<LocatedQueryTerm>& terms,
                                 QueryTermBuilder& builder,
                                 std::vector<LocatedQueryTerm>* ngrams) {
    QueryGraph graph;
    graph.nodes_.push_back(makeNode(QueryNode::Kind::Start));
    graph.nodes_.push_back(makeNode(QueryNode::Kind::End));

    auto addTerm = [&](const LocatedQueryTerm& term, size_t firstId, size_t lastId) {
        LocatedQueryTermSubset subset;
        subset.termSubset = QueryTermSubset::full(term.value);
        subset.positionStart = term.positionStart;
        subset.positionEnd = term.positionEnd;
        subset.termIdStart = static_cast<uint8_t>(firstId);
        subset.termIdEnd = static_cast<uint8_t>(lastId);
        graph.nodes_.push_back(makeNode(QueryNode::Kind::Term, std::move(subset)));
        checkNodeCount(graph.nodes_.size());
    };

    for (size_t termIdx = 0; termIdx < terms.size(); termIdx++) {
        addTerm(terms[termIdx], termIdx, termIdx);
        for (size_t n = 2; n <= Limits::MAX_NGRAM && n <= termIdx + 1; n++) {
            std::vector<LocatedQueryTerm> window(terms.begin() + (termIdx + 1 - n),
                                                 terms.begin() + (termIdx + 1));
            auto ngram = builder.makeNgram(window);
            if (!ngram) {
                continue;
            }
            if (ngrams) {
                ngrams->push_back(*ngram);
            }
            addTerm(*ngram, termIdx + 1 - n, termIdx);
        }
    }

    graph.buildInitialEdges();
    return graph;
}

QueryGraph QueryGraph::placeholder() {
    QueryGraph graph;
    graph.nodes_.push_back(makeNode(QueryNode::Kind::Start));
    graph.nodes_.push_back(makeNode(QueryNode::Kind::End));
    graph.nodes_[ROOT_NODE].successors.insert(END_NODE);
    graph.nodes_[END_NODE].predecessors.insert(ROOT_NODE);
    return graph;
}

void QueryGraph::buildInitialEdges() {
    for (auto& node : nodes_) {
        node.successors.clear();
        node.predecessors.clear();
    }
    constexpr int MAX_ID = std::numeric_limits<int>::max();
    for (size_t id = 0; id < nodes_.size(); id++) {
        int endPrevTermId;
        switch (nodes_[id].kind) {
            case QueryNode::Kind::Term: endPrevTermId = nodes_[id].term->termIdEnd; break;
            case QueryNode::Kind::Start: endPrevTermId = -1; break;
            default: continue;
        }

        BitSet successors;
        int min = MAX_ID;
        for (size_t next = 0; next < nodes_.size(); next++) {
            int startNextTermId;
            switch (nodes_[next].kind) {
                case QueryNode::Kind::Term: startNextTermId = nodes_[next].term->termIdStart; break;
                case QueryNode::Kind::End: startNextTermId = MAX_ID - 1; break;
                default: continue;
            }
            if (startNextTermId <= endPrevTermId) {
                continue;
            }
            if (startNextTermId < min) {
                min = startNextTermId;
                successors.clear();
                successors.insert(next);
            } else if (startNextTermId == min) {
                successors.insert(next);
            }
        }
        successors.forEach([&](uint32_t next) { nodes_[next].predecessors.insert(id); });
        nodes_[id].successors = std::move(successors);
    }
}

void QueryGraph::removeNodesKeepEdges(const std::vector<QueryNodeId>& ids) {
    for (QueryNodeId id : ids) {
        const BitSet predecessors = nodes_.at(id).predecessors;
        const BitSet successors = nodes_.at(id).successors;
        predecessors.forEach([&](uint32_t pred) {
            nodes_[pred].successors.remove(id);
            nodes_[pred].successors |= successors;
        });
        successors.forEach([&](uint32_t succ) {
            nodes_[succ].predecessors.remove(id);
            nodes_[succ].predecessors |= predecessors;
        });
        QueryNode& node = nodes_[id];
        node.kind = QueryNode::Kind::Deleted;
        node.term.reset();
        node.predecessors.clear();
        node.successors.clear();
    }
}

void QueryGraph::removeNodes(const std::vector<QueryNodeId>& ids) {
    for (QueryNodeId id : ids) {
        QueryNode& node = nodes_.at(id);
        node.predecessors.forEach([&](uint32_t pred) { nodes_[pred].successors.remove(id); });
        node.successors.forEach([&](uint32_t succ) { nodes_[succ].predecessors.remove(id); });
        node.kind = QueryNode::Kind::Deleted;
        node.term.reset();
        node.predecessors.clear();
        node.successors.clear();
    }
}

void QueryGraph::simplify() {
    while (true) {
        std::vector<QueryNodeId> toRemove;
        for (size_t id = 0; id < nodes_.size(); id++) {
            const QueryNode& node = nodes_[id];
            const bool deleted = node.kind == QueryNode::Kind::Deleted;
            if (deleted) {
                continue;
            }
            if ((node.kind != QueryNode::Kind::End && node.successors.empty()) ||
                (node.kind != QueryNode::Kind::Start && node.predecessors.empty())) {
                toRemove.push_back(static_cast<QueryNodeId>(id));
            }
        }
        if (toRemove.empty()) {
            return;
        }
        removeNodes(toRemove);
    }
}

std::vector<BitSet> QueryGraph::removalOrderLast(const SearchContext& ctx) const {
    int first = std::numeric_limits<uint8_t>::max();
    int last = 0;
    for (const auto& node : nodes_) {
        if (!node.isTerm()) {
            continue;
        }
        last = std::max<int>(last, node.term->termIdEnd);
        first = std::min<int>(first, node.term->termIdStart);
    }
    if (first >= last) {
        return {};
    }
    return removalOrder(ctx, [last](uint8_t termId) {
        return static_cast<uint16_t>(1 + last - termId);
    });
}

std::vector<BitSet> QueryGraph::removalOrderFrequency(SearchContext& ctx) const {
    std::map<uint8_t, BitSet> termDocids;
    for (const auto& node : nodes_) {
        if (!node.isTerm()) {
            continue;
        }
        const BitSet docids = computeQueryTermSubsetDocids(ctx, nullptr, node.term->termSubset);
        for (int id = node.term->termIdStart; id <= node.term->termIdEnd; id++) {
            termDocids[static_cast<uint8_t>(id)] |= docids;
        }
    }

    // A term matching nothing is removed first
    std::vector<std::pair<uint8_t, uint64_t>> frequencies;
    for (const auto& [id, docids] : termDocids) {
        const size_t count = docids.cardinality();
        frequencies.emplace_back(id, count == 0 ? std::numeric_limits<uint64_t>::max() : count);
    }
    std::stable_sort(frequencies.begin(), frequencies.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::map<uint8_t, uint16_t> weights;
    uint16_t weight = 1;
    for (size_t i = 0; i < frequencies.size(); i++) {
        weights[frequencies[i].first] = weight;
        if (i + 1 < frequencies.size() && frequencies[i + 1].second != frequencies[i].second) {
            weight++;
        }
    }
    return removalOrder(ctx, [&weights](uint8_t termId) { return weights.at(termId); });
}

std::vector<BitSet> QueryGraph::removalOrder(
    const SearchContext& ctx, const std::function<uint16_t(uint8_t)>& order) const {
    std::map<uint16_t, BitSet> groups;
    bool mandatoryTerm = false;
    for (size_t id = 0; id < nodes_.size(); id++) {
        const QueryNode& node = nodes_[id];
        if (!node.isTerm()) {
            continue;
        }
        const QueryTermSubset& subset = node.term->termSubset;
        if (subset.originalPhrase(ctx) || subset.isMandatory()) {
            mandatoryTerm = true;
            continue;
        }
        uint16_t cost = 0;
        for (int termId = node.term->termIdStart; termId <= node.term->termIdEnd; termId++) {
            cost = std::max(cost, order(static_cast<uint8_t>(termId)));
        }
        groups[cost].insert(id);
    }

    std::vector<BitSet> result;
    result.reserve(groups.size());
    for (auto& [cost, group] : groups) {
        result.push_back(std::move(group));
    }
    if (!mandatoryTerm && !result.empty()) {
        result.pop_back();
    }
    return result;
}

size_t QueryGraph::wordsInPhrasesCount(const SearchContext& ctx) const {
    size_t count = 0;
    for (const auto& node : nodes_) {
        if (!node.isTerm()) {
            continue;
        }
        auto phrase = node.term->termSubset.originalPhrase(ctx);
        if (!phrase) {
            continue;
        }
        for (const auto& word : ctx.phraseInterner.get(*phrase).words) {
            if (word) {
                count++;
            }
        }
    }
    return count;
}

QueryGraph QueryGraph::buildFromPaths(const std::vector<std::vector<PathStep>>& paths) {
    // Merge the end term of a step with the start term of the next one
    std::vector<std::vector<LocatedQueryTermSubset>> singleTermPaths;
    singleTermPaths.reserve(paths.size());
    for (const auto& path : paths) {
        std::vector<LocatedQueryTermSubset> processed;
        std::optional<LocatedQueryTermSubset> prevDest;
        for (const auto& [start, dest] : path) {
            if (prevDest) {
                if (start) {
                    if (start->termIdStart == prevDest->termIdStart &&
                        start->termIdEnd == prevDest->termIdEnd) {
                        LocatedQueryTermSubset merged = *start;
                        merged.termSubset.intersect(prevDest->termSubset);
                        processed.push_back(std::move(merged));
                    } else {
                        processed.push_back(*prevDest);
                        processed.push_back(*start);
                    }
                } else {
                    processed.push_back(*prevDest);
                }
            } else if (start) {
                processed.push_back(*start);
            }
            prevDest = dest;
        }
        if (prevDest) {
            processed.push_back(*prevDest);
        }
        singleTermPaths.push_back(std::move(processed));
    }

    QueryGraph graph;
    graph.nodes_.push_back(makeNode(QueryNode::Kind::Start));
    graph.nodes_.push_back(makeNode(QueryNode::Kind::End));

    std::unordered_map<TermAndSuffix, QueryNodeId, TermAndSuffixHash> nodeIds;
    for (const auto& path : singleTermPaths) {
        std::vector<size_t> suffixHashes(path.size());
        size_t hash = 0;
        for (size_t i = path.size(); i-- > 0;) {
            util::hashCombine(hash, path[i].hash());
            suffixHashes[i] = hash;
        }

        QueryNodeId prev = ROOT_NODE;
        for (size_t i = 0; i < path.size(); i++) {
            TermAndSuffix key{path[i], suffixHashes[i]};
            auto it = nodeIds.find(key);
            QueryNodeId id;
            if (it == nodeIds.end()) {
                id = static_cast<QueryNodeId>(graph.nodes_.size());
                graph.nodes_.push_back(makeNode(QueryNode::Kind::Term, path[i]));
                checkNodeCount(graph.nodes_.size());
                nodeIds.emplace(std::move(key), id);
            } else {
                id = it->second;
            }
            graph.nodes_[prev].successors.insert(id);
            graph.nodes_[id].predecessors.insert(prev);
            prev = id;
        }
        graph.nodes_[prev].successors.insert(END_NODE);
        graph.nodes_[END_NODE].predecessors.insert(prev);
    }
    return graph;
}

std::string QueryGraph::describe(const SearchContext& ctx) const {
    std::ostringstream out;
    for (size_t id = 0; id < nodes_.size(); id++) {
        const QueryNode& node = nodes_[id];
        switch (node.kind) {
            case QueryNode::Kind::Deleted: continue;
            case QueryNode::Kind::Start: out << id << " START"; break;
            case QueryNode::Kind::End: out << id << " END"; break;
            case QueryNode::Kind::Term:
                out << id << " " << node.term->termSubset.description(ctx) << " ["
                    << node.term->positionStart << ".." << node.term->positionEnd << "]";
                break;
        }
        out << " ->";
        node.successors.forEach([&](uint32_t succ) { out << " " << succ; });
        out << "\n";
    }
    return out.str();
}

bool QueryGraph::operator==(const QueryGraph& other) const {
    if (nodes_.size() != other.nodes_.size()) {
        return false;
    }
    for (size_t i = 0; i < nodes_.size(); i++) {
        const QueryNode& a = nodes_[i];
        const QueryNode& b = other.nodes_[i];
        if (a.kind != b.kind || a.term != b.term || a.successors != b.successors ||
            a.predecessors != b.predecessors) {
            return false;
        }
    }
    return true;
}

}  // namespace search
}  // namespace rankflow
