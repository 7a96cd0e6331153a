// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/ResolveQueryGraph.h"

#include "rankflow/search/SearchContext.h"
#include "rankflow/util/Exceptions.h"
#include "rankflow/util/SearchProfiler.h"

#include <bit>
#include <deque>
#include <map>

namespace rankflow {
namespace search {

using util::BitSet;

uint16_t positionBucket(uint16_t position) {
    if (position < 16) {
        return position;
    }
    return static_cast<uint16_t>(std::bit_floor(static_cast<unsigned>(position)));
}

BitSet computeQueryTermSubsetDocids(SearchContext& ctx, const BitSet* universe,
                                    const QueryTermSubset& subset) {
    BitSet docids;
    for (const Word& word : subset.allSingleWordsExceptPrefixDb(ctx)) {
        docids |= ctx.wordDocids(word);
    }
    for (PhraseId phrase : subset.allPhrases(ctx)) {
        docids |= ctx.phraseDocids(phrase);
    }
    if (auto prefix = subset.usePrefixDb(ctx)) {
        docids |= ctx.wordPrefixDocids(*prefix);
    }
    if (universe) {
        docids &= *universe;
    }
    return docids;
}

std::set<WordId> locatingWords(SearchContext& ctx, const QueryTermSubset& subset) {
    std::set<WordId> words;
    for (const Word& word : subset.allSingleWordsExceptPrefixDb(ctx)) {
        words.insert(word.id);
    }
    for (PhraseId phrase : subset.allPhrases(ctx)) {
        for (const auto& word : ctx.phraseInterner.get(phrase).words) {
            if (word) {
                words.insert(*word);
                break;
            }
        }
    }
    if (auto prefix = subset.usePrefixDb(ctx)) {
        const std::vector<WordId> expansions = ctx.prefixWords(prefix->id);
        words.insert(expansions.begin(), expansions.end());
    }
    return words;
}

BitSet computeQueryTermSubsetDocidsWithinFieldId(SearchContext& ctx, const BitSet* universe,
                                                 const QueryTermSubset& subset,
                                                 index::FieldId fid) {
    BitSet docids;
    for (const Word& word : subset.allSingleWordsExceptPrefixDb(ctx)) {
        docids |= ctx.wordFidDocids(word.id, fid);
    }
    for (PhraseId phrase : subset.allPhrases(ctx)) {
        // Phrase matches are not located: require its first word in the field
        const auto& words = ctx.phraseInterner.get(phrase).words;
        for (const auto& word : words) {
            if (word) {
                docids |= ctx.phraseDocids(phrase) & ctx.wordFidDocids(*word, fid);
                break;
            }
        }
    }
    if (auto prefix = subset.usePrefixDb(ctx)) {
        const std::vector<WordId> expansions = ctx.prefixWords(prefix->id);
        for (WordId word : expansions) {
            docids |= ctx.wordFidDocids(word, fid);
        }
    }
    if (universe) {
        docids &= *universe;
    }
    return docids;
}

BitSet computeQueryTermSubsetDocidsWithinPosition(SearchContext& ctx, const BitSet* universe,
                                                  const QueryTermSubset& subset,
                                                  uint16_t bucket) {
    auto wordInBucket = [&](WordId word) {
        BitSet result;
        const std::vector<uint16_t> positions = ctx.wordPositions(word);
        for (uint16_t position : positions) {
            if (positionBucket(position) == bucket) {
                result |= ctx.wordPositionDocids(word, position);
            }
        }
        return result;
    };

    BitSet docids;
    for (const Word& word : subset.allSingleWordsExceptPrefixDb(ctx)) {
        docids |= wordInBucket(word.id);
    }
    for (PhraseId phrase : subset.allPhrases(ctx)) {
        const auto& words = ctx.phraseInterner.get(phrase).words;
        for (const auto& word : words) {
            if (word) {
                docids |= ctx.phraseDocids(phrase) & wordInBucket(*word);
                break;
            }
        }
    }
    if (auto prefix = subset.usePrefixDb(ctx)) {
        const std::vector<WordId> expansions = ctx.prefixWords(prefix->id);
        for (WordId word : expansions) {
            docids |= wordInBucket(word);
        }
    }
    if (universe) {
        docids &= *universe;
    }
    return docids;
}

BitSet computeQueryGraphDocids(SearchContext& ctx, const QueryGraph& graph,
                               const BitSet& universe) {
    PROFILE_SCOPE("resolveQueryGraph");
    std::map<QueryNodeId, BitSet> pathDocids;
    BitSet resolved;
    std::deque<QueryNodeId> toVisit{graph.rootNode()};
    BitSet queued;
    queued.insert(graph.rootNode());

    size_t deferredInARow = 0;
    while (!toVisit.empty()) {
        const QueryNodeId id = toVisit.front();
        toVisit.pop_front();
        const QueryNode& node = graph.node(id);

        if (!node.predecessors.isSubsetOf(resolved)) {
            // Some predecessor is not resolved yet
            if (++deferredInARow > toVisit.size()) {
                break;
            }
            toVisit.push_back(id);
            continue;
        }
        deferredInARow = 0;

        BitSet predecessorsDocids;
        node.predecessors.forEach([&](uint32_t pred) { predecessorsDocids |= pathDocids[pred]; });

        BitSet docids;
        switch (node.kind) {
            case QueryNode::Kind::Start: docids = universe; break;
            case QueryNode::Kind::End: return predecessorsDocids;
            case QueryNode::Kind::Term:
                docids = computeQueryTermSubsetDocids(ctx, &predecessorsDocids,
                                                      node.term->termSubset);
                break;
            case QueryNode::Kind::Deleted:
                throw InternalException(InternalErrorCode::InvariantViolation,
                                        "Deleted node " + std::to_string(id) +
                                            " reached while resolving the query graph");
        }
        resolved.insert(id);
        pathDocids[id] = std::move(docids);

        node.successors.forEach([&](uint32_t succ) {
            if (!queued.contains(succ)) {
                queued.insert(succ);
                toVisit.push_back(static_cast<QueryNodeId>(succ));
            }
        });
    }
    throw InternalException(InternalErrorCode::InvariantViolation,
                            "End node unreachable while resolving the query graph");
}

}  // namespace search
}  // namespace rankflow
