// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/ProximityGraph.h"

#include "rankflow/search/Limits.h"
#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"

#include <set>

namespace rankflow {
namespace search {

namespace {

/**
 * Words that can stand at the boundary of a term: its single words, the
 * expansions of its prefix, and the first (or last) word of its phrases.
 */
std::set<WordId> boundaryWords(SearchContext& ctx, const QueryTermSubset& subset, bool last) {
    std::set<WordId> words;
    for (const Word& word : subset.allSingleWordsExceptPrefixDb(ctx)) {
        words.insert(word.id);
    }
    if (auto prefix = subset.usePrefixDb(ctx)) {
        const std::vector<WordId> expansions = ctx.prefixWords(prefix->id);
        words.insert(expansions.begin(), expansions.end());
    }
    for (PhraseId phrase : subset.allPhrases(ctx)) {
        const auto& phraseWords = ctx.phraseInterner.get(phrase).words;
        if (last) {
            for (auto it = phraseWords.rbegin(); it != phraseWords.rend(); ++it) {
                if (*it) {
                    words.insert(**it);
                    break;
                }
            }
        } else {
            for (const auto& word : phraseWords) {
                if (word) {
                    words.insert(*word);
                    break;
                }
            }
        }
    }
    return words;
}

}  // namespace

size_t ProximityConditionHash::operator()(const ProximityCondition& condition) const noexcept {
    size_t seed = condition.right.hash();
    util::hashCombine(seed, condition.left ? condition.left->hash() : 0);
    util::hashCombine(seed, static_cast<size_t>(condition.kind));
    util::hashCombine(seed, condition.proximity);
    return seed;
}

std::vector<std::pair<uint32_t, util::Interned<ProximityCondition>>> ProximityGraph::buildEdges(
    SearchContext& /*ctx*/, Interner& conditions, const LocatedQueryTermSubset* source,
    const LocatedQueryTermSubset& dest) {
    std::vector<std::pair<uint32_t, util::Interned<ProximityCondition>>> edges;
    const uint32_t rightNgramMax = static_cast<uint32_t>(dest.termIdsLen()) - 1;

    ProximityCondition anywhere;
    anywhere.kind = ProximityCondition::Kind::Term;
    anywhere.right = dest;

    if (!source || static_cast<uint32_t>(source->positionEnd) + 1 != dest.positionStart) {
        edges.emplace_back(rightNgramMax, conditions.insert(anywhere));
        return edges;
    }

    for (uint32_t cost = rightNgramMax; cost < rightNgramMax + Limits::MAX_DISTANCE - 1; cost++) {
        ProximityCondition pair;
        pair.kind = ProximityCondition::Kind::Pair;
        pair.left = *source;
        pair.right = dest;
        pair.proximity = static_cast<uint8_t>(cost - rightNgramMax + 1);
        edges.emplace_back(cost, conditions.insert(pair));
    }
    edges.emplace_back(Limits::MAX_DISTANCE - 1 + rightNgramMax, conditions.insert(anywhere));
    return edges;
}

ComputedCondition ProximityGraph::resolveCondition(SearchContext& ctx,
                                                   const Condition& condition,
                                                   const util::BitSet& universe) {
    ComputedCondition computed;
    computed.endTermSubset = condition.right;

    if (condition.kind == ProximityCondition::Kind::Term) {
        computed.docids =
            computeQueryTermSubsetDocids(ctx, &universe, condition.right.termSubset);
        return computed;
    }

    computed.startTermSubset = condition.left;
    const std::set<WordId> leftWords = boundaryWords(ctx, condition.left->termSubset, true);
    const std::set<WordId> rightWords = boundaryWords(ctx, condition.right.termSubset, false);

    util::BitSet pairs;
    for (WordId left : leftWords) {
        for (WordId right : rightWords) {
            pairs |= ctx.wordPairProximityDocids(left, right, condition.proximity);
            if (condition.proximity > 1) {
                // right before left counts one position further apart
                pairs |= ctx.wordPairProximityDocids(
                    right, left, static_cast<uint8_t>(condition.proximity - 1));
            }
        }
    }
    pairs &= universe;
    if (!pairs.empty()) {
        pairs &= computeQueryTermSubsetDocids(ctx, &universe, condition.left->termSubset);
    }
    if (!pairs.empty()) {
        pairs &= computeQueryTermSubsetDocids(ctx, &universe, condition.right.termSubset);
    }
    computed.docids = std::move(pairs);
    return computed;
}

std::string ProximityGraph::label(const SearchContext& ctx, const Condition& condition) {
    if (condition.kind == ProximityCondition::Kind::Term) {
        return condition.right.termSubset.description(ctx) + " : any distance";
    }
    return condition.left->termSubset.description(ctx) + " -- " +
           condition.right.termSubset.description(ctx) + " : " +
           std::to_string(condition.proximity);
}

}  // namespace search
}  // namespace rankflow
