// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/ExactAttribute.h"

#include "rankflow/index/IndexSource.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/util/SearchProfiler.h"

#include <algorithm>
#include <string>
#include <utility>

namespace rankflow {
namespace search {

namespace {

struct PositionedExactTerm {
    ExactTerm term;
    uint16_t position;
    uint8_t termId;
};

/**
 * Exact terms of the query graph ordered by term id, or nullopt when they do
 * not cover the term ids 0..n without a hole.
 */
std::optional<std::vector<PositionedExactTerm>> exactTermsInOrder(SearchContext& ctx,
                                                                   const QueryGraph& query) {
    std::vector<PositionedExactTerm> terms;
    for (const QueryNode& node : query.nodes()) {
        if (!node.isTerm()) {
            continue;
        }
        const LocatedQueryTermSubset& located = *node.term;
        if (auto exact = located.termSubset.exactTerm(ctx)) {
            terms.push_back(
                PositionedExactTerm{*exact, located.positionStart, located.termIdStart});
        }
    }
    std::stable_sort(terms.begin(), terms.end(),
                     [](const PositionedExactTerm& a, const PositionedExactTerm& b) {
                         return a.termId < b.termId;
                     });
    terms.erase(std::unique(terms.begin(), terms.end(),
                            [](const PositionedExactTerm& a, const PositionedExactTerm& b) {
                                return a.termId == b.termId;
                            }),
                terms.end());

    if (terms.empty() || terms.front().termId != 0) {
        return std::nullopt;
    }
    for (size_t i = 1; i < terms.size(); i++) {
        if (terms[i].termId != terms[i - 1].termId + 1) {
            return std::nullopt;
        }
    }
    return terms;
}

}  // namespace

void ExactAttributeRule::startIteration(SearchContext& ctx, SearchLogger& /*logger*/,
                                        const util::BitSet& universe, const QueryGraph& query) {
    PROFILE_SCOPE("exact_attribute::startIteration");
    State state{query, {}, 0};

    auto terms = exactTermsInOrder(ctx, query);
    if (!terms) {
        state.buckets.push_back(universe);
        state_.emplace(std::move(state));
        return;
    }

    // (word, position) pairs a matching field must hold; phrase gaps still
    // occupy a position
    std::vector<std::pair<std::string, uint16_t>> words;
    uint16_t wordCount = 0;
    for (const auto& positioned : *terms) {
        const auto termWords = positioned.term.words(ctx);
        for (size_t i = 0; i < termWords.size(); i++) {
            if (termWords[i]) {
                words.emplace_back(ctx.word(*termWords[i]),
                                   static_cast<uint16_t>(positioned.position + i));
            }
        }
        wordCount = static_cast<uint16_t>(wordCount + termWords.size());
    }

    const index::IndexSource& index = ctx.index();
    std::vector<index::FieldId> fields = ctx.restrictedFields();
    if (fields.empty()) {
        fields = index.searchableFieldIds();
    }

    util::BitSet equal;
    util::BitSet starts;
    for (index::FieldId fid : fields) {
        util::BitSet fieldStarts = universe;
        for (const auto& [word, position] : words) {
            fieldStarts &= index.wordFidPositionDocids(word, fid, position);
            if (fieldStarts.empty()) {
                break;
            }
        }
        if (fieldStarts.empty()) {
            continue;
        }
        equal |= fieldStarts & index.fieldWordCountDocids(fid, wordCount);
        starts |= fieldStarts;
    }
    starts -= equal;

    util::BitSet rest = universe - equal;
    rest -= starts;
    state.buckets.push_back(std::move(equal));
    state.buckets.push_back(std::move(starts));
    state.buckets.push_back(std::move(rest));
    state_.emplace(std::move(state));
}

std::optional<RankingRuleOutput> ExactAttributeRule::nextBucket(SearchContext& /*ctx*/,
                                                                SearchLogger& /*logger*/,
                                                                const util::BitSet& universe) {
    if (!state_) {
        return std::nullopt;
    }
    State& state = *state_;
    while (state.next < state.buckets.size()) {
        const size_t index = state.next++;
        util::BitSet candidates = state.buckets[index] & universe;
        if (!candidates.empty()) {
            return RankingRuleOutput{state.query, std::move(candidates), index};
        }
    }
    state_.reset();
    return std::nullopt;
}

void ExactAttributeRule::endIteration(SearchContext& /*ctx*/, SearchLogger& /*logger*/) {
    state_.reset();
}

}  // namespace search
}  // namespace rankflow
