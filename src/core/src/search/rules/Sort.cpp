// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/Sort.h"

#include "rankflow/index/IndexSource.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/util/SearchProfiler.h"

#include <utility>

namespace rankflow {
namespace search {

namespace {

// Appends the value groups of one facet kind in sort order, keeping each
// document in its first group only
template<typename Value>
void appendGroups(std::vector<std::pair<Value, util::BitSet>> values, bool ascending,
                  util::BitSet& remaining, std::vector<util::BitSet>& buckets) {
    auto take = [&](util::BitSet& docids) {
        docids &= remaining;
        if (!docids.empty()) {
            remaining -= docids;
            buckets.push_back(std::move(docids));
        }
    };
    if (ascending) {
        for (auto it = values.begin(); it != values.end(); ++it) {
            take(it->second);
        }
    } else {
        for (auto it = values.rbegin(); it != values.rend(); ++it) {
            take(it->second);
        }
    }
}

}  // namespace

SortRule::SortRule(std::string field, bool ascending)
    : field_(std::move(field))
    , ascending_(ascending) {}

std::string SortRule::id() const {
    return field_ + (ascending_ ? ":asc" : ":desc");
}

void SortRule::startIteration(SearchContext& ctx, SearchLogger& /*logger*/,
                              const util::BitSet& universe, const QueryGraph& query) {
    PROFILE_SCOPE("sort::startIteration");
    State state{query, {}, 0};
    util::BitSet remaining = universe;
    const index::IndexSource& index = ctx.index();
    appendGroups(index.facetNumberValues(field_), ascending_, remaining, state.buckets);
    appendGroups(index.facetStringValues(field_), ascending_, remaining, state.buckets);
    state.buckets.push_back(std::move(remaining));
    state_.emplace(std::move(state));
}

std::optional<RankingRuleOutput> SortRule::nextBucket(SearchContext& /*ctx*/,
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

void SortRule::endIteration(SearchContext& /*ctx*/, SearchLogger& /*logger*/) {
    state_.reset();
}

}  // namespace search
}  // namespace rankflow
