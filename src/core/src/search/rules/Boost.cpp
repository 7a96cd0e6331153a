// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/Boost.h"

#include "rankflow/search/SearchContext.h"
#include "rankflow/util/SearchProfiler.h"

#include <utility>

namespace rankflow {
namespace search {

FilterBoostingRule::FilterBoostingRule(std::string id, std::vector<filter::Filter> filters)
    : id_(std::move(id))
    , filters_(std::move(filters)) {}

void FilterBoostingRule::startIteration(SearchContext& ctx, SearchLogger& /*logger*/,
                                        const util::BitSet& universe, const QueryGraph& query) {
    PROFILE_SCOPE("boost::startIteration");
    State state{query, {}, 0};
    state.buckets.reserve(filters_.size() + 1);
    util::BitSet remaining = universe;
    for (const auto& filter : filters_) {
        util::BitSet matching = filter.evaluate(ctx.index()) & remaining;
        remaining -= matching;
        state.buckets.push_back(std::move(matching));
    }
    state.buckets.push_back(std::move(remaining));
    state_.emplace(std::move(state));
}

std::optional<RankingRuleOutput> FilterBoostingRule::nextBucket(SearchContext& /*ctx*/,
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

void FilterBoostingRule::endIteration(SearchContext& /*ctx*/, SearchLogger& /*logger*/) {
    state_.reset();
}

namespace {

std::vector<filter::Filter> single(filter::Filter filter) {
    std::vector<filter::Filter> filters;
    filters.push_back(std::move(filter));
    return filters;
}

}  // namespace

BoostRule::BoostRule(filter::Filter filter)
    : FilterBoostingRule("boost:" + filter.toString(), single(filter)) {}

}  // namespace search
}  // namespace rankflow
