// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/Search.h"

#include "rankflow/filter/Filter.h"
#include "rankflow/observability/Metrics.h"
#include "rankflow/search/QueryGraph.h"
#include "rankflow/search/QueryTermBuilder.h"
#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/SearchLogger.h"
#include "rankflow/search/rules/Criterion.h"
#include "rankflow/util/Exceptions.h"
#include "rankflow/util/SearchProfiler.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace rankflow {
namespace search {

namespace {

/**
 * Decrements the active searches gauge on scope exit.
 */
class ActiveSearch {
public:
    ActiveSearch()
        : gauge_(observability::MetricsRegistry::instance().getGauge(
              observability::metric_names::SEARCH_ACTIVE)) {
        gauge_->inc();
    }

    ~ActiveSearch() { gauge_->dec(); }

    ActiveSearch(const ActiveSearch&) = delete;
    ActiveSearch& operator=(const ActiveSearch&) = delete;

private:
    std::shared_ptr<observability::Gauge> gauge_;
};

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

/**
 * Graph of the query once every term the strategy may drop is dropped.
 */
QueryGraph maximallyReducedGraph(SearchContext& ctx, const QueryGraph& graph,
                                 TermsMatchingStrategy strategy) {
    std::vector<util::BitSet> groups;
    switch (strategy) {
        case TermsMatchingStrategy::Last: groups = graph.removalOrderLast(ctx); break;
        case TermsMatchingStrategy::Frequency: groups = graph.removalOrderFrequency(ctx); break;
        case TermsMatchingStrategy::All: break;
    }
    std::vector<QueryNodeId> nodes;
    for (const auto& group : groups) {
        group.forEach([&](uint32_t node) { nodes.push_back(static_cast<QueryNodeId>(node)); });
    }
    QueryGraph reduced = graph;
    reduced.removeNodesKeepEdges(nodes);
    return reduced;
}

}  // namespace

Search::Search(const index::IndexSource& index, SearchConfig config)
    : index_(index)
    , config_(std::move(config)) {}

SearchResult Search::execute() {
    PROFILE_SCOPE("Search::execute");
    ActiveSearch active;
    auto latency = observability::MetricsRegistry::instance().getTimer(
        observability::metric_names::SEARCH_LATENCY);
    observability::ScopedTimer timer(*latency);

    DefaultSearchLogger defaultLogger;
    SearchLogger& logger = config_.logger ? *config_.logger : defaultLogger;

    std::vector<Criterion> criteria;
    if (config_.rankingRules.empty()) {
        criteria = defaultCriteria();
    } else {
        for (const auto& name : config_.rankingRules) {
            criteria.push_back(Criterion::parse(name));
        }
    }
    std::vector<Criterion> sort;
    for (const auto& entry : config_.sort) {
        sort.push_back(Criterion::parseSort(entry));
    }
    validateSort(criteria, sort, index_);
    checkDistinctAttribute();

    util::BitSet universe = initialUniverse();

    SearchContext ctx(index_);
    restrictSearchableAttributes(ctx);

    QueryTermBuilder builder(ctx, config_.typoTolerance);
    ExtractedTokens tokens = builder.parse(config_.query);

    for (const Word& word : tokens.negativeWords) {
        universe -= ctx.wordDocids(word);
    }
    for (const LocatedQueryTerm& phrase : tokens.negativePhrases) {
        if (auto id = ctx.termInterner.get(phrase.value).originalPhrase()) {
            universe -= ctx.phraseDocids(*id);
        }
    }

    const bool placeholder = tokens.queryTerms.empty();
    if (placeholder && !isBlank(config_.query) && tokens.negativeWords.empty() &&
        tokens.negativePhrases.empty()) {
        std::cerr << "[Search] Query '" << config_.query
                  << "' has no searchable words, running a placeholder search" << std::endl;
    }

    auto rules = buildRankingRules(criteria, sort, config_.termsMatchingStrategy, placeholder);

    QueryGraph graph;
    if (placeholder) {
        graph = QueryGraph::placeholder();
    } else {
        graph = QueryGraph::fromQuery(ctx, tokens.queryTerms, builder);
        QueryGraph reduced = maximallyReducedGraph(ctx, graph, config_.termsMatchingStrategy);
        logger.queryForInitialUniverse(ctx, reduced);
        universe = computeQueryGraphDocids(ctx, reduced, universe);
    }

    BucketSortOutput output = bucketSort(ctx, rules, graph, universe, config_.offset,
                                         config_.limit, logger, config_.timeBudget,
                                         config_.distinct);
    return SearchResult{std::move(output.docids), std::move(output.allCandidates),
                        std::move(output.buckets)};
}

util::BitSet Search::initialUniverse() {
    if (config_.filter) {
        if (auto filter = filter::Filter::fromString(*config_.filter)) {
            return filter->evaluate(index_);
        }
    }
    return index_.documentIds();
}

void Search::checkDistinctAttribute() const {
    if (!config_.distinct) {
        return;
    }
    const std::vector<std::string> filterable = index_.filterableFields();
    if (std::find(filterable.begin(), filterable.end(), *config_.distinct) == filterable.end()) {
        std::string available;
        for (const auto& field : filterable) {
            available += available.empty() ? field : ", " + field;
        }
        throw UserException(UserErrorCode::InvalidDistinctAttribute,
                            "Attribute `" + *config_.distinct +
                                "` is not filterable and thus, cannot be used as distinct "
                                "attribute. Available filterable attributes are: `" +
                                available + "`.");
    }
}

void Search::restrictSearchableAttributes(SearchContext& ctx) {
    if (!config_.searchableAttributes) {
        return;
    }
    const std::vector<index::FieldId> searchable = index_.searchableFieldIds();
    std::vector<index::FieldId> fields;
    for (const std::string& name : *config_.searchableAttributes) {
        if (name == "*") {
            return;
        }
        auto fid = index_.fieldId(name);
        if (!fid || std::find(searchable.begin(), searchable.end(), *fid) == searchable.end()) {
            throw UserException(UserErrorCode::InvalidSearchableAttribute,
                                "Attribute `" + name + "` is not searchable");
        }
        fields.push_back(*fid);
    }
    ctx.restrictToFields(std::move(fields));
}

}  // namespace search
}  // namespace rankflow
