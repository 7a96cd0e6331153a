// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/graph/ConditionDocIdsCache.h"

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/observability/Metrics.h"
#include "rankflow/search/QueryTermBuilder.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/graph/TypoGraph.h"

#include <gtest/gtest.h>

#include <map>
#include <memory>

using namespace rankflow;
using namespace rankflow::search;
using rankflow::index::DocId;
using rankflow::index::Document;
using rankflow::index::FieldId;
using rankflow::index::IndexSettings;
using rankflow::index::IndexSource;
using rankflow::index::MemoryIndex;
using rankflow::util::BitSet;

namespace metric_names = rankflow::observability::metric_names;

/**
 * Forwards to another index and counts word posting lookups.
 */
class CountingIndexSource : public IndexSource {
public:
    explicit CountingIndexSource(const IndexSource& inner)
        : inner_(inner) {}

    size_t wordLookups(const std::string& word) const {
        auto it = wordLookups_.find(word);
        return it == wordLookups_.end() ? 0 : it->second;
    }

    void resetCounts() { wordLookups_.clear(); }

    BitSet documentIds() const override { return inner_.documentIds(); }
    BitSet wordDocids(const std::string& word) const override {
        wordLookups_[word]++;
        return inner_.wordDocids(word);
    }
    BitSet exactWordDocids(const std::string& word) const override {
        return inner_.exactWordDocids(word);
    }
    std::optional<BitSet> wordPrefixDocids(const std::string& prefix) const override {
        return inner_.wordPrefixDocids(prefix);
    }
    BitSet wordPairProximityDocids(const std::string& left, const std::string& right,
                                   uint8_t proximity) const override {
        return inner_.wordPairProximityDocids(left, right, proximity);
    }
    BitSet wordFidDocids(const std::string& word, FieldId fid) const override {
        return inner_.wordFidDocids(word, fid);
    }
    BitSet wordPositionDocids(const std::string& word, uint16_t position) const override {
        return inner_.wordPositionDocids(word, position);
    }
    BitSet wordFidPositionDocids(const std::string& word, FieldId fid,
                                 uint16_t position) const override {
        return inner_.wordFidPositionDocids(word, fid, position);
    }
    BitSet fieldWordCountDocids(FieldId fid, uint16_t count) const override {
        return inner_.fieldWordCountDocids(fid, count);
    }
    std::vector<FieldId> fieldIdsOfWord(const std::string& word) const override {
        return inner_.fieldIdsOfWord(word);
    }
    std::vector<uint16_t> positionsOfWord(const std::string& word) const override {
        return inner_.positionsOfWord(word);
    }
    bool containsWord(const std::string& word) const override { return inner_.containsWord(word); }
    std::vector<std::string> wordsWithPrefix(const std::string& prefix,
                                             size_t limit) const override {
        return inner_.wordsWithPrefix(prefix, limit);
    }
    std::vector<std::string> wordsStartingWith(const std::string& first) const override {
        return inner_.wordsStartingWith(first);
    }
    std::vector<std::string> vocabulary() const override { return inner_.vocabulary(); }
    std::vector<std::vector<std::string>> synonyms(
        const std::vector<std::string>& words) const override {
        return inner_.synonyms(words);
    }
    std::vector<FieldId> searchableFieldIds() const override { return inner_.searchableFieldIds(); }
    std::optional<FieldId> fieldId(const std::string& name) const override {
        return inner_.fieldId(name);
    }
    std::vector<std::string> filterableFields() const override { return inner_.filterableFields(); }
    std::vector<std::string> sortableFields() const override { return inner_.sortableFields(); }
    BitSet facetStringDocids(const std::string& field,
                             const std::string& normalizedValue) const override {
        return inner_.facetStringDocids(field, normalizedValue);
    }
    BitSet facetNumberDocids(const std::string& field, double low, double high) const override {
        return inner_.facetNumberDocids(field, low, high);
    }
    BitSet facetExistsDocids(const std::string& field) const override {
        return inner_.facetExistsDocids(field);
    }
    std::vector<std::pair<double, BitSet>> facetNumberValues(
        const std::string& field) const override {
        return inner_.facetNumberValues(field);
    }
    std::vector<std::pair<std::string, BitSet>> facetStringValues(
        const std::string& field) const override {
        return inner_.facetStringValues(field);
    }
    BitSet documentsSharingFacetValue(const std::string& field, DocId doc) const override {
        return inner_.documentsSharingFacetValue(field, doc);
    }

private:
    const IndexSource& inner_;
    mutable std::map<std::string, size_t> wordLookups_;
};

class ConditionDocIdsCacheTest : public ::testing::Test {
protected:
    using Graph = RankingRuleGraph<TypoGraph>;

    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title"};
        index_ = std::make_unique<MemoryIndex>(settings);
        for (index::DocId id = 1; id <= 10; id++) {
            Document doc;
            doc.text["title"] = "apple";
            index_->addDocument(id, doc);
        }
        index_->finish();

        counting_ = std::make_unique<CountingIndexSource>(*index_);
        ctx_ = std::make_unique<SearchContext>(*counting_);
        QueryTermBuilder builder(*ctx_, TypoToleranceConfig{});
        auto tokens = builder.parse("apple ");
        graph_ = Graph::build(*ctx_, QueryGraph::fromQuery(*ctx_, tokens.queryTerms, builder), {});
        counting_->resetCounts();

        auto& registry = observability::MetricsRegistry::instance();
        resolved_ = registry.getCounter(metric_names::CONDITIONS_RESOLVED);
        hits_ = registry.getCounter(metric_names::CONDITIONS_CACHE_HITS);
        narrowed_ = registry.getCounter(metric_names::CONDITIONS_NARROWED);
        resolved_->reset();
        hits_->reset();
        narrowed_->reset();
    }

    Graph::ConditionId onlyCondition() {
        EXPECT_EQ(1u, graph_.conditions.size());
        for (const auto& edge : graph_.edges) {
            if (edge && edge->condition) {
                return *edge->condition;
            }
        }
        ADD_FAILURE() << "graph has no conditional edge";
        return Graph::ConditionId();
    }

    std::unique_ptr<MemoryIndex> index_;
    std::unique_ptr<CountingIndexSource> counting_;
    std::unique_ptr<SearchContext> ctx_;
    Graph graph_;

    std::shared_ptr<observability::Counter> resolved_;
    std::shared_ptr<observability::Counter> hits_;
    std::shared_ptr<observability::Counter> narrowed_;
};

// ==================== Memoization Tests ====================

TEST_F(ConditionDocIdsCacheTest, ResolvesOnceThenNarrows) {
    ConditionDocIdsCache<TypoGraph> cache;
    const auto condition = onlyCondition();

    const BitSet all = BitSet::fromRange(1, 11);
    EXPECT_EQ(all, cache.getComputedCondition(*ctx_, condition, graph_, all).docids);

    const BitSet smaller{1, 2, 3, 4};
    const ComputedCondition& narrowed =
        cache.getComputedCondition(*ctx_, condition, graph_, smaller);
    EXPECT_EQ(smaller, narrowed.docids);
    EXPECT_EQ(4u, narrowed.universeLen);

    EXPECT_EQ(1u, counting_->wordLookups("apple"));
    EXPECT_EQ(1, resolved_->count());
    EXPECT_EQ(1, narrowed_->count());
    EXPECT_EQ(1u, cache.size());
}

TEST_F(ConditionDocIdsCacheTest, SameUniverseSizeIsAHit) {
    ConditionDocIdsCache<TypoGraph> cache;
    const auto condition = onlyCondition();
    const BitSet universe{2, 4, 6};

    cache.getComputedCondition(*ctx_, condition, graph_, universe);
    const ComputedCondition& again = cache.getComputedCondition(*ctx_, condition, graph_, universe);
    EXPECT_EQ(universe, again.docids);
    EXPECT_EQ(1, hits_->count());
    EXPECT_EQ(0, narrowed_->count());
}

TEST_F(ConditionDocIdsCacheTest, DocidsStayWithinTheUniverse) {
    ConditionDocIdsCache<TypoGraph> cache;
    const auto condition = onlyCondition();
    const BitSet universe{3, 7};
    EXPECT_TRUE(cache.getComputedCondition(*ctx_, condition, graph_, universe)
                    .docids.isSubsetOf(universe));
}

// ==================== Subset Tests ====================

TEST_F(ConditionDocIdsCacheTest, SubsetsOfAResolvedCondition) {
    ConditionDocIdsCache<TypoGraph> cache;
    const auto condition = onlyCondition();
    cache.getComputedCondition(*ctx_, condition, graph_, BitSet{1});

    auto [start, end] = cache.getSubsetsUsedByCondition(condition);
    EXPECT_FALSE(start.has_value());
    EXPECT_EQ("apple", end.termSubset.description(*ctx_));
}

TEST_F(ConditionDocIdsCacheTest, UnresolvedConditionThrows) {
    ConditionDocIdsCache<TypoGraph> cache;
    const auto condition = onlyCondition();
    try {
        cache.getSubsetsUsedByCondition(condition);
        FAIL() << "Expected InternalException";
    } catch (const InternalException& e) {
        EXPECT_EQ(InternalErrorCode::InvariantViolation, e.code());
    }
}
