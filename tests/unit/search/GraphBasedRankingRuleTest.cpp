// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/GraphBasedRankingRule.h"

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/search/QueryTermBuilder.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/SearchLogger.h"
#include "rankflow/search/graph/ProximityGraph.h"
#include "rankflow/search/graph/TypoGraph.h"
#include "rankflow/search/graph/WordsGraph.h"

#include <gtest/gtest.h>

#include <memory>

using namespace rankflow;
using namespace rankflow::search;
using rankflow::index::Document;
using rankflow::index::IndexSettings;
using rankflow::index::MemoryIndex;
using rankflow::util::BitSet;

class GraphBasedRankingRuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title"};
        index_ = std::make_unique<MemoryIndex>(settings);
        add(1, "house");
        add(2, "hose");
        add(3, "house");
        add(4, "hose");
        add(5, "garden");
        add(6, "house garden");
        add(7, "quick brown");
        add(8, "quick fox brown");
        add(9, "brown quick");
        index_->finish();

        ctx_ = std::make_unique<SearchContext>(*index_);
        builder_ = std::make_unique<QueryTermBuilder>(*ctx_, TypoToleranceConfig{});
    }

    void add(index::DocId id, const std::string& title) {
        Document doc;
        doc.text["title"] = title;
        index_->addDocument(id, doc);
    }

    QueryGraph graphOf(const std::string& query) {
        auto tokens = builder_->parse(query);
        return QueryGraph::fromQuery(*ctx_, tokens.queryTerms, *builder_);
    }

    /**
     * Drains a rule the way bucketSort does at a single level.
     */
    std::vector<BitSet> drain(RankingRule& rule, const QueryGraph& query, BitSet universe) {
        std::vector<BitSet> buckets;
        rule.startIteration(*ctx_, logger_, universe, query);
        while (!universe.empty()) {
            auto bucket = rule.nextBucket(*ctx_, logger_, universe);
            if (!bucket) {
                break;
            }
            EXPECT_TRUE(bucket->candidates.isSubsetOf(universe));
            universe -= bucket->candidates;
            buckets.push_back(bucket->candidates);
        }
        rule.endIteration(*ctx_, logger_);
        return buckets;
    }

    std::unique_ptr<MemoryIndex> index_;
    std::unique_ptr<SearchContext> ctx_;
    std::unique_ptr<QueryTermBuilder> builder_;
    DefaultSearchLogger logger_;
};

// ==================== Typo Rule Tests ====================

TEST_F(GraphBasedRankingRuleTest, TypoBucketsByIncreasingTypos) {
    GraphBasedRankingRule<TypoGraph> rule(TypoGraph::NAME, std::nullopt);
    auto buckets = drain(rule, graphOf("house "), BitSet{1, 2, 3, 4, 5});

    ASSERT_EQ(3u, buckets.size());
    EXPECT_EQ((BitSet{1, 3}), buckets[0]);
    EXPECT_EQ((BitSet{2, 4}), buckets[1]);
    // Documents matching no path come last
    EXPECT_EQ((BitSet{5}), buckets[2]);
}

TEST_F(GraphBasedRankingRuleTest, BucketsPartitionTheUniverse) {
    GraphBasedRankingRule<TypoGraph> rule(TypoGraph::NAME, std::nullopt);
    const BitSet universe = BitSet::fromRange(1, 10);
    auto buckets = drain(rule, graphOf("house "), universe);

    BitSet covered;
    for (const auto& bucket : buckets) {
        EXPECT_TRUE(bucket.isDisjoint(covered));
        covered |= bucket;
    }
    EXPECT_EQ(universe, covered);
}

TEST_F(GraphBasedRankingRuleTest, RestartGivesTheSameBuckets) {
    GraphBasedRankingRule<TypoGraph> rule(TypoGraph::NAME, std::nullopt);
    QueryGraph query = graphOf("house ");
    auto first = drain(rule, query, BitSet{1, 2, 3, 4, 5});
    auto second = drain(rule, query, BitSet{1, 2, 3, 4, 5});
    EXPECT_EQ(first, second);
}

TEST_F(GraphBasedRankingRuleTest, NextBucketWithoutStartIteration) {
    GraphBasedRankingRule<TypoGraph> rule(TypoGraph::NAME, std::nullopt);
    EXPECT_FALSE(rule.nextBucket(*ctx_, logger_, BitSet{1}).has_value());
}

TEST_F(GraphBasedRankingRuleTest, CostsAreNonDecreasing) {
    GraphBasedRankingRule<TypoGraph> rule(TypoGraph::NAME, std::nullopt);
    BitSet universe{1, 2, 3, 4, 5};
    rule.startIteration(*ctx_, logger_, universe, graphOf("house "));
    uint64_t previous = 0;
    while (auto bucket = rule.nextBucket(*ctx_, logger_, universe)) {
        EXPECT_GE(bucket->cost, previous);
        previous = bucket->cost;
        universe -= bucket->candidates;
        if (universe.empty()) {
            break;
        }
    }
    rule.endIteration(*ctx_, logger_);
    rule.endIteration(*ctx_, logger_);
}

// ==================== Words Rule Tests ====================

TEST_F(GraphBasedRankingRuleTest, WordsDropsTheLastTermFirst) {
    GraphBasedRankingRule<WordsGraph> rule(WordsGraph::NAME, TermsMatchingStrategy::Last);
    auto buckets = drain(rule, graphOf("house garden "), BitSet::fromRange(1, 7));

    ASSERT_EQ(3u, buckets.size());
    EXPECT_EQ((BitSet{6}), buckets[0]);
    // house, with its one-typo derivation hose
    EXPECT_EQ((BitSet{1, 2, 3, 4}), buckets[1]);
    EXPECT_EQ((BitSet{5}), buckets[2]);
}

TEST_F(GraphBasedRankingRuleTest, WordsBucketNarrowsTheQuery) {
    GraphBasedRankingRule<WordsGraph> rule(WordsGraph::NAME, TermsMatchingStrategy::Last);
    BitSet universe = BitSet::fromRange(1, 7);
    rule.startIteration(*ctx_, logger_, universe, graphOf("house garden "));
    auto bucket = rule.nextBucket(*ctx_, logger_, universe);
    ASSERT_TRUE(bucket.has_value());

    // Only the house -> garden path matched
    size_t terms = 0;
    for (const auto& node : bucket->query.nodes()) {
        terms += node.isTerm() ? 1 : 0;
    }
    EXPECT_EQ(2u, terms);
    rule.endIteration(*ctx_, logger_);
}

// ==================== Proximity Rule Tests ====================

TEST_F(GraphBasedRankingRuleTest, ProximityCountsReversedPairsOneFurther) {
    GraphBasedRankingRule<ProximityGraph> rule(ProximityGraph::NAME, std::nullopt);
    auto buckets = drain(rule, graphOf("quick brown "), BitSet{7, 8, 9});

    ASSERT_EQ(2u, buckets.size());
    EXPECT_EQ((BitSet{7}), buckets[0]);
    EXPECT_EQ((BitSet{8, 9}), buckets[1]);
}

// ==================== Logging Tests ====================

TEST_F(GraphBasedRankingRuleTest, DetailedLoggerReceivesPaths) {
    DetailedSearchLogger detailed;
    GraphBasedRankingRule<TypoGraph> rule(TypoGraph::NAME, std::nullopt);
    BitSet universe{1, 2, 3, 4};
    rule.startIteration(*ctx_, detailed, universe, graphOf("house "));
    auto bucket = rule.nextBucket(*ctx_, detailed, universe);
    ASSERT_TRUE(bucket.has_value());
    rule.endIteration(*ctx_, detailed);

    ASSERT_EQ(1u, detailed.events().size());
    const auto& event = detailed.events()[0];
    EXPECT_EQ(DetailedSearchLogger::EventKind::InternalState, event.kind);
    EXPECT_EQ("typo", event.ruleId);
    EXPECT_EQ(0u, event.cost);
    ASSERT_EQ(1u, event.paths.size());
    EXPECT_EQ((std::vector<std::string>{"house : 0 typos"}), event.paths[0]);
}
