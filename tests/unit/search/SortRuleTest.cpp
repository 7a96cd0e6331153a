// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/Sort.h"

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/SearchLogger.h"

#include <gtest/gtest.h>

#include <memory>

using namespace rankflow;
using namespace rankflow::search;
using rankflow::index::Document;
using rankflow::index::IndexSettings;
using rankflow::index::MemoryIndex;
using rankflow::util::BitSet;

class SortRuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title"};
        settings.sortableFields = {"price"};
        index_ = std::make_unique<MemoryIndex>(settings);

        addPrice(1, {30});
        addPrice(2, {10});
        addPrice(3, {20, 5});  // sorted by its best value
        addPrice(4, {10});
        addLabel(5, "Beta");
        addLabel(6, "alpha");
        add(7, Document{});  // no value
        index_->finish();
        ctx_ = std::make_unique<SearchContext>(*index_);
    }

    void add(index::DocId id, Document doc) {
        doc.text["title"] = "item";
        index_->addDocument(id, doc);
    }

    void addPrice(index::DocId id, std::vector<double> prices) {
        Document doc;
        doc.numbers["price"] = std::move(prices);
        add(id, std::move(doc));
    }

    void addLabel(index::DocId id, const std::string& label) {
        Document doc;
        doc.strings["price"] = {label};
        add(id, std::move(doc));
    }

    std::vector<BitSet> drain(RankingRule& rule, BitSet universe) {
        std::vector<BitSet> buckets;
        const QueryGraph query = QueryGraph::placeholder();
        uint64_t lastCost = 0;
        rule.startIteration(*ctx_, logger_, universe, query);
        while (auto bucket = rule.nextBucket(*ctx_, logger_, universe)) {
            EXPECT_EQ(query, bucket->query);
            EXPECT_GE(bucket->cost, lastCost);
            lastCost = bucket->cost;
            universe -= bucket->candidates;
            buckets.push_back(bucket->candidates);
        }
        rule.endIteration(*ctx_, logger_);
        EXPECT_TRUE(universe.empty());
        return buckets;
    }

    std::unique_ptr<MemoryIndex> index_;
    std::unique_ptr<SearchContext> ctx_;
    DefaultSearchLogger logger_;
};

// ==================== Ascending Tests ====================

TEST_F(SortRuleTest, NumbersThenStringsThenMissing) {
    SortRule rule("price", true);
    EXPECT_EQ("price:asc", rule.id());

    auto buckets = drain(rule, BitSet::fromRange(1, 8));
    ASSERT_EQ(6u, buckets.size());
    EXPECT_EQ((BitSet{3}), buckets[0]);
    EXPECT_EQ((BitSet{2, 4}), buckets[1]);
    EXPECT_EQ((BitSet{1}), buckets[2]);
    // Strings compare case-folded
    EXPECT_EQ((BitSet{6}), buckets[3]);
    EXPECT_EQ((BitSet{5}), buckets[4]);
    EXPECT_EQ((BitSet{7}), buckets[5]);
}

TEST_F(SortRuleTest, EmptyBucketsAreSkipped) {
    SortRule rule("price", true);
    auto buckets = drain(rule, BitSet{1, 7});
    ASSERT_EQ(2u, buckets.size());
    EXPECT_EQ((BitSet{1}), buckets[0]);
    EXPECT_EQ((BitSet{7}), buckets[1]);
}

// ==================== Descending Tests ====================

TEST_F(SortRuleTest, DescendingReversesEachKind) {
    SortRule rule("price", false);
    EXPECT_EQ("price:desc", rule.id());

    auto buckets = drain(rule, BitSet::fromRange(1, 8));
    ASSERT_EQ(6u, buckets.size());
    EXPECT_EQ((BitSet{1}), buckets[0]);
    // 3 holds 20 and 5, its best descending value is 20
    EXPECT_EQ((BitSet{3}), buckets[1]);
    EXPECT_EQ((BitSet{2, 4}), buckets[2]);
    EXPECT_EQ((BitSet{5}), buckets[3]);
    EXPECT_EQ((BitSet{6}), buckets[4]);
    EXPECT_EQ((BitSet{7}), buckets[5]);
}

// ==================== Lifecycle Tests ====================

TEST_F(SortRuleTest, UnknownFieldIsOneBucket) {
    SortRule rule("missing", true);
    auto buckets = drain(rule, BitSet{1, 2, 3});
    ASSERT_EQ(1u, buckets.size());
    EXPECT_EQ((BitSet{1, 2, 3}), buckets[0]);
}

TEST_F(SortRuleTest, BucketsFollowTheShrinkingUniverse) {
    SortRule rule("price", true);
    rule.startIteration(*ctx_, logger_, BitSet::fromRange(1, 8), QueryGraph::placeholder());
    // 3 was ranked elsewhere
    auto bucket = rule.nextBucket(*ctx_, logger_, BitSet{1, 2, 4});
    ASSERT_TRUE(bucket.has_value());
    EXPECT_EQ((BitSet{2, 4}), bucket->candidates);
    rule.endIteration(*ctx_, logger_);
    EXPECT_FALSE(rule.nextBucket(*ctx_, logger_, BitSet{1}).has_value());
}
