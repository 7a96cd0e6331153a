// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/ExactAttribute.h"

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/search/QueryTermBuilder.h"
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

class ExactAttributeTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title", "body"};
        index_ = std::make_unique<MemoryIndex>(settings);
        add(1, "quick brown", "");
        add(2, "quick brown fox", "");
        add(3, "the quick brown", "");
        add(4, "fox", "quick brown");
        add(5, "brown quick", "");
        index_->finish();

        ctx_ = std::make_unique<SearchContext>(*index_);
        builder_ = std::make_unique<QueryTermBuilder>(*ctx_, TypoToleranceConfig{});
    }

    void add(index::DocId id, const std::string& title, const std::string& body) {
        Document doc;
        doc.text["title"] = title;
        if (!body.empty()) {
            doc.text["body"] = body;
        }
        index_->addDocument(id, doc);
    }

    QueryGraph graphOf(const std::string& query) {
        auto tokens = builder_->parse(query);
        return QueryGraph::fromQuery(*ctx_, tokens.queryTerms, *builder_);
    }

    std::vector<BitSet> drain(const QueryGraph& query, BitSet universe) {
        ExactAttributeRule rule;
        std::vector<BitSet> buckets;
        rule.startIteration(*ctx_, logger_, universe, query);
        while (auto bucket = rule.nextBucket(*ctx_, logger_, universe)) {
            EXPECT_EQ(query, bucket->query);
            EXPECT_TRUE(bucket->candidates.isSubsetOf(universe));
            universe -= bucket->candidates;
            buckets.push_back(bucket->candidates);
        }
        rule.endIteration(*ctx_, logger_);
        EXPECT_TRUE(universe.empty());
        return buckets;
    }

    std::unique_ptr<MemoryIndex> index_;
    std::unique_ptr<SearchContext> ctx_;
    std::unique_ptr<QueryTermBuilder> builder_;
    DefaultSearchLogger logger_;
};

// ==================== Bucket Tests ====================

TEST_F(ExactAttributeTest, EqualThenStartsWithThenRest) {
    auto buckets = drain(graphOf("quick brown "), BitSet::fromRange(1, 6));
    ASSERT_EQ(3u, buckets.size());
    // 4 holds the query in its second field
    EXPECT_EQ((BitSet{1, 4}), buckets[0]);
    EXPECT_EQ((BitSet{2}), buckets[1]);
    EXPECT_EQ((BitSet{3, 5}), buckets[2]);
}

TEST_F(ExactAttributeTest, EmptyBucketsAreSkipped) {
    auto buckets = drain(graphOf("quick brown "), BitSet{2, 3});
    ASSERT_EQ(2u, buckets.size());
    EXPECT_EQ((BitSet{2}), buckets[0]);
    EXPECT_EQ((BitSet{3}), buckets[1]);
}

TEST_F(ExactAttributeTest, RestrictedFieldsOnly) {
    ctx_->restrictToFields({*index_->fieldId("title")});
    auto buckets = drain(graphOf("quick brown "), BitSet::fromRange(1, 6));
    ASSERT_EQ(3u, buckets.size());
    EXPECT_EQ((BitSet{1}), buckets[0]);
    EXPECT_EQ((BitSet{2}), buckets[1]);
    EXPECT_EQ((BitSet{3, 4, 5}), buckets[2]);
}

TEST_F(ExactAttributeTest, MissingFirstTermIsOneBucket) {
    QueryGraph query = graphOf("quick brown ");
    std::vector<QueryNodeId> first;
    for (size_t i = 0; i < query.size(); i++) {
        const QueryNode& node = query.node(static_cast<QueryNodeId>(i));
        if (node.isTerm() && node.term->termIdStart == 0 && node.term->termIdEnd == 0) {
            first.push_back(static_cast<QueryNodeId>(i));
        }
    }
    ASSERT_FALSE(first.empty());
    query.removeNodesKeepEdges(first);

    auto buckets = drain(query, BitSet::fromRange(1, 6));
    ASSERT_EQ(1u, buckets.size());
    EXPECT_EQ(BitSet::fromRange(1, 6), buckets[0]);
}

TEST_F(ExactAttributeTest, NoBucketBeforeStartIteration) {
    ExactAttributeRule rule;
    EXPECT_EQ("exact_attribute", rule.id());
    EXPECT_FALSE(rule.nextBucket(*ctx_, logger_, BitSet{1}).has_value());
}
