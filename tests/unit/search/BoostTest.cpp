// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/Boost.h"

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/SearchLogger.h"
#include "rankflow/util/Exceptions.h"

#include <gtest/gtest.h>

#include <memory>

using namespace rankflow;
using namespace rankflow::search;
using rankflow::filter::Filter;
using rankflow::index::Document;
using rankflow::index::IndexSettings;
using rankflow::index::MemoryIndex;
using rankflow::util::BitSet;

class BoostTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title"};
        settings.filterableFields = {"genre"};
        index_ = std::make_unique<MemoryIndex>(settings);
        add(1, "comedy");
        add(2, "drama");
        add(3, "comedy");
        add(4, "drama");
        add(5, "horror");
        index_->finish();
        ctx_ = std::make_unique<SearchContext>(*index_);
    }

    void add(index::DocId id, const std::string& genre) {
        Document doc;
        doc.text["title"] = "movie";
        doc.strings["genre"] = {genre};
        index_->addDocument(id, doc);
    }

    static Filter filterOf(const std::string& expression) { return *Filter::fromString(expression); }

    std::vector<BitSet> drain(RankingRule& rule, BitSet universe) {
        std::vector<BitSet> buckets;
        const QueryGraph query = QueryGraph::placeholder();
        rule.startIteration(*ctx_, logger_, universe, query);
        while (auto bucket = rule.nextBucket(*ctx_, logger_, universe)) {
            EXPECT_EQ(query, bucket->query);
            universe -= bucket->candidates;
            buckets.push_back(bucket->candidates);
        }
        rule.endIteration(*ctx_, logger_);
        return buckets;
    }

    std::unique_ptr<MemoryIndex> index_;
    std::unique_ptr<SearchContext> ctx_;
    DefaultSearchLogger logger_;
};

// ==================== Boost Tests ====================

TEST_F(BoostTest, MatchingDocumentsComeFirst) {
    BoostRule rule(filterOf("genre = drama"));
    auto buckets = drain(rule, BitSet::fromRange(1, 6));
    ASSERT_EQ(2u, buckets.size());
    EXPECT_EQ((BitSet{2, 4}), buckets[0]);
    EXPECT_EQ((BitSet{1, 3, 5}), buckets[1]);
}

TEST_F(BoostTest, IdNamesTheFilter) {
    BoostRule rule(filterOf("genre = drama"));
    EXPECT_EQ("boost:\"genre\" = \"drama\"", rule.id());
}

TEST_F(BoostTest, EmptyBucketsAreSkipped) {
    BoostRule rule(filterOf("genre = drama"));
    auto buckets = drain(rule, BitSet{1, 3});
    ASSERT_EQ(1u, buckets.size());
    EXPECT_EQ((BitSet{1, 3}), buckets[0]);

    BoostRule everything(filterOf("genre EXISTS"));
    buckets = drain(everything, BitSet{1, 2});
    ASSERT_EQ(1u, buckets.size());
    EXPECT_EQ((BitSet{1, 2}), buckets[0]);
}

TEST_F(BoostTest, NoBucketBeforeStartIteration) {
    BoostRule rule(filterOf("genre = drama"));
    EXPECT_FALSE(rule.nextBucket(*ctx_, logger_, BitSet{1}).has_value());
}

// ==================== Filter Boosting Tests ====================

TEST_F(BoostTest, FiltersApplyInOrder) {
    std::vector<Filter> filters;
    filters.push_back(filterOf("genre = horror"));
    filters.push_back(filterOf("genre = drama OR genre = horror"));
    FilterBoostingRule rule("filters", std::move(filters));

    auto buckets = drain(rule, BitSet::fromRange(1, 6));
    ASSERT_EQ(3u, buckets.size());
    EXPECT_EQ((BitSet{5}), buckets[0]);
    // A document is only returned for the first filter it matches
    EXPECT_EQ((BitSet{2, 4}), buckets[1]);
    EXPECT_EQ((BitSet{1, 3}), buckets[2]);
}

TEST_F(BoostTest, BucketsFollowTheShrinkingUniverse) {
    BoostRule rule(filterOf("genre = drama"));
    const BitSet universe = BitSet::fromRange(1, 6);
    rule.startIteration(*ctx_, logger_, universe, QueryGraph::placeholder());
    // The caller already ranked 4 elsewhere
    auto bucket = rule.nextBucket(*ctx_, logger_, BitSet{1, 2, 3, 5});
    ASSERT_TRUE(bucket.has_value());
    EXPECT_EQ((BitSet{2}), bucket->candidates);
    EXPECT_EQ(0u, bucket->cost);
    rule.endIteration(*ctx_, logger_);
}

TEST_F(BoostTest, NonFilterableFieldFailsAtStart) {
    BoostRule rule(filterOf("title = movie"));
    EXPECT_THROW(rule.startIteration(*ctx_, logger_, BitSet{1}, QueryGraph::placeholder()),
                 UserException);
}
