// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/QueryGraph.h"

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/search/QueryTermBuilder.h"
#include "rankflow/search/ResolveQueryGraph.h"
#include "rankflow/search/SearchContext.h"

#include <gtest/gtest.h>

#include <memory>

using namespace rankflow;
using namespace rankflow::search;
using rankflow::index::Document;
using rankflow::index::IndexSettings;
using rankflow::index::MemoryIndex;
using rankflow::util::BitSet;

class QueryGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title"};
        index_ = std::make_unique<MemoryIndex>(settings);
        add(1, "red car");
        add(2, "red bus");
        add(3, "red van big");
        add(4, "big car");
        add(5, "summer house");
        add(6, "summerhouse by the lake");
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

    std::unique_ptr<MemoryIndex> index_;
    std::unique_ptr<SearchContext> ctx_;
    std::unique_ptr<QueryTermBuilder> builder_;
};

// ==================== Construction Tests ====================

TEST_F(QueryGraphTest, WordsAndNgrams) {
    // 2 summer, 3 house, 4 summerhouse, 5 by, 6 houseby, 7 summerhouseby
    std::vector<LocatedQueryTerm> ngrams;
    auto tokens = builder_->parse("summer house by");
    QueryGraph graph = QueryGraph::fromQuery(*ctx_, tokens.queryTerms, *builder_, &ngrams);

    ASSERT_EQ(8u, graph.size());
    EXPECT_EQ(3u, ngrams.size());
    EXPECT_EQ((BitSet{2, 4, 7}), graph.node(graph.rootNode()).successors);
    EXPECT_EQ((BitSet{3, 6}), graph.node(2).successors);
    EXPECT_EQ((BitSet{5}), graph.node(3).successors);
    EXPECT_EQ((BitSet{5}), graph.node(4).successors);
    EXPECT_EQ((BitSet{5, 6, 7}), graph.node(graph.endNode()).predecessors);

    const auto& summerhouse = *graph.node(4).term;
    EXPECT_EQ(0, summerhouse.termIdStart);
    EXPECT_EQ(1, summerhouse.termIdEnd);
    EXPECT_EQ(2u, summerhouse.termIdsLen());
}

TEST_F(QueryGraphTest, Placeholder) {
    QueryGraph graph = QueryGraph::placeholder();
    ASSERT_EQ(2u, graph.size());
    EXPECT_EQ((BitSet{QueryGraph::END_NODE}), graph.node(graph.rootNode()).successors);
    EXPECT_EQ(QueryNode::Kind::Start, graph.node(graph.rootNode()).kind);
    EXPECT_EQ(QueryNode::Kind::End, graph.node(graph.endNode()).kind);
}

TEST_F(QueryGraphTest, DescribeListsLiveNodes) {
    QueryGraph graph = graphOf("summer house");
    const std::string description = graph.describe(*ctx_);
    EXPECT_NE(std::string::npos, description.find("START"));
    EXPECT_NE(std::string::npos, description.find("END"));
    EXPECT_NE(std::string::npos, description.find("summer"));
}

// ==================== Editing Tests ====================

TEST_F(QueryGraphTest, RemoveNodesKeepEdgesLinksNeighbours) {
    QueryGraph graph = graphOf("summer house by");
    graph.removeNodesKeepEdges({3});

    EXPECT_EQ(QueryNode::Kind::Deleted, graph.node(3).kind);
    EXPECT_EQ((BitSet{5, 6}), graph.node(2).successors);
    EXPECT_EQ((BitSet{2, 4}), graph.node(5).predecessors);
}

TEST_F(QueryGraphTest, SimplifyDropsDeadBranches) {
    QueryGraph graph = graphOf("summer house by");
    graph.removeNodes({5, 6});
    graph.simplify();

    std::vector<QueryNodeId> live;
    for (QueryNodeId id = 0; id < graph.size(); id++) {
        if (graph.node(id).isTerm()) {
            live.push_back(id);
        }
    }
    EXPECT_EQ((std::vector<QueryNodeId>{7}), live);
    EXPECT_EQ((BitSet{7}), graph.node(graph.rootNode()).successors);
}

TEST_F(QueryGraphTest, BuildFromPathsSharesCommonSuffixes) {
    QueryGraph graph = graphOf("summer house by");
    const auto& summer = *graph.node(2).term;
    const auto& summerhouse = *graph.node(4).term;
    const auto& by = *graph.node(5).term;

    std::vector<std::vector<QueryGraph::PathStep>> paths = {
        {{std::nullopt, summer}, {summer, by}},
        {{std::nullopt, summerhouse}, {summerhouse, by}},
    };
    QueryGraph rebuilt = QueryGraph::buildFromPaths(paths);

    // Start, End, summer, by, summerhouse
    ASSERT_EQ(5u, rebuilt.size());
    EXPECT_EQ((BitSet{2, 4}), rebuilt.node(rebuilt.rootNode()).successors);
    EXPECT_EQ((BitSet{2, 4}), rebuilt.node(3).predecessors);
    EXPECT_EQ(by, *rebuilt.node(3).term);
    EXPECT_EQ((BitSet{3}), rebuilt.node(rebuilt.endNode()).predecessors);
}

TEST_F(QueryGraphTest, CopiesAreIndependent) {
    QueryGraph graph = graphOf("summer house");
    QueryGraph copy = graph;
    EXPECT_EQ(graph, copy);
    copy.removeNodesKeepEdges({3});
    EXPECT_NE(graph, copy);
    EXPECT_TRUE(graph.node(3).isTerm());
}

// ==================== Removal Order Tests ====================

TEST_F(QueryGraphTest, RemovalOrderLastDropsTrailingTermsFirst) {
    QueryGraph graph = graphOf("summer house by");
    auto groups = graph.removalOrderLast(*ctx_);
    ASSERT_EQ(2u, groups.size());
    EXPECT_EQ((BitSet{5}), groups[0]);
    EXPECT_EQ((BitSet{3, 6}), groups[1]);
}

TEST_F(QueryGraphTest, RemovalOrderSingleWord) {
    QueryGraph graph = graphOf("summer");
    EXPECT_TRUE(graph.removalOrderLast(*ctx_).empty());
}

TEST_F(QueryGraphTest, PhrasesAreNeverRemoved) {
    QueryGraph graph = graphOf("\"summer house\" lake");
    // 2 phrase, 3 lake
    auto groups = graph.removalOrderLast(*ctx_);
    ASSERT_EQ(1u, groups.size());
    EXPECT_EQ((BitSet{3}), groups[0]);
    EXPECT_EQ(2u, graph.wordsInPhrasesCount(*ctx_));
}

TEST_F(QueryGraphTest, RemovalOrderFrequencyDropsCommonTermsFirst) {
    // red: 3 documents, big: 2, car: 2
    QueryGraph graph = graphOf("red big car ");
    auto groups = graph.removalOrderFrequency(*ctx_);
    ASSERT_EQ(1u, groups.size());
    EXPECT_EQ((BitSet{2}), groups[0]);
}

// ==================== Resolution Tests ====================

TEST_F(QueryGraphTest, GraphDocidsFollowEveryPath) {
    QueryGraph graph = graphOf("summer house ");
    BitSet docids = computeQueryGraphDocids(*ctx_, graph, ctx_->documentIds());
    EXPECT_EQ((BitSet{5, 6}), docids);
}

TEST_F(QueryGraphTest, PositionBuckets) {
    EXPECT_EQ(0, positionBucket(0));
    EXPECT_EQ(15, positionBucket(15));
    EXPECT_EQ(16, positionBucket(20));
    EXPECT_EQ(32, positionBucket(63));
    EXPECT_EQ(64, positionBucket(64));
}
