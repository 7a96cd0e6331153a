// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/util/Exceptions.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace rankflow;
using namespace rankflow::index;
using rankflow::util::BitSet;

class MemoryIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title", "body"};
        settings.filterableFields = {"genre", "year"};
        settings.sortableFields = {"year"};
        settings.exactFields = {"sku"};
        settings.searchableFields.push_back("sku");
        settings.prefixCacheMaxLength = 2;
        index_ = std::make_unique<MemoryIndex>(settings);

        add(1, "The quick brown fox", "jumps over the lazy dog", "comedy", 1999);
        add(2, "Brown bears", "quick. brown", "drama", 2005);
        add(3, "Lazy afternoon", "", "Comedy", 2010);

        Document withSku;
        withSku.text["sku"] = "AB12";
        index_->addDocument(4, withSku);
        index_->finish();
    }

    void add(DocId id, const std::string& title, const std::string& body,
             const std::string& genre, double year) {
        Document doc;
        doc.text["title"] = title;
        if (!body.empty()) {
            doc.text["body"] = body;
        }
        doc.strings["genre"] = {genre};
        doc.numbers["year"] = {year};
        index_->addDocument(id, doc);
    }

    std::unique_ptr<MemoryIndex> index_;
};

// ==================== Postings Tests ====================

TEST_F(MemoryIndexTest, WordPostings) {
    EXPECT_EQ((BitSet{1, 2, 3, 4}), index_->documentIds());
    EXPECT_EQ((BitSet{1, 2}), index_->wordDocids("brown"));
    EXPECT_EQ((BitSet{1, 3}), index_->wordDocids("lazy"));
    EXPECT_TRUE(index_->wordDocids("missing").empty());
    EXPECT_TRUE(index_->containsWord("quick"));
    EXPECT_FALSE(index_->containsWord("missing"));
}

TEST_F(MemoryIndexTest, ExactFieldsUseExactPostings) {
    EXPECT_TRUE(index_->wordDocids("ab12").empty());
    EXPECT_EQ((BitSet{4}), index_->exactWordDocids("ab12"));
    EXPECT_TRUE(index_->containsWord("ab12"));
}

TEST_F(MemoryIndexTest, PairProximityKeepsSmallestForwardDistance) {
    EXPECT_EQ((BitSet{1}), index_->wordPairProximityDocids("quick", "brown", 1));
    EXPECT_TRUE(index_->wordPairProximityDocids("brown", "quick", 1).empty());
    EXPECT_EQ((BitSet{1}), index_->wordPairProximityDocids("quick", "fox", 2));
    // Hard separator in "quick. brown" puts them 8 positions apart
    EXPECT_TRUE(index_->wordPairProximityDocids("quick", "brown", 7).empty());
}

TEST_F(MemoryIndexTest, PairsDoNotCrossFields) {
    EXPECT_TRUE(index_->wordPairProximityDocids("fox", "jumps", 1).empty());
}

TEST_F(MemoryIndexTest, FieldAndPositionPostings) {
    auto title = index_->fieldId("title");
    auto body = index_->fieldId("body");
    ASSERT_TRUE(title && body);
    EXPECT_EQ((std::vector<FieldId>{*title, *body}), index_->fieldIdsOfWord("brown"));
    EXPECT_EQ((BitSet{1, 2}), index_->wordFidDocids("brown", *title));
    EXPECT_EQ((BitSet{2}), index_->wordFidDocids("brown", *body));
    EXPECT_EQ((BitSet{2}), index_->wordPositionDocids("brown", 0));
    EXPECT_EQ((BitSet{1}), index_->wordPositionDocids("brown", 2));
}

TEST_F(MemoryIndexTest, SearchableFieldsInWeightOrder) {
    auto fids = index_->searchableFieldIds();
    ASSERT_EQ(3u, fids.size());
    EXPECT_EQ(index_->fieldId("title"), fids[0]);
    EXPECT_EQ(index_->fieldId("body"), fids[1]);
}

TEST_F(MemoryIndexTest, PositionInFieldPostings) {
    const FieldId title = *index_->fieldId("title");
    const FieldId body = *index_->fieldId("body");
    EXPECT_EQ((BitSet{1}), index_->wordFidPositionDocids("brown", title, 2));
    EXPECT_EQ((BitSet{2}), index_->wordFidPositionDocids("brown", title, 0));
    // A hard separator widens the gap
    EXPECT_EQ((BitSet{2}), index_->wordFidPositionDocids("brown", body, 8));
    EXPECT_TRUE(index_->wordFidPositionDocids("brown", body, 1).empty());
}

TEST_F(MemoryIndexTest, FieldWordCounts) {
    const FieldId title = *index_->fieldId("title");
    const FieldId body = *index_->fieldId("body");
    EXPECT_EQ((BitSet{1}), index_->fieldWordCountDocids(title, 4));
    EXPECT_EQ((BitSet{2, 3}), index_->fieldWordCountDocids(title, 2));
    EXPECT_EQ((BitSet{2}), index_->fieldWordCountDocids(body, 2));
    EXPECT_TRUE(index_->fieldWordCountDocids(body, 0).empty());
}

// ==================== Vocabulary Tests ====================

TEST_F(MemoryIndexTest, WordsWithPrefix) {
    EXPECT_EQ((std::vector<std::string>{"bears", "brown"}), index_->wordsWithPrefix("b", 10));
    EXPECT_EQ((std::vector<std::string>{"bears"}), index_->wordsWithPrefix("b", 1));
    EXPECT_TRUE(index_->wordsWithPrefix("zz", 10).empty());
}

TEST_F(MemoryIndexTest, PrefixCache) {
    auto cached = index_->wordPrefixDocids("b");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ((BitSet{1, 2}), *cached);
    // A single word starting with "fo": below prefixCacheMinWords
    EXPECT_FALSE(index_->wordPrefixDocids("fo").has_value());
}

TEST_F(MemoryIndexTest, Synonyms) {
    MemoryIndex index(IndexSettings{});
    index.addSynonyms({"NYC"}, {{"new", "york"}});
    auto alternatives = index.synonyms({"nyc"});
    ASSERT_EQ(1u, alternatives.size());
    EXPECT_EQ((std::vector<std::string>{"new", "york"}), alternatives[0]);
}

// ==================== Facet Tests ====================

TEST_F(MemoryIndexTest, StringFacetsAreCaseFolded) {
    EXPECT_EQ((BitSet{1, 3}), index_->facetStringDocids("genre", "comedy"));
    EXPECT_TRUE(index_->facetStringDocids("genre", "Comedy").empty());
}

TEST_F(MemoryIndexTest, NumberFacetRanges) {
    EXPECT_EQ((BitSet{2, 3}), index_->facetNumberDocids("year", 2000, 2010));
    EXPECT_EQ((BitSet{1}), index_->facetNumberDocids("year", 1999, 1999));
    EXPECT_TRUE(index_->facetNumberDocids("year", 2011, 2000).empty());
    EXPECT_EQ((BitSet{1, 2, 3}), index_->facetExistsDocids("year"));
}

TEST_F(MemoryIndexTest, FacetValuesInAscendingOrder) {
    auto years = index_->facetNumberValues("year");
    ASSERT_EQ(3u, years.size());
    EXPECT_EQ(1999, years[0].first);
    EXPECT_EQ((BitSet{1}), years[0].second);
    EXPECT_EQ(2010, years[2].first);

    auto genres = index_->facetStringValues("genre");
    ASSERT_EQ(2u, genres.size());
    EXPECT_EQ("comedy", genres[0].first);
    EXPECT_EQ((BitSet{1, 3}), genres[0].second);
    EXPECT_EQ("drama", genres[1].first);

    EXPECT_TRUE(index_->facetNumberValues("genre").empty());
    EXPECT_TRUE(index_->facetStringValues("missing").empty());
}

TEST_F(MemoryIndexTest, DocumentsSharingFacetValue) {
    EXPECT_EQ((BitSet{1, 3}), index_->documentsSharingFacetValue("genre", 1));
    EXPECT_EQ((BitSet{2}), index_->documentsSharingFacetValue("year", 2));
    EXPECT_TRUE(index_->documentsSharingFacetValue("genre", 4).empty());
}

TEST_F(MemoryIndexTest, SortableFields) {
    EXPECT_EQ((std::vector<std::string>{"year"}), index_->sortableFields());
}

// ==================== Lifecycle Tests ====================

TEST_F(MemoryIndexTest, DuplicateIdRejected) {
    MemoryIndex index(IndexSettings{});
    index.addDocument(1, Document{});
    EXPECT_THROW(index.addDocument(1, Document{}), std::invalid_argument);
}

TEST_F(MemoryIndexTest, FrozenAfterFinish) {
    EXPECT_THROW(index_->addDocument(9, Document{}), UnsupportedOperationException);
}
