// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/QueryTermBuilder.h"

#include "rankflow/analysis/QueryTokenizer.h"
#include "rankflow/index/MemoryIndex.h"
#include "rankflow/search/Limits.h"
#include "rankflow/search/SearchContext.h"

#include <gtest/gtest.h>

#include <memory>

using namespace rankflow;
using namespace rankflow::search;
using rankflow::analysis::QueryTokenizer;
using rankflow::index::Document;
using rankflow::index::IndexSettings;
using rankflow::index::MemoryIndex;

class QueryTermBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexSettings settings;
        settings.searchableFields = {"title"};
        index_ = std::make_unique<MemoryIndex>(settings);
        add(1, "sunflower seeds");
        add(2, "sun flower garden");
        add(3, "summer house");
        add(4, "summerhouse by the lake");
        add(5, "sunflowers and roses");
        index_->finish();

        ctx_ = std::make_unique<SearchContext>(*index_);
        builder_ = std::make_unique<QueryTermBuilder>(*ctx_, TypoToleranceConfig{});
    }

    void add(index::DocId id, const std::string& title) {
        Document doc;
        doc.text["title"] = title;
        index_->addDocument(id, doc);
    }

    const QueryTerm& term(const LocatedQueryTerm& located) {
        return ctx_->termInterner.get(located.value);
    }

    std::string word(WordId id) { return ctx_->word(id); }

    WordId wordId(const std::string& text) { return ctx_->wordInterner.insert(text); }

    std::unique_ptr<MemoryIndex> index_;
    std::unique_ptr<SearchContext> ctx_;
    std::unique_ptr<QueryTermBuilder> builder_;
};

// ==================== Tokenization Tests ====================

TEST_F(QueryTermBuilderTest, PositionsFollowWords) {
    auto tokens = builder_->parse("summer house lake");
    ASSERT_EQ(3u, tokens.queryTerms.size());
    EXPECT_EQ(0, tokens.queryTerms[0].positionStart);
    EXPECT_EQ(1, tokens.queryTerms[1].positionStart);
    EXPECT_EQ(2, tokens.queryTerms[2].positionEnd);
    EXPECT_EQ("summer", word(term(tokens.queryTerms[0]).original));
}

TEST_F(QueryTermBuilderTest, HardSeparatorAddsGap) {
    auto tokens = builder_->parse("summer. house");
    ASSERT_EQ(2u, tokens.queryTerms.size());
    EXPECT_EQ(0, tokens.queryTerms[0].positionStart);
    EXPECT_EQ(1 + QueryTokenizer::HARD_SEPARATOR_GAP, tokens.queryTerms[1].positionStart);
}

TEST_F(QueryTermBuilderTest, OnlyTheLastWordIsAPrefix) {
    auto tokens = builder_->parse("summer hou");
    ASSERT_EQ(2u, tokens.queryTerms.size());
    EXPECT_FALSE(term(tokens.queryTerms[0]).isPrefix);
    EXPECT_TRUE(term(tokens.queryTerms[1]).isPrefix);

    auto trailing = builder_->parse("summer hou ");
    ASSERT_EQ(2u, trailing.queryTerms.size());
    EXPECT_FALSE(term(trailing.queryTerms[1]).isPrefix);
}

TEST_F(QueryTermBuilderTest, PrefixExpandsToIndexedWords) {
    auto tokens = builder_->parse("sunflower");
    ASSERT_EQ(1u, tokens.queryTerms.size());
    const QueryTerm& sunflower = term(tokens.queryTerms[0]);
    ASSERT_TRUE(sunflower.zeroTypo.exact.has_value());
    EXPECT_EQ("sunflower", word(*sunflower.zeroTypo.exact));
    EXPECT_EQ(1u, sunflower.zeroTypo.prefixOf.size());
    EXPECT_EQ(1u, sunflower.zeroTypo.prefixOf.count(wordId("sunflowers")));
}

TEST_F(QueryTermBuilderTest, WordsLimit) {
    auto tokens = builder_->parse("a b c d e f g h i j k l");
    EXPECT_EQ(Limits::MAX_QUERY_WORDS, tokens.queryTerms.size());
}

TEST_F(QueryTermBuilderTest, EmptyQuery) {
    auto tokens = builder_->parse("   ");
    EXPECT_TRUE(tokens.queryTerms.empty());
    EXPECT_TRUE(tokens.negativeWords.empty());
}

// ==================== Phrase Tests ====================

TEST_F(QueryTermBuilderTest, QuotedWordsFormAPhrase) {
    auto tokens = builder_->parse("\"summer house\" lake");
    ASSERT_EQ(2u, tokens.queryTerms.size());
    const QueryTerm& phrase = term(tokens.queryTerms[0]);
    ASSERT_TRUE(phrase.originalPhrase().has_value());
    EXPECT_FALSE(phrase.allowsSplitWords());
    EXPECT_EQ(0, tokens.queryTerms[0].positionStart);
    EXPECT_EQ(1, tokens.queryTerms[0].positionEnd);
    EXPECT_EQ(2, tokens.queryTerms[1].positionStart);

    const Phrase& words = ctx_->phraseInterner.get(*phrase.originalPhrase());
    ASSERT_EQ(2u, words.words.size());
    EXPECT_EQ("summer", word(*words.words[0]));
    EXPECT_EQ("house", word(*words.words[1]));
}

TEST_F(QueryTermBuilderTest, UnclosedQuoteExtendsToTheEnd) {
    auto tokens = builder_->parse("lake \"summer house");
    ASSERT_EQ(2u, tokens.queryTerms.size());
    EXPECT_FALSE(term(tokens.queryTerms[0]).originalPhrase().has_value());
    EXPECT_TRUE(term(tokens.queryTerms[1]).originalPhrase().has_value());
}

// ==================== Negation Tests ====================

TEST_F(QueryTermBuilderTest, DashBeforeWordNegatesIt) {
    auto tokens = builder_->parse("house -summer");
    ASSERT_EQ(1u, tokens.queryTerms.size());
    ASSERT_EQ(1u, tokens.negativeWords.size());
    EXPECT_EQ("summer", word(tokens.negativeWords[0].id));
}

TEST_F(QueryTermBuilderTest, DashInsideWordIsNotNegation) {
    auto tokens = builder_->parse("summer-house");
    EXPECT_EQ(2u, tokens.queryTerms.size());
    EXPECT_TRUE(tokens.negativeWords.empty());
}

TEST_F(QueryTermBuilderTest, NegatedPhrase) {
    auto tokens = builder_->parse("lake -\"summer house\"");
    ASSERT_EQ(1u, tokens.queryTerms.size());
    ASSERT_EQ(1u, tokens.negativePhrases.size());
    EXPECT_TRUE(term(tokens.negativePhrases[0]).originalPhrase().has_value());
}

// ==================== Typo Tests ====================

TEST_F(QueryTermBuilderTest, TypoBudgetByLength) {
    EXPECT_EQ(0, builder_->numberOfTyposAllowed("sun"));
    EXPECT_EQ(1, builder_->numberOfTyposAllowed("house"));
    EXPECT_EQ(2, builder_->numberOfTyposAllowed("sunflower"));

    TypoToleranceConfig disabled;
    disabled.enabled = false;
    QueryTermBuilder strict(*ctx_, disabled);
    EXPECT_EQ(0, strict.numberOfTyposAllowed("sunflower"));
}

TEST_F(QueryTermBuilderTest, OneTypoDerivations) {
    auto tokens = builder_->parse("sunflwer ");
    ASSERT_EQ(1u, tokens.queryTerms.size());
    const QueryTerm& sunflwer = term(tokens.queryTerms[0]);
    EXPECT_FALSE(sunflwer.zeroTypo.exact.has_value());
    EXPECT_EQ(1, sunflwer.maxLevenshteinDistance);
    EXPECT_EQ(1u, sunflwer.oneTypo.oneTypo.count(wordId("sunflower")));
    EXPECT_EQ(0u, sunflwer.oneTypo.oneTypo.count(wordId("sunflowers")));
}

TEST_F(QueryTermBuilderTest, SplitWordsUseTheMostFrequentPair) {
    auto tokens = builder_->parse("sunflower ");
    ASSERT_EQ(1u, tokens.queryTerms.size());
    const QueryTerm& sunflower = term(tokens.queryTerms[0]);
    ASSERT_TRUE(sunflower.oneTypo.splitWords.has_value());
    const Phrase& split = ctx_->phraseInterner.get(*sunflower.oneTypo.splitWords);
    ASSERT_EQ(2u, split.words.size());
    EXPECT_EQ("sun", word(*split.words[0]));
    EXPECT_EQ("flower", word(*split.words[1]));
}

TEST_F(QueryTermBuilderTest, EditDistance) {
    auto cp = [](const std::string& s) { return QueryTokenizer::codePoints(s); };
    EXPECT_EQ(3u, QueryTermBuilder::editDistance(cp("kitten"), cp("sitting"), false));
    EXPECT_EQ(1u, QueryTermBuilder::editDistance(cp("huose"), cp("house"), false));
    EXPECT_EQ(0u, QueryTermBuilder::editDistance(cp("sun"), cp("sunflower"), true));
    EXPECT_EQ(1u, QueryTermBuilder::editDistance(cp("sum"), cp("sunflower"), true));
}

// ==================== Ngram Tests ====================

TEST_F(QueryTermBuilderTest, NgramMergesAdjacentWords) {
    auto tokens = builder_->parse("sun flower");
    ASSERT_EQ(2u, tokens.queryTerms.size());
    auto ngram = builder_->makeNgram(tokens.queryTerms);
    ASSERT_TRUE(ngram.has_value());

    const QueryTerm& merged = term(*ngram);
    EXPECT_EQ("sunflower", word(merged.original));
    ASSERT_TRUE(merged.ngramWords.has_value());
    EXPECT_EQ(2u, merged.ngramWords->size());
    // Nine code points allow two typos, minus one per merged word
    EXPECT_EQ(1, merged.maxLevenshteinDistance);
    EXPECT_TRUE(merged.zeroTypo.exact.has_value());
    // Splitting back into "sun flower" adds nothing
    EXPECT_FALSE(merged.oneTypo.splitWords.has_value());
    EXPECT_EQ(0, ngram->positionStart);
    EXPECT_EQ(1, ngram->positionEnd);
}

TEST_F(QueryTermBuilderTest, NoNgramAcrossPhrasesOrGaps) {
    auto phrase = builder_->parse("\"summer\" house");
    ASSERT_EQ(2u, phrase.queryTerms.size());
    EXPECT_FALSE(builder_->makeNgram(phrase.queryTerms).has_value());

    auto gap = builder_->parse("summer. house");
    ASSERT_EQ(2u, gap.queryTerms.size());
    EXPECT_FALSE(builder_->makeNgram(gap.queryTerms).has_value());
}
