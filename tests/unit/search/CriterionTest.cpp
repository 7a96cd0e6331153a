// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/rules/Criterion.h"

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/util/Exceptions.h"

#include <gtest/gtest.h>

using namespace rankflow;
using namespace rankflow::search;
using rankflow::index::IndexSettings;
using rankflow::index::MemoryIndex;

class CriterionTest : public ::testing::Test {
protected:
    static std::vector<Criterion> parseAll(const std::vector<std::string>& names) {
        std::vector<Criterion> criteria;
        for (const auto& name : names) {
            criteria.push_back(Criterion::parse(name));
        }
        return criteria;
    }

    static std::vector<Criterion> parseSorts(const std::vector<std::string>& entries) {
        std::vector<Criterion> sort;
        for (const auto& entry : entries) {
            sort.push_back(Criterion::parseSort(entry));
        }
        return sort;
    }

    static std::vector<std::string> ruleIds(const std::vector<std::string>& names,
                                            TermsMatchingStrategy strategy =
                                                TermsMatchingStrategy::Last,
                                            bool placeholder = false,
                                            const std::vector<std::string>& sort = {}) {
        std::vector<std::string> ids;
        for (const auto& rule :
             buildRankingRules(parseAll(names), parseSorts(sort), strategy, placeholder)) {
            ids.push_back(rule->id());
        }
        return ids;
    }

    static UserErrorCode sortError(const std::vector<std::string>& names,
                                   const std::vector<std::string>& sort) {
        IndexSettings settings;
        settings.sortableFields = {"price", "year"};
        MemoryIndex index(settings);
        try {
            validateSort(parseAll(names), parseSorts(sort), index);
        } catch (const UserException& e) {
            return e.code();
        }
        ADD_FAILURE() << "Expected UserException";
        return UserErrorCode::InvalidRankingRule;
    }
};

// ==================== Parse Tests ====================

TEST_F(CriterionTest, ParsesEveryName) {
    for (const std::string name : {"words", "typo", "proximity", "attribute", "fid", "position",
                                   "exactness", "sort", "price:asc", "price:desc"}) {
        EXPECT_EQ(name, Criterion::parse(name).name());
    }
}

TEST_F(CriterionTest, BoostKeepsItsFilter) {
    Criterion boost = Criterion::parse("boost:genre = comedy");
    EXPECT_EQ(Criterion::Kind::Boost, boost.kind);
    EXPECT_EQ("genre = comedy", boost.filter);
    EXPECT_EQ("boost:genre = comedy", boost.name());
}

TEST_F(CriterionTest, UnknownNameThrows) {
    for (const std::string name : {"Words", "", "boost", ":asc", "price:up"}) {
        try {
            Criterion::parse(name);
            FAIL() << "Expected UserException for " << name;
        } catch (const UserException& e) {
            EXPECT_EQ(UserErrorCode::InvalidRankingRule, e.code());
        }
    }
}

TEST_F(CriterionTest, Defaults) {
    std::vector<std::string> names;
    for (const auto& criterion : defaultCriteria()) {
        names.push_back(criterion.name());
    }
    EXPECT_EQ((std::vector<std::string>{"words", "typo", "proximity", "attribute", "sort",
                                        "exactness"}),
              names);
}

TEST_F(CriterionTest, AscDescKeepTheirField) {
    Criterion asc = Criterion::parse("release.year:asc");
    EXPECT_EQ(Criterion::Kind::Asc, asc.kind);
    EXPECT_EQ("release.year", asc.field);

    Criterion desc = Criterion::parseSort("price:desc");
    EXPECT_EQ(Criterion::Kind::Desc, desc.kind);
    EXPECT_EQ("price", desc.field);
}

TEST_F(CriterionTest, SortEntryMustBeAscOrDesc) {
    for (const std::string entry : {"price", "sort", "price:ASC", ":desc"}) {
        try {
            Criterion::parseSort(entry);
            FAIL() << "Expected UserException for " << entry;
        } catch (const UserException& e) {
            EXPECT_EQ(UserErrorCode::InvalidSort, e.code());
            EXPECT_STREQ("invalid_search_sort", toString(e.code()));
        }
    }
}

// ==================== Sort Validation Tests ====================

TEST_F(CriterionTest, SortableFieldsPass) {
    IndexSettings settings;
    settings.sortableFields = {"price"};
    MemoryIndex index(settings);
    EXPECT_NO_THROW(
        validateSort(parseAll({"words", "sort", "price:desc"}), parseSorts({"price:asc"}), index));
    EXPECT_NO_THROW(validateSort(parseAll({"words"}), {}, index));
}

TEST_F(CriterionTest, SortWithoutSortRuleThrows) {
    EXPECT_EQ(UserErrorCode::InvalidSort, sortError({"words", "typo"}, {"price:asc"}));
}

TEST_F(CriterionTest, NonSortableFieldThrows) {
    EXPECT_EQ(UserErrorCode::InvalidSort, sortError({"words", "sort"}, {"title:asc"}));
    EXPECT_EQ(UserErrorCode::InvalidSort, sortError({"words", "title:desc"}, {}));

    IndexSettings settings;
    settings.sortableFields = {"price", "year"};
    MemoryIndex index(settings);
    try {
        validateSort(parseAll({"sort"}), parseSorts({"title:asc"}), index);
        FAIL() << "Expected UserException";
    } catch (const UserException& e) {
        EXPECT_STREQ(
            "Attribute `title` is not sortable. Available sortable attributes are: `price, year`.",
            e.what());
    }
}

// ==================== Build Tests ====================

TEST_F(CriterionTest, AttributeExpandsToFidAndPosition) {
    EXPECT_EQ((std::vector<std::string>{"words", "typo", "proximity", "attribute", "fid",
                                        "position", "exact_attribute", "exactness"}),
              ruleIds({"words", "typo", "proximity", "attribute", "exactness"}));
}

TEST_F(CriterionTest, AttributeDoesNotRepeatListedRules) {
    EXPECT_EQ((std::vector<std::string>{"words", "fid", "attribute", "position"}),
              ruleIds({"fid", "attribute", "position"}));
}

TEST_F(CriterionTest, WordsIsInsertedFirst) {
    EXPECT_EQ((std::vector<std::string>{"words", "typo", "proximity"}),
              ruleIds({"typo", "words", "proximity"}));
}

TEST_F(CriterionTest, DuplicatesAreIgnored) {
    EXPECT_EQ((std::vector<std::string>{"words", "typo"}), ruleIds({"typo", "typo", "words"}));
}

TEST_F(CriterionTest, AllStrategyHasNoWordsRule) {
    EXPECT_EQ((std::vector<std::string>{"typo", "exact_attribute", "exactness"}),
              ruleIds({"words", "typo", "exactness"}, TermsMatchingStrategy::All));
}

TEST_F(CriterionTest, BoostBeforeWords) {
    EXPECT_EQ((std::vector<std::string>{"boost:\"genre\" = \"comedy\"", "words", "typo"}),
              ruleIds({"boost:genre = comedy", "typo"}));
}

TEST_F(CriterionTest, PlaceholderKeepsOnlyBoosts) {
    EXPECT_EQ((std::vector<std::string>{"boost:\"genre\" = \"comedy\""}),
              ruleIds({"words", "boost:genre = comedy", "typo"}, TermsMatchingStrategy::Last,
                      true));
}

TEST_F(CriterionTest, InvalidBoostFilter) {
    EXPECT_THROW(ruleIds({"boost:   "}), FilterParseException);
    EXPECT_THROW(ruleIds({"boost:genre ="}), FilterParseException);
}

// ==================== Sort Build Tests ====================

TEST_F(CriterionTest, SortExpandsToTheSearchSort) {
    EXPECT_EQ((std::vector<std::string>{"words", "price:asc", "year:desc", "typo"}),
              ruleIds({"words", "sort", "typo"}, TermsMatchingStrategy::Last, false,
                      {"price:asc", "year:desc"}));
    EXPECT_EQ((std::vector<std::string>{"words", "typo"}), ruleIds({"words", "sort", "typo"}));
}

TEST_F(CriterionTest, SortRulesDoNotInsertWords) {
    EXPECT_EQ((std::vector<std::string>{"price:desc", "words", "typo"}),
              ruleIds({"price:desc", "typo"}));
}

TEST_F(CriterionTest, FieldIsSortedOnce) {
    EXPECT_EQ((std::vector<std::string>{"price:asc", "words", "year:asc"}),
              ruleIds({"price:asc", "words", "sort"}, TermsMatchingStrategy::Last, false,
                      {"price:desc", "year:asc"}));
}

TEST_F(CriterionTest, PlaceholderKeepsSortRules) {
    EXPECT_EQ((std::vector<std::string>{"price:asc", "year:desc"}),
              ruleIds({"words", "sort", "typo", "year:desc"}, TermsMatchingStrategy::Last, true,
                      {"price:asc"}));
}
