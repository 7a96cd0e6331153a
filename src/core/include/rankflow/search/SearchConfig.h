// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/util/TimeBudget.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rankflow {
namespace search {

class SearchLogger;

/**
 * @brief How many query terms a document must match.
 */
enum class TermsMatchingStrategy {
    /** Drop terms from the end of the query until documents match */
    Last,
    /** Every term must match */
    All,
    /** Drop the most frequent terms first */
    Frequency
};

/**
 * @brief Typo budget per query word, by number of code points.
 */
struct TypoToleranceConfig {
    bool enabled = true;

    /** Words shorter than this get no typo */
    size_t minWordSizeForOneTypo = 5;

    /** Words shorter than this get at most one typo */
    size_t minWordSizeForTwoTypos = 9;
};

/**
 * @brief Parameters of one search request.
 *
 * Usage:
 * ```cpp
 * SearchConfig config;
 * config.query = "quick brown fox";
 * config.filter = "genre = comedy";
 * config.rankingRules = {"words", "sort", "typo", "proximity"};
 * config.sort = {"price:asc"};
 * config.limit = 10;
 * ```
 */
struct SearchConfig {
    std::string query;

    /** Filter expression restricting the initial universe */
    std::optional<std::string> filter;

    /** Criterion names, most important first; empty selects the defaults */
    std::vector<std::string> rankingRules;

    /**
     * `<field>:asc` or `<field>:desc` entries applied in order where the
     * `sort` criterion sits. The fields must be sortable.
     */
    std::vector<std::string> sort;

    /** Filterable field whose values appear at most once in the results */
    std::optional<std::string> distinct;

    TermsMatchingStrategy termsMatchingStrategy = TermsMatchingStrategy::Last;

    size_t offset = 0;
    size_t limit = 20;

    util::TimeBudget timeBudget;

    TypoToleranceConfig typoTolerance;

    /** Searchable field names words may match in; unset means all */
    std::optional<std::vector<std::string>> searchableAttributes;

    /** Receives ranking events; not owned */
    SearchLogger* logger = nullptr;
};

}  // namespace search
}  // namespace rankflow
