// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/SearchConfig.h"
#include "rankflow/search/rules/RankingRule.h"

#include <memory>
#include <string>
#include <vector>

namespace rankflow {
namespace index {
class IndexSource;
}

namespace search {

/**
 * @brief A ranking criterion as named in SearchConfig::rankingRules.
 */
struct Criterion {
    enum class Kind {
        Words,
        Typo,
        Proximity,
        Attribute,
        Fid,
        Position,
        Exactness,
        Boost,
        Sort,
        Asc,
        Desc
    };

    Kind kind = Kind::Words;

    /** Filter expression of a Boost criterion */
    std::string filter;

    /** Sorted field of an Asc or Desc criterion */
    std::string field;

    /**
     * @brief Parses `words`, `typo`, `proximity`, `attribute`, `fid`,
     * `position`, `exactness`, `sort`, `boost:<filter>`, `<field>:asc` or
     * `<field>:desc`.
     * @throws UserException(InvalidRankingRule) for anything else
     */
    static Criterion parse(const std::string& name);

    /**
     * @brief Parses one entry of SearchConfig::sort, `<field>:asc` or
     * `<field>:desc`.
     * @throws UserException(InvalidSort) for anything else
     */
    static Criterion parseSort(const std::string& text);

    std::string name() const;

    bool operator==(const Criterion& other) const {
        return kind == other.kind && filter == other.filter && field == other.field;
    }
};

/**
 * @brief words, typo, proximity, attribute, sort, exactness
 */
std::vector<Criterion> defaultCriteria();

/**
 * @brief Checks the sorted fields of a search against the index.
 *
 * @param criteria ranking criteria of the search
 * @param sort parsed SearchConfig::sort entries
 * @throws UserException(InvalidSort) if sort is not empty while criteria
 * has no `sort` criterion, or if an asc/desc field is not sortable
 */
void validateSort(const std::vector<Criterion>& criteria, const std::vector<Criterion>& sort,
                  const index::IndexSource& index);

/**
 * @brief Instantiates the ranking rules of a search, most important first.
 *
 * - `attribute` expands to the attribute, fid and position rules
 * - `exactness` expands to the exact attribute and exactness rules
 * - `sort` expands to one sort rule per entry of sort, in order
 * - the words rule is inserted before the first typo, proximity, attribute,
 *   fid, position or exactness rule when not listed; it is left out
 *   entirely with TermsMatchingStrategy::All
 * - a criterion listed twice is only instantiated once, and a field is
 *   sorted at most once
 * - a placeholder search (no query words) keeps only the boost and sort
 *   rules
 *
 * @throws FilterParseException if a boost filter is invalid or blank
 */
std::vector<std::unique_ptr<RankingRule>> buildRankingRules(const std::vector<Criterion>& criteria,
                                                            const std::vector<Criterion>& sort,
                                                            TermsMatchingStrategy strategy,
                                                            bool placeholder);

}  // namespace search
}  // namespace rankflow
