// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/analysis/QueryTokenizer.h"
#include "rankflow/search/QueryTerm.h"
#include "rankflow/search/SearchConfig.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rankflow {
namespace search {

class SearchContext;

/**
 * @brief Terms of a parsed query.
 */
struct ExtractedTokens {
    /** Terms to search for, in query order */
    std::vector<LocatedQueryTerm> queryTerms;

    /** Words prefixed with '-': matching documents are excluded */
    std::vector<Word> negativeWords;

    /** Phrases prefixed with '-': matching documents are excluded */
    std::vector<LocatedQueryTerm> negativePhrases;
};

/**
 * @brief Turns query tokens into query terms with all their derivations.
 *
 * Each word gets its exact form (when indexed), prefix expansions (last word
 * only), synonyms, typo derivations within its Damerau-Levenshtein budget and
 * the best split into two adjacent words. Quoted sections become phrases.
 *
 * Terms are pushed into the term interner of the SearchContext.
 */
class QueryTermBuilder {
public:
    QueryTermBuilder(SearchContext& ctx, TypoToleranceConfig typoTolerance);

    /**
     * @brief Tokenizes and parses a raw query, keeping at most
     * Limits::MAX_QUERY_WORDS terms.
     */
    ExtractedTokens parse(const std::string& query);

    /**
     * @brief Parses query tokens.
     *
     * Positions start at 0 and grow by 1 per word and by 7 per hard
     * separator. A '-' preceded by whitespace negates the next word or
     * phrase. A quote left open extends the phrase to the end of the query.
     * Only the last word, when nothing follows it, is a prefix.
     */
    ExtractedTokens locatedQueryTermsFromTokens(const std::vector<analysis::Token>& tokens,
                                                std::optional<size_t> wordsLimit);

    /**
     * @brief Merges consecutive single-word terms into one ngram term.
     *
     * Returns nullopt when a term is a phrase, when positions are not
     * contiguous or when the merged word is too long. The ngram allows
     * (terms.size() - 1) fewer typos than the merged word would.
     */
    std::optional<LocatedQueryTerm> makeNgram(const std::vector<LocatedQueryTerm>& terms);

    /**
     * @brief Typo budget of a word: 0, 1 or 2.
     */
    uint8_t numberOfTyposAllowed(const std::string& word) const;

    /**
     * @brief Optimal string alignment distance between code point sequences.
     *
     * With prefix set, the distance to the closest prefix of candidate.
     */
    static size_t editDistance(const std::vector<int32_t>& query,
                               const std::vector<int32_t>& candidate, bool prefix);

private:
    QueryTerm termFromWord(const std::string& word, uint8_t maxTypos, bool isPrefix);

    void computeTypoDerivations(QueryTerm& term);

    std::optional<PhraseId> findSplitWords(const std::string& word);

    std::optional<LocatedQueryTerm> buildPhrase(std::vector<std::optional<WordId>> words,
                                                uint16_t start, uint16_t end);

    SearchContext& ctx_;
    TypoToleranceConfig typoTolerance_;
};

}  // namespace search
}  // namespace rankflow
