// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/util/Interner.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rankflow {
namespace search {

class SearchContext;

using WordId = util::Interned<std::string>;

/**
 * @brief Consecutive words that must appear next to each other.
 *
 * A missing word (nullopt) is a gap, one position that may hold any word.
 */
struct Phrase {
    std::vector<std::optional<WordId>> words;

    bool operator==(const Phrase& other) const { return words == other.words; }
    bool operator!=(const Phrase& other) const { return !(*this == other); }

    std::string description(const util::Interner<std::string>& words) const;
};

struct PhraseHash {
    size_t operator()(const Phrase& phrase) const noexcept;
};

using PhraseId = util::Interned<Phrase>;

/**
 * @brief A single-word derivation of a query term.
 *
 * Original words are the query word itself (exact match); derived words come
 * from typos, prefixes or ngram concatenation. Only original words match the
 * exact-attribute postings.
 */
struct Word {
    WordId id;
    bool derived = false;

    bool operator==(const Word& other) const { return id == other.id && derived == other.derived; }
    bool operator!=(const Word& other) const { return !(*this == other); }
    bool operator<(const Word& other) const {
        return id != other.id ? id < other.id : derived < other.derived;
    }
};

/**
 * @brief Selection among the derivations of one typo level.
 *
 * Union with All yields All; intersection with Nothing yields Nothing.
 */
class NTypoTermSubset {
public:
    enum class Kind : uint8_t { All, Subset, Nothing };

    static NTypoTermSubset all() { return NTypoTermSubset(Kind::All); }
    static NTypoTermSubset nothing() { return NTypoTermSubset(Kind::Nothing); }
    static NTypoTermSubset subset(std::set<WordId> words, std::set<PhraseId> phrases);

    Kind kind() const { return kind_; }
    const std::set<WordId>& words() const { return words_; }
    const std::set<PhraseId>& phrases() const { return phrases_; }

    bool containsWord(WordId word) const;
    bool containsPhrase(PhraseId phrase) const;

    /**
     * True for Nothing and for a Subset without words or phrases.
     */
    bool isEmpty() const;

    void unionWith(const NTypoTermSubset& other);
    void intersect(const NTypoTermSubset& other);

    bool operator==(const NTypoTermSubset& other) const;
    bool operator!=(const NTypoTermSubset& other) const { return !(*this == other); }

    size_t hash() const noexcept;

private:
    explicit NTypoTermSubset(Kind kind)
        : kind_(kind) {}

    Kind kind_;
    std::set<WordId> words_;
    std::set<PhraseId> phrases_;
};

struct ZeroTypoTerm {
    /** Set when the query term is a quoted phrase */
    std::optional<PhraseId> phrase;
    /** The query word itself, when the index contains it */
    std::optional<WordId> exact;
    /** Indexed words the (prefix) query word is a strict prefix of */
    std::set<WordId> prefixOf;
    std::set<PhraseId> synonyms;
    /** The query word, when the index keeps a prefix posting for it */
    std::optional<WordId> usePrefixDb;

    bool empty() const {
        return !phrase && !exact && prefixOf.empty() && synonyms.empty() && !usePrefixDb;
    }
};

struct OneTypoTerm {
    /** The two words the query word splits into, as a phrase */
    std::optional<PhraseId> splitWords;
    std::set<WordId> oneTypo;

    bool empty() const { return !splitWords && oneTypo.empty(); }
};

struct TwoTypoTerm {
    std::set<WordId> twoTypos;

    bool empty() const { return twoTypos.empty(); }
};

/**
 * @brief Every acceptable match of one query position: the word itself,
 * typo and prefix derivations, synonyms, split words, or a phrase.
 */
struct QueryTerm {
    WordId original;
    /** The merged query words when this term is an ngram */
    std::optional<std::vector<WordId>> ngramWords;
    uint8_t maxLevenshteinDistance = 0;
    bool isPrefix = false;
    ZeroTypoTerm zeroTypo;
    OneTypoTerm oneTypo;
    TwoTypoTerm twoTypo;

    bool allowsSplitWords() const { return !zeroTypo.phrase.has_value(); }

    bool isEmpty() const { return zeroTypo.empty() && oneTypo.empty() && twoTypo.empty(); }

    std::optional<PhraseId> originalPhrase() const { return zeroTypo.phrase; }

    /**
     * @brief All derived words and phrases, sorted.
     */
    std::pair<std::vector<WordId>, std::vector<PhraseId>> allComputedDerivations() const;
};

using TermId = util::Interned<QueryTerm>;

/**
 * @brief A query term and the range of query positions it covers.
 */
struct LocatedQueryTerm {
    TermId value;
    uint16_t positionStart = 0;
    uint16_t positionEnd = 0;
};

/**
 * @brief The exact form of a term, if any: its phrase or its original word.
 */
struct ExactTerm {
    std::optional<PhraseId> phrase;
    std::optional<WordId> word;

    /**
     * @brief Words in order; gaps of a phrase are nullopt.
     */
    std::vector<std::optional<WordId>> words(const SearchContext& ctx) const;
};

/**
 * @brief A query term restricted to some of its derivations, per typo level.
 *
 * Ranking rules narrow the subset of a term (e.g. the typo rule keeps only
 * the one-typo derivations on its cost-1 edge) and hand the narrowed graph
 * to the next rule.
 */
class QueryTermSubset {
public:
    QueryTermSubset() = default;

    static QueryTermSubset empty(TermId forTerm);
    static QueryTermSubset full(TermId forTerm);

    TermId original() const { return original_; }

    bool isMandatory() const { return mandatory_; }
    void makeMandatory() { mandatory_ = true; }

    std::optional<ExactTerm> exactTerm(const SearchContext& ctx) const;

    /**
     * @throws InternalException if the subsets belong to different terms
     */
    void unionWith(const QueryTermSubset& other);

    /**
     * @throws InternalException if the subsets belong to different terms
     */
    void intersect(const QueryTermSubset& other);

    /**
     * @brief The prefix whose precomputed posting should be used, if any.
     */
    std::optional<Word> usePrefixDb(const SearchContext& ctx) const;

    std::set<Word> allSingleWordsExceptPrefixDb(const SearchContext& ctx) const;

    std::set<PhraseId> allPhrases(const SearchContext& ctx) const;

    std::optional<PhraseId> originalPhrase(const SearchContext& ctx) const;

    /**
     * @brief Highest number of typos among the selected derivations.
     */
    uint8_t maxTypoCost(const SearchContext& ctx) const;

    /**
     * @brief Narrows the subset to the exact word or phrase, if the term has one.
     */
    void keepOnlyExactTerm(const SearchContext& ctx);

    void clearZeroTypoSubset() { zeroTypo_ = NTypoTermSubset::nothing(); }
    void clearOneTypoSubset() { oneTypo_ = NTypoTermSubset::nothing(); }
    void clearTwoTypoSubset() { twoTypo_ = NTypoTermSubset::nothing(); }

    /**
     * @brief True if no derivation at all is selected.
     */
    bool isEmpty(const SearchContext& ctx) const;

    std::string description(const SearchContext& ctx) const;

    bool operator==(const QueryTermSubset& other) const;
    bool operator!=(const QueryTermSubset& other) const { return !(*this == other); }

    size_t hash() const noexcept;

private:
    TermId original_;
    NTypoTermSubset zeroTypo_ = NTypoTermSubset::nothing();
    NTypoTermSubset oneTypo_ = NTypoTermSubset::nothing();
    NTypoTermSubset twoTypo_ = NTypoTermSubset::nothing();
    bool mandatory_ = false;
};

/**
 * @brief A term subset placed in the query: the positions it covers and the
 * ids of the original query terms it stands for (several for an ngram).
 */
struct LocatedQueryTermSubset {
    QueryTermSubset termSubset;
    uint16_t positionStart = 0;
    uint16_t positionEnd = 0;
    uint8_t termIdStart = 0;
    uint8_t termIdEnd = 0;

    size_t termIdsLen() const { return static_cast<size_t>(termIdEnd - termIdStart) + 1; }

    bool operator==(const LocatedQueryTermSubset& other) const {
        return termSubset == other.termSubset && positionStart == other.positionStart &&
               positionEnd == other.positionEnd && termIdStart == other.termIdStart &&
               termIdEnd == other.termIdEnd;
    }
    bool operator!=(const LocatedQueryTermSubset& other) const { return !(*this == other); }

    size_t hash() const noexcept;
};

struct LocatedQueryTermSubsetHash {
    size_t operator()(const LocatedQueryTermSubset& term) const noexcept { return term.hash(); }
};

}  // namespace search
}  // namespace rankflow
