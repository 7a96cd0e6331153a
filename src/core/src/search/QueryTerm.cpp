// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/QueryTerm.h"

#include "rankflow/search/SearchContext.h"
#include "rankflow/util/Exceptions.h"

#include <algorithm>
#include <iterator>

namespace rankflow {
namespace search {

using util::hashCombine;

// ==================== Phrase ====================

std::string Phrase::description(const util::Interner<std::string>& interner) const {
    std::string result;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) {
            result += ' ';
        }
        result += words[i] ? interner.get(*words[i]) : std::string("_");
    }
    return result;
}

size_t PhraseHash::operator()(const Phrase& phrase) const noexcept {
    size_t seed = phrase.words.size();
    for (const auto& word : phrase.words) {
        hashCombine(seed, word ? std::hash<uint32_t>()(word->raw()) : 0x5bd1e995);
    }
    return seed;
}

// ==================== NTypoTermSubset ====================

NTypoTermSubset NTypoTermSubset::subset(std::set<WordId> words, std::set<PhraseId> phrases) {
    NTypoTermSubset result(Kind::Subset);
    result.words_ = std::move(words);
    result.phrases_ = std::move(phrases);
    return result;
}

bool NTypoTermSubset::containsWord(WordId word) const {
    switch (kind_) {
        case Kind::All: return true;
        case Kind::Subset: return words_.count(word) > 0;
        case Kind::Nothing: return false;
    }
    return false;
}

bool NTypoTermSubset::containsPhrase(PhraseId phrase) const {
    switch (kind_) {
        case Kind::All: return true;
        case Kind::Subset: return phrases_.count(phrase) > 0;
        case Kind::Nothing: return false;
    }
    return false;
}

bool NTypoTermSubset::isEmpty() const {
    switch (kind_) {
        case Kind::All: return false;
        case Kind::Subset: return words_.empty() && phrases_.empty();
        case Kind::Nothing: return true;
    }
    return true;
}

void NTypoTermSubset::unionWith(const NTypoTermSubset& other) {
    if (kind_ == Kind::All || other.kind_ == Kind::Nothing) {
        return;
    }
    if (other.kind_ == Kind::All || kind_ == Kind::Nothing) {
        *this = other;
        return;
    }
    words_.insert(other.words_.begin(), other.words_.end());
    phrases_.insert(other.phrases_.begin(), other.phrases_.end());
}

void NTypoTermSubset::intersect(const NTypoTermSubset& other) {
    if (kind_ == Kind::Nothing || other.kind_ == Kind::All) {
        return;
    }
    if (other.kind_ == Kind::Nothing || kind_ == Kind::All) {
        *this = other;
        return;
    }
    std::set<WordId> words;
    std::set_intersection(words_.begin(), words_.end(), other.words_.begin(),
                          other.words_.end(), std::inserter(words, words.end()));
    std::set<PhraseId> phrases;
    std::set_intersection(phrases_.begin(), phrases_.end(), other.phrases_.begin(),
                          other.phrases_.end(), std::inserter(phrases, phrases.end()));
    words_ = std::move(words);
    phrases_ = std::move(phrases);
}

bool NTypoTermSubset::operator==(const NTypoTermSubset& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    return kind_ != Kind::Subset || (words_ == other.words_ && phrases_ == other.phrases_);
}

size_t NTypoTermSubset::hash() const noexcept {
    size_t seed = static_cast<size_t>(kind_);
    if (kind_ == Kind::Subset) {
        for (const auto& word : words_) {
            hashCombine(seed, word.raw());
        }
        hashCombine(seed, 0xff);
        for (const auto& phrase : phrases_) {
            hashCombine(seed, phrase.raw());
        }
    }
    return seed;
}

// ==================== QueryTerm ====================

std::pair<std::vector<WordId>, std::vector<PhraseId>> QueryTerm::allComputedDerivations() const {
    std::set<WordId> words;
    std::set<PhraseId> phrases;
    if (zeroTypo.exact) {
        words.insert(*zeroTypo.exact);
    }
    words.insert(zeroTypo.prefixOf.begin(), zeroTypo.prefixOf.end());
    if (zeroTypo.phrase) {
        phrases.insert(*zeroTypo.phrase);
    }
    phrases.insert(zeroTypo.synonyms.begin(), zeroTypo.synonyms.end());
    words.insert(oneTypo.oneTypo.begin(), oneTypo.oneTypo.end());
    if (oneTypo.splitWords) {
        phrases.insert(*oneTypo.splitWords);
    }
    words.insert(twoTypo.twoTypos.begin(), twoTypo.twoTypos.end());
    return {std::vector<WordId>(words.begin(), words.end()),
            std::vector<PhraseId>(phrases.begin(), phrases.end())};
}

std::vector<std::optional<WordId>> ExactTerm::words(const SearchContext& ctx) const {
    if (phrase) {
        return ctx.phraseInterner.get(*phrase).words;
    }
    return {word};
}

// ==================== QueryTermSubset ====================

QueryTermSubset QueryTermSubset::empty(TermId forTerm) {
    QueryTermSubset result;
    result.original_ = forTerm;
    return result;
}

QueryTermSubset QueryTermSubset::full(TermId forTerm) {
    QueryTermSubset result;
    result.original_ = forTerm;
    result.zeroTypo_ = NTypoTermSubset::all();
    result.oneTypo_ = NTypoTermSubset::all();
    result.twoTypo_ = NTypoTermSubset::all();
    return result;
}

std::optional<ExactTerm> QueryTermSubset::exactTerm(const SearchContext& ctx) const {
    const QueryTerm& term = ctx.termInterner.get(original_);
    if (term.ngramWords) {
        return std::nullopt;
    }
    if (term.zeroTypo.phrase) {
        if (!zeroTypo_.containsPhrase(*term.zeroTypo.phrase)) {
            return std::nullopt;
        }
        return ExactTerm{term.zeroTypo.phrase, std::nullopt};
    }
    if (term.zeroTypo.exact) {
        if (!zeroTypo_.containsWord(*term.zeroTypo.exact)) {
            return std::nullopt;
        }
        return ExactTerm{std::nullopt, term.zeroTypo.exact};
    }
    return std::nullopt;
}

void QueryTermSubset::unionWith(const QueryTermSubset& other) {
    if (original_ != other.original_) {
        throw InternalException(InternalErrorCode::InvariantViolation,
                                "Cannot union subsets of different query terms");
    }
    zeroTypo_.unionWith(other.zeroTypo_);
    oneTypo_.unionWith(other.oneTypo_);
    twoTypo_.unionWith(other.twoTypo_);
}

void QueryTermSubset::intersect(const QueryTermSubset& other) {
    if (original_ != other.original_) {
        throw InternalException(InternalErrorCode::InvariantViolation,
                                "Cannot intersect subsets of different query terms");
    }
    zeroTypo_.intersect(other.zeroTypo_);
    oneTypo_.intersect(other.oneTypo_);
    twoTypo_.intersect(other.twoTypo_);
}

std::optional<Word> QueryTermSubset::usePrefixDb(const SearchContext& ctx) const {
    const QueryTerm& term = ctx.termInterner.get(original_);
    if (!term.zeroTypo.usePrefixDb || !zeroTypo_.containsWord(*term.zeroTypo.usePrefixDb)) {
        return std::nullopt;
    }
    return Word{*term.zeroTypo.usePrefixDb, term.ngramWords.has_value()};
}

std::set<Word> QueryTermSubset::allSingleWordsExceptPrefixDb(const SearchContext& ctx) const {
    const QueryTerm& term = ctx.termInterner.get(original_);
    const bool ngram = term.ngramWords.has_value();
    std::set<Word> result;

    switch (zeroTypo_.kind()) {
        case NTypoTermSubset::Kind::All:
            if (term.zeroTypo.exact) {
                result.insert(Word{*term.zeroTypo.exact, ngram});
            }
            for (const auto& word : term.zeroTypo.prefixOf) {
                result.insert(Word{word, true});
            }
            break;
        case NTypoTermSubset::Kind::Subset:
            for (const auto& word : zeroTypo_.words()) {
                if (term.zeroTypo.usePrefixDb == word && term.zeroTypo.exact != word) {
                    continue;
                }
                const bool isExact = term.zeroTypo.exact == word;
                result.insert(Word{word, !isExact || ngram});
            }
            break;
        case NTypoTermSubset::Kind::Nothing:
            break;
    }

    switch (oneTypo_.kind()) {
        case NTypoTermSubset::Kind::All:
            for (const auto& word : term.oneTypo.oneTypo) {
                result.insert(Word{word, true});
            }
            break;
        case NTypoTermSubset::Kind::Subset:
            for (const auto& word : oneTypo_.words()) {
                result.insert(Word{word, true});
            }
            break;
        case NTypoTermSubset::Kind::Nothing:
            break;
    }

    switch (twoTypo_.kind()) {
        case NTypoTermSubset::Kind::All:
            for (const auto& word : term.twoTypo.twoTypos) {
                result.insert(Word{word, true});
            }
            break;
        case NTypoTermSubset::Kind::Subset:
            for (const auto& word : twoTypo_.words()) {
                result.insert(Word{word, true});
            }
            break;
        case NTypoTermSubset::Kind::Nothing:
            break;
    }
    return result;
}

std::set<PhraseId> QueryTermSubset::allPhrases(const SearchContext& ctx) const {
    const QueryTerm& term = ctx.termInterner.get(original_);
    std::set<PhraseId> result;

    switch (zeroTypo_.kind()) {
        case NTypoTermSubset::Kind::All:
            if (term.zeroTypo.phrase) {
                result.insert(*term.zeroTypo.phrase);
            }
            result.insert(term.zeroTypo.synonyms.begin(), term.zeroTypo.synonyms.end());
            break;
        case NTypoTermSubset::Kind::Subset:
            result.insert(zeroTypo_.phrases().begin(), zeroTypo_.phrases().end());
            break;
        case NTypoTermSubset::Kind::Nothing:
            break;
    }

    switch (oneTypo_.kind()) {
        case NTypoTermSubset::Kind::All:
            if (term.oneTypo.splitWords) {
                result.insert(*term.oneTypo.splitWords);
            }
            break;
        case NTypoTermSubset::Kind::Subset:
            result.insert(oneTypo_.phrases().begin(), oneTypo_.phrases().end());
            break;
        case NTypoTermSubset::Kind::Nothing:
            break;
    }
    return result;
}

std::optional<PhraseId> QueryTermSubset::originalPhrase(const SearchContext& ctx) const {
    const QueryTerm& term = ctx.termInterner.get(original_);
    if (!term.zeroTypo.phrase || !zeroTypo_.containsPhrase(*term.zeroTypo.phrase)) {
        return std::nullopt;
    }
    return term.zeroTypo.phrase;
}

uint8_t QueryTermSubset::maxTypoCost(const SearchContext& ctx) const {
    const QueryTerm& term = ctx.termInterner.get(original_);
    switch (term.maxLevenshteinDistance) {
        case 0:
            // Split words count as one typo even when typos are not allowed
            return term.allowsSplitWords() ? 1 : 0;
        case 1:
            return oneTypo_.isEmpty() ? 0 : 1;
        default:
            if (!twoTypo_.isEmpty()) {
                return 2;
            }
            return oneTypo_.isEmpty() ? 0 : 1;
    }
}

void QueryTermSubset::keepOnlyExactTerm(const SearchContext& ctx) {
    auto exact = exactTerm(ctx);
    if (!exact) {
        return;
    }
    if (exact->phrase) {
        zeroTypo_ = NTypoTermSubset::subset({}, {*exact->phrase});
    } else {
        zeroTypo_ = NTypoTermSubset::subset({*exact->word}, {});
    }
    clearOneTypoSubset();
    clearTwoTypoSubset();
}

bool QueryTermSubset::isEmpty(const SearchContext& ctx) const {
    if (zeroTypo_.isEmpty() && oneTypo_.isEmpty() && twoTypo_.isEmpty()) {
        return true;
    }
    return !usePrefixDb(ctx) && allSingleWordsExceptPrefixDb(ctx).empty() &&
           allPhrases(ctx).empty();
}

std::string QueryTermSubset::description(const SearchContext& ctx) const {
    const QueryTerm& term = ctx.termInterner.get(original_);
    if (term.zeroTypo.phrase) {
        return "\"" + ctx.phraseInterner.get(*term.zeroTypo.phrase).description(ctx.wordInterner) +
               "\"";
    }
    return ctx.word(term.original);
}

bool QueryTermSubset::operator==(const QueryTermSubset& other) const {
    return original_ == other.original_ && zeroTypo_ == other.zeroTypo_ &&
           oneTypo_ == other.oneTypo_ && twoTypo_ == other.twoTypo_ &&
           mandatory_ == other.mandatory_;
}

size_t QueryTermSubset::hash() const noexcept {
    size_t seed = original_.raw();
    hashCombine(seed, zeroTypo_.hash());
    hashCombine(seed, oneTypo_.hash());
    hashCombine(seed, twoTypo_.hash());
    hashCombine(seed, mandatory_ ? 1 : 0);
    return seed;
}

size_t LocatedQueryTermSubset::hash() const noexcept {
    size_t seed = termSubset.hash();
    hashCombine(seed, positionStart);
    hashCombine(seed, positionEnd);
    hashCombine(seed, termIdStart);
    hashCombine(seed, termIdEnd);
    return seed;
}

}  // namespace search
}  // namespace rankflow
