// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/QueryTermBuilder.h"

#include "rankflow/search/Limits.h"
#include "rankflow/search/SearchContext.h"

#include <algorithm>

namespace rankflow {
namespace search {

using analysis::QueryTokenizer;
using analysis::Token;
using analysis::TokenKind;

namespace {

bool endsWithWhitespace(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    const char last = text.back();
    return last == ' ' || last == '\t' || last == '\n' || last == '\r' || last == '\f' ||
           last == '\v';
}

// Words of a phrase being read between quotes
struct PhraseBuffer {
    std::vector<std::optional<WordId>> words;
    uint16_t start = 0;
    uint16_t end = 0;

    bool empty() const { return words.empty(); }

    void push(WordId word, uint16_t position) {
        if (words.empty()) {
            start = position;
        }
        end = position;
        words.push_back(word);
    }
};

}  // namespace

QueryTermBuilder::QueryTermBuilder(SearchContext& ctx, TypoToleranceConfig typoTolerance)
    : ctx_(ctx)
    , typoTolerance_(typoTolerance) {}

ExtractedTokens QueryTermBuilder::parse(const std::string& query) {
    return locatedQueryTermsFromTokens(QueryTokenizer::tokenize(query), Limits::MAX_QUERY_WORDS);
}

uint8_t QueryTermBuilder::numberOfTyposAllowed(const std::string& word) const {
    const size_t length = QueryTokenizer::codePointCount(word);
    if (!typoTolerance_.enabled || length < typoTolerance_.minWordSizeForOneTypo) {
        return 0;
    }
    if (length < typoTolerance_.minWordSizeForTwoTypos) {
        return 1;
    }
    return 2;
}

ExtractedTokens QueryTermBuilder::locatedQueryTermsFromTokens(const std::vector<Token>& tokens,
                                                              std::optional<size_t> wordsLimit) {
    ExtractedTokens result;
    const size_t partsLimit = wordsLimit.value_or(static_cast<size_t>(-1));
    const size_t tokenCount = std::min(tokens.size(), Limits::MAX_TOKEN_COUNT);

    std::optional<PhraseBuffer> phrase;
    bool negativePhrase = false;
    bool negativeNextToken = false;
    bool encounteredWhitespace = true;

    // Wraps to 0 on the first word
    uint16_t position = static_cast<uint16_t>(-1);

    auto closePhrase = [&](PhraseBuffer buffer) {
        auto term = buildPhrase(std::move(buffer.words), buffer.start, buffer.end);
        if (!term) {
            return;
        }
        if (negativePhrase) {
            result.negativePhrases.push_back(*term);
        } else {
            result.queryTerms.push_back(*term);
        }
    };

    for (size_t i = 0; i < tokenCount; i++) {
        const Token& token = tokens[i];
        if (token.lemma.empty()) {
            continue;
        }
        if (result.queryTerms.size() >= partsLimit) {
            return result;
        }

        if (token.kind == TokenKind::Word) {
            position = static_cast<uint16_t>(position + 1);
            if (phrase) {
                phrase->push(ctx_.wordInterner.insert(token.lemma), position);
            } else if (negativeNextToken) {
                result.negativeWords.push_back(Word{ctx_.wordInterner.insert(token.lemma), false});
                negativeNextToken = false;
            } else {
                const bool isLast = i + 1 == tokenCount;
                QueryTerm term =
                    termFromWord(token.lemma, numberOfTyposAllowed(token.lemma), isLast);
                computeTypoDerivations(term);
                result.queryTerms.push_back(
                    LocatedQueryTerm{ctx_.termInterner.push(std::move(term)), position, position});
            }
        } else {
            const bool hard = token.kind == TokenKind::HardSeparator;
            if (hard) {
                position = static_cast<uint16_t>(position + QueryTokenizer::HARD_SEPARATOR_GAP);
                // A sentence boundary inside a phrase closes it and opens a new one
                if (phrase) {
                    closePhrase(std::move(*phrase));
                    phrase = PhraseBuffer();
                }
            }

            size_t quotes = static_cast<size_t>(
                std::count(token.lemma.begin(), token.lemma.end(), '"'));
            if (quotes > 0) {
                if (phrase) {
                    quotes--;
                    closePhrase(std::move(*phrase));
                    negativePhrase = false;
                    phrase.reset();
                }
                if (quotes % 2 == 1) {
                    negativePhrase = negativeNextToken;
                    phrase = PhraseBuffer();
                }
            }
            negativeNextToken = !phrase && token.lemma == "-" && encounteredWhitespace;
        }
        encounteredWhitespace = endsWithWhitespace(token.lemma);
    }

    // An unclosed quote makes the rest of the query a phrase
    if (phrase) {
        closePhrase(std::move(*phrase));
    }
    return result;
}

std::optional<LocatedQueryTerm> QueryTermBuilder::buildPhrase(
    std::vector<std::optional<WordId>> words, uint16_t start, uint16_t end) {
    if (words.empty()) {
        return std::nullopt;
    }
    const PhraseId phrase = ctx_.phraseInterner.insert(Phrase{std::move(words)});
    const std::string description = ctx_.phraseInterner.get(phrase).description(ctx_.wordInterner);

    QueryTerm term;
    term.original = ctx_.wordInterner.insert(description);
    term.zeroTypo.phrase = phrase;
    return LocatedQueryTerm{ctx_.termInterner.push(std::move(term)), start, end};
}

QueryTerm QueryTermBuilder::termFromWord(const std::string& word, uint8_t maxTypos,
                                         bool isPrefix) {
    const WordId wordId = ctx_.wordInterner.insert(word);
    QueryTerm term;
    term.original = wordId;
    if (word.size() > Limits::MAX_WORD_LENGTH) {
        return term;
    }
    term.maxLevenshteinDistance = maxTypos;
    term.isPrefix = isPrefix;

    const index::IndexSource& index = ctx_.index();
    if (isPrefix && index.wordPrefixDocids(word).has_value()) {
        term.zeroTypo.usePrefixDb = wordId;
    }
    if (index.containsWord(word)) {
        term.zeroTypo.exact = wordId;
    }
    if (isPrefix && !term.zeroTypo.usePrefixDb) {
        for (const auto& derived : index.wordsWithPrefix(word, Limits::MAX_PREFIX_COUNT + 1)) {
            const WordId derivedId = ctx_.wordInterner.insert(derived);
            if (derivedId == wordId) {
                continue;
            }
            term.zeroTypo.prefixOf.insert(derivedId);
            if (term.zeroTypo.prefixOf.size() >= Limits::MAX_PREFIX_COUNT) {
                break;
            }
        }
    }

    size_t synonymWords = 0;
    size_t synonymPhrases = 0;
    for (const auto& synonym : index.synonyms({word})) {
        if (synonymPhrases++ >= Limits::MAX_SYNONYM_PHRASE_COUNT) {
            break;
        }
        if (synonymWords + synonym.size() > Limits::MAX_SYNONYM_WORD_COUNT) {
            continue;
        }
        synonymWords += synonym.size();
        Phrase phrase;
        for (const auto& synonymWord : synonym) {
            phrase.words.emplace_back(ctx_.wordInterner.insert(synonymWord));
        }
        term.zeroTypo.synonyms.insert(ctx_.phraseInterner.insert(std::move(phrase)));
    }
    return term;
}

void QueryTermBuilder::computeTypoDerivations(QueryTerm& term) {
    const std::string word = ctx_.word(term.original);
    if (word.size() > Limits::MAX_WORD_LENGTH) {
        return;
    }
    const index::IndexSource& index = ctx_.index();
    const std::vector<int32_t> codePoints = QueryTokenizer::codePoints(word);
    const std::string first = QueryTokenizer::firstCharacter(word);

    auto lengthAllows = [&](const std::vector<int32_t>& candidate, size_t maxDistance) {
        if (candidate.size() + maxDistance < codePoints.size()) {
            return false;
        }
        return term.isPrefix || candidate.size() <= codePoints.size() + maxDistance;
    };

    if (term.maxLevenshteinDistance == 1) {
        for (const auto& candidate : index.wordsStartingWith(first)) {
            const auto candidatePoints = QueryTokenizer::codePoints(candidate);
            if (!lengthAllows(candidatePoints, 1)) {
                continue;
            }
            if (editDistance(codePoints, candidatePoints, term.isPrefix) != 1) {
                continue;
            }
            term.oneTypo.oneTypo.insert(ctx_.wordInterner.insert(candidate));
            if (term.oneTypo.oneTypo.size() >= Limits::MAX_ONE_TYPO_COUNT) {
                break;
            }
        }
    } else if (term.maxLevenshteinDistance >= 2) {
        auto& oneTypo = term.oneTypo.oneTypo;
        auto& twoTypos = term.twoTypo.twoTypos;
        for (const auto& candidate : index.vocabulary()) {
            const bool oneTypoFull = oneTypo.size() >= Limits::MAX_ONE_TYPO_COUNT;
            const bool twoTyposFull = twoTypos.size() >= Limits::MAX_TWO_TYPOS_COUNT;
            if (oneTypoFull && twoTyposFull) {
                break;
            }
            const auto candidatePoints = QueryTokenizer::codePoints(candidate);
            if (!lengthAllows(candidatePoints, 2)) {
                continue;
            }
            if (QueryTokenizer::firstCharacter(candidate) != first) {
                // A typo on the first character counts as two
                if (!twoTyposFull &&
                    editDistance(codePoints, candidatePoints, term.isPrefix) <= 1) {
                    twoTypos.insert(ctx_.wordInterner.insert(candidate));
                }
                continue;
            }
            const size_t distance = editDistance(codePoints, candidatePoints, term.isPrefix);
            if (distance == 1 && !oneTypoFull) {
                oneTypo.insert(ctx_.wordInterner.insert(candidate));
            } else if (distance == 2 && !twoTyposFull) {
                twoTypos.insert(ctx_.wordInterner.insert(candidate));
            }
        }
    }

    if (!term.allowsSplitWords()) {
        return;
    }
    auto split = findSplitWords(word);
    if (split && term.ngramWords) {
        // Splitting an ngram back into its own words adds nothing
        const auto& splitWords = ctx_.phraseInterner.get(*split).words;
        std::vector<std::optional<WordId>> ngramWords(term.ngramWords->begin(),
                                                      term.ngramWords->end());
        if (splitWords == ngramWords) {
            split.reset();
        }
    }
    term.oneTypo.splitWords = split;
}

std::optional<PhraseId> QueryTermBuilder::findSplitWords(const std::string& word) {
    std::optional<std::pair<WordId, WordId>> best;
    size_t bestFrequency = 0;
    for (size_t i = 1; i < word.size(); i++) {
        if ((static_cast<unsigned char>(word[i]) & 0xC0) == 0x80) {
            continue;
        }
        const WordId left = ctx_.wordInterner.insert(word.substr(0, i));
        const WordId right = ctx_.wordInterner.insert(word.substr(i));
        const size_t frequency = ctx_.wordPairProximityDocids(left, right, 1).cardinality();
        if (frequency > bestFrequency) {
            bestFrequency = frequency;
            best = std::make_pair(left, right);
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return ctx_.phraseInterner.insert(Phrase{{best->first, best->second}});
}

std::optional<LocatedQueryTerm> QueryTermBuilder::makeNgram(
    const std::vector<LocatedQueryTerm>& terms) {
    if (terms.empty()) {
        return std::nullopt;
    }
    std::vector<WordId> wordIds;
    std::vector<std::string> words;
    for (size_t i = 0; i < terms.size(); i++) {
        const QueryTerm& term = ctx_.termInterner.get(terms[i].value);
        if (term.zeroTypo.phrase || term.ngramWords) {
            return std::nullopt;
        }
        if (i > 0 && terms[i - 1].positionEnd + 1 != terms[i].positionStart) {
            return std::nullopt;
        }
        wordIds.push_back(term.original);
        words.push_back(ctx_.word(term.original));
    }

    std::string joined;
    for (const auto& word : words) {
        joined += word;
    }
    if (joined.size() > Limits::MAX_WORD_LENGTH) {
        return std::nullopt;
    }

    const bool isPrefix = ctx_.termInterner.get(terms.back().value).isPrefix;
    const uint8_t allowed = numberOfTyposAllowed(joined);
    const auto penalty = static_cast<uint8_t>(terms.size() - 1);
    const uint8_t maxTypos = allowed > penalty ? static_cast<uint8_t>(allowed - penalty) : 0;

    QueryTerm term = termFromWord(joined, maxTypos, isPrefix);
    for (const auto& synonym : ctx_.index().synonyms(words)) {
        Phrase phrase;
        for (const auto& synonymWord : synonym) {
            phrase.words.emplace_back(ctx_.wordInterner.insert(synonymWord));
        }
        term.zeroTypo.synonyms.insert(ctx_.phraseInterner.insert(std::move(phrase)));
    }
    term.ngramWords = std::move(wordIds);
    computeTypoDerivations(term);

    return LocatedQueryTerm{ctx_.termInterner.push(std::move(term)), terms.front().positionStart,
                            terms.back().positionEnd};
}

size_t QueryTermBuilder::editDistance(const std::vector<int32_t>& query,
                                      const std::vector<int32_t>& candidate, bool prefix) {
    const size_t m = query.size();
    const size_t n = candidate.size();
    std::vector<std::vector<size_t>> d(m + 1, std::vector<size_t>(n + 1, 0));
    for (size_t i = 0; i <= m; i++) {
        d[i][0] = i;
    }
    for (size_t j = 0; j <= n; j++) {
        d[0][j] = j;
    }
    for (size_t i = 1; i <= m; i++) {
        for (size_t j = 1; j <= n; j++) {
            const size_t cost = query[i - 1] == candidate[j - 1] ? 0 : 1;
            d[i][j] = std::min({d[i - 1][j] + 1, d[i][j - 1] + 1, d[i - 1][j - 1] + cost});
            if (i > 1 && j > 1 && query[i - 1] == candidate[j - 2] &&
                query[i - 2] == candidate[j - 1]) {
                d[i][j] = std::min(d[i][j], d[i - 2][j - 2] + 1);
            }
        }
    }
    if (!prefix) {
        return d[m][n];
    }
    return *std::min_element(d[m].begin(), d[m].end());
}

}  // namespace search
}  // namespace rankflow
