// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/analysis/QueryTokenizer.h"

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <limits>
#include <memory>

namespace rankflow {
namespace analysis {

namespace {

icu::BreakIterator* wordIterator() {
    thread_local std::unique_ptr<icu::BreakIterator> bi = [] {
        UErrorCode status = U_ZERO_ERROR;
        auto iter = std::unique_ptr<icu::BreakIterator>(
            icu::BreakIterator::createWordInstance(icu::Locale::getRoot(), status));
        if (U_FAILURE(status)) {
            return std::unique_ptr<icu::BreakIterator>(nullptr);
        }
        return iter;
    }();
    return bi.get();
}

bool isHardSeparator(const icu::UnicodeString& segment) {
    for (int32_t i = 0; i < segment.length(); i = segment.moveIndex32(i, 1)) {
        UChar32 c = segment.char32At(i);
        switch (c) {
            case '.':
            case '!':
            case '?':
            case ';':
            case ':':
            case '\n':
            case '\r':
            case 0x3002:  // ideographic full stop
                return true;
            default:
                break;
        }
    }
    return false;
}

bool hasLetterOrDigit(const icu::UnicodeString& segment) {
    for (int32_t i = 0; i < segment.length(); i = segment.moveIndex32(i, 1)) {
        UChar32 c = segment.char32At(i);
        if (u_isalnum(c)) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::vector<Token> QueryTokenizer::tokenize(const std::string& text) {
    if (text.empty()) {
        return {};
    }

    icu::BreakIterator* bi = wordIterator();
    if (bi == nullptr) {
        return {};
    }

    icu::UnicodeString utext = icu::UnicodeString::fromUTF8(text);
    bi->setText(utext);

    std::vector<Token> tokens;
    tokens.reserve(text.size() / 4 + 1);

    icu::UnicodeString segment;
    int32_t start = bi->first();
    for (int32_t end = bi->next(); end != icu::BreakIterator::DONE; start = end, end = bi->next()) {
        utext.extractBetween(start, end, segment);
        if (segment.isEmpty()) {
            continue;
        }

        const int32_t status = bi->getRuleStatus();
        const bool isWord = (status >= UBRK_WORD_NONE_LIMIT) || hasLetterOrDigit(segment);

        Token token;
        if (isWord) {
            token.kind = TokenKind::Word;
            segment.foldCase(U_FOLD_CASE_DEFAULT);
        } else {
            token.kind = isHardSeparator(segment) ? TokenKind::HardSeparator
                                                  : TokenKind::SoftSeparator;
        }
        segment.toUTF8String(token.lemma);
        tokens.push_back(std::move(token));
    }

    return tokens;
}

std::vector<PositionedWord> QueryTokenizer::positionedWords(const std::string& text) {
    std::vector<PositionedWord> words;
    uint32_t position = 0;
    bool first = true;
    for (auto& token : tokenize(text)) {
        if (token.kind == TokenKind::HardSeparator) {
            if (!first) {
                position += HARD_SEPARATOR_GAP;
            }
            continue;
        }
        if (token.kind != TokenKind::Word) {
            continue;
        }
        if (!first) {
            position++;
        }
        first = false;
        if (position > std::numeric_limits<uint16_t>::max()) {
            break;
        }
        words.push_back(PositionedWord{std::move(token.lemma), static_cast<uint16_t>(position)});
    }
    return words;
}

std::string QueryTokenizer::normalize(const std::string& text) {
    icu::UnicodeString utext = icu::UnicodeString::fromUTF8(text);
    utext.foldCase(U_FOLD_CASE_DEFAULT);
    std::string result;
    utext.toUTF8String(result);
    return result;
}

std::string QueryTokenizer::firstCharacter(const std::string& word) {
    if (word.empty()) {
        return {};
    }
    icu::UnicodeString utext = icu::UnicodeString::fromUTF8(word);
    icu::UnicodeString first(utext.char32At(0));
    std::string result;
    first.toUTF8String(result);
    return result;
}

size_t QueryTokenizer::codePointCount(const std::string& word) {
    icu::UnicodeString utext = icu::UnicodeString::fromUTF8(word);
    return static_cast<size_t>(utext.countChar32());
}

std::vector<int32_t> QueryTokenizer::codePoints(const std::string& word) {
    icu::UnicodeString utext = icu::UnicodeString::fromUTF8(word);
    std::vector<int32_t> result;
    result.reserve(utext.length());
    for (int32_t i = 0; i < utext.length(); i = utext.moveIndex32(i, 1)) {
        result.push_back(utext.char32At(i));
    }
    return result;
}

}  // namespace analysis
}  // namespace rankflow
