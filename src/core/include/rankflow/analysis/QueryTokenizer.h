// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rankflow {
namespace analysis {

enum class TokenKind {
    Word,
    SoftSeparator,  // whitespace, quotes, commas, hyphens
    HardSeparator   // sentence punctuation: . ! ? ; : and line breaks
};

/**
 * A segment of the input. Words carry their case-folded form, separators
 * their raw text.
 */
struct Token {
    TokenKind kind;
    std::string lemma;
};

/**
 * A word and its position inside one field value.
 */
struct PositionedWord {
    std::string word;
    uint16_t position;
};

/**
 * QueryTokenizer - Unicode word segmentation using ICU
 *
 * Splits text on UAX#29 word boundaries with icu::BreakIterator. Word
 * segments are case-folded; every other segment is kept as a separator so
 * that the query parser can see quotes, the negation dash and sentence
 * boundaries.
 *
 * Positions advance by 1 per word and by 7 per hard separator, both for
 * indexed text and for queries, so that proximity is measured identically
 * on both sides.
 *
 * Usage:
 * ```cpp
 * auto tokens = QueryTokenizer::tokenize("Hello \"big World\"");
 * // Word(hello) Soft( ") Word(big) Soft( ) Word(world) Soft(")
 * ```
 */
class QueryTokenizer {
public:
    /**
     * Number of positions a hard separator adds between two words
     */
    static constexpr uint16_t HARD_SEPARATOR_GAP = 7;

    /**
     * Segment text (UTF-8) into words and separators.
     */
    static std::vector<Token> tokenize(const std::string& text);

    /**
     * Words of an indexed field value with their positions.
     */
    static std::vector<PositionedWord> positionedWords(const std::string& text);

    /**
     * Case-folded form of text (UTF-8).
     */
    static std::string normalize(const std::string& text);

    /**
     * First code point of word as UTF-8, empty for an empty word.
     */
    static std::string firstCharacter(const std::string& word);

    /**
     * Number of code points of word.
     */
    static size_t codePointCount(const std::string& word);

    /**
     * Code points of word.
     */
    static std::vector<int32_t> codePoints(const std::string& word);
};

}  // namespace analysis
}  // namespace rankflow
