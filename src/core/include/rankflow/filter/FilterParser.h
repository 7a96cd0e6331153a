// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rankflow {
namespace filter {

/**
 * @brief A value of a filter expression and its byte offset in the input.
 */
struct FilterToken {
    std::string value;
    size_t offset = 0;
};

enum class ComparisonOp {
    Equal,
    NotEqual,
    GreaterThan,
    GreaterThanOrEqual,
    LowerThan,
    LowerThanOrEqual
};

/**
 * @brief Node of a parsed filter expression.
 *
 * - Comparison: field op values[0]
 * - Between: field values[0] TO values[1]
 * - Exists: field EXISTS
 * - In: field IN [values...]
 * - Not: NOT children[0]
 * - And / Or: children joined by AND / OR
 */
struct FilterCondition {
    enum class Kind { Comparison, Between, Exists, In, Not, And, Or };

    Kind kind = Kind::Exists;
    FilterToken field;
    ComparisonOp op = ComparisonOp::Equal;
    std::vector<FilterToken> values;
    std::vector<FilterCondition> children;

    /**
     * @brief Every field referenced, in order of appearance.
     */
    std::vector<FilterToken> fields() const;

    /**
     * @brief Canonical text of the expression, fully parenthesized.
     */
    std::string toString() const;
};

/**
 * @brief Recursive descent parser of filter expressions.
 *
 * Grammar:
 * ```
 * filter     = expression EOF
 * expression = or
 * or         = and ("OR" and)*
 * and        = not ("AND" not)*
 * not        = "NOT" not | primary
 * primary    = "(" expression ")" | in | condition | exists | notExists | to
 * in         = value ["NOT"] "IN" "[" value ("," value)* ","? "]"
 * condition  = value ("=" | "!=" | ">" | ">=" | "<" | "<=") value
 * exists     = value "EXISTS"
 * notExists  = value "NOT" "EXISTS"
 * to         = value value "TO" value
 * value      = word | 'single quoted' | "double quoted"
 * word       = (alphanumeric | "_" | "-" | ".")+
 * ```
 * Keywords are case-sensitive. Inside quotes, a backslash escapes the quote.
 */
class FilterParser {
public:
    /**
     * @brief Parses an expression; blank input yields nullopt.
     * @throws FilterParseException on syntax errors and when nesting exceeds
     *         Limits::MAX_FILTER_DEPTH
     */
    static std::optional<FilterCondition> parse(const std::string& input);

private:
    explicit FilterParser(const std::string& input)
        : input_(input) {}

    FilterCondition parseOr(size_t depth);
    FilterCondition parseAnd(size_t depth);
    FilterCondition parseNot(size_t depth);
    FilterCondition parsePrimary(size_t depth);
    FilterCondition parseAfterField(FilterToken field);
    std::vector<FilterToken> parseValueList();

    /**
     * Reads a value; keywords are rejected unless quoted.
     */
    FilterToken parseValue(const char* expected);

    std::optional<FilterToken> peekValue();

    /**
     * Consumes keyword if it is the next word.
     */
    bool acceptKeyword(const char* keyword);
    bool peekKeyword(const char* keyword);
    bool acceptSymbol(const char* symbol);

    void skipWhitespace();
    bool atEnd();
    void checkDepth(size_t depth) const;

    [[noreturn]] void fail(const std::string& message) const { failAt(message, pos_); }
    [[noreturn]] void failAt(const std::string& message, size_t offset) const;

    const std::string& input_;
    size_t pos_ = 0;
};

}  // namespace filter
}  // namespace rankflow
