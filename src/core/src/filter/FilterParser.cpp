// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/filter/FilterParser.h"

#include "rankflow/search/Limits.h"
#include "rankflow/util/Exceptions.h"

#include <cctype>
#include <cstring>

namespace rankflow {
namespace filter {

namespace {

const char* const KEYWORDS[] = {"AND", "OR", "NOT", "IN", "TO", "EXISTS"};

bool isWordChar(char c) {
    const auto byte = static_cast<unsigned char>(c);
    // Bytes of multi-byte UTF-8 sequences are accepted as letters
    return std::isalnum(byte) || c == '_' || c == '-' || c == '.' || byte >= 0x80;
}

bool isKeyword(const std::string& word) {
    for (const char* keyword : KEYWORDS) {
        if (word == keyword) {
            return true;
        }
    }
    return false;
}

const char* opSymbol(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::Equal: return "=";
        case ComparisonOp::NotEqual: return "!=";
        case ComparisonOp::GreaterThan: return ">";
        case ComparisonOp::GreaterThanOrEqual: return ">=";
        case ComparisonOp::LowerThan: return "<";
        case ComparisonOp::LowerThanOrEqual: return "<=";
    }
    return "?";
}

std::string quote(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "\"";
}

void collectFields(const FilterCondition& condition, std::vector<FilterToken>& out) {
    switch (condition.kind) {
        case FilterCondition::Kind::Not:
        case FilterCondition::Kind::And:
        case FilterCondition::Kind::Or:
            for (const auto& child : condition.children) {
                collectFields(child, out);
            }
            break;
        default: out.push_back(condition.field); break;
    }
}

}  // namespace

// ==================== FilterCondition ====================

std::vector<FilterToken> FilterCondition::fields() const {
    std::vector<FilterToken> result;
    collectFields(*this, result);
    return result;
}

std::string FilterCondition::toString() const {
    switch (kind) {
        case Kind::Comparison:
            return quote(field.value) + " " + opSymbol(op) + " " + quote(values.at(0).value);
        case Kind::Between:
            return quote(field.value) + " " + quote(values.at(0).value) + " TO " +
                   quote(values.at(1).value);
        case Kind::Exists: return quote(field.value) + " EXISTS";
        case Kind::In: {
            std::string result = quote(field.value) + " IN [";
            for (size_t i = 0; i < values.size(); i++) {
                result += (i == 0 ? "" : ", ") + quote(values[i].value);
            }
            return result + "]";
        }
        case Kind::Not: return "NOT (" + children.at(0).toString() + ")";
        case Kind::And:
        case Kind::Or: {
            std::string result = "(";
            for (size_t i = 0; i < children.size(); i++) {
                if (i > 0) {
                    result += kind == Kind::And ? " AND " : " OR ";
                }
                result += children[i].toString();
            }
            return result + ")";
        }
    }
    return "";
}

// ==================== FilterParser ====================

std::optional<FilterCondition> FilterParser::parse(const std::string& input) {
    FilterParser parser(input);
    if (parser.atEnd()) {
        return std::nullopt;
    }
    FilterCondition condition = parser.parseOr(0);
    if (!parser.atEnd()) {
        parser.fail("Unexpected input, expected `AND`, `OR` or the end of the filter");
    }
    return condition;
}

FilterCondition FilterParser::parseOr(size_t depth) {
    checkDepth(depth);
    FilterCondition first = parseAnd(depth + 1);
    if (!peekKeyword("OR")) {
        return first;
    }
    FilterCondition result;
    result.kind = FilterCondition::Kind::Or;
    result.children.push_back(std::move(first));
    while (acceptKeyword("OR")) {
        result.children.push_back(parseAnd(depth + 1));
    }
    return result;
}

FilterCondition FilterParser::parseAnd(size_t depth) {
    checkDepth(depth);
    FilterCondition first = parseNot(depth + 1);
    if (!peekKeyword("AND")) {
        return first;
    }
    FilterCondition result;
    result.kind = FilterCondition::Kind::And;
    result.children.push_back(std::move(first));
    while (acceptKeyword("AND")) {
        result.children.push_back(parseNot(depth + 1));
    }
    return result;
}

FilterCondition FilterParser::parseNot(size_t depth) {
    checkDepth(depth);
    if (!acceptKeyword("NOT")) {
        return parsePrimary(depth + 1);
    }
    FilterCondition inner = parseNot(depth + 1);
    if (inner.kind == FilterCondition::Kind::Not) {
        // NOT NOT x is x
        FilterCondition unwrapped = std::move(inner.children.front());
        return unwrapped;
    }
    FilterCondition result;
    result.kind = FilterCondition::Kind::Not;
    result.children.push_back(std::move(inner));
    return result;
}

FilterCondition FilterParser::parsePrimary(size_t depth) {
    checkDepth(depth);
    if (acceptSymbol("(")) {
        FilterCondition inner = parseOr(depth + 1);
        if (!acceptSymbol(")")) {
            fail("Expected a closing `)`");
        }
        return inner;
    }
    return parseAfterField(parseValue("a field name or `(`"));
}

FilterCondition FilterParser::parseAfterField(FilterToken field) {
    FilterCondition result;
    result.field = std::move(field);

    static const std::pair<const char*, ComparisonOp> OPERATORS[] = {
        {"!=", ComparisonOp::NotEqual},
        {">=", ComparisonOp::GreaterThanOrEqual},
        {"<=", ComparisonOp::LowerThanOrEqual},
        {">", ComparisonOp::GreaterThan},
        {"<", ComparisonOp::LowerThan},
        {"=", ComparisonOp::Equal},
    };
    for (const auto& [symbol, op] : OPERATORS) {
        if (acceptSymbol(symbol)) {
            result.kind = FilterCondition::Kind::Comparison;
            result.op = op;
            result.values.push_back(parseValue("a value"));
            return result;
        }
    }

    if (acceptKeyword("EXISTS")) {
        result.kind = FilterCondition::Kind::Exists;
        return result;
    }
    if (acceptKeyword("IN")) {
        result.kind = FilterCondition::Kind::In;
        result.values = parseValueList();
        return result;
    }
    if (acceptKeyword("NOT")) {
        if (acceptKeyword("EXISTS")) {
            result.kind = FilterCondition::Kind::Exists;
        } else if (acceptKeyword("IN")) {
            result.kind = FilterCondition::Kind::In;
            result.values = parseValueList();
        } else {
            fail("Expected `EXISTS` or `IN` after `NOT`");
        }
        FilterCondition negated;
        negated.kind = FilterCondition::Kind::Not;
        negated.children.push_back(std::move(result));
        return negated;
    }

    if (peekValue()) {
        result.kind = FilterCondition::Kind::Between;
        result.values.push_back(parseValue("a value"));
        if (!acceptKeyword("TO")) {
            fail("Expected `TO` after the lower bound of `" + result.field.value + "`");
        }
        result.values.push_back(parseValue("an upper bound"));
        return result;
    }

    fail("Expected a comparison operator, `IN`, `EXISTS` or a range after `" +
         result.field.value + "`");
}

std::vector<FilterToken> FilterParser::parseValueList() {
    if (!acceptSymbol("[")) {
        fail("Expected `[` after `IN`");
    }
    std::vector<FilterToken> values;
    if (acceptSymbol("]")) {
        return values;
    }
    while (true) {
        values.push_back(parseValue("a value"));
        if (acceptSymbol(",")) {
            if (acceptSymbol("]")) {
                break;
            }
            continue;
        }
        if (acceptSymbol("]")) {
            break;
        }
        fail(atEnd() ? "Expected a closing `]`" : "Expected `,` or `]` in the `IN` list");
    }
    return values;
}

FilterToken FilterParser::parseValue(const char* expected) {
    skipWhitespace();
    if (pos_ >= input_.size()) {
        fail(std::string("Expected ") + expected + " but the filter ended");
    }
    const size_t start = pos_;
    const char first = input_[pos_];

    if (first == '\'' || first == '"') {
        pos_++;
        std::string value;
        while (pos_ < input_.size() && input_[pos_] != first) {
            if (input_[pos_] == '\\' && pos_ + 1 < input_.size() && input_[pos_ + 1] == first) {
                pos_++;
            }
            value += input_[pos_++];
        }
        if (pos_ >= input_.size()) {
            failAt("Unterminated quoted value", start);
        }
        pos_++;
        return FilterToken{std::move(value), start};
    }

    while (pos_ < input_.size() && isWordChar(input_[pos_])) {
        pos_++;
    }
    if (pos_ == start) {
        fail(std::string("Expected ") + expected);
    }
    std::string word = input_.substr(start, pos_ - start);
    if (isKeyword(word)) {
        failAt("`" + word + "` is a reserved keyword and cannot be used as a value, quote it",
               start);
    }
    return FilterToken{std::move(word), start};
}

std::optional<FilterToken> FilterParser::peekValue() {
    const size_t saved = pos_;
    skipWhitespace();
    if (pos_ >= input_.size()) {
        pos_ = saved;
        return std::nullopt;
    }
    const char c = input_[pos_];
    if (c != '\'' && c != '"' && !isWordChar(c)) {
        pos_ = saved;
        return std::nullopt;
    }
    size_t end = pos_;
    while (end < input_.size() && isWordChar(input_[end])) {
        end++;
    }
    if (c != '\'' && c != '"' && isKeyword(input_.substr(pos_, end - pos_))) {
        pos_ = saved;
        return std::nullopt;
    }
    FilterToken token{input_.substr(pos_, end - pos_), pos_};
    pos_ = saved;
    return token;
}

bool FilterParser::peekKeyword(const char* keyword) {
    skipWhitespace();
    const size_t len = std::strlen(keyword);
    if (input_.compare(pos_, len, keyword) != 0) {
        return false;
    }
    return pos_ + len >= input_.size() || !isWordChar(input_[pos_ + len]);
}

bool FilterParser::acceptKeyword(const char* keyword) {
    if (!peekKeyword(keyword)) {
        return false;
    }
    pos_ += std::strlen(keyword);
    return true;
}

bool FilterParser::acceptSymbol(const char* symbol) {
    skipWhitespace();
    const size_t len = std::strlen(symbol);
    if (input_.compare(pos_, len, symbol) != 0) {
        return false;
    }
    pos_ += len;
    return true;
}

void FilterParser::skipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
        pos_++;
    }
}

bool FilterParser::atEnd() {
    skipWhitespace();
    return pos_ >= input_.size();
}

void FilterParser::checkDepth(size_t depth) const {
    if (depth > search::Limits::MAX_FILTER_DEPTH) {
        fail("The filter exceeds the maximum nesting depth of " +
             std::to_string(search::Limits::MAX_FILTER_DEPTH));
    }
}

void FilterParser::failAt(const std::string& message, size_t offset) const {
    throw FilterParseException(message, offset);
}

}  // namespace filter
}  // namespace rankflow
