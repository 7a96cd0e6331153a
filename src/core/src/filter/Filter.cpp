// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/filter/Filter.h"

#include "rankflow/analysis/QueryTokenizer.h"
#include "rankflow/util/Exceptions.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace rankflow {
namespace filter {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

double requireNumber(const FilterToken& token) {
    auto value = parseNumber(token.value);
    if (!value) {
        throw FilterParseException("`" + token.value + "` is not a valid number", token.offset);
    }
    return *value;
}

class Evaluator {
public:
    explicit Evaluator(const index::IndexSource& index)
        : index_(index) {}

    util::BitSet evaluate(const FilterCondition& condition) {
        switch (condition.kind) {
            case FilterCondition::Kind::Comparison: return comparison(condition);
            case FilterCondition::Kind::Between: {
                const double low = requireNumber(condition.values.at(0));
                const double high = requireNumber(condition.values.at(1));
                return index_.facetNumberDocids(condition.field.value, low, high);
            }
            case FilterCondition::Kind::Exists:
                return index_.facetExistsDocids(condition.field.value);
            case FilterCondition::Kind::In: {
                util::BitSet docids;
                for (const auto& value : condition.values) {
                    docids |= equal(condition.field.value, value);
                }
                return docids;
            }
            case FilterCondition::Kind::Not:
                return allDocuments() - evaluate(condition.children.at(0));
            case FilterCondition::Kind::And: {
                util::BitSet docids = evaluate(condition.children.at(0));
                for (size_t i = 1; i < condition.children.size() && !docids.empty(); i++) {
                    docids &= evaluate(condition.children[i]);
                }
                return docids;
            }
            case FilterCondition::Kind::Or: {
                util::BitSet docids;
                for (const auto& child : condition.children) {
                    docids |= evaluate(child);
                }
                return docids;
            }
        }
        throw InternalException(InternalErrorCode::InvariantViolation, "Unknown filter kind");
    }

private:
    util::BitSet comparison(const FilterCondition& condition) {
        const std::string& field = condition.field.value;
        const FilterToken& value = condition.values.at(0);
        switch (condition.op) {
            case ComparisonOp::Equal: return equal(field, value);
            case ComparisonOp::NotEqual: return allDocuments() - equal(field, value);
            case ComparisonOp::GreaterThan:
                return index_.facetNumberDocids(field, std::nextafter(requireNumber(value), INF),
                                                INF);
            case ComparisonOp::GreaterThanOrEqual:
                return index_.facetNumberDocids(field, requireNumber(value), INF);
            case ComparisonOp::LowerThan:
                return index_.facetNumberDocids(field, -INF,
                                                std::nextafter(requireNumber(value), -INF));
            case ComparisonOp::LowerThanOrEqual:
                return index_.facetNumberDocids(field, -INF, requireNumber(value));
        }
        throw InternalException(InternalErrorCode::InvariantViolation, "Unknown filter operator");
    }

    util::BitSet equal(const std::string& field, const FilterToken& value) {
        util::BitSet docids =
            index_.facetStringDocids(field, analysis::QueryTokenizer::normalize(value.value));
        if (auto number = parseNumber(value.value)) {
            docids |= index_.facetNumberDocids(field, *number, *number);
        }
        return docids;
    }

    const util::BitSet& allDocuments() {
        if (!allDocuments_) {
            allDocuments_ = index_.documentIds();
        }
        return *allDocuments_;
    }

    const index::IndexSource& index_;
    std::optional<util::BitSet> allDocuments_;
};

}  // namespace

std::optional<Filter> Filter::fromString(const std::string& expression) {
    auto condition = FilterParser::parse(expression);
    if (!condition) {
        return std::nullopt;
    }
    return Filter(std::move(*condition));
}

util::BitSet Filter::evaluate(const index::IndexSource& index) const {
    const std::vector<std::string> filterable = index.filterableFields();
    for (const FilterToken& field : condition_.fields()) {
        if (std::find(filterable.begin(), filterable.end(), field.value) == filterable.end()) {
            std::string available;
            for (const auto& name : filterable) {
                available += (available.empty() ? "" : ", ") + name;
            }
            throw UserException(UserErrorCode::AttributeNotFilterable,
                                "Attribute `" + field.value + "` is not filterable. " +
                                    (available.empty()
                                         ? std::string("This index has no filterable attributes.")
                                         : "Available filterable attributes are: " + available +
                                               "."));
        }
    }
    return Evaluator(index).evaluate(condition_);
}

}  // namespace filter
}  // namespace rankflow
