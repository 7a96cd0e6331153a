// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/filter/FilterParser.h"
#include "rankflow/index/IndexSource.h"
#include "rankflow/util/BitSet.h"

#include <optional>
#include <string>
#include <utility>

namespace rankflow {
namespace filter {

/**
 * @brief A parsed filter, evaluated against the facets of an index.
 *
 * - String equality compares case-folded values
 * - Numeric comparisons require the value to parse as a finite number;
 *   `=` also matches numeric facets when the value is a number
 * - `!=`, `NOT` and `NOT EXISTS` complement against every document
 *
 * Usage:
 * ```cpp
 * auto filter = Filter::fromString("genre = comedy AND year >= 2000");
 * util::BitSet docids = filter->evaluate(index);
 * ```
 */
class Filter {
public:
    explicit Filter(FilterCondition condition)
        : condition_(std::move(condition)) {}

    /**
     * @brief Parses an expression; blank expressions yield nullopt.
     * @throws FilterParseException on invalid syntax
     */
    static std::optional<Filter> fromString(const std::string& expression);

    /**
     * @brief Documents of the index matching the filter.
     * @throws UserException(AttributeNotFilterable) for fields that are not filterable
     * @throws FilterParseException for non-numeric values of range comparisons
     */
    util::BitSet evaluate(const index::IndexSource& index) const;

    const FilterCondition& condition() const { return condition_; }

    std::string toString() const { return condition_.toString(); }

private:
    FilterCondition condition_;
};

}  // namespace filter
}  // namespace rankflow
