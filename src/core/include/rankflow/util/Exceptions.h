// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rankflow {

/**
 * @brief Base exception class for all Rankflow exceptions.
 */
class RankflowException : public std::runtime_error {
public:
    explicit RankflowException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Error codes surfaced to the caller as user errors.
 */
enum class UserErrorCode {
    InvalidFilter,
    InvalidRankingRule,
    InvalidSearchableAttribute,
    AttributeNotFilterable,
    InvalidSort,
    InvalidDistinctAttribute,
    QueryTooComplex
};

inline const char* toString(UserErrorCode code) {
    switch (code) {
        case UserErrorCode::InvalidFilter: return "invalid_search_filter";
        case UserErrorCode::InvalidRankingRule: return "invalid_ranking_rule";
        case UserErrorCode::InvalidSearchableAttribute: return "invalid_searchable_attribute";
        case UserErrorCode::AttributeNotFilterable: return "invalid_filter_attribute";
        case UserErrorCode::InvalidSort: return "invalid_search_sort";
        case UserErrorCode::InvalidDistinctAttribute: return "invalid_search_distinct";
        case UserErrorCode::QueryTooComplex: return "query_too_complex";
    }
    return "unknown";
}

/**
 * @brief Error codes for bugs and data corruption.
 */
enum class InternalErrorCode {
    FieldIdMapMissingEntry,
    CorruptedData,
    InvalidInternedHandle,
    InvariantViolation
};

inline const char* toString(InternalErrorCode code) {
    switch (code) {
        case InternalErrorCode::FieldIdMapMissingEntry: return "field_id_map_missing_entry";
        case InternalErrorCode::CorruptedData: return "corrupted_data";
        case InternalErrorCode::InvalidInternedHandle: return "invalid_interned_handle";
        case InternalErrorCode::InvariantViolation: return "invariant_violation";
    }
    return "unknown";
}

/**
 * @brief Thrown for malformed user input. Aborts the current request only.
 */
class UserException : public RankflowException {
public:
    UserException(UserErrorCode code, const std::string& message)
        : RankflowException(message)
        , code_(code) {}

    UserErrorCode code() const noexcept { return code_; }

private:
    UserErrorCode code_;
};

/**
 * @brief Thrown when a filter expression cannot be parsed.
 *
 * The offset is the byte position of the offending input.
 */
class FilterParseException : public UserException {
public:
    FilterParseException(const std::string& message, size_t offset)
        : UserException(UserErrorCode::InvalidFilter,
                        message + " at position " + std::to_string(offset))
        , offset_(offset) {}

    size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

/**
 * @brief Thrown on programming errors or corrupted data.
 */
class InternalException : public RankflowException {
public:
    InternalException(InternalErrorCode code, const std::string& message)
        : RankflowException(message)
        , code_(code) {}

    InternalErrorCode code() const noexcept { return code_; }

private:
    InternalErrorCode code_;
};

/**
 * @brief Thrown when the time budget of a search is exhausted or the search
 * was cancelled. No partial result is produced.
 */
class SearchTimedOutException : public RankflowException {
public:
    explicit SearchTimedOutException(const std::string& message)
        : RankflowException(message) {}
};

/**
 * @brief Thrown when an unsupported operation is attempted.
 */
class UnsupportedOperationException : public RankflowException {
public:
    explicit UnsupportedOperationException(const std::string& message)
        : RankflowException(message) {}
};

}  // namespace rankflow
