// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace rankflow {
namespace search {

/**
 * Hard limits of the ranking engine. Graph and condition limits are raised
 * as UserException(QueryTooComplex) when exceeded.
 */
struct Limits {
    /** Query words kept after tokenization (phrases count as one) */
    static constexpr size_t MAX_QUERY_WORDS = 10;

    /** Tokens read from the raw query before any processing */
    static constexpr size_t MAX_TOKEN_COUNT = 1000;

    /** Longer words are searched verbatim, without derivations */
    static constexpr size_t MAX_WORD_LENGTH = 250;

    /** Largest number of consecutive words merged into an ngram */
    static constexpr size_t MAX_NGRAM = 3;

    static constexpr size_t MAX_QUERY_GRAPH_NODES = 512;

    /** Distinct conditions in one ranking rule graph */
    static constexpr size_t MAX_GRAPH_CONDITIONS = 65535;

    static constexpr size_t MAX_FILTER_DEPTH = 200;

    /** Proximity costs are bounded by MAX_DISTANCE - 1 plus the ngram length */
    static constexpr uint32_t MAX_DISTANCE = 8;

    static constexpr uint8_t MAX_TYPOS = 2;

    // Derivation caps per query term
    static constexpr size_t MAX_PREFIX_COUNT = 50;
    static constexpr size_t MAX_ONE_TYPO_COUNT = 150;
    static constexpr size_t MAX_TWO_TYPOS_COUNT = 50;
    static constexpr size_t MAX_SYNONYM_PHRASE_COUNT = 50;
    static constexpr size_t MAX_SYNONYM_WORD_COUNT = 100;
};

}  // namespace search
}  // namespace rankflow
