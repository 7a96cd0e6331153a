// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/index/IndexSource.h"
#include "rankflow/search/QueryTerm.h"
#include "rankflow/util/BitSet.h"
#include "rankflow/util/Interner.h"

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Request-scoped state shared by every ranking rule of one search.
 *
 * Owns the word, phrase and term interners and memoizes every lookup made
 * against the IndexSource, so each distinct key reaches the index at most
 * once per request. Cached sets are returned by reference; references stay
 * valid for the lifetime of the context.
 *
 * Not thread-safe: one context per search.
 */
class SearchContext {
public:
    explicit SearchContext(const index::IndexSource& index);

    SearchContext(const SearchContext&) = delete;
    SearchContext& operator=(const SearchContext&) = delete;

    const index::IndexSource& index() const { return index_; }

    util::Interner<std::string> wordInterner;
    util::Interner<Phrase, PhraseHash> phraseInterner;
    util::FixedInterner<QueryTerm> termInterner;

    const std::string& word(WordId id) const { return wordInterner.get(id); }

    // ==================== Restriction ====================

    /**
     * @brief Restricts word matches to these fields. Empty means every
     * searchable field.
     */
    void restrictToFields(std::vector<index::FieldId> fields);

    const std::vector<index::FieldId>& restrictedFields() const { return restrictedFields_; }

    // ==================== Cached lookups ====================

    const util::BitSet& documentIds();

    /**
     * @brief Word postings; original words also match exact-attribute postings.
     */
    const util::BitSet& wordDocids(Word word);

    /**
     * @brief Precomputed prefix posting, empty when the index keeps none.
     */
    const util::BitSet& wordPrefixDocids(Word prefix);

    /**
     * @brief Indexed words starting with prefix, itself included.
     */
    const std::vector<WordId>& prefixWords(WordId prefix);

    const util::BitSet& wordPairProximityDocids(WordId left, WordId right, uint8_t proximity);

    const util::BitSet& wordFidDocids(WordId word, index::FieldId fid);

    const util::BitSet& wordPositionDocids(WordId word, uint16_t position);

    const std::vector<index::FieldId>& wordFids(WordId word);

    const std::vector<uint16_t>& wordPositions(WordId word);

    /**
     * @brief Documents containing every word of the phrase, each pair of
     * words at (at most) its distance inside the phrase.
     */
    const util::BitSet& phraseDocids(PhraseId phrase);

    // ==================== Field weights ====================

    /**
     * @brief Rank of a searchable field, 0 for the most important one.
     * @throws InternalException(FieldIdMapMissingEntry) for unknown fields
     */
    uint16_t fieldWeight(index::FieldId fid);

    /**
     * @brief Weight of the least important searchable field.
     */
    std::optional<uint16_t> maxSearchableWeight();

private:
    const util::BitSet& restrict(util::BitSet& docids, WordId word);

    const index::IndexSource& index_;
    std::vector<index::FieldId> restrictedFields_;

    std::optional<util::BitSet> documentIds_;
    std::map<std::pair<uint32_t, bool>, util::BitSet> wordDocids_;
    std::map<std::pair<uint32_t, bool>, util::BitSet> prefixDocids_;
    std::map<std::tuple<uint32_t, uint32_t, uint8_t>, util::BitSet> pairProximityDocids_;
    std::map<std::pair<uint32_t, index::FieldId>, util::BitSet> wordFidDocids_;
    std::map<std::pair<uint32_t, uint16_t>, util::BitSet> wordPositionDocids_;
    std::map<uint32_t, std::vector<index::FieldId>> wordFids_;
    std::map<uint32_t, std::vector<uint16_t>> wordPositions_;
    std::map<uint32_t, std::vector<WordId>> prefixWords_;
    std::map<uint32_t, util::BitSet> phraseDocids_;
    std::optional<std::map<index::FieldId, uint16_t>> fieldWeights_;
};

}  // namespace search
}  // namespace rankflow
