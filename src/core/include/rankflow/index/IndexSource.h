// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/util/BitSet.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rankflow {
namespace index {

using DocId = uint32_t;
using FieldId = uint16_t;

/**
 * @brief Read-only snapshot resolving words, word pairs and facets into
 * document id sets.
 *
 * Every method must return the same answer for the same arguments during the
 * lifetime of one search. Missing keys resolve to an empty set.
 *
 * Word arguments are normalized (case-folded) terms as produced by
 * analysis::QueryTokenizer.
 */
class IndexSource {
public:
    virtual ~IndexSource() = default;

    // ==================== Documents ====================

    /**
     * @brief Every live document.
     */
    virtual util::BitSet documentIds() const = 0;

    // ==================== Postings ====================

    /**
     * @brief Documents containing the word in a typo-tolerant field.
     */
    virtual util::BitSet wordDocids(const std::string& word) const = 0;

    /**
     * @brief Documents containing the word in a field where typos and
     * prefixes are disabled.
     */
    virtual util::BitSet exactWordDocids(const std::string& word) const = 0;

    /**
     * @brief Precomputed union of the postings of every word starting with
     * prefix, if the snapshot keeps one for it.
     */
    virtual std::optional<util::BitSet> wordPrefixDocids(const std::string& prefix) const = 0;

    /**
     * @brief Documents where right occurs proximity positions after left in
     * the same field, proximity in [1, 7]. Only the smallest distance of
     * each pair per document is recorded.
     */
    virtual util::BitSet wordPairProximityDocids(const std::string& left, const std::string& right,
                                                 uint8_t proximity) const = 0;

    virtual util::BitSet wordFidDocids(const std::string& word, FieldId fid) const = 0;

    /**
     * @brief Documents where word occurs at this position of some field.
     */
    virtual util::BitSet wordPositionDocids(const std::string& word, uint16_t position) const = 0;

    /**
     * @brief Documents where word occurs at this position of field fid.
     */
    virtual util::BitSet wordFidPositionDocids(const std::string& word, FieldId fid,
                                               uint16_t position) const = 0;

    /**
     * @brief Documents whose value for field fid holds exactly count words.
     */
    virtual util::BitSet fieldWordCountDocids(FieldId fid, uint16_t count) const = 0;

    /**
     * @brief Ascending field ids the word occurs in.
     */
    virtual std::vector<FieldId> fieldIdsOfWord(const std::string& word) const = 0;

    /**
     * @brief Ascending positions the word occurs at, over all documents.
     */
    virtual std::vector<uint16_t> positionsOfWord(const std::string& word) const = 0;

    // ==================== Vocabulary ====================

    virtual bool containsWord(const std::string& word) const = 0;

    /**
     * @brief Words starting with prefix in lexicographic order, at most limit.
     */
    virtual std::vector<std::string> wordsWithPrefix(const std::string& prefix,
                                                     size_t limit) const = 0;

    /**
     * @brief Words whose first code point is firstCharacter (UTF-8).
     */
    virtual std::vector<std::string> wordsStartingWith(const std::string& firstCharacter) const = 0;

    /**
     * @brief Every indexed word in lexicographic order.
     */
    virtual std::vector<std::string> vocabulary() const = 0;

    /**
     * @brief Synonym expansions of a word sequence.
     */
    virtual std::vector<std::vector<std::string>> synonyms(
        const std::vector<std::string>& words) const = 0;

    // ==================== Fields ====================

    /**
     * @brief Searchable fields, most important first.
     */
    virtual std::vector<FieldId> searchableFieldIds() const = 0;

    virtual std::optional<FieldId> fieldId(const std::string& name) const = 0;

    virtual std::vector<std::string> filterableFields() const = 0;

    /**
     * @brief Fields asc()/desc() ranking rules may sort on.
     */
    virtual std::vector<std::string> sortableFields() const = 0;

    // ==================== Facets ====================

    /**
     * @brief Documents whose string facet equals the case-folded value.
     */
    virtual util::BitSet facetStringDocids(const std::string& field,
                                           const std::string& normalizedValue) const = 0;

    /**
     * @brief Documents with a numeric facet value in [low, high].
     */
    virtual util::BitSet facetNumberDocids(const std::string& field, double low,
                                           double high) const = 0;

    /**
     * @brief Documents having any value for the field.
     */
    virtual util::BitSet facetExistsDocids(const std::string& field) const = 0;

    /**
     * @brief Distinct numeric values of the field in ascending order, each
     * with the documents holding it.
     */
    virtual std::vector<std::pair<double, util::BitSet>> facetNumberValues(
        const std::string& field) const = 0;

    /**
     * @brief Distinct case-folded string values of the field in ascending
     * byte order, each with the documents holding it.
     */
    virtual std::vector<std::pair<std::string, util::BitSet>> facetStringValues(
        const std::string& field) const = 0;

    /**
     * @brief Documents sharing at least one value of the field with doc,
     * doc included. Empty when doc has no value for the field.
     */
    virtual util::BitSet documentsSharingFacetValue(const std::string& field,
                                                    DocId doc) const = 0;
};

}  // namespace index
}  // namespace rankflow
