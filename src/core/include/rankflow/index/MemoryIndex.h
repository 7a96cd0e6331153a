// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/index/IndexSource.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace rankflow {
namespace index {

/**
 * @brief Field values of one document.
 */
struct Document {
    /** Text fields, tokenized when the field is searchable */
    std::map<std::string, std::string> text;

    /** String facet values, matched case-insensitively by filters */
    std::map<std::string, std::vector<std::string>> strings;

    /** Numeric facet values */
    std::map<std::string, std::vector<double>> numbers;
};

/**
 * @brief Searchable and filterable field configuration.
 */
struct IndexSettings {
    /** Searchable text fields, most important first */
    std::vector<std::string> searchableFields;

    /** Fields filters may reference */
    std::vector<std::string> filterableFields;

    /** Fields asc()/desc() ranking rules may sort on */
    std::vector<std::string> sortableFields;

    /** Searchable fields matched without typos or prefixes */
    std::vector<std::string> exactFields;

    /**
     * Prefixes up to this many code points get a precomputed posting when at
     * least prefixCacheMinWords words share them. 0 disables the cache.
     */
    size_t prefixCacheMaxLength = 0;
    size_t prefixCacheMinWords = 2;
};

/**
 * @brief In-memory IndexSource built from documents.
 *
 * Computes word, exact word, prefix, pair proximity (forward pairs at
 * distance 1 to 7 inside one field value, smallest distance kept), field id
 * and position postings, per-field word counts, plus string and numeric
 * facets.
 *
 * Documents must be added before the first search; the index is immutable
 * once finish() has been called.
 *
 * Usage:
 * ```cpp
 * IndexSettings settings;
 * settings.searchableFields = {"title", "body"};
 * MemoryIndex index(settings);
 * Document doc;
 * doc.text["title"] = "The quick brown fox";
 * index.addDocument(1, doc);
 * index.finish();
 * ```
 */
class MemoryIndex : public IndexSource {
public:
    explicit MemoryIndex(IndexSettings settings);

    /**
     * @brief Indexes a document under an explicit id.
     * @throws std::invalid_argument if the id was already used
     * @throws UnsupportedOperationException once finish() was called
     */
    void addDocument(DocId id, const Document& document);

    /**
     * @brief Registers alternatives for a word sequence (case-folded).
     */
    void addSynonyms(const std::vector<std::string>& words,
                     const std::vector<std::vector<std::string>>& alternatives);

    /**
     * @brief Builds the prefix cache and freezes the index.
     */
    void finish();

    [[nodiscard]] size_t numDocs() const { return documents_.cardinality(); }

    // ==================== IndexSource ====================

    util::BitSet documentIds() const override { return documents_; }
    util::BitSet wordDocids(const std::string& word) const override;
    util::BitSet exactWordDocids(const std::string& word) const override;
    std::optional<util::BitSet> wordPrefixDocids(const std::string& prefix) const override;
    util::BitSet wordPairProximityDocids(const std::string& left, const std::string& right,
                                         uint8_t proximity) const override;
    util::BitSet wordFidDocids(const std::string& word, FieldId fid) const override;
    util::BitSet wordPositionDocids(const std::string& word, uint16_t position) const override;
    util::BitSet wordFidPositionDocids(const std::string& word, FieldId fid,
                                       uint16_t position) const override;
    util::BitSet fieldWordCountDocids(FieldId fid, uint16_t count) const override;
    std::vector<FieldId> fieldIdsOfWord(const std::string& word) const override;
    std::vector<uint16_t> positionsOfWord(const std::string& word) const override;
    bool containsWord(const std::string& word) const override;
    std::vector<std::string> wordsWithPrefix(const std::string& prefix,
                                             size_t limit) const override;
    std::vector<std::string> wordsStartingWith(const std::string& firstCharacter) const override;
    std::vector<std::string> vocabulary() const override;
    std::vector<std::vector<std::string>> synonyms(
        const std::vector<std::string>& words) const override;
    std::vector<FieldId> searchableFieldIds() const override;
    std::optional<FieldId> fieldId(const std::string& name) const override;
    std::vector<std::string> filterableFields() const override;
    std::vector<std::string> sortableFields() const override;
    util::BitSet facetStringDocids(const std::string& field,
                                   const std::string& normalizedValue) const override;
    util::BitSet facetNumberDocids(const std::string& field, double low,
                                   double high) const override;
    util::BitSet facetExistsDocids(const std::string& field) const override;
    std::vector<std::pair<double, util::BitSet>> facetNumberValues(
        const std::string& field) const override;
    std::vector<std::pair<std::string, util::BitSet>> facetStringValues(
        const std::string& field) const override;
    util::BitSet documentsSharingFacetValue(const std::string& field, DocId doc) const override;

private:
    FieldId fieldIdFor(const std::string& name);
    void indexText(DocId id, FieldId fid, bool exact, const std::string& value);

    static const util::BitSet& lookup(const std::map<std::string, util::BitSet>& postings,
                                      const std::string& key);

    IndexSettings settings_;
    bool finished_ = false;
    util::BitSet documents_;

    std::map<std::string, FieldId> fieldIds_;
    std::set<std::string> exactFields_;

    // Word postings (std::map keeps the vocabulary sorted for prefix scans)
    std::map<std::string, util::BitSet> words_;
    std::map<std::string, util::BitSet> exactWords_;
    std::map<std::string, util::BitSet> prefixes_;
    std::map<std::tuple<std::string, std::string, uint8_t>, util::BitSet> pairProximity_;
    std::map<std::pair<std::string, FieldId>, util::BitSet> wordFids_;
    std::map<std::pair<std::string, uint16_t>, util::BitSet> wordPositions_;
    std::map<std::tuple<std::string, FieldId, uint16_t>, util::BitSet> wordFidPositions_;
    std::map<std::pair<FieldId, uint16_t>, util::BitSet> fieldWordCounts_;
    std::map<std::string, std::set<FieldId>> fieldsOfWord_;
    std::map<std::string, std::set<uint16_t>> positionsOfWord_;

    std::map<std::vector<std::string>, std::vector<std::vector<std::string>>> synonyms_;

    // Facets
    std::map<std::pair<std::string, std::string>, util::BitSet> stringFacets_;
    std::map<std::string, std::multimap<double, DocId>> numberFacets_;
    std::map<std::string, util::BitSet> facetExists_;

    // Facet values of each document, keyed by (field, doc)
    std::map<std::pair<std::string, DocId>, std::vector<std::string>> docStringValues_;
    std::map<std::pair<std::string, DocId>, std::vector<double>> docNumberValues_;
};

}  // namespace index
}  // namespace rankflow
