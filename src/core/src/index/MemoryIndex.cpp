// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/index/MemoryIndex.h"

#include "rankflow/analysis/QueryTokenizer.h"
#include "rankflow/util/Exceptions.h"

#include <algorithm>
#include <stdexcept>

namespace rankflow {
namespace index {

using analysis::QueryTokenizer;

namespace {
constexpr uint16_t MAX_PAIR_PROXIMITY = 7;
}

MemoryIndex::MemoryIndex(IndexSettings settings)
    : settings_(std::move(settings)) {
    // Searchable fields get the lowest ids, in weight order
    for (const auto& name : settings_.searchableFields) {
        fieldIdFor(name);
    }
    for (const auto& name : settings_.exactFields) {
        exactFields_.insert(name);
    }
}

FieldId MemoryIndex::fieldIdFor(const std::string& name) {
    auto it = fieldIds_.find(name);
    if (it != fieldIds_.end()) {
        return it->second;
    }
    const auto fid = static_cast<FieldId>(fieldIds_.size());
    fieldIds_.emplace(name, fid);
    return fid;
}

void MemoryIndex::addDocument(DocId id, const Document& document) {
    if (finished_) {
        throw UnsupportedOperationException("MemoryIndex is frozen, cannot add document " +
                                            std::to_string(id));
    }
    if (documents_.contains(id)) {
        throw std::invalid_argument("Document id already indexed: " + std::to_string(id));
    }
    documents_.insert(id);

    std::map<std::pair<std::string, std::string>, uint16_t> pairs;

    for (const auto& name : settings_.searchableFields) {
        auto it = document.text.find(name);
        if (it == document.text.end()) {
            continue;
        }
        const FieldId fid = fieldIdFor(name);
        indexText(id, fid, exactFields_.count(name) > 0, it->second);

        // Forward pairs inside this field value
        const auto words = QueryTokenizer::positionedWords(it->second);
        for (size_t i = 0; i < words.size(); i++) {
            for (size_t j = i + 1; j < words.size(); j++) {
                const uint16_t distance = words[j].position - words[i].position;
                if (distance > MAX_PAIR_PROXIMITY) {
                    break;
                }
                auto key = std::make_pair(words[i].word, words[j].word);
                auto found = pairs.find(key);
                if (found == pairs.end() || found->second > distance) {
                    pairs[key] = distance;
                }
            }
        }
    }

    for (const auto& [key, proximity] : pairs) {
        pairProximity_[std::make_tuple(key.first, key.second, static_cast<uint8_t>(proximity))]
            .insert(id);
    }

    for (const auto& [field, values] : document.strings) {
        fieldIdFor(field);
        for (const auto& value : values) {
            const std::string normalized = QueryTokenizer::normalize(value);
            stringFacets_[std::make_pair(field, normalized)].insert(id);
            docStringValues_[std::make_pair(field, id)].push_back(normalized);
        }
        if (!values.empty()) {
            facetExists_[field].insert(id);
        }
    }
    for (const auto& [field, values] : document.numbers) {
        fieldIdFor(field);
        for (double value : values) {
            numberFacets_[field].emplace(value, id);
            docNumberValues_[std::make_pair(field, id)].push_back(value);
        }
        if (!values.empty()) {
            facetExists_[field].insert(id);
        }
    }
}

void MemoryIndex::indexText(DocId id, FieldId fid, bool exact, const std::string& value) {
    const auto words = QueryTokenizer::positionedWords(value);
    if (!words.empty()) {
        fieldWordCounts_[std::make_pair(fid, static_cast<uint16_t>(words.size()))].insert(id);
    }
    for (const auto& positioned : words) {
        const std::string& word = positioned.word;
        if (exact) {
            exactWords_[word].insert(id);
        } else {
            words_[word].insert(id);
        }
        wordFids_[std::make_pair(word, fid)].insert(id);
        wordPositions_[std::make_pair(word, positioned.position)].insert(id);
        wordFidPositions_[std::make_tuple(word, fid, positioned.position)].insert(id);
        fieldsOfWord_[word].insert(fid);
        positionsOfWord_[word].insert(positioned.position);
    }
}

void MemoryIndex::addSynonyms(const std::vector<std::string>& words,
                              const std::vector<std::vector<std::string>>& alternatives) {
    std::vector<std::string> key;
    key.reserve(words.size());
    for (const auto& word : words) {
        key.push_back(QueryTokenizer::normalize(word));
    }
    auto& target = synonyms_[key];
    for (const auto& alternative : alternatives) {
        std::vector<std::string> normalized;
        normalized.reserve(alternative.size());
        for (const auto& word : alternative) {
            normalized.push_back(QueryTokenizer::normalize(word));
        }
        target.push_back(std::move(normalized));
    }
}

void MemoryIndex::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (settings_.prefixCacheMaxLength == 0) {
        return;
    }

    std::map<std::string, std::pair<size_t, util::BitSet>> candidates;
    for (const auto& [word, docids] : words_) {
        // Byte offsets where each code point after the first starts
        std::vector<size_t> boundaries;
        for (size_t i = 1; i < word.size(); i++) {
            if ((static_cast<unsigned char>(word[i]) & 0xC0) != 0x80) {
                boundaries.push_back(i);
            }
        }
        const size_t maxLength = std::min(settings_.prefixCacheMaxLength, boundaries.size());
        for (size_t len = 1; len <= maxLength; len++) {
            auto& entry = candidates[word.substr(0, boundaries[len - 1])];
            entry.first++;
            entry.second |= docids;
        }
    }
    for (auto& [prefix, entry] : candidates) {
        if (entry.first >= settings_.prefixCacheMinWords) {
            prefixes_.emplace(prefix, std::move(entry.second));
        }
    }
}

const util::BitSet& MemoryIndex::lookup(const std::map<std::string, util::BitSet>& postings,
                                        const std::string& key) {
    static const util::BitSet empty;
    auto it = postings.find(key);
    return it == postings.end() ? empty : it->second;
}

util::BitSet MemoryIndex::wordDocids(const std::string& word) const {
    return lookup(words_, word);
}

util::BitSet MemoryIndex::exactWordDocids(const std::string& word) const {
    return lookup(exactWords_, word);
}

std::optional<util::BitSet> MemoryIndex::wordPrefixDocids(const std::string& prefix) const {
    auto it = prefixes_.find(prefix);
    if (it == prefixes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

util::BitSet MemoryIndex::wordPairProximityDocids(const std::string& left,
                                                  const std::string& right,
                                                  uint8_t proximity) const {
    auto it = pairProximity_.find(std::make_tuple(left, right, proximity));
    return it == pairProximity_.end() ? util::BitSet() : it->second;
}

util::BitSet MemoryIndex::wordFidDocids(const std::string& word, FieldId fid) const {
    auto it = wordFids_.find(std::make_pair(word, fid));
    return it == wordFids_.end() ? util::BitSet() : it->second;
}

util::BitSet MemoryIndex::wordPositionDocids(const std::string& word, uint16_t position) const {
    auto it = wordPositions_.find(std::make_pair(word, position));
    return it == wordPositions_.end() ? util::BitSet() : it->second;
}

util::BitSet MemoryIndex::wordFidPositionDocids(const std::string& word, FieldId fid,
                                                uint16_t position) const {
    auto it = wordFidPositions_.find(std::make_tuple(word, fid, position));
    return it == wordFidPositions_.end() ? util::BitSet() : it->second;
}

util::BitSet MemoryIndex::fieldWordCountDocids(FieldId fid, uint16_t count) const {
    auto it = fieldWordCounts_.find(std::make_pair(fid, count));
    return it == fieldWordCounts_.end() ? util::BitSet() : it->second;
}

std::vector<FieldId> MemoryIndex::fieldIdsOfWord(const std::string& word) const {
    auto it = fieldsOfWord_.find(word);
    if (it == fieldsOfWord_.end()) {
        return {};
    }
    return std::vector<FieldId>(it->second.begin(), it->second.end());
}

std::vector<uint16_t> MemoryIndex::positionsOfWord(const std::string& word) const {
    auto it = positionsOfWord_.find(word);
    if (it == positionsOfWord_.end()) {
        return {};
    }
    return std::vector<uint16_t>(it->second.begin(), it->second.end());
}

bool MemoryIndex::containsWord(const std::string& word) const {
    return words_.count(word) > 0 || exactWords_.count(word) > 0;
}

std::vector<std::string> MemoryIndex::wordsWithPrefix(const std::string& prefix,
                                                      size_t limit) const {
    std::vector<std::string> result;
    for (auto it = words_.lower_bound(prefix); it != words_.end() && result.size() < limit; ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        result.push_back(it->first);
    }
    return result;
}

std::vector<std::string> MemoryIndex::wordsStartingWith(const std::string& firstCharacter) const {
    return wordsWithPrefix(firstCharacter, words_.size());
}

std::vector<std::string> MemoryIndex::vocabulary() const {
    std::vector<std::string> result;
    result.reserve(words_.size());
    for (const auto& [word, docids] : words_) {
        result.push_back(word);
    }
    return result;
}

std::vector<std::vector<std::string>> MemoryIndex::synonyms(
    const std::vector<std::string>& words) const {
    auto it = synonyms_.find(words);
    if (it == synonyms_.end()) {
        return {};
    }
    return it->second;
}

std::vector<FieldId> MemoryIndex::searchableFieldIds() const {
    std::vector<FieldId> result;
    result.reserve(settings_.searchableFields.size());
    for (const auto& name : settings_.searchableFields) {
        result.push_back(fieldIds_.at(name));
    }
    return result;
}

std::optional<FieldId> MemoryIndex::fieldId(const std::string& name) const {
    auto it = fieldIds_.find(name);
    if (it == fieldIds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryIndex::filterableFields() const {
    return settings_.filterableFields;
}

std::vector<std::string> MemoryIndex::sortableFields() const {
    return settings_.sortableFields;
}

util::BitSet MemoryIndex::facetStringDocids(const std::string& field,
                                            const std::string& normalizedValue) const {
    auto it = stringFacets_.find(std::make_pair(field, normalizedValue));
    return it == stringFacets_.end() ? util::BitSet() : it->second;
}

util::BitSet MemoryIndex::facetNumberDocids(const std::string& field, double low,
                                            double high) const {
    util::BitSet result;
    auto it = numberFacets_.find(field);
    if (it == numberFacets_.end() || low > high) {
        return result;
    }
    const auto& values = it->second;
    for (auto entry = values.lower_bound(low); entry != values.end() && entry->first <= high;
         ++entry) {
        result.insert(entry->second);
    }
    return result;
}

util::BitSet MemoryIndex::facetExistsDocids(const std::string& field) const {
    return lookup(facetExists_, field);
}

std::vector<std::pair<double, util::BitSet>> MemoryIndex::facetNumberValues(
    const std::string& field) const {
    std::vector<std::pair<double, util::BitSet>> result;
    auto it = numberFacets_.find(field);
    if (it == numberFacets_.end()) {
        return result;
    }
    // The multimap is ordered by value, equal values are adjacent
    for (const auto& [value, doc] : it->second) {
        if (result.empty() || result.back().first != value) {
            result.emplace_back(value, util::BitSet());
        }
        result.back().second.insert(doc);
    }
    return result;
}

std::vector<std::pair<std::string, util::BitSet>> MemoryIndex::facetStringValues(
    const std::string& field) const {
    std::vector<std::pair<std::string, util::BitSet>> result;
    for (auto it = stringFacets_.lower_bound(std::make_pair(field, std::string()));
         it != stringFacets_.end() && it->first.first == field; ++it) {
        result.emplace_back(it->first.second, it->second);
    }
    return result;
}

util::BitSet MemoryIndex::documentsSharingFacetValue(const std::string& field, DocId doc) const {
    util::BitSet result;
    auto strings = docStringValues_.find(std::make_pair(field, doc));
    if (strings != docStringValues_.end()) {
        for (const auto& value : strings->second) {
            result |= facetStringDocids(field, value);
        }
    }
    auto numbers = docNumberValues_.find(std::make_pair(field, doc));
    if (numbers != docNumberValues_.end()) {
        for (double value : numbers->second) {
            result |= facetNumberDocids(field, value, value);
        }
    }
    return result;
}

}  // namespace index
}  // namespace rankflow
