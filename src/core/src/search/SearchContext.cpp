// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/SearchContext.h"

#include "rankflow/util/Exceptions.h"

#include <algorithm>
#include <limits>

namespace rankflow {
namespace search {

using util::BitSet;

SearchContext::SearchContext(const index::IndexSource& index)
    : index_(index) {}

void SearchContext::restrictToFields(std::vector<index::FieldId> fields) {
    std::sort(fields.begin(), fields.end());
    fields.erase(std::unique(fields.begin(), fields.end()), fields.end());
    restrictedFields_ = std::move(fields);

    // Word-level caches depend on the restriction
    wordDocids_.clear();
    prefixDocids_.clear();
    wordFids_.clear();
    phraseDocids_.clear();
}

const BitSet& SearchContext::documentIds() {
    if (!documentIds_) {
        documentIds_ = index_.documentIds();
    }
    return *documentIds_;
}

const BitSet& SearchContext::restrict(BitSet& docids, WordId word) {
    if (restrictedFields_.empty()) {
        return docids;
    }
    BitSet allowed;
    for (index::FieldId fid : restrictedFields_) {
        allowed |= wordFidDocids(word, fid);
    }
    docids &= allowed;
    return docids;
}

const BitSet& SearchContext::wordDocids(Word word) {
    const auto key = std::make_pair(word.id.raw(), word.derived);
    auto it = wordDocids_.find(key);
    if (it != wordDocids_.end()) {
        return it->second;
    }
    const std::string& text = wordInterner.get(word.id);
    BitSet docids = index_.wordDocids(text);
    if (!word.derived) {
        docids |= index_.exactWordDocids(text);
    }
    restrict(docids, word.id);
    return wordDocids_.emplace(key, std::move(docids)).first->second;
}

const BitSet& SearchContext::wordPrefixDocids(Word prefix) {
    const auto key = std::make_pair(prefix.id.raw(), prefix.derived);
    auto it = prefixDocids_.find(key);
    if (it != prefixDocids_.end()) {
        return it->second;
    }
    const std::string& text = wordInterner.get(prefix.id);
    BitSet docids;
    if (restrictedFields_.empty()) {
        docids = index_.wordPrefixDocids(text).value_or(BitSet());
    } else {
        // The prefix posting is not split per field: rebuild it from its words
        for (WordId word : prefixWords(prefix.id)) {
            docids |= wordDocids(Word{word, true});
        }
    }
    return prefixDocids_.emplace(key, std::move(docids)).first->second;
}

const std::vector<WordId>& SearchContext::prefixWords(WordId prefix) {
    auto it = prefixWords_.find(prefix.raw());
    if (it != prefixWords_.end()) {
        return it->second;
    }
    std::vector<WordId> words;
    for (const auto& word :
         index_.wordsWithPrefix(wordInterner.get(prefix), std::numeric_limits<size_t>::max())) {
        words.push_back(wordInterner.insert(word));
    }
    return prefixWords_.emplace(prefix.raw(), std::move(words)).first->second;
}

const BitSet& SearchContext::wordPairProximityDocids(WordId left, WordId right,
                                                     uint8_t proximity) {
    const auto key = std::make_tuple(left.raw(), right.raw(), proximity);
    auto it = pairProximityDocids_.find(key);
    if (it != pairProximityDocids_.end()) {
        return it->second;
    }
    BitSet docids =
        index_.wordPairProximityDocids(wordInterner.get(left), wordInterner.get(right), proximity);
    return pairProximityDocids_.emplace(key, std::move(docids)).first->second;
}

const BitSet& SearchContext::wordFidDocids(WordId word, index::FieldId fid) {
    const auto key = std::make_pair(word.raw(), fid);
    auto it = wordFidDocids_.find(key);
    if (it != wordFidDocids_.end()) {
        return it->second;
    }
    BitSet docids = index_.wordFidDocids(wordInterner.get(word), fid);
    return wordFidDocids_.emplace(key, std::move(docids)).first->second;
}

const BitSet& SearchContext::wordPositionDocids(WordId word, uint16_t position) {
    const auto key = std::make_pair(word.raw(), position);
    auto it = wordPositionDocids_.find(key);
    if (it != wordPositionDocids_.end()) {
        return it->second;
    }
    BitSet docids = index_.wordPositionDocids(wordInterner.get(word), position);
    return wordPositionDocids_.emplace(key, std::move(docids)).first->second;
}

const std::vector<index::FieldId>& SearchContext::wordFids(WordId word) {
    auto it = wordFids_.find(word.raw());
    if (it != wordFids_.end()) {
        return it->second;
    }
    std::vector<index::FieldId> fids = index_.fieldIdsOfWord(wordInterner.get(word));
    if (!restrictedFields_.empty()) {
        fids.erase(std::remove_if(fids.begin(), fids.end(),
                                  [this](index::FieldId fid) {
                                      return !std::binary_search(restrictedFields_.begin(),
                                                                 restrictedFields_.end(), fid);
                                  }),
                   fids.end());
    }
    std::sort(fids.begin(), fids.end());
    return wordFids_.emplace(word.raw(), std::move(fids)).first->second;
}

const std::vector<uint16_t>& SearchContext::wordPositions(WordId word) {
    auto it = wordPositions_.find(word.raw());
    if (it != wordPositions_.end()) {
        return it->second;
    }
    std::vector<uint16_t> positions = index_.positionsOfWord(wordInterner.get(word));
    std::sort(positions.begin(), positions.end());
    return wordPositions_.emplace(word.raw(), std::move(positions)).first->second;
}

const BitSet& SearchContext::phraseDocids(PhraseId phrase) {
    auto it = phraseDocids_.find(phrase.raw());
    if (it != phraseDocids_.end()) {
        return it->second;
    }
    // Copy: wordInterner may grow while the lookups below run
    const std::vector<std::optional<WordId>> words = phraseInterner.get(phrase).words;

    auto finish = [&](BitSet docids) -> const BitSet& {
        return phraseDocids_.emplace(phrase.raw(), std::move(docids)).first->second;
    };

    // Every word must be present
    std::optional<BitSet> candidates;
    for (const auto& word : words) {
        if (!word) {
            continue;
        }
        const BitSet& docids = wordDocids(Word{*word, false});
        if (!candidates) {
            candidates = docids;
        } else {
            *candidates &= docids;
        }
        if (candidates->empty()) {
            return finish(BitSet());
        }
    }
    if (!candidates) {
        return finish(BitSet());
    }

    // Pairs inside windows of at most three words
    const size_t windowSize = std::min<size_t>(words.size(), 3);
    for (size_t start = 0; start + windowSize <= words.size(); start++) {
        std::vector<BitSet> pairs;
        for (size_t i = start; i < start + windowSize; i++) {
            if (!words[i]) {
                continue;
            }
            for (size_t j = i + 1; j < start + windowSize; j++) {
                if (!words[j]) {
                    continue;
                }
                const size_t gap = j - i - 1;
                BitSet docids;
                for (size_t proximity = 1; proximity <= gap + 1; proximity++) {
                    docids |= wordPairProximityDocids(*words[i], *words[j],
                                                      static_cast<uint8_t>(proximity));
                }
                if (docids.empty()) {
                    return finish(BitSet());
                }
                pairs.push_back(std::move(docids));
            }
        }
        std::sort(pairs.begin(), pairs.end(), [](const BitSet& a, const BitSet& b) {
            return a.cardinality() < b.cardinality();
        });
        for (const auto& docids : pairs) {
            *candidates &= docids;
            if (candidates->empty()) {
                return finish(BitSet());
            }
        }
    }
    return finish(std::move(*candidates));
}

uint16_t SearchContext::fieldWeight(index::FieldId fid) {
    if (!fieldWeights_) {
        fieldWeights_.emplace();
        const auto searchable = index_.searchableFieldIds();
        for (size_t weight = 0; weight < searchable.size(); weight++) {
            fieldWeights_->emplace(searchable[weight], static_cast<uint16_t>(weight));
        }
    }
    auto it = fieldWeights_->find(fid);
    if (it == fieldWeights_->end()) {
        throw InternalException(InternalErrorCode::FieldIdMapMissingEntry,
                                "No weight for field id " + std::to_string(fid));
    }
    return it->second;
}

std::optional<uint16_t> SearchContext::maxSearchableWeight() {
    const auto searchable = index_.searchableFieldIds();
    if (searchable.empty()) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(searchable.size() - 1);
}

}  // namespace search
}  // namespace rankflow
