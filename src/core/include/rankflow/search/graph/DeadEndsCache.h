// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/util/BitSet.h"
#include "rankflow/util/Interner.h"

#include <memory>
#include <vector>

namespace rankflow {
namespace search {

/**
 * @brief Prefix tree of conditions that cannot lead to any document.
 *
 * The root holds conditions forbidden everywhere. The child reached by a
 * sequence of conditions holds the conditions forbidden right after that
 * sequence (the path prefix). For example:
 *
 *   root: forbidden {a, b}
 *     after c: forbidden {e}
 *       after c, f: forbidden {h, i}
 *     after g: forbidden {f}
 */
template<typename Condition>
class DeadEndsCache {
public:
    using ConditionId = util::Interned<Condition>;

    /**
     * @brief Forbids a condition for every path.
     */
    void forbidCondition(ConditionId condition) { forbidden_.insert(condition.raw()); }

    /**
     * @brief Forbids a condition right after the given path prefix.
     */
    template<typename Iterator>
    void forbidConditionAfterPrefix(Iterator begin, Iterator end, ConditionId condition) {
        DeadEndsCache* cursor = this;
        for (; begin != end; ++begin) {
            DeadEndsCache* next = cursor->advance(*begin);
            if (!next) {
                cursor->conditions_.push_back(*begin);
                cursor->next_.push_back(std::make_unique<DeadEndsCache>());
                next = cursor->next_.back().get();
            }
            cursor = next;
        }
        cursor->forbidden_.insert(condition.raw());
    }

    /**
     * @brief Conditions forbidden right after the prefix, or nullptr if the
     * tree has no node for it.
     */
    template<typename Iterator>
    const util::BitSet* forbiddenConditionsAfterPrefix(Iterator begin, Iterator end) {
        DeadEndsCache* cursor = this;
        for (; begin != end; ++begin) {
            cursor = cursor->advance(*begin);
            if (!cursor) {
                return nullptr;
            }
        }
        return &cursor->forbidden_;
    }

    /**
     * @brief Union of the conditions forbidden after every prefix of path,
     * the empty prefix included.
     */
    template<typename Iterator>
    util::BitSet forbiddenConditionsForAllPrefixesUpTo(Iterator begin, Iterator end) {
        util::BitSet forbidden = forbidden_;
        DeadEndsCache* cursor = this;
        for (; begin != end; ++begin) {
            cursor = cursor->advance(*begin);
            if (!cursor) {
                break;
            }
            forbidden |= cursor->forbidden_;
        }
        return forbidden;
    }

    const util::BitSet& forbidden() const { return forbidden_; }

private:
    DeadEndsCache* advance(ConditionId condition) {
        for (size_t i = 0; i < conditions_.size(); i++) {
            if (conditions_[i] == condition) {
                return next_[i].get();
            }
        }
        return nullptr;
    }

    std::vector<ConditionId> conditions_;
    std::vector<std::unique_ptr<DeadEndsCache>> next_;
    util::BitSet forbidden_;
};

}  // namespace search
}  // namespace rankflow
