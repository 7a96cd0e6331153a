// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/SearchLogger.h"

#include "rankflow/search/rules/RankingRule.h"

#include <sstream>

namespace rankflow {
namespace search {

namespace {

std::string describeDocids(const util::BitSet& docids) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    size_t shown = 0;
    docids.forEach([&](uint32_t doc) {
        if (shown++ >= 16) {
            return;
        }
        out << (first ? "" : ", ") << doc;
        first = false;
    });
    if (shown > 16) {
        out << ", ... (" << shown << " total)";
    }
    out << "}";
    return out.str();
}

}  // namespace

void DetailedSearchLogger::initialQuery(const SearchContext& ctx, const QueryGraph& query) {
    initialQuery_ = query.describe(ctx);
}

void DetailedSearchLogger::queryForInitialUniverse(const SearchContext& ctx,
                                                   const QueryGraph& query) {
    reducedQuery_ = query.describe(ctx);
}

void DetailedSearchLogger::initialUniverse(const util::BitSet& universe) {
    initialUniverse_ = universe;
}

void DetailedSearchLogger::rankingRules(const std::vector<std::unique_ptr<RankingRule>>& rules) {
    rankingRules_.clear();
    for (const auto& rule : rules) {
        rankingRules_.push_back(rule->id());
    }
}

void DetailedSearchLogger::startIterationRankingRule(size_t index, const RankingRule& rule,
                                                     const QueryGraph& /*query*/,
                                                     const util::BitSet& universe) {
    events_.push_back(Event{EventKind::StartIteration, index, rule.id(), universe, {}, 0, {}});
}

void DetailedSearchLogger::nextBucketRankingRule(size_t index, const RankingRule& rule,
                                                 const util::BitSet& /*universe*/,
                                                 const util::BitSet& bucket) {
    events_.push_back(Event{EventKind::NextBucket, index, rule.id(), bucket, {}, 0, {}});
}

void DetailedSearchLogger::skipBucketRankingRule(size_t index, const RankingRule& rule,
                                                 const util::BitSet& candidates) {
    events_.push_back(Event{EventKind::SkipBucket, index, rule.id(), candidates, {}, 0, {}});
}

void DetailedSearchLogger::endIterationRankingRule(size_t index, const RankingRule& rule,
                                                   const util::BitSet& universe) {
    events_.push_back(Event{EventKind::EndIteration, index, rule.id(), universe, {}, 0, {}});
}

void DetailedSearchLogger::addToResults(const std::vector<uint32_t>& docids) {
    events_.push_back(Event{EventKind::AddToResults, 0, {}, {}, docids, 0, {}});
}

void DetailedSearchLogger::logInternalState(
    const std::string& rule, uint64_t cost,
    const std::vector<std::vector<std::string>>& goodPaths) {
    events_.push_back(Event{EventKind::InternalState, 0, rule, {}, {}, cost, goodPaths});
}

std::vector<util::BitSet> DetailedSearchLogger::bucketsOf(size_t ruleIndex) const {
    std::vector<util::BitSet> buckets;
    for (const auto& event : events_) {
        if (event.kind == EventKind::NextBucket && event.ruleIndex == ruleIndex) {
            buckets.push_back(event.docids);
        }
    }
    return buckets;
}

void DetailedSearchLogger::printReport(std::ostream& out) const {
    out << "=== Search Report ===\n";
    out << "Query:\n" << initialQuery_;
    if (!reducedQuery_.empty()) {
        out << "Query for initial universe:\n" << reducedQuery_;
    }
    out << "Initial universe: " << describeDocids(initialUniverse_) << "\n";
    out << "Ranking rules:";
    for (const auto& id : rankingRules_) {
        out << " " << id;
    }
    out << "\n";

    for (const auto& event : events_) {
        const std::string indent(2 * (event.ruleIndex + 1), ' ');
        switch (event.kind) {
            case EventKind::StartIteration:
                out << indent << "start " << event.ruleId << " " << describeDocids(event.docids)
                    << "\n";
                break;
            case EventKind::NextBucket:
                out << indent << "bucket " << event.ruleId << " " << describeDocids(event.docids)
                    << "\n";
                break;
            case EventKind::SkipBucket:
                out << indent << "skip " << event.ruleId << " " << describeDocids(event.docids)
                    << "\n";
                break;
            case EventKind::EndIteration:
                out << indent << "end " << event.ruleId << "\n";
                break;
            case EventKind::AddToResults:
                out << "  results:";
                for (uint32_t doc : event.results) {
                    out << " " << doc;
                }
                out << "\n";
                break;
            case EventKind::InternalState:
                out << "    " << event.ruleId << " cost=" << event.cost << " paths="
                    << event.paths.size() << "\n";
                for (const auto& path : event.paths) {
                    out << "     ";
                    for (const auto& label : path) {
                        out << " [" << label << "]";
                    }
                    out << "\n";
                }
                break;
        }
    }
}

}  // namespace search
}  // namespace rankflow
