// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "rankflow/search/QueryGraph.h"
#include "rankflow/util/BitSet.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace rankflow {
namespace search {

class RankingRule;
class SearchContext;

/**
 * @brief Receives the events of a search, for debugging and profiling.
 *
 * Loggers observe only: a search returns the same results with any logger.
 */
class SearchLogger {
public:
    virtual ~SearchLogger() = default;

    virtual void initialQuery(const SearchContext& ctx, const QueryGraph& query) = 0;

    /**
     * The query graph after the terms matching strategy reduced it.
     */
    virtual void queryForInitialUniverse(const SearchContext& ctx, const QueryGraph& query) = 0;

    virtual void initialUniverse(const util::BitSet& universe) = 0;

    virtual void rankingRules(const std::vector<std::unique_ptr<RankingRule>>& rules) = 0;

    virtual void startIterationRankingRule(size_t index, const RankingRule& rule,
                                           const QueryGraph& query,
                                           const util::BitSet& universe) = 0;

    virtual void nextBucketRankingRule(size_t index, const RankingRule& rule,
                                       const util::BitSet& universe,
                                       const util::BitSet& bucket) = 0;

    virtual void skipBucketRankingRule(size_t index, const RankingRule& rule,
                                       const util::BitSet& candidates) = 0;

    virtual void endIterationRankingRule(size_t index, const RankingRule& rule,
                                         const util::BitSet& universe) = 0;

    virtual void addToResults(const std::vector<uint32_t>& docids) = 0;

    /**
     * State of a graph rule after computing a bucket: the cost and the
     * paths that produced documents, one label per condition.
     */
    virtual void logInternalState(const std::string& rule, uint64_t cost,
                                  const std::vector<std::vector<std::string>>& goodPaths) = 0;

    /**
     * Whether logInternalState() wants its arguments; building path labels
     * costs time, so rules skip it for loggers that ignore them.
     */
    virtual bool wantsInternalState() const { return false; }
};

/**
 * @brief Logger ignoring every event.
 */
class DefaultSearchLogger : public SearchLogger {
public:
    void initialQuery(const SearchContext&, const QueryGraph&) override {}
    void queryForInitialUniverse(const SearchContext&, const QueryGraph&) override {}
    void initialUniverse(const util::BitSet&) override {}
    void rankingRules(const std::vector<std::unique_ptr<RankingRule>>&) override {}
    void startIterationRankingRule(size_t, const RankingRule&, const QueryGraph&,
                                   const util::BitSet&) override {}
    void nextBucketRankingRule(size_t, const RankingRule&, const util::BitSet&,
                               const util::BitSet&) override {}
    void skipBucketRankingRule(size_t, const RankingRule&, const util::BitSet&) override {}
    void endIterationRankingRule(size_t, const RankingRule&, const util::BitSet&) override {}
    void addToResults(const std::vector<uint32_t>&) override {}
    void logInternalState(const std::string&, uint64_t,
                          const std::vector<std::vector<std::string>>&) override {}
};

/**
 * @brief Logger recording every event, for tests and debugging.
 *
 * Usage:
 * ```cpp
 * DetailedSearchLogger logger;
 * config.logger = &logger;
 * Search(index, config).execute();
 * logger.printReport(std::cout);
 * ```
 */
class DetailedSearchLogger : public SearchLogger {
public:
    enum class EventKind : uint8_t {
        StartIteration,
        NextBucket,
        SkipBucket,
        EndIteration,
        AddToResults,
        InternalState
    };

    struct Event {
        EventKind kind;
        size_t ruleIndex = 0;
        std::string ruleId;
        /** Bucket, skipped candidates or universe, depending on kind */
        util::BitSet docids;
        std::vector<uint32_t> results;
        uint64_t cost = 0;
        std::vector<std::vector<std::string>> paths;
    };

    void initialQuery(const SearchContext& ctx, const QueryGraph& query) override;
    void queryForInitialUniverse(const SearchContext& ctx, const QueryGraph& query) override;
    void initialUniverse(const util::BitSet& universe) override;
    void rankingRules(const std::vector<std::unique_ptr<RankingRule>>& rules) override;
    void startIterationRankingRule(size_t index, const RankingRule& rule, const QueryGraph& query,
                                   const util::BitSet& universe) override;
    void nextBucketRankingRule(size_t index, const RankingRule& rule,
                               const util::BitSet& universe,
                               const util::BitSet& bucket) override;
    void skipBucketRankingRule(size_t index, const RankingRule& rule,
                               const util::BitSet& candidates) override;
    void endIterationRankingRule(size_t index, const RankingRule& rule,
                                 const util::BitSet& universe) override;
    void addToResults(const std::vector<uint32_t>& docids) override;
    void logInternalState(const std::string& rule, uint64_t cost,
                          const std::vector<std::vector<std::string>>& goodPaths) override;

    bool wantsInternalState() const override { return true; }

    const std::string& initialQueryDescription() const { return initialQuery_; }
    const std::string& reducedQueryDescription() const { return reducedQuery_; }
    const util::BitSet& initialUniverseDocids() const { return initialUniverse_; }
    const std::vector<std::string>& rankingRuleIds() const { return rankingRules_; }
    const std::vector<Event>& events() const { return events_; }

    /**
     * Buckets returned by the rule at index, in order.
     */
    std::vector<util::BitSet> bucketsOf(size_t ruleIndex) const;

    /**
     * Prints the query, the rules and every event, indented by rule depth.
     */
    void printReport(std::ostream& out) const;

private:
    std::string initialQuery_;
    std::string reducedQuery_;
    util::BitSet initialUniverse_;
    std::vector<std::string> rankingRules_;
    std::vector<Event> events_;
};

}  // namespace search
}  // namespace rankflow
