// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/search/BucketSort.h"

#include "rankflow/index/IndexSource.h"
#include "rankflow/observability/Metrics.h"
#include "rankflow/search/SearchContext.h"
#include "rankflow/search/SearchLogger.h"
#include "rankflow/util/Exceptions.h"
#include "rankflow/util/SearchProfiler.h"

#include <algorithm>
#include <utility>

namespace rankflow {
namespace search {

namespace {

/**
 * Results accumulated by the driver, with the offset of the next bucket.
 */
class ResultCollector {
public:
    ResultCollector(size_t from, size_t length, SearchLogger& logger)
        : from_(from)
        , length_(length)
        , logger_(logger) {}

    bool full() const { return output_.docids.size() >= length_; }

    size_t offset() const { return offset_; }

    /**
     * Starts a new bucket of the first rule.
     */
    void enterOutermost(const util::BitSet& candidates) {
        outermost_ = candidates;
        outermostOpen_ = false;
    }

    void add(const util::BitSet& candidates, size_t ruleIndex, const RankingRule& rule) {
        if (candidates.empty()) {
            return;
        }
        const size_t count = candidates.cardinality();

        std::vector<uint32_t> docids;
        if (offset_ < from_) {
            if (offset_ + count <= from_) {
                logger_.skipBucketRankingRule(ruleIndex, rule, candidates);
            } else {
                const std::vector<uint32_t> all = candidates.toVector();
                const size_t skip = from_ - offset_;
                logger_.skipBucketRankingRule(
                    ruleIndex, rule,
                    util::BitSet::fromValues(std::vector<uint32_t>(
                        all.begin(), all.begin() + static_cast<std::ptrdiff_t>(skip))));
                const size_t take = std::min(all.size() - skip, length_ - output_.docids.size());
                docids.assign(all.begin() + static_cast<std::ptrdiff_t>(skip),
                              all.begin() + static_cast<std::ptrdiff_t>(skip + take));
            }
        } else {
            const size_t take = length_ - output_.docids.size();
            candidates.forEach([&](uint32_t doc) {
                if (docids.size() < take) {
                    docids.push_back(doc);
                }
            });
        }

        if (!docids.empty()) {
            logger_.addToResults(docids);
            if (!outermostOpen_) {
                output_.buckets.push_back(OutermostBucket{outermost_, output_.docids.size(), 0});
                outermostOpen_ = true;
            }
            output_.buckets.back().resultCount += docids.size();
            output_.docids.insert(output_.docids.end(), docids.begin(), docids.end());
        }
        offset_ += count;
    }

    BucketSortOutput take() { return std::move(output_); }

private:
    size_t from_;
    size_t length_;
    SearchLogger& logger_;

    size_t offset_ = 0;
    util::BitSet outermost_;
    bool outermostOpen_ = false;
    BucketSortOutput output_;
};

/**
 * Keeps the first document of each distinct field value, in ascending id
 * order. Documents without a value are always kept.
 */
util::BitSet excludedByDistinct(const index::IndexSource& index, const std::string& field,
                                const util::BitSet& candidates) {
    util::BitSet excluded;
    candidates.forEach([&](uint32_t doc) {
        if (excluded.contains(doc)) {
            return;
        }
        util::BitSet sharing = index.documentsSharingFacetValue(field, doc);
        sharing.remove(doc);
        excluded |= sharing;
    });
    return excluded;
}

void checkTimeBudget(const util::TimeBudget& timeBudget) {
    if (timeBudget.exceeded()) {
        observability::MetricsRegistry::instance()
            .getCounter(observability::metric_names::SEARCH_TIMEOUTS)
            ->inc();
        throw SearchTimedOutException(timeBudget.cancelled() ? "Search was cancelled"
                                                             : "Search time budget exceeded");
    }
}

}  // namespace

BucketSortOutput bucketSort(SearchContext& ctx, std::vector<std::unique_ptr<RankingRule>>& rules,
                            const QueryGraph& query, const util::BitSet& universe, size_t from,
                            size_t length, SearchLogger& logger,
                            const util::TimeBudget& timeBudget,
                            const std::optional<std::string>& distinct) {
    PROFILE_SCOPE("bucketSort");
    logger.initialQuery(ctx, query);
    logger.rankingRules(rules);
    logger.initialUniverse(universe);

    const size_t universeLen = universe.cardinality();
    if (universeLen < from) {
        BucketSortOutput output;
        output.allCandidates = universe;
        return output;
    }

    if (rules.empty()) {
        BucketSortOutput output;
        output.allCandidates = universe;
        if (distinct) {
            output.allCandidates -= excludedByDistinct(ctx.index(), *distinct, universe);
        }
        size_t index = 0;
        output.allCandidates.forEach([&](uint32_t doc) {
            if (index >= from && output.docids.size() < length) {
                output.docids.push_back(doc);
            }
            index++;
        });
        if (!output.docids.empty()) {
            output.buckets.push_back(
                OutermostBucket{output.allCandidates, 0, output.docids.size()});
        }
        return output;
    }

    auto bucketsEmitted = observability::MetricsRegistry::instance().getCounter(
        observability::metric_names::BUCKETS_EMITTED);
    auto bucketSize = observability::MetricsRegistry::instance().getHistogram(
        observability::metric_names::BUCKET_SIZE);

    const size_t lastRule = rules.size() - 1;
    std::vector<util::BitSet> universes(rules.size());
    universes[0] = universe;
    size_t current = 0;

    ResultCollector results(from, length, logger);
    results.enterOutermost(universe);
    util::BitSet allCandidates = universe;

    // Applies distinct to a bucket on its way to the results
    auto addToResults = [&](util::BitSet bucket, size_t ruleIndex) {
        if (distinct) {
            const util::BitSet excluded = excludedByDistinct(ctx.index(), *distinct, bucket);
            bucket -= excluded;
            for (auto& pending : universes) {
                pending -= excluded;
            }
            allCandidates -= excluded;
        }
        results.add(bucket, ruleIndex, *rules[ruleIndex]);
    };

    checkTimeBudget(timeBudget);
    logger.startIterationRankingRule(0, *rules[0], query, universe);
    rules[0]->startIteration(ctx, logger, universe, query);

    // Ends the iteration of the current rule; false once the first rule is done
    auto back = [&]() {
        logger.endIterationRankingRule(current, *rules[current], universes[current]);
        universes[current].clear();
        rules[current]->endIteration(ctx, logger);
        if (current == 0) {
            return false;
        }
        current--;
        return true;
    };

    bool running = true;
    while (running && !results.full()) {
        if (universes[current].cardinality() <= 1) {
            util::BitSet bucket = std::move(universes[current]);
            universes[current] = util::BitSet();
            if (current == 0 && !bucket.empty()) {
                // A leftover document of the first rule is a bucket of its own
                results.enterOutermost(bucket);
            }
            addToResults(std::move(bucket), current);
            running = back();
            continue;
        }

        checkTimeBudget(timeBudget);
        std::optional<RankingRuleOutput> next =
            rules[current]->nextBucket(ctx, logger, universes[current]);
        if (!next) {
            running = back();
            continue;
        }

        logger.nextBucketRankingRule(current, *rules[current], universes[current],
                                     next->candidates);
        if (!next->candidates.isSubsetOf(universes[current])) {
            throw InternalException(InternalErrorCode::InvariantViolation,
                                    "Ranking rule " + rules[current]->id() +
                                        " returned documents outside of its universe");
        }
        bucketsEmitted->inc();
        const size_t count = next->candidates.cardinality();
        bucketSize->observe(static_cast<double>(count));

        universes[current] -= next->candidates;
        if (current == 0) {
            results.enterOutermost(next->candidates);
        }

        if (current == lastRule || count <= 1 || results.offset() + count <= from) {
            addToResults(std::move(next->candidates), current);
            continue;
        }

        current++;
        universes[current] = next->candidates;
        logger.startIterationRankingRule(current, *rules[current], next->query,
                                         universes[current]);
        rules[current]->startIteration(ctx, logger, universes[current], next->query);
    }

    // Stopped at the limit: end the iterations still open
    while (running) {
        running = back();
    }

    BucketSortOutput output = results.take();
    output.allCandidates = std::move(allCandidates);
    return output;
}

}  // namespace search
}  // namespace rankflow
