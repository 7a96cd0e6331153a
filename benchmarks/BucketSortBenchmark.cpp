// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/index/MemoryIndex.h"
#include "rankflow/search/Search.h"

#include <benchmark/benchmark.h>

#include <map>
#include <memory>
#include <random>
#include <sstream>

using namespace rankflow;
using namespace rankflow::index;
using namespace rankflow::search;

// ==================== Test Corpus Setup ====================

/**
 * Generate random text for document
 */
std::string generateRandomText(int numWords, std::mt19937& rng) {
    static const std::vector<std::string> words = {
        "search",    "engine",      "index",  "document", "query",   "result",
        "ranking",   "relevance",   "typo",   "proximity", "bucket", "sort",
        "fast",      "performance", "memory", "the",       "quick",  "brown",
        "fox",       "jumps",       "over",   "lazy",      "dog",    "sunflower",
        "sun",       "flower",      "garden", "summer",    "house",  "summerhouse"};

    std::uniform_int_distribution<size_t> dist(0, words.size() - 1);
    std::ostringstream oss;
    for (int i = 0; i < numWords; i++) {
        if (i > 0) oss << " ";
        oss << words[dist(rng)];
    }
    return oss.str();
}

/**
 * Create test index with specified number of documents
 */
std::unique_ptr<MemoryIndex> createTestIndex(int numDocs) {
    IndexSettings settings;
    settings.searchableFields = {"title", "body"};
    settings.filterableFields = {"year"};
    auto index = std::make_unique<MemoryIndex>(settings);

    std::mt19937 rng(12345);  // Fixed seed
    std::uniform_int_distribution<int> years(1950, 2024);

    for (int i = 0; i < numDocs; i++) {
        Document doc;
        doc.text["title"] = generateRandomText(5, rng);
        doc.text["body"] = generateRandomText(50, rng);
        doc.numbers["year"] = {static_cast<double>(years(rng))};
        index->addDocument(static_cast<DocId>(i), doc);
    }
    index->finish();
    return index;
}

MemoryIndex& cachedIndex(int numDocs) {
    static std::map<int, std::unique_ptr<MemoryIndex>> indexCache;
    auto& index = indexCache[numDocs];
    if (!index) {
        index = createTestIndex(numDocs);
    }
    return *index;
}

void runSearch(benchmark::State& state, const SearchConfig& config) {
    const int numDocs = static_cast<int>(state.range(0));
    MemoryIndex& index = cachedIndex(numDocs);

    for (auto _ : state) {
        auto result = Search(index, config).execute();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel(std::to_string(numDocs) + " docs");
}

// ==================== Search Benchmarks ====================

/**
 * Benchmark: Placeholder search, no ranking work
 */
static void BM_PlaceholderSearch(benchmark::State& state) {
    runSearch(state, SearchConfig{});
}

/**
 * Benchmark: Single word with the default ranking rules
 */
static void BM_SingleWordSearch(benchmark::State& state) {
    SearchConfig config;
    config.query = "quick";
    runSearch(state, config);
}

/**
 * Benchmark: Multi-word query, exercises words and proximity graphs
 */
static void BM_MultiWordSearch(benchmark::State& state) {
    SearchConfig config;
    config.query = "the quick brown fox";
    runSearch(state, config);
}

/**
 * Benchmark: Query with typos, split words and ngrams
 */
static void BM_TypoSearch(benchmark::State& state) {
    SearchConfig config;
    config.query = "sun flowr sumer hose";
    runSearch(state, config);
}

/**
 * Benchmark: Deep pagination
 * Measures the cost of skipping buckets before the page
 */
static void BM_DeepPagination(benchmark::State& state) {
    SearchConfig config;
    config.query = "search engine ranking";
    config.offset = 500;
    config.limit = 20;
    runSearch(state, config);
}

/**
 * Benchmark: Filtered search with a boost rule
 */
static void BM_FilterAndBoost(benchmark::State& state) {
    SearchConfig config;
    config.query = "summer house";
    config.filter = "year >= 1990";
    config.rankingRules = {"boost:year > 2010", "words", "typo", "proximity", "attribute",
                           "exactness"};
    runSearch(state, config);
}

BENCHMARK(BM_PlaceholderSearch)->Arg(1000)->Arg(10000);
BENCHMARK(BM_SingleWordSearch)->Arg(1000)->Arg(10000);
BENCHMARK(BM_MultiWordSearch)->Arg(1000)->Arg(10000);
BENCHMARK(BM_TypoSearch)->Arg(1000)->Arg(10000);
BENCHMARK(BM_DeepPagination)->Arg(10000);
BENCHMARK(BM_FilterAndBoost)->Arg(1000)->Arg(10000);

BENCHMARK_MAIN();
