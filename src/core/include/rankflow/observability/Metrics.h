// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace rankflow {
namespace observability {

/**
 * Names of the metrics the ranking engine reports.
 */
namespace metric_names {
inline constexpr const char* CONDITIONS_RESOLVED = "rankflow.conditions.resolved";
inline constexpr const char* CONDITIONS_CACHE_HITS = "rankflow.conditions.cache_hits";
inline constexpr const char* CONDITIONS_NARROWED = "rankflow.conditions.narrowed";
inline constexpr const char* BUCKETS_EMITTED = "rankflow.buckets.emitted";
inline constexpr const char* BUCKET_SIZE = "rankflow.buckets.size";
inline constexpr const char* SEARCH_TIMEOUTS = "rankflow.search.timeouts";
inline constexpr const char* SEARCH_ACTIVE = "rankflow.search.active";
inline constexpr const char* SEARCH_LATENCY = "rankflow.search.latency";
}  // namespace metric_names

/**
 * Monotonically increasing count of events
 *
 * Use for: conditions resolved, buckets emitted, timeouts
 */
class Counter {
public:
    explicit Counter(std::string name)
        : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void inc() { value_.fetch_add(1, std::memory_order_relaxed); }

    int64_t count() const { return value_.load(std::memory_order_relaxed); }

    void reset() { value_.store(0, std::memory_order_relaxed); }

private:
    std::string name_;
    std::atomic<int64_t> value_{0};
};

/**
 * Level that goes up and down
 *
 * Use for: searches in flight
 */
class Gauge {
public:
    explicit Gauge(std::string name)
        : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void inc() { value_.fetch_add(1, std::memory_order_relaxed); }

    void dec() { value_.fetch_sub(1, std::memory_order_relaxed); }

    int64_t value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::string name_;
    std::atomic<int64_t> value_{0};
};

/**
 * Count and sum of observed values
 *
 * Use for: bucket sizes
 */
class Histogram {
public:
    explicit Histogram(std::string name)
        : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        count_++;
        sum_ += value;
    }

    int64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ == 0 ? 0.0 : sum_ / static_cast<double>(count_);
    }

private:
    std::string name_;
    int64_t count_ = 0;
    double sum_ = 0.0;
    mutable std::mutex mutex_;
};

/**
 * Accumulated durations
 *
 * Use for: search latency
 */
class Timer {
public:
    explicit Timer(std::string name)
        : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void record(std::chrono::nanoseconds duration) {
        count_.fetch_add(1, std::memory_order_relaxed);
        totalNanos_.fetch_add(duration.count(), std::memory_order_relaxed);
    }

    int64_t count() const { return count_.load(std::memory_order_relaxed); }

    double totalMs() const { return static_cast<double>(totalNanos_.load()) / 1e6; }

private:
    std::string name_;
    std::atomic<int64_t> count_{0};
    std::atomic<int64_t> totalNanos_{0};
};

/**
 * RAII timer recording its lifetime into a Timer
 */
class ScopedTimer {
public:
    explicit ScopedTimer(Timer& timer)
        : timer_(timer)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        timer_.record(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_));
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Timer& timer_;
    std::chrono::steady_clock::time_point start_;
};

/**
 * Process-wide registry; a name always maps to the same metric
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry registry;
        return registry;
    }

    std::shared_ptr<Counter> getCounter(const std::string& name) {
        return getOrCreate(counters_, name);
    }

    std::shared_ptr<Gauge> getGauge(const std::string& name) { return getOrCreate(gauges_, name); }

    std::shared_ptr<Histogram> getHistogram(const std::string& name) {
        return getOrCreate(histograms_, name);
    }

    std::shared_ptr<Timer> getTimer(const std::string& name) { return getOrCreate(timers_, name); }

private:
    MetricsRegistry() = default;

    template<typename M>
    std::shared_ptr<M> getOrCreate(std::map<std::string, std::shared_ptr<M>>& metrics,
                                   const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = metrics[name];
        if (!slot) {
            slot = std::make_shared<M>(name);
        }
        return slot;
    }

    std::map<std::string, std::shared_ptr<Counter>> counters_;
    std::map<std::string, std::shared_ptr<Gauge>> gauges_;
    std::map<std::string, std::shared_ptr<Histogram>> histograms_;
    std::map<std::string, std::shared_ptr<Timer>> timers_;
    std::mutex mutex_;
};

}  // namespace observability
}  // namespace rankflow
