// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

// Enable search profiling by defining RANKFLOW_PROFILE_SEARCH
// #define RANKFLOW_PROFILE_SEARCH

namespace rankflow::util {

#ifdef RANKFLOW_PROFILE_SEARCH

/**
 * Per-thread profiler collecting named phase durations of the ranking
 * pipeline. One instance per thread.
 */
class SearchProfiler {
public:
    SearchProfiler() = default;

    // Declared in SearchProfiler.cpp (not inline to ensure single definition)
    static SearchProfiler& instance();

    void record(const std::string& name, int64_t nanoseconds) {
        samples_[name].push_back(nanoseconds);
    }

    const std::map<std::string, std::vector<int64_t>>& samples() const { return samples_; }

    void reset() { samples_.clear(); }

    /**
     * Prints count, total and mean per phase.
     */
    void printReport(std::ostream& out) const;

private:
    std::map<std::string, std::vector<int64_t>> samples_;
};

/**
 * Scoped timer for automatic timing
 */
class ProfileScope {
public:
    explicit ProfileScope(const char* name)
        : name_(name)
        , start_(std::chrono::steady_clock::now()) {}

    ~ProfileScope() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
        SearchProfiler::instance().record(name_, duration);
    }

    ProfileScope(const ProfileScope&) = delete;
    ProfileScope& operator=(const ProfileScope&) = delete;

private:
    const char* name_;
    std::chrono::steady_clock::time_point start_;
};

// Helper macros to properly expand __LINE__
#    define RANKFLOW_PROFILE_CONCAT_IMPL(x, y) x##y
#    define RANKFLOW_PROFILE_CONCAT(x, y) RANKFLOW_PROFILE_CONCAT_IMPL(x, y)
#    define PROFILE_SCOPE(name)                                                                    \
        ::rankflow::util::ProfileScope RANKFLOW_PROFILE_CONCAT(__profile_scope_, __LINE__)(name)

#else

// No-op when profiling is disabled
#    define PROFILE_SCOPE(name)                                                                    \
        do {                                                                                       \
        } while (0)

class SearchProfiler {
public:
    static SearchProfiler& instance() {
        static SearchProfiler profiler;
        return profiler;
    }

    void reset() {}

    void printReport(std::ostream&) const {}

    const std::map<std::string, std::vector<int64_t>>& samples() const {
        static std::map<std::string, std::vector<int64_t>> empty;
        return empty;
    }
};

#endif

}  // namespace rankflow::util
