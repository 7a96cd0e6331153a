// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/util/SearchProfiler.h"

#include <iomanip>
#include <numeric>

namespace rankflow::util {

#ifdef RANKFLOW_PROFILE_SEARCH

SearchProfiler& SearchProfiler::instance() {
    thread_local SearchProfiler profiler;
    return profiler;
}

void SearchProfiler::printReport(std::ostream& out) const {
    out << "=== Search Profile ===\n";
    for (const auto& [name, durations] : samples_) {
        const int64_t total = std::accumulate(durations.begin(), durations.end(), int64_t{0});
        const double totalMs = total / 1000000.0;
        const double meanUs = durations.empty() ? 0.0 : (total / 1000.0) / durations.size();
        out << std::left << std::setw(32) << name << " count=" << durations.size()
            << " total=" << std::fixed << std::setprecision(3) << totalMs << "ms"
            << " mean=" << meanUs << "us\n";
    }
}

#endif

}  // namespace rankflow::util
