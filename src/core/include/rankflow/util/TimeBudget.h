// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace rankflow::util {

/**
 * @brief Cooperative deadline plus cancellation flag for one search.
 *
 * The flag is shared: copies of a TimeBudget observe the same cancel().
 * A default-constructed budget never expires.
 */
class TimeBudget {
public:
    using Clock = std::chrono::steady_clock;

    TimeBudget()
        : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Budget expiring after the given duration from now.
     */
    template<typename Duration>
    static TimeBudget after(Duration budget) {
        TimeBudget result;
        result.deadline_ = Clock::now() + std::chrono::duration_cast<Clock::duration>(budget);
        return result;
    }

    static TimeBudget unlimited() { return TimeBudget(); }

    /**
     * @brief Requests cancellation; observed at the next exceeded() check.
     */
    void cancel() const noexcept { cancelled_->store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_->load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool exceeded() const noexcept {
        if (cancelled()) {
            return true;
        }
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    [[nodiscard]] bool isUnlimited() const noexcept { return !deadline_.has_value(); }

private:
    std::optional<Clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace rankflow::util
