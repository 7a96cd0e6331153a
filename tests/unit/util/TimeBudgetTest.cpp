// Copyright 2024 Rankflow Project
// Licensed under the Apache License, Version 2.0

#include "rankflow/util/TimeBudget.h"

#include <gtest/gtest.h>

#include <chrono>

using namespace rankflow::util;

class TimeBudgetTest : public ::testing::Test {};

TEST_F(TimeBudgetTest, UnlimitedNeverExpires) {
    TimeBudget budget = TimeBudget::unlimited();
    EXPECT_TRUE(budget.isUnlimited());
    EXPECT_FALSE(budget.exceeded());
}

TEST_F(TimeBudgetTest, ZeroBudgetIsExceeded) {
    TimeBudget budget = TimeBudget::after(std::chrono::milliseconds(0));
    EXPECT_FALSE(budget.isUnlimited());
    EXPECT_TRUE(budget.exceeded());
    EXPECT_FALSE(budget.cancelled());
}

TEST_F(TimeBudgetTest, GenerousBudgetNotExceeded) {
    TimeBudget budget = TimeBudget::after(std::chrono::hours(1));
    EXPECT_FALSE(budget.exceeded());
}

TEST_F(TimeBudgetTest, CancelIsSharedBetweenCopies) {
    TimeBudget budget;
    TimeBudget copy = budget;
    copy.cancel();
    EXPECT_TRUE(budget.cancelled());
    EXPECT_TRUE(budget.exceeded());
}
