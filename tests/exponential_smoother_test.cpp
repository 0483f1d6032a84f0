#include <gtest/gtest.h>
#include "exponential_smoother.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using indicators::ExponentialSmoother;
using indicators::SmoothingKind;
using indicators::SmootherState;

TEST(ExponentialSmootherTest, AlphaPerKind) {
    EXPECT_DOUBLE_EQ(ExponentialSmoother(9, SmoothingKind::Ema).getAlpha(), 0.2);
    EXPECT_DOUBLE_EQ(ExponentialSmoother(4, SmoothingKind::Wilder).getAlpha(), 0.25);
}

TEST(ExponentialSmootherTest, SeedIsPlainMean) {
    ExponentialSmoother smoother(4, SmoothingKind::Ema);
    SmootherState state;
    for (double v : {2.0, 4.0, 6.0}) {
        state = smoother.step(state, v);
        EXPECT_FALSE(smoother.output(state).has_value());
    }
    state = smoother.step(state, 8.0);
    ASSERT_TRUE(smoother.output(state).has_value());
    EXPECT_DOUBLE_EQ(*smoother.output(state), 5.0);
}

TEST(ExponentialSmootherTest, EmaRecursion) {
    ExponentialSmoother smoother(3, SmoothingKind::Ema); // alpha = 0.5
    const auto series = smoother.smooth({1.0, 2.0, 3.0, 5.0, 1.0});
    ASSERT_EQ(series.size(), 5u);
    EXPECT_FALSE(series[1].has_value());
    EXPECT_DOUBLE_EQ(*series[2], 2.0);
    EXPECT_DOUBLE_EQ(*series[3], 3.5);
    EXPECT_DOUBLE_EQ(*series[4], 2.25);
}

TEST(ExponentialSmootherTest, WilderRecursion) {
    ExponentialSmoother smoother(2, SmoothingKind::Wilder);
    const auto series = smoother.smooth({4.0, 2.0, 6.0, 0.0});
    EXPECT_DOUBLE_EQ(*series[1], 3.0);
    EXPECT_DOUBLE_EQ(*series[2], 4.5);  // (3*1 + 6)/2
    EXPECT_DOUBLE_EQ(*series[3], 2.25); // (4.5*1 + 0)/2
}

TEST(ExponentialSmootherTest, StepDoesNotMutateItsInput) {
    ExponentialSmoother smoother(2, SmoothingKind::Ema);
    SmootherState state;
    state = smoother.step(state, 1.0);
    state = smoother.step(state, 3.0);
    const SmootherState before = state;

    const auto a = smoother.step(state, 10.0);
    const auto b = smoother.step(state, 10.0);
    EXPECT_DOUBLE_EQ(a.value, b.value);
    EXPECT_EQ(state.seen, before.seen);
    EXPECT_DOUBLE_EQ(state.value, before.value);
}

TEST(ExponentialSmootherTest, PeriodOneTracksInput) {
    ExponentialSmoother smoother(1, SmoothingKind::Ema);
    const auto series = smoother.smooth({3.0, 7.0, -2.0});
    EXPECT_DOUBLE_EQ(*series[0], 3.0);
    EXPECT_DOUBLE_EQ(*series[1], 7.0);
    EXPECT_DOUBLE_EQ(*series[2], -2.0);
}

TEST(ExponentialSmootherTest, InvalidPeriodThrows) {
    EXPECT_THROW(ExponentialSmoother(0, SmoothingKind::Wilder), core::InvalidPeriodException);
}
