#include <gtest/gtest.h>
#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"
#include <algorithm>

using indicators::RsiIndicator;

namespace {

    std::vector<double> risingCloses(int count) {
        std::vector<double> closes;
        for (int i = 1; i <= count; ++i) {
            closes.push_back(static_cast<double>(i));
        }
        return closes;
    }

} // namespace

TEST(RsiIndicatorTest, StrictlyRisingSeriesReads100) {
    const auto series = indicators::computeRsi(risingCloses(21), 14);
    ASSERT_EQ(series.size(), 21u);
    for (std::size_t i = 0; i < 14; ++i) {
        EXPECT_FALSE(series[i].has_value()) << "index " << i;
    }
    for (std::size_t i = 14; i < 21; ++i) {
        ASSERT_TRUE(series[i].has_value());
        EXPECT_DOUBLE_EQ(*series[i], 100.0);
    }
}

TEST(RsiIndicatorTest, StrictlyFallingSeriesReads0) {
    auto closes = risingCloses(20);
    std::reverse(closes.begin(), closes.end());
    const auto series = indicators::computeRsi(closes, 5);
    for (std::size_t i = 5; i < series.size(); ++i) {
        EXPECT_DOUBLE_EQ(*series[i], 0.0);
    }
}

TEST(RsiIndicatorTest, FlatSeriesReads50) {
    const auto series = indicators::computeRsi(test_helpers::constant(30, 42.0), 14);
    EXPECT_FALSE(series[13].has_value());
    for (std::size_t i = 14; i < series.size(); ++i) {
        ASSERT_TRUE(series[i].has_value());
        EXPECT_DOUBLE_EQ(*series[i], 50.0);
    }
}

TEST(RsiIndicatorTest, EqualGainsAndLossesRead50) {
    const auto series = indicators::computeRsi(std::vector<double>{10.0, 11.0, 10.0}, 2);
    EXPECT_DOUBLE_EQ(*series[2], 50.0);
}

TEST(RsiIndicatorTest, SeedAndFirstWilderStep) {
    // Changes +2, -1, +2: avg gain 4/3, avg loss 1/3, RS 4, RSI 80
    RsiIndicator rsi(3);
    rsi.update({1, 10.0});
    rsi.update({2, 12.0});
    rsi.update({3, 11.0});
    EXPECT_NEAR(*rsi.update({4, 13.0}), 80.0, 1e-10);
    EXPECT_NEAR(*rsi.averageGain(), 4.0 / 3.0, 1e-12);
    EXPECT_NEAR(*rsi.averageLoss(), 1.0 / 3.0, 1e-12);

    // +1: avg gain (4/3*2 + 1)/3 = 11/9, avg loss (1/3*2)/3 = 2/9
    EXPECT_NEAR(*rsi.update({5, 14.0}), 100.0 - 100.0 / (1.0 + 11.0 / 2.0), 1e-10);
}

TEST(RsiIndicatorTest, ValuesStayWithinBounds) {
    const auto series = indicators::computeRsi(test_helpers::randomWalk(1000, 77), 14);
    for (const auto& value : series) {
        if (!value) continue;
        EXPECT_GE(*value, 0.0);
        EXPECT_LE(*value, 100.0);
    }
}

TEST(RsiIndicatorTest, ShortInputIsAllUndefined) {
    // period closes give only period-1 changes
    const auto series = indicators::computeRsi(risingCloses(14), 14);
    EXPECT_EQ(test_helpers::countDefined(series), 0u);
}

TEST(RsiIndicatorTest, NameAndLookback) {
    RsiIndicator rsi(14);
    EXPECT_EQ(rsi.getName(), "RSI(14)");
    EXPECT_EQ(rsi.getLookback(), 14);
    EXPECT_FALSE(rsi.averageGain().has_value());
}

TEST(RsiIndicatorTest, RsiFromAverages) {
    EXPECT_DOUBLE_EQ(RsiIndicator::rsiFromAverages(0.0, 0.0), 50.0);
    EXPECT_DOUBLE_EQ(RsiIndicator::rsiFromAverages(1.5, 0.0), 100.0);
    EXPECT_DOUBLE_EQ(RsiIndicator::rsiFromAverages(0.0, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(RsiIndicator::rsiFromAverages(1.0, 1.0), 50.0);
    EXPECT_DOUBLE_EQ(RsiIndicator::rsiFromAverages(3.0, 1.0), 75.0);
}

TEST(RsiIndicatorTest, InvalidPeriodThrows) {
    EXPECT_THROW(RsiIndicator(0), core::InvalidPeriodException);
}

TEST(RsiIndicatorTest, StreamingEqualsBatch) {
    const auto closes = test_helpers::randomWalk(200, 19);
    const auto batch = indicators::computeRsi(closes, 14);
    RsiIndicator rsi(14);
    const auto observations = core::toObservations(closes);
    for (std::size_t i = 0; i < observations.size(); ++i) {
        EXPECT_EQ(rsi.update(observations[i]), batch[i]) << "index " << i;
    }
}

TEST(RsiIndicatorTest, SameTimestampRecomputesFromPreviousBar) {
    const std::vector<double> closes{10.0, 12.0, 11.0, 13.0, 12.5, 15.0};

    RsiIndicator repainted(3);
    RsiIndicator clean(3);
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const auto ts = static_cast<core::Timestamp>(1000 + i);
        repainted.update({ts, closes[i] + 5.0});
        repainted.update({ts, closes[i] - 5.0});
        const auto revised = repainted.update({ts, closes[i]});
        const auto reference = clean.update({ts, closes[i]});
        ASSERT_EQ(revised.has_value(), reference.has_value()) << "index " << i;
        if (revised) {
            EXPECT_NEAR(*revised, *reference, 1e-12) << "index " << i;
        }
    }
}

TEST(RsiIndicatorTest, SameTimestampOnFirstBarOnlyMovesThePreviousClose) {
    RsiIndicator rsi(2);
    rsi.update({1, 50.0});
    rsi.update({1, 10.0});
    rsi.update({2, 11.0});
    EXPECT_DOUBLE_EQ(*rsi.update({3, 12.0}), 100.0);
}

TEST(RsiIndicatorTest, OutOfOrderObservationLeavesStateUntouched) {
    RsiIndicator rsi(2);
    rsi.update({10, 1.0});
    rsi.update({20, 2.0});
    rsi.update({30, 1.0});
    const auto before = rsi.value();
    EXPECT_THROW(rsi.update({25, 3.0}), core::OutOfOrderObservationException);
    EXPECT_EQ(rsi.value(), before);
    EXPECT_DOUBLE_EQ(*before, 50.0);
}

TEST(RsiIndicatorTest, Deterministic) {
    const auto closes = test_helpers::randomWalk(200, 99);
    EXPECT_EQ(indicators::computeRsi(closes, 14), indicators::computeRsi(closes, 14));

    RsiIndicator rsi(14);
    rsi.calculate(core::toObservations(closes));
    const auto first = rsi.getResult();
    rsi.calculate(core::toObservations(closes));
    EXPECT_EQ(rsi.getResult(), first);
}
