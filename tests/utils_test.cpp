#include <gtest/gtest.h>
#include "utils.hpp"
#include "datatypes.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <limits>
#include <stdexcept>

using namespace core::utils;

TEST(UtilsTest, TimestampToStringUtc) {
    EXPECT_EQ(timestampToString(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(timestampToString(1704067200000LL), "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(timestampToString(1704067200123LL), "2024-01-01T00:00:00.123Z");
    EXPECT_EQ(timestampToString(-1), "1969-12-31T23:59:59.999Z");
}

TEST(UtilsTest, StringToTimestampHandlesOffsetsAndFractions) {
    EXPECT_EQ(stringToTimestamp("2024-01-01T00:00:00Z"), 1704067200000LL);
    EXPECT_EQ(stringToTimestamp("2024-01-01T00:00:00.5Z"), 1704067200500LL);
    EXPECT_EQ(stringToTimestamp("2024-01-01T00:00:00.123456Z"), 1704067200123LL);
    EXPECT_EQ(stringToTimestamp("2024-01-01T05:30:00+05:30"), 1704067200000LL);
    EXPECT_EQ(stringToTimestamp("2023-12-31T19:00:00-05:00"), 1704067200000LL);
}

TEST(UtilsTest, StringToTimestampRoundTripsFormattedValues) {
    const core::Timestamp ts = 1718900000789LL;
    EXPECT_EQ(stringToTimestamp(timestampToString(ts)), ts);
}

TEST(UtilsTest, StringToTimestampRejectsGarbage) {
    EXPECT_THROW(stringToTimestamp("yesterday"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01T00:00:00"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01T00:00:00X"), std::runtime_error);
}

TEST(UtilsTest, FormatFixed) {
    EXPECT_EQ(formatFixed(1.5, 2), "1.50");
    EXPECT_EQ(formatFixed(10.0, 0), "10");
    EXPECT_EQ(formatFixed(-0.125, 3), "-0.125");
}

TEST(UtilsTest, RequireFinite) {
    EXPECT_NO_THROW(requireFinite(1.0, 0));
    EXPECT_THROW(requireFinite(std::numeric_limits<double>::quiet_NaN(), 7), core::NonFiniteInputException);
    EXPECT_THROW(requireFinite(-std::numeric_limits<double>::infinity(), 7), core::NonFiniteInputException);
}

TEST(UtilsTest, ToObservationsKeepsOrderAndTimestamps) {
    core::TimeSeries<core::Candle> candles{
        {1000, 1.0, 2.0, 0.5, 1.5, 10.0},
        {2000, 1.5, 3.0, 1.0, 2.5, 12.0},
    };
    const auto observations = core::toObservations(candles);
    ASSERT_EQ(observations.size(), 2u);
    EXPECT_EQ(observations[1].timestamp, 2000);
    EXPECT_DOUBLE_EQ(observations[1].close, 2.5);

    const auto sequenced = core::toObservations(std::vector<double>{4.0, 5.0});
    EXPECT_EQ(sequenced[0].timestamp, 0);
    EXPECT_EQ(sequenced[1].timestamp, 1);
}

TEST(UtilsTest, EngineErrorsShareOneBase) {
    EXPECT_THROW(throw core::InvalidPeriodException("x"), core::IndicatorEngineException);
    EXPECT_THROW(throw core::DataLoadException("x"), core::IndicatorEngineException);
    EXPECT_THROW(throw core::OutOfOrderObservationException("x"), std::runtime_error);
}

TEST(LoggingTest, LevelFromString) {
    using core::logging::level_from_string;
    EXPECT_EQ(level_from_string("TRACE"), spdlog::level::trace);
    EXPECT_EQ(level_from_string("warning"), spdlog::level::warn);
    EXPECT_EQ(level_from_string("error"), spdlog::level::err);
    EXPECT_EQ(level_from_string("off"), spdlog::level::off);
    EXPECT_EQ(level_from_string("chatty"), spdlog::level::info);
}

TEST(LoggingTest, LoggerIsAvailableToTests) {
    EXPECT_NE(core::logging::getLogger(), nullptr);
}
