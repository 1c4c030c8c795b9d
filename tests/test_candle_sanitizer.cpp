#include "candle_sanitizer.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <limits>

using data::RawCandle;
using data::RawValue;

namespace {
    RawCandle raw(RawValue time, RawValue close, RawValue volume = std::monostate{}) {
        RawCandle bar;
        bar.time = std::move(time);
        bar.open = close;
        bar.high = close;
        bar.low = close;
        bar.close = std::move(close);
        bar.volume = std::move(volume);
        return bar;
    }
}

TEST(CandleSanitizerTest, DropsUnparseableAndNonPositiveBars) {
    std::vector<RawCandle> input = {
        raw(1000.0, 1.1),
        raw(std::string("not a date"), 1.2),
        raw(2000.0, std::string("abc")),
        raw(3000.0, 0.0),
        raw(4000.0, -1.0),
        raw(5000.0, 1.3),
    };
    auto candles = data::sanitizeCandles(input);
    ASSERT_EQ(candles.size(), 2u);
    EXPECT_EQ(candles[0].time, 1000);
    EXPECT_EQ(candles[1].time, 5000);
}

TEST(CandleSanitizerTest, DropsTimesOutsideTimestampRange) {
    std::vector<RawCandle> input = {
        raw(1e30, 1.1),
        raw(-1e30, 1.1),
        raw(9.3e18, 1.1),
        raw(std::numeric_limits<double>::infinity(), 1.1),
        raw(std::numeric_limits<double>::quiet_NaN(), 1.1),
        raw(1700000000.75, 1.2),
    };
    auto candles = data::sanitizeCandles(input);
    ASSERT_EQ(candles.size(), 1u);
    EXPECT_EQ(candles[0].time, 1700000000);
}

TEST(CandleSanitizerTest, SortsAndKeepsFirstDuplicate) {
    std::vector<RawCandle> input = {
        raw(3000.0, 1.3),
        raw(1000.0, 1.1),
        raw(3000.0, 9.9),
        raw(2000.0, 1.2),
    };
    auto candles = data::sanitizeCandles(input);
    ASSERT_EQ(candles.size(), 3u);
    EXPECT_EQ(candles[0].time, 1000);
    EXPECT_EQ(candles[1].time, 2000);
    EXPECT_EQ(candles[2].time, 3000);
    EXPECT_DOUBLE_EQ(candles[2].close, 1.3);
}

TEST(CandleSanitizerTest, ParsesNumericTextAndIsoTimes) {
    std::vector<RawCandle> input = {
        raw(std::string("2024-01-02T00:00:00Z"), std::string("1.2345abc"), std::string("12")),
    };
    auto candles = data::sanitizeCandles(input);
    ASSERT_EQ(candles.size(), 1u);
    EXPECT_EQ(candles[0].time, core::utils::stringToTimestamp("2024-01-02"));
    EXPECT_DOUBLE_EQ(candles[0].close, 1.2345);
    EXPECT_DOUBLE_EQ(candles[0].volume, 12.0);
}

TEST(CandleSanitizerTest, MissingOrNegativeVolumeBecomesZero) {
    std::vector<RawCandle> input = {raw(1000.0, 1.1), raw(2000.0, 1.2, -5.0)};
    auto candles = data::sanitizeCandles(input);
    ASSERT_EQ(candles.size(), 2u);
    EXPECT_DOUBLE_EQ(candles[0].volume, 0.0);
    EXPECT_DOUBLE_EQ(candles[1].volume, 0.0);
}

TEST(CandleSanitizerTest, CorrectsMetalScale) {
    auto gold = data::sanitizeCandles({raw(1000.0, 19.5)}, "XAUUSD");
    ASSERT_EQ(gold.size(), 1u);
    EXPECT_DOUBLE_EQ(gold[0].close, 1950.0);
    EXPECT_DOUBLE_EQ(gold[0].high, 1950.0);

    auto silver = data::sanitizeCandles({raw(1000.0, 2.4)}, "XAGUSD");
    ASSERT_EQ(silver.size(), 1u);
    EXPECT_DOUBLE_EQ(silver[0].close, 24.0);

    auto normal_gold = data::sanitizeCandles({raw(1000.0, 1950.0)}, "XAUUSD");
    EXPECT_DOUBLE_EQ(normal_gold[0].close, 1950.0);
}

TEST(CandleSanitizerTest, JsonRowsAndNonArrayPayload) {
    auto rows = nlohmann::json::parse(R"([
        {"time": "2024-01-01T00:00:00Z", "open": 1.1, "high": 1.2, "low": 1.0, "close": 1.15},
        {"time": 1704070800, "open": "1.15", "high": "1.25", "low": "1.1", "close": "1.2", "volume": 7},
        {"time": null, "close": 1.3},
        "garbage"
    ])");
    auto candles = data::sanitizeJsonRows(rows);
    ASSERT_EQ(candles.size(), 2u);
    EXPECT_EQ(candles[0].time, 1704067200);
    EXPECT_EQ(candles[1].time, 1704070800);
    EXPECT_DOUBLE_EQ(candles[1].high, 1.25);
    EXPECT_DOUBLE_EQ(candles[1].volume, 7.0);

    EXPECT_TRUE(data::sanitizeJsonRows(nlohmann::json::object()).empty());
}

TEST(ResampleTest, BucketsByTargetPeriod) {
    // Six M2 bars spanning two M5 buckets: [0,300) and [300,600)
    core::TimeSeries<core::Candle> base;
    const double closes[] = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    for (int i = 0; i < 6; ++i) {
        core::Candle bar;
        bar.time = i * 120;
        bar.open = closes[i] - 0.5;
        bar.high = closes[i] + 1.0;
        bar.low = closes[i] - 1.0;
        bar.close = closes[i];
        bar.volume = 1.0;
        base.push_back(bar);
    }

    auto m5 = data::resampleCandles(base, core::Timeframe::M5);
    ASSERT_EQ(m5.size(), 2u);
    EXPECT_EQ(m5[0].time, 0);
    EXPECT_DOUBLE_EQ(m5[0].open, 0.5);
    EXPECT_DOUBLE_EQ(m5[0].close, 3.0);
    EXPECT_DOUBLE_EQ(m5[0].high, 4.0);
    EXPECT_DOUBLE_EQ(m5[0].low, 0.0);
    EXPECT_DOUBLE_EQ(m5[0].volume, 3.0);
    EXPECT_EQ(m5[1].time, 300);
    EXPECT_DOUBLE_EQ(m5[1].close, 6.0);
}

TEST(ResampleTest, EmptyInputAndAggregate) {
    EXPECT_TRUE(data::resampleCandles({}, core::Timeframe::H1).empty());
    EXPECT_FALSE(data::aggregateCandles({}).has_value());
}

TEST(TimeUtilsTest, ParsesAndAligns) {
    EXPECT_EQ(core::utils::stringToTimestamp("2024-01-01"), 1704067200);
    EXPECT_EQ(core::utils::stringToTimestamp("2024-01-01T01:00:00+01:00"), 1704067200);
    EXPECT_EQ(core::utils::timestampToString(1704067200), "2024-01-01T00:00:00Z");
    EXPECT_FALSE(core::utils::tryParseTimestamp("yesterday").has_value());
    EXPECT_THROW(core::utils::stringToTimestamp("yesterday"), std::runtime_error);

    EXPECT_EQ(core::utils::alignToTimeframe(1704067200 + 3599, core::Timeframe::H1), 1704067200);
    EXPECT_EQ(core::utils::alignToTimeframe(1704067200 + 3600, core::Timeframe::H1), 1704070800);
    EXPECT_EQ(core::utils::timeframeFromString("H4"), core::Timeframe::H4);
    EXPECT_THROW(core::utils::timeframeFromString("W1"), std::invalid_argument);
}
