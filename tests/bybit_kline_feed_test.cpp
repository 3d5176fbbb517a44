#include <gtest/gtest.h>
#include "api/bybit/bybit_kline_feed.hpp"

using namespace BybitTrader;

TEST(BybitKlineFeedTest, IntervalConversion) {
    EXPECT_EQ(API::kline_interval_to_milliseconds("1"), 60000);
    EXPECT_EQ(API::kline_interval_to_milliseconds("15"), 15 * 60000);
    EXPECT_EQ(API::kline_interval_to_milliseconds("240"), 240LL * 60000LL);
    EXPECT_EQ(API::kline_interval_to_milliseconds("D"), 86400000LL);
    EXPECT_EQ(API::kline_interval_to_milliseconds("W"), 7LL * 86400000LL);
}

TEST(BybitKlineFeedTest, UnknownIntervalThrows) {
    EXPECT_THROW(API::kline_interval_to_milliseconds(""), std::runtime_error);
    EXPECT_THROW(API::kline_interval_to_milliseconds("15m"), std::runtime_error);
    EXPECT_THROW(API::kline_interval_to_milliseconds("0"), std::runtime_error);
}

TEST(BybitKlineFeedTest, FormingBarIsDropped) {
    const std::int64_t interval_ms = 60000;
    std::vector<Core::Bar> bars;
    bars.emplace_back(0, 100.0, 101.0, 99.0, 100.5, 10.0);
    bars.emplace_back(60000, 100.5, 102.0, 100.0, 101.5, 12.0);
    bars.emplace_back(120000, 101.5, 101.8, 101.0, 101.2, 3.0);

    std::vector<Core::Bar> closed_bars = API::drop_forming_bars(bars, 150000, interval_ms);
    ASSERT_EQ(closed_bars.size(), 2u);
    EXPECT_EQ(closed_bars.back().timestamp_ms, 60000);

    // A bar is closed once its interval has fully elapsed.
    EXPECT_EQ(API::drop_forming_bars(bars, 180000, interval_ms).size(), 3u);
    EXPECT_TRUE(API::drop_forming_bars(bars, 59999, interval_ms).empty());
}
