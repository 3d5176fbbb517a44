#include <gtest/gtest.h>
#include <cmath>
#include "test_helpers.hpp"
#include "trader/strategy_analysis/indicators.hpp"

using namespace BybitTrader;
using namespace BybitTrader::Core;
using BybitTrader::Testing::make_bar;

namespace {

Config::StrategyConfig small_strategy_config() {
    Config::StrategyConfig strategy;
    strategy.fast_ema = 2;
    strategy.slow_ema = 3;
    strategy.stoch_period = 3;
    strategy.stoch_k_period = 2;
    strategy.atr_period = 2;
    strategy.volume_ma_period = 3;
    return strategy;
}

} // namespace

TEST(ExponentialMovingAverageTest, SeedsWithSimpleAverageThenSmooths) {
    ExponentialMovingAverage ema(3);
    ema.update(1.0);
    ema.update(2.0);
    EXPECT_FALSE(ema.is_valid());
    ema.update(3.0);
    ASSERT_TRUE(ema.is_valid());
    EXPECT_DOUBLE_EQ(ema.value(), 2.0);

    // k = 2 / (3 + 1) = 0.5
    ema.update(4.0);
    EXPECT_DOUBLE_EQ(ema.value(), 3.0);
}

TEST(ExponentialMovingAverageTest, ConvergesToConstantInput) {
    ExponentialMovingAverage ema(5);
    for (int bar_index = 0; bar_index < 200; ++bar_index) {
        ema.update(42.0);
    }
    EXPECT_NEAR(ema.value(), 42.0, 1e-9);
}

TEST(StochasticOscillatorTest, FlatRangeReportsFifty) {
    StochasticOscillator stochastic(3, 2);
    for (int bar_index = 0; bar_index < 4; ++bar_index) {
        stochastic.update(make_bar(bar_index + 1, 10.0, 10.0, 10.0, 10.0));
    }
    ASSERT_TRUE(stochastic.k_valid());
    ASSERT_TRUE(stochastic.d_valid());
    EXPECT_DOUBLE_EQ(stochastic.k_value(), 50.0);
    EXPECT_DOUBLE_EQ(stochastic.d_value(), 50.0);
}

TEST(StochasticOscillatorTest, KTracksCloseWithinRange) {
    StochasticOscillator stochastic(3, 2);
    stochastic.update(make_bar(1, 10.0, 12.0, 8.0, 10.0));
    stochastic.update(make_bar(2, 10.0, 14.0, 9.0, 13.0));
    EXPECT_FALSE(stochastic.k_valid());
    stochastic.update(make_bar(3, 13.0, 16.0, 12.0, 16.0));
    ASSERT_TRUE(stochastic.k_valid());
    // HH 16, LL 8, close at the top
    EXPECT_DOUBLE_EQ(stochastic.k_value(), 100.0);
    EXPECT_FALSE(stochastic.d_valid());

    stochastic.update(make_bar(4, 16.0, 16.0, 10.0, 12.0));
    // HH 16, LL 9: 100 * (12 - 9) / 7
    EXPECT_NEAR(stochastic.k_value(), 300.0 / 7.0, 1e-9);
    ASSERT_TRUE(stochastic.d_valid());
    EXPECT_NEAR(stochastic.d_value(), (100.0 + 300.0 / 7.0) / 2.0, 1e-9);
}

TEST(AverageTrueRangeTest, SeedsThenAppliesWilderSmoothing) {
    AverageTrueRange atr(2);
    atr.update(make_bar(1, 9.0, 10.0, 8.0, 9.0));
    EXPECT_FALSE(atr.is_valid());
    atr.update(make_bar(2, 9.0, 11.0, 9.0, 10.0));
    ASSERT_TRUE(atr.is_valid());
    EXPECT_DOUBLE_EQ(atr.value(), 2.0);

    // TR = max(4, |14 - 10|, |10 - 10|) = 4
    atr.update(make_bar(3, 10.0, 14.0, 10.0, 13.0));
    EXPECT_DOUBLE_EQ(atr.value(), 3.0);
}

TEST(AverageTrueRangeTest, GapUsesPreviousClose) {
    AverageTrueRange atr(1);
    atr.update(make_bar(1, 10.0, 10.0, 10.0, 10.0));
    atr.update(make_bar(2, 15.0, 16.0, 15.0, 15.5));
    EXPECT_DOUBLE_EQ(atr.value(), 6.0);
}

TEST(VolumeAverageTest, ReportsMeanAndSampleStandardDeviation) {
    VolumeAverage volume_average(3);
    volume_average.update(1.0);
    volume_average.update(2.0);
    EXPECT_FALSE(volume_average.is_valid());
    volume_average.update(3.0);
    ASSERT_TRUE(volume_average.is_valid());
    EXPECT_DOUBLE_EQ(volume_average.average(), 2.0);
    EXPECT_DOUBLE_EQ(volume_average.standard_deviation(), 1.0);
}

TEST(IndicatorEngineTest, InvalidPeriodsAreRejected) {
    Config::StrategyConfig strategy = small_strategy_config();
    strategy.atr_period = 0;
    EXPECT_THROW(IndicatorEngine engine(strategy), std::invalid_argument);
}

TEST(IndicatorEngineTest, SnapshotBecomesValidAfterLongestWindow) {
    IndicatorEngine engine(small_strategy_config());
    IndicatorSnapshot snapshot;
    for (int bar_index = 0; bar_index < 3; ++bar_index) {
        double close = 100.0 + bar_index;
        snapshot = engine.update(make_bar(1000 * (bar_index + 1), close, close + 1.0, close - 1.0, close, 10.0));
    }
    EXPECT_TRUE(snapshot.ema_fast_valid);
    EXPECT_TRUE(snapshot.ema_slow_valid);
    EXPECT_TRUE(snapshot.stoch_k_valid);
    EXPECT_FALSE(snapshot.stoch_d_valid);
    EXPECT_FALSE(snapshot.signal_inputs_valid());

    snapshot = engine.update(make_bar(4000, 103.0, 104.0, 102.0, 103.0, 10.0));
    EXPECT_TRUE(snapshot.signal_inputs_valid());
    EXPECT_TRUE(snapshot.atr_valid);
    EXPECT_TRUE(engine.has_previous_snapshot());
    EXPECT_EQ(engine.previous_snapshot().timestamp_ms, 3000);
    EXPECT_EQ(engine.current_snapshot().timestamp_ms, 4000);
}

TEST(IndicatorEngineTest, OutOfOrderBarLeavesStateUntouched) {
    IndicatorEngine engine(small_strategy_config());
    engine.update(make_bar(2000, 100.0, 101.0, 99.0, 100.0));
    engine.update(make_bar(3000, 100.0, 101.0, 99.0, 100.5));

    try {
        engine.update(make_bar(3000, 100.0, 101.0, 99.0, 250.0));
        FAIL() << "duplicate timestamp accepted";
    } catch (const OutOfOrderBar& out_of_order_error) {
        EXPECT_EQ(out_of_order_error.bar_timestamp, 3000);
        EXPECT_EQ(out_of_order_error.last_timestamp, 3000);
    }
    EXPECT_THROW(engine.update(make_bar(1000, 100.0, 101.0, 99.0, 100.0)), OutOfOrderBar);

    EXPECT_EQ(engine.processed_bar_count(), 2);
    EXPECT_EQ(engine.last_timestamp_ms(), 3000);
    EXPECT_DOUBLE_EQ(engine.current_snapshot().close_price, 100.5);
}
