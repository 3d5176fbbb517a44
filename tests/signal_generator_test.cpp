#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "trader/strategy_analysis/signal_generator.hpp"

using namespace BybitTrader;
using namespace BybitTrader::Core;

namespace {

IndicatorSnapshot snapshot_of(double ema_fast, double ema_slow, double stoch_k, double stoch_d, double volume) {
    IndicatorSnapshot snapshot = Testing::make_snapshot(150.0);
    snapshot.ema_fast = ema_fast;
    snapshot.ema_slow = ema_slow;
    snapshot.stoch_k = stoch_k;
    snapshot.stoch_d = stoch_d;
    snapshot.volume = volume;
    snapshot.vol_avg = 1000.0;
    snapshot.vol_std = 200.0;
    return snapshot;
}

class SignalGeneratorTest : public ::testing::Test {
protected:
    Config::StrategyConfig strategy;

    // Fast EMA crosses above slow, %K turns up out of oversold, volume 1.2x average.
    IndicatorSnapshot bullish_previous = snapshot_of(100.0, 101.0, 15.0, 16.0, 900.0);
    IndicatorSnapshot bullish_current = snapshot_of(102.0, 101.0, 22.0, 18.0, 1200.0);

    IndicatorSnapshot bearish_previous = snapshot_of(102.0, 101.0, 85.0, 84.0, 900.0);
    IndicatorSnapshot bearish_current = snapshot_of(100.0, 101.0, 78.0, 82.0, 1200.0);
};

} // namespace

TEST_F(SignalGeneratorTest, BullishCrossWithConfirmationEntersLong) {
    SignalGenerator generator(strategy);
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::EnterLong);
}

TEST_F(SignalGeneratorTest, BearishCrossWithConfirmationEntersShort) {
    SignalGenerator generator(strategy);
    EXPECT_EQ(generator.evaluate(bearish_previous, bearish_current, PositionSide::Flat), Signal::EnterShort);
}

TEST_F(SignalGeneratorTest, CrossWithoutStochasticConfirmationHolds) {
    SignalGenerator generator(strategy);
    bullish_previous.stoch_k = 35.0;
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::None);

    bullish_previous.stoch_k = 15.0;
    bullish_current.stoch_d = 25.0;
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::None);
}

TEST_F(SignalGeneratorTest, StochasticMustCrossNotJustSitAboveSignalLine) {
    SignalGenerator generator(strategy);
    // %K already above %D on the previous bar: no crossover.
    bullish_previous.stoch_d = 12.0;
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::None);

    bearish_previous.stoch_d = 88.0;
    EXPECT_EQ(generator.evaluate(bearish_previous, bearish_current, PositionSide::Flat), Signal::None);
}

TEST_F(SignalGeneratorTest, VolumeFilterUsesStandardDeviationMultiplier) {
    strategy.volume_std_multiplier = 1.5;
    SignalGenerator strict_generator(strategy);
    // Needs 1000 + 1.5 * 200 = 1300
    EXPECT_EQ(strict_generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::None);

    bullish_current.volume = 1300.0;
    EXPECT_EQ(strict_generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::EnterLong);
}

TEST_F(SignalGeneratorTest, VolumeBelowAverageBlocksEntry) {
    SignalGenerator generator(strategy);
    bullish_current.volume = 999.0;
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::None);
}

TEST_F(SignalGeneratorTest, InvalidIndicatorsNeverSignal) {
    SignalGenerator generator(strategy);
    bullish_current.stoch_d_valid = false;
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Flat), Signal::None);

    bearish_previous.vol_avg_valid = false;
    EXPECT_EQ(generator.evaluate(bearish_previous, bearish_current, PositionSide::Long), Signal::None);
}

TEST_F(SignalGeneratorTest, OpenPositionOnlyProducesMatchingExit) {
    SignalGenerator generator(strategy);

    // Bullish cross while already long: no entry, no exit.
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Long), Signal::None);
    EXPECT_EQ(generator.evaluate(bullish_previous, bullish_current, PositionSide::Short), Signal::ExitShort);

    EXPECT_EQ(generator.evaluate(bearish_previous, bearish_current, PositionSide::Long), Signal::ExitLong);
    EXPECT_EQ(generator.evaluate(bearish_previous, bearish_current, PositionSide::Short), Signal::None);
}

TEST_F(SignalGeneratorTest, ExitNeedsOnlyTheTrendFlip) {
    SignalGenerator generator(strategy);
    IndicatorSnapshot previous = snapshot_of(100.0, 99.0, 50.0, 50.0, 10.0);
    IndicatorSnapshot current = snapshot_of(98.0, 99.0, 50.0, 50.0, 10.0);
    EXPECT_EQ(generator.evaluate(previous, current, PositionSide::Long), Signal::ExitLong);
}
