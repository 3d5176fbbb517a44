#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "trader/coordinators/trading_coordinator.hpp"

using namespace BybitTrader;
using namespace BybitTrader::Core;
using BybitTrader::Testing::make_bar;

namespace {

class TradingCoordinatorTest : public ::testing::Test {
protected:
    Config::SystemConfig config;
    Testing::FakeExecutionGateway gateway;
    Testing::RecordingEventSink sink;
    RiskSizer risk_sizer;
    IndicatorEngine indicator_engine;
    SignalGenerator signal_generator;
    PositionStateMachine state_machine;
    TradingCoordinator coordinator;

    static Config::SystemConfig make_config() {
        Config::SystemConfig test_config = Testing::make_test_config();
        test_config.strategy.fast_ema = 2;
        test_config.strategy.slow_ema = 3;
        test_config.strategy.stoch_period = 3;
        test_config.strategy.stoch_k_period = 2;
        test_config.strategy.atr_period = 2;
        test_config.strategy.volume_ma_period = 3;
        return test_config;
    }

    TradingCoordinatorTest()
        : config(make_config()),
          risk_sizer(config.risk),
          indicator_engine(config.strategy),
          signal_generator(config.strategy),
          state_machine(PositionStateMachineConstructionParams(config, gateway, risk_sizer, sink)),
          coordinator(TradingCoordinatorConstructionParams(config, indicator_engine, signal_generator, state_machine, sink)) {}

    // Constant close 100 with a 2-point range: ATR settles at 2.
    std::vector<Bar> flat_history(int bar_count) const {
        std::vector<Bar> history;
        for (int bar_index = 1; bar_index <= bar_count; ++bar_index) {
            history.push_back(make_bar(bar_index * 60000LL, 100.0, 101.0, 99.0, 100.0, 10.0));
        }
        return history;
    }
};

} // namespace

TEST_F(TradingCoordinatorTest, WarmUpFeedsIndicatorsOnly) {
    std::vector<Bar> history = flat_history(5);
    history.insert(history.begin() + 3, make_bar(60000LL, 100.0, 101.0, 99.0, 100.0));

    int accepted_count = coordinator.warm_up(history);

    EXPECT_EQ(accepted_count, 5);
    EXPECT_EQ(sink.rejected_bars.size(), 1u);
    EXPECT_TRUE(sink.signals.empty());
    EXPECT_TRUE(gateway.submitted_orders.empty());
    EXPECT_EQ(indicator_engine.processed_bar_count(), 5);
}

TEST_F(TradingCoordinatorTest, LatestValidAtrAppearsAfterWarmUp) {
    EXPECT_FALSE(coordinator.latest_valid_atr().has_value());
    coordinator.warm_up(flat_history(4));
    ASSERT_TRUE(coordinator.latest_valid_atr().has_value());
    EXPECT_DOUBLE_EQ(*coordinator.latest_valid_atr(), 2.0);
}

TEST_F(TradingCoordinatorTest, OutOfOrderLiveBarIsRejected) {
    coordinator.warm_up(flat_history(4));

    BarProcessingResult result = coordinator.process_bar(make_bar(4 * 60000LL, 100.0, 101.0, 99.0, 100.0));

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.signal, Signal::None);
    ASSERT_EQ(sink.rejected_bars.size(), 1u);
    EXPECT_EQ(sink.rejected_bars[0].last_timestamp_ms, 4 * 60000LL);
}

TEST_F(TradingCoordinatorTest, FirstBarNeverSignals) {
    BarProcessingResult result = coordinator.process_bar(make_bar(60000LL, 100.0, 101.0, 99.0, 100.0));

    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.signal, Signal::None);
    EXPECT_EQ(result.state_after, PositionState::Flat);
}

TEST_F(TradingCoordinatorTest, RecoveredPositionExitsOnStopThroughPipeline) {
    coordinator.warm_up(flat_history(4));
    gateway.position = ExchangePosition(PositionSide::Long, 1.0, 100.0);
    state_machine.recover_from_exchange(coordinator.latest_valid_atr());
    ASSERT_DOUBLE_EQ(state_machine.status().intent.stop_loss, 96.5);

    BarProcessingResult result = coordinator.process_bar(make_bar(5 * 60000LL, 100.0, 100.0, 95.0, 96.0));

    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.state_after, PositionState::Flat);
    ASSERT_EQ(gateway.submitted_orders.size(), 1u);
    EXPECT_EQ(gateway.submitted_orders[0].side, OrderSide::Sell);
    EXPECT_TRUE(gateway.submitted_orders[0].reduce_only);
}

TEST_F(TradingCoordinatorTest, StuckPositionPropagatesToCaller) {
    coordinator.warm_up(flat_history(4));
    gateway.position = ExchangePosition(PositionSide::Long, 1.0, 100.0);
    state_machine.recover_from_exchange(coordinator.latest_valid_atr());
    gateway.default_state = OrderState::Rejected;

    EXPECT_THROW(coordinator.process_bar(make_bar(5 * 60000LL, 100.0, 100.0, 95.0, 96.0)), StuckPosition);
    EXPECT_TRUE(state_machine.entries_halted());
    EXPECT_EQ(indicator_engine.processed_bar_count(), 5);
}
