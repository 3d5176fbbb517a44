#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "test_helpers.hpp"
#include "trader/trading_logic/position_state_machine.hpp"

using namespace BybitTrader;
using namespace BybitTrader::Core;
using BybitTrader::Testing::FakeExecutionGateway;
using BybitTrader::Testing::RecordingEventSink;
using BybitTrader::Testing::make_bar;
using BybitTrader::Testing::make_snapshot;

namespace {

class PositionStateMachineTest : public ::testing::Test {
protected:
    Config::SystemConfig config;
    FakeExecutionGateway gateway;
    RecordingEventSink sink;
    RiskSizer risk_sizer;
    PositionStateMachine state_machine;
    std::int64_t next_timestamp;

    PositionStateMachineTest()
        : config(Testing::make_test_config()),
          risk_sizer(config.risk),
          state_machine(PositionStateMachineConstructionParams(config, gateway, risk_sizer, sink)),
          next_timestamp(1700000000000) {}

    void feed(double low, double high, double close, Signal signal, double atr = 200.0) {
        next_timestamp += 60000;
        Bar bar = make_bar(next_timestamp, close, high, low, close);
        IndicatorSnapshot snapshot = make_snapshot(atr);
        state_machine.on_bar(BarDecisionRequest(bar, snapshot, signal));
    }

    void open_long() {
        feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);
        ASSERT_EQ(state_machine.state(), PositionState::Open);
    }

    std::string last_transition_reason_to(PositionState target_state) const {
        for (auto iterator = sink.transitions.rbegin(); iterator != sink.transitions.rend(); ++iterator) {
            if (iterator->to_state == target_state) return iterator->reason;
        }
        return "";
    }
};

// ========================================================================
// ENTRY
// ========================================================================

TEST_F(PositionStateMachineTest, FilledEntryOpensPositionAndArmsProtectiveOrders) {
    open_long();

    PositionStatus status = state_machine.status();
    EXPECT_EQ(status.intent.side, PositionSide::Long);
    EXPECT_DOUBLE_EQ(status.intent.size, 0.01);
    EXPECT_DOUBLE_EQ(status.intent.entry_price, 30000.0);
    EXPECT_DOUBLE_EQ(status.intent.stop_loss, 29650.0);
    EXPECT_DOUBLE_EQ(status.intent.take_profit, 30700.0);

    ASSERT_EQ(gateway.submitted_orders.size(), 3u);
    const OrderRequest& entry_order = gateway.submitted_orders[0];
    EXPECT_EQ(entry_order.type, OrderType::Market);
    EXPECT_EQ(entry_order.side, OrderSide::Buy);
    EXPECT_FALSE(entry_order.reduce_only);
    EXPECT_EQ(entry_order.client_order_id.rfind("bt-entry-", 0), 0u);

    const OrderRequest& stop_order = gateway.submitted_orders[1];
    EXPECT_EQ(stop_order.type, OrderType::StopMarket);
    EXPECT_EQ(stop_order.side, OrderSide::Sell);
    EXPECT_TRUE(stop_order.reduce_only);
    EXPECT_DOUBLE_EQ(stop_order.trigger_price.value(), 29650.0);

    const OrderRequest& target_order = gateway.submitted_orders[2];
    EXPECT_EQ(target_order.type, OrderType::TakeProfitMarket);
    EXPECT_DOUBLE_EQ(target_order.trigger_price.value(), 30700.0);
}

TEST_F(PositionStateMachineTest, ProtectiveLevelsFollowTheActualFillPrice) {
    gateway.push_status(OrderState::Filled, "", 30100.0);
    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);

    PositionIntent intent = state_machine.status().intent;
    EXPECT_DOUBLE_EQ(intent.entry_price, 30100.0);
    EXPECT_DOUBLE_EQ(intent.stop_loss, 29750.0);
    EXPECT_DOUBLE_EQ(intent.take_profit, 30800.0);
}

TEST_F(PositionStateMachineTest, RejectedEntryReturnsToFlat) {
    gateway.push_status(OrderState::Rejected, "insufficient margin");
    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(state_machine.current_side(), PositionSide::Flat);
    ASSERT_EQ(sink.failed.size(), 1u);
    EXPECT_NE(sink.failed[0].reason.find("insufficient margin"), std::string::npos);
    EXPECT_EQ(gateway.submitted_orders.size(), 1u);
    ASSERT_EQ(sink.transitions.size(), 2u);
    EXPECT_EQ(sink.transitions[0].to_state, PositionState::PendingEntry);
    EXPECT_EQ(sink.transitions[1].to_state, PositionState::Flat);
}

TEST_F(PositionStateMachineTest, UnconfirmedEntryAdoptsExchangePosition) {
    gateway.default_state = OrderState::Pending;
    gateway.position = ExchangePosition(PositionSide::Long, 0.01, 30020.0);

    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    PositionIntent intent = state_machine.status().intent;
    EXPECT_DOUBLE_EQ(intent.entry_price, 30020.0);
    EXPECT_DOUBLE_EQ(intent.stop_loss, 29670.0);
    ASSERT_EQ(gateway.cancelled_orders.size(), 1u);
    EXPECT_EQ(gateway.cancelled_orders[0].order_id, "order-1");
    EXPECT_EQ(gateway.orders_of_type(OrderType::StopMarket).size(), 1u);
}

TEST_F(PositionStateMachineTest, UnconfirmedEntryWithFlatExchangeFails) {
    gateway.default_state = OrderState::Pending;

    feed(29950.0, 30050.0, 30000.0, Signal::EnterShort);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    ASSERT_EQ(sink.failed.size(), 1u);
    EXPECT_EQ(sink.failed[0].side, OrderSide::Sell);
    EXPECT_EQ(gateway.cancelled_orders.size(), 1u);
}

TEST_F(PositionStateMachineTest, SubmissionFailureLeavesPositionFlat) {
    gateway.submit_failures_remaining = 1;
    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(sink.failed.size(), 1u);
    EXPECT_TRUE(gateway.submitted_orders.empty());
}

TEST_F(PositionStateMachineTest, EntrySubmitFailureAdoptsFilledExchangePosition) {
    gateway.submit_failures_remaining = 1;
    gateway.position = ExchangePosition(PositionSide::Long, 0.01, 30010.0);

    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);

    PositionStatus status = state_machine.status();
    EXPECT_EQ(status.state, PositionState::Open);
    EXPECT_DOUBLE_EQ(status.intent.entry_price, 30010.0);
    EXPECT_DOUBLE_EQ(status.intent.stop_loss, 29660.0);
    EXPECT_DOUBLE_EQ(status.intent.take_profit, 30710.0);
    EXPECT_EQ(sink.failed.size(), 1u);
    EXPECT_EQ(gateway.orders_of_type(OrderType::StopMarket).size(), 1u);
    EXPECT_EQ(gateway.orders_of_type(OrderType::TakeProfitMarket).size(), 1u);
}

TEST_F(PositionStateMachineTest, EntryWithoutValidAtrIsDiscarded) {
    next_timestamp += 60000;
    Bar bar = make_bar(next_timestamp, 30000.0, 30050.0, 29950.0, 30000.0);
    IndicatorSnapshot snapshot = make_snapshot(0.0, false);
    state_machine.on_bar(BarDecisionRequest(bar, snapshot, Signal::EnterLong));

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    ASSERT_EQ(sink.discarded.size(), 1u);
    EXPECT_TRUE(gateway.submitted_orders.empty());
}

TEST_F(PositionStateMachineTest, EntryDiscardedWhenEquityQueryFails) {
    gateway.fail_equity_query = true;
    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    ASSERT_EQ(sink.discarded.size(), 1u);
    EXPECT_NE(sink.discarded[0].reason.find("equity query failed"), std::string::npos);
}

TEST_F(PositionStateMachineTest, EntryDiscardedOnInsufficientEquity) {
    // 0.01 * 30000 / 2 = 150 margin
    gateway.equity = 100.0;
    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    ASSERT_EQ(sink.discarded.size(), 1u);
    EXPECT_EQ(sink.discarded[0].signal, Signal::EnterLong);
    EXPECT_TRUE(gateway.submitted_orders.empty());
}

TEST_F(PositionStateMachineTest, EntrySignalWhileOpenIsIgnored) {
    open_long();
    feed(29950.0, 30050.0, 30000.0, Signal::EnterShort);

    EXPECT_EQ(state_machine.current_side(), PositionSide::Long);
    EXPECT_EQ(gateway.submitted_orders.size(), 3u);
}

// ========================================================================
// EXIT
// ========================================================================

TEST_F(PositionStateMachineTest, StopLossClosesLongAndCancelsProtectiveOrders) {
    open_long();
    feed(29600.0, 30000.0, 29700.0, Signal::None);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    ASSERT_EQ(gateway.submitted_orders.size(), 4u);
    const OrderRequest& exit_order = gateway.submitted_orders[3];
    EXPECT_EQ(exit_order.type, OrderType::Market);
    EXPECT_EQ(exit_order.side, OrderSide::Sell);
    EXPECT_TRUE(exit_order.reduce_only);
    EXPECT_DOUBLE_EQ(exit_order.quantity, 0.01);
    EXPECT_EQ(gateway.cancelled_orders.size(), 2u);
    EXPECT_EQ(last_transition_reason_to(PositionState::PendingExit), "stop-loss hit");
}

TEST_F(PositionStateMachineTest, StopWinsWhenBarCrossesBothLevels) {
    open_long();
    feed(29600.0, 30800.0, 30000.0, Signal::None);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(last_transition_reason_to(PositionState::PendingExit), "stop-loss hit");
}

TEST_F(PositionStateMachineTest, TakeProfitClosesShort) {
    feed(29950.0, 30050.0, 30000.0, Signal::EnterShort);
    ASSERT_EQ(state_machine.current_side(), PositionSide::Short);
    PositionIntent intent = state_machine.status().intent;
    EXPECT_DOUBLE_EQ(intent.stop_loss, 30350.0);
    EXPECT_DOUBLE_EQ(intent.take_profit, 29300.0);

    feed(29250.0, 29500.0, 29300.0, Signal::None);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(gateway.submitted_orders.back().side, OrderSide::Buy);
    EXPECT_EQ(last_transition_reason_to(PositionState::PendingExit), "take-profit hit");
}

TEST_F(PositionStateMachineTest, ExitSignalClosesMatchingSideOnly) {
    open_long();

    feed(29900.0, 30100.0, 30000.0, Signal::ExitShort);
    EXPECT_EQ(state_machine.state(), PositionState::Open);

    feed(29900.0, 30100.0, 30000.0, Signal::ExitLong);
    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(last_transition_reason_to(PositionState::PendingExit), "signal EXIT_LONG");
}

TEST_F(PositionStateMachineTest, RejectedExitCountsWhenExchangeAlreadyFlat) {
    open_long();
    gateway.push_status(OrderState::Rejected, "reduce-only would increase position");
    gateway.position = ExchangePosition();

    feed(29900.0, 30100.0, 30000.0, Signal::ExitLong);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_TRUE(sink.failed.empty());
}

TEST_F(PositionStateMachineTest, ExitSubmitFailureCountsWhenExchangeAlreadyFlat) {
    open_long();
    int queries_before_exit = gateway.position_queries;
    gateway.position = ExchangePosition();
    gateway.submit_failures_remaining = 2;

    feed(29600.0, 30000.0, 29700.0, Signal::None);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_TRUE(sink.fatals.empty());
    EXPECT_FALSE(state_machine.entries_halted());
    EXPECT_GT(gateway.position_queries, queries_before_exit);
}

TEST_F(PositionStateMachineTest, ExitSubmitFailureRetriesWhileExchangeStillOpen) {
    open_long();
    gateway.submit_failures_remaining = 1;

    feed(29600.0, 30000.0, 29700.0, Signal::None);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(sink.failed.size(), 1u);
    EXPECT_TRUE(sink.fatals.empty());
    EXPECT_EQ(gateway.position.side, PositionSide::Flat);
}

TEST_F(PositionStateMachineTest, ExitFailingTwiceHaltsEntriesUntilExchangeIsFlat) {
    open_long();
    gateway.default_state = OrderState::Rejected;

    EXPECT_THROW(feed(29900.0, 30100.0, 30000.0, Signal::ExitLong), StuckPosition);

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    EXPECT_TRUE(state_machine.entries_halted());
    ASSERT_EQ(sink.fatals.size(), 1u);
    EXPECT_EQ(sink.fatals[0].condition, "StuckPosition");
    EXPECT_EQ(sink.failed.size(), 2u);
    EXPECT_EQ(gateway.orders_of_type(OrderType::StopMarket).size(), 2u);

    // Exchange still long: stays halted.
    state_machine.reconcile();
    EXPECT_TRUE(state_machine.entries_halted());
    EXPECT_EQ(state_machine.state(), PositionState::Open);

    gateway.position = ExchangePosition();
    gateway.default_state = OrderState::Filled;
    state_machine.reconcile();
    EXPECT_FALSE(state_machine.entries_halted());
    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(sink.divergences.size(), 1u);

    feed(29950.0, 30050.0, 30000.0, Signal::EnterLong);
    EXPECT_EQ(state_machine.state(), PositionState::Open);
}

// ========================================================================
// RECOVERY
// ========================================================================

TEST_F(PositionStateMachineTest, RecoveryWithoutAtrDefersProtectiveLevels) {
    gateway.position = ExchangePosition(PositionSide::Long, 0.002, 29000.0);

    state_machine.recover_from_exchange(std::nullopt);

    PositionStatus status = state_machine.status();
    EXPECT_EQ(status.state, PositionState::Open);
    EXPECT_EQ(status.intent.side, PositionSide::Long);
    EXPECT_DOUBLE_EQ(status.intent.size, 0.002);
    EXPECT_FALSE(status.intent.protective_levels_set);
    EXPECT_TRUE(gateway.submitted_orders.empty());

    feed(28900.0, 29100.0, 29000.0, Signal::None);
    status = state_machine.status();
    EXPECT_TRUE(status.intent.protective_levels_set);
    EXPECT_DOUBLE_EQ(status.intent.stop_loss, 28650.0);
    EXPECT_DOUBLE_EQ(status.intent.take_profit, 29700.0);
    EXPECT_TRUE(gateway.submitted_orders.empty());

    feed(28600.0, 29000.0, 28700.0, Signal::None);
    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    ASSERT_EQ(gateway.submitted_orders.size(), 1u);
    EXPECT_DOUBLE_EQ(gateway.submitted_orders[0].quantity, 0.002);
    EXPECT_TRUE(gateway.submitted_orders[0].reduce_only);
}

TEST_F(PositionStateMachineTest, RecoveryWithAtrSetsLevelsImmediately) {
    gateway.position = ExchangePosition(PositionSide::Short, 0.003, 31000.0);

    state_machine.recover_from_exchange(100.0);

    PositionIntent intent = state_machine.status().intent;
    EXPECT_TRUE(intent.protective_levels_set);
    EXPECT_DOUBLE_EQ(intent.stop_loss, 31175.0);
    EXPECT_DOUBLE_EQ(intent.take_profit, 30650.0);
    EXPECT_TRUE(gateway.submitted_orders.empty());
}

TEST_F(PositionStateMachineTest, RecoveryWithFlatExchangeStaysFlat) {
    state_machine.recover_from_exchange(200.0);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_TRUE(sink.transitions.empty());
}

TEST_F(PositionStateMachineTest, RecoveryPropagatesPositionQueryFailure) {
    gateway.fail_position_query = true;
    EXPECT_THROW(state_machine.recover_from_exchange(std::nullopt), GatewayError);
}

// ========================================================================
// RECONCILIATION
// ========================================================================

TEST_F(PositionStateMachineTest, ReconcileAdoptsUnexpectedExchangePosition) {
    gateway.position = ExchangePosition(PositionSide::Short, 0.005, 31000.0);

    state_machine.reconcile();

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    EXPECT_EQ(state_machine.current_side(), PositionSide::Short);
    ASSERT_EQ(sink.divergences.size(), 1u);
    EXPECT_EQ(sink.divergences[0].reported.side, PositionSide::Short);
    EXPECT_TRUE(gateway.submitted_orders.empty());
}

TEST_F(PositionStateMachineTest, ReconcileForcesFlatWhenExchangeIsFlat) {
    open_long();
    gateway.position = ExchangePosition();

    state_machine.reconcile();

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(sink.divergences.size(), 1u);
    EXPECT_EQ(gateway.cancelled_orders.size(), 2u);
}

TEST_F(PositionStateMachineTest, ReconcileUpdatesSizeMismatch) {
    open_long();
    gateway.position = ExchangePosition(PositionSide::Long, 0.008, 30000.0);

    state_machine.reconcile();

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    EXPECT_DOUBLE_EQ(state_machine.status().intent.size, 0.008);
    EXPECT_EQ(sink.divergences.size(), 1u);
}

TEST_F(PositionStateMachineTest, ReconcileAdoptsOppositeSide) {
    open_long();
    gateway.position = ExchangePosition(PositionSide::Short, 0.01, 30500.0);

    state_machine.reconcile();

    EXPECT_EQ(state_machine.current_side(), PositionSide::Short);
    EXPECT_EQ(gateway.cancelled_orders.size(), 2u);
    EXPECT_EQ(sink.divergences.size(), 1u);
}

TEST_F(PositionStateMachineTest, ReconcileArmsProtectiveOrdersForAdoptedPosition) {
    feed(30900.0, 31100.0, 31000.0, Signal::None);
    gateway.position = ExchangePosition(PositionSide::Short, 0.005, 31000.0);

    state_machine.reconcile();

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    std::vector<OrderRequest> stop_orders = gateway.orders_of_type(OrderType::StopMarket);
    std::vector<OrderRequest> target_orders = gateway.orders_of_type(OrderType::TakeProfitMarket);
    ASSERT_EQ(stop_orders.size(), 1u);
    ASSERT_EQ(target_orders.size(), 1u);
    EXPECT_EQ(stop_orders[0].side, OrderSide::Buy);
    EXPECT_TRUE(stop_orders[0].reduce_only);
    EXPECT_DOUBLE_EQ(stop_orders[0].quantity, 0.005);
    EXPECT_DOUBLE_EQ(stop_orders[0].trigger_price.value(), 31350.0);
    EXPECT_DOUBLE_EQ(target_orders[0].trigger_price.value(), 30300.0);
}

TEST_F(PositionStateMachineTest, ReconcileArmsProtectiveOrdersOnceAtrArrives) {
    gateway.position = ExchangePosition(PositionSide::Short, 0.005, 31000.0);
    state_machine.reconcile();
    EXPECT_TRUE(gateway.submitted_orders.empty());

    feed(30900.0, 31100.0, 31000.0, Signal::None);
    EXPECT_EQ(gateway.orders_of_type(OrderType::StopMarket).size(), 1u);

    feed(30900.0, 31100.0, 31000.0, Signal::None);
    EXPECT_EQ(gateway.orders_of_type(OrderType::StopMarket).size(), 1u);
}

TEST_F(PositionStateMachineTest, ReconcileRearmsProtectiveOrdersAfterSideFlip) {
    open_long();
    gateway.position = ExchangePosition(PositionSide::Short, 0.01, 30500.0);

    state_machine.reconcile();

    std::vector<OrderRequest> stop_orders = gateway.orders_of_type(OrderType::StopMarket);
    ASSERT_EQ(stop_orders.size(), 2u);
    EXPECT_EQ(stop_orders[1].side, OrderSide::Buy);
    EXPECT_DOUBLE_EQ(stop_orders[1].trigger_price.value(), 30850.0);
}

TEST_F(PositionStateMachineTest, ReconcileWithMatchingPositionIsQuiet) {
    open_long();
    state_machine.reconcile();

    EXPECT_TRUE(sink.divergences.empty());
    EXPECT_EQ(state_machine.state(), PositionState::Open);
}

TEST_F(PositionStateMachineTest, ReconcileWaitsForInFlightEntry) {
    gateway.default_state = OrderState::Pending;
    gateway.position = ExchangePosition(PositionSide::Long, 0.01, 30000.0);

    std::thread bar_thread([this] { feed(29950.0, 30050.0, 30000.0, Signal::EnterLong); });
    // PendingEntry is announced while the entry holds the state lock.
    while (sink.transition_count() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    state_machine.reconcile();
    bar_thread.join();

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    EXPECT_TRUE(sink.divergences.empty());
}

// ========================================================================
// SHUTDOWN
// ========================================================================

TEST_F(PositionStateMachineTest, ShutdownLeavesPositionToProtectiveOrders) {
    open_long();
    state_machine.shutdown(false);

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    EXPECT_EQ(gateway.submitted_orders.size(), 3u);
    EXPECT_TRUE(gateway.cancelled_orders.empty());
}

TEST_F(PositionStateMachineTest, ShutdownClosesPositionWhenConfigured) {
    open_long();
    state_machine.shutdown(true);

    EXPECT_EQ(state_machine.state(), PositionState::Flat);
    EXPECT_EQ(gateway.submitted_orders.back().side, OrderSide::Sell);
    EXPECT_TRUE(gateway.submitted_orders.back().reduce_only);
    EXPECT_EQ(gateway.position.side, PositionSide::Flat);
}

TEST_F(PositionStateMachineTest, ShutdownWithStuckExitLeavesPositionProtected) {
    open_long();
    gateway.default_state = OrderState::Rejected;

    EXPECT_NO_THROW(state_machine.shutdown(true));

    EXPECT_EQ(state_machine.state(), PositionState::Open);
    EXPECT_TRUE(state_machine.entries_halted());
    EXPECT_EQ(gateway.orders_of_type(OrderType::StopMarket).size(), 2u);
}

TEST_F(PositionStateMachineTest, ShutdownWhileFlatDoesNothing) {
    state_machine.shutdown(true);
    EXPECT_TRUE(gateway.submitted_orders.empty());
    EXPECT_EQ(gateway.position_queries, 0);
}

} // namespace
