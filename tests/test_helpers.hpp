#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "api/general/execution_gateway_interface.hpp"
#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "trader/trading_logic/trading_events.hpp"

namespace BybitTrader {
namespace Testing {

// Short order timeouts so the unconfirmed-order paths run in milliseconds.
inline Config::SystemConfig make_test_config() {
    Config::SystemConfig config;
    config.api.api_key = "test-key";
    config.api.api_secret = "test-secret";
    config.strategy.symbol = "BTCUSDT";
    config.risk.leverage = 2.0;
    config.risk.sizing_policy = "fixed";
    config.risk.position_size = 0.01;
    config.risk.scale_size_by_leverage = false;
    config.risk.atr_multiplier = 1.75;
    config.risk.risk_reward_ratio = 2.0;
    config.risk.qty_step = 0.001;
    config.risk.min_order_qty = 0.001;
    config.risk.size_tolerance = 0.0000001;
    config.timing.order_confirmation_timeout_ms = 40;
    config.timing.order_status_poll_interval_ms = 5;
    return config;
}

inline Core::Bar make_bar(std::int64_t timestamp_ms, double open, double high, double low, double close, double volume = 1.0) {
    return Core::Bar(timestamp_ms, open, high, low, close, volume);
}

// Snapshot where every indicator is valid; only ATR matters to the state machine.
inline Core::IndicatorSnapshot make_snapshot(double atr, bool atr_valid = true) {
    Core::IndicatorSnapshot snapshot;
    snapshot.ema_fast = 100.0;
    snapshot.ema_slow = 100.0;
    snapshot.stoch_k = 50.0;
    snapshot.stoch_d = 50.0;
    snapshot.atr = atr;
    snapshot.vol_avg = 1.0;
    snapshot.ema_fast_valid = true;
    snapshot.ema_slow_valid = true;
    snapshot.stoch_k_valid = true;
    snapshot.stoch_d_valid = true;
    snapshot.atr_valid = atr_valid;
    snapshot.vol_avg_valid = true;
    return snapshot;
}

/**
 * Scripted exchange. Status queries consume status_script first, then answer default_state.
 * A market order reported Filled moves `position` the way the exchange would.
 */
class FakeExecutionGateway : public API::ExecutionGatewayInterface {
public:
    std::vector<Core::OrderRequest> submitted_orders;
    std::vector<Core::OrderHandle> cancelled_orders;
    std::deque<Core::OrderStatusReport> status_script;
    Core::OrderState default_state = Core::OrderState::Filled;
    std::string default_reason = "scripted";
    double fill_price = 30000.0;

    Core::ExchangePosition position;
    double equity = 10000.0;
    bool fail_equity_query = false;
    bool fail_position_query = false;
    int submit_failures_remaining = 0;
    int position_queries = 0;

    Core::OrderHandle submit_order(const Core::OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        if (submit_failures_remaining > 0) {
            --submit_failures_remaining;
            throw Core::GatewayError("scripted submit failure", 10001);
        }
        submitted_orders.push_back(request);
        Core::OrderHandle handle;
        handle.order_id = "order-" + std::to_string(submitted_orders.size());
        handle.client_order_id = request.client_order_id;
        orders_by_id.emplace(handle.order_id, request);
        return handle;
    }

    void cancel_order(const Core::OrderHandle& handle) override {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        cancelled_orders.push_back(handle);
    }

    Core::OrderStatusReport query_order_status(const Core::OrderHandle& handle) override {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        Core::OrderStatusReport report;
        if (!status_script.empty()) {
            report = status_script.front();
            status_script.pop_front();
        } else {
            report.state = default_state;
            report.reason = default_reason;
        }

        auto order_iterator = orders_by_id.find(handle.order_id);
        if (report.state == Core::OrderState::Filled && order_iterator != orders_by_id.end()) {
            const Core::OrderRequest& order = order_iterator->second;
            if (report.average_fill_price <= 0.0) report.average_fill_price = fill_price;
            if (report.filled_quantity <= 0.0) report.filled_quantity = order.quantity;
            if (order.type == Core::OrderType::Market && filled_order_ids.insert(handle.order_id).second) {
                apply_fill(order, report);
            }
        }
        return report;
    }

    Core::ExchangePosition query_position() override {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        ++position_queries;
        if (fail_position_query) {
            throw Core::GatewayError("scripted position query failure");
        }
        return position;
    }

    double query_account_equity() override {
        std::lock_guard<std::mutex> lock(gateway_mutex);
        if (fail_equity_query) {
            throw Core::GatewayError("scripted equity query failure");
        }
        return equity;
    }

    std::string get_gateway_name() const override { return "fake"; }

    std::vector<Core::OrderRequest> orders_of_type(Core::OrderType type) const {
        std::vector<Core::OrderRequest> matching_orders;
        for (const Core::OrderRequest& order : submitted_orders) {
            if (order.type == type) matching_orders.push_back(order);
        }
        return matching_orders;
    }

    void push_status(Core::OrderState state, const std::string& reason = "", double average_price = 0.0) {
        Core::OrderStatusReport report;
        report.state = state;
        report.reason = reason;
        report.average_fill_price = average_price;
        status_script.push_back(report);
    }

private:
    std::mutex gateway_mutex;
    std::map<std::string, Core::OrderRequest> orders_by_id;
    std::set<std::string> filled_order_ids;

    void apply_fill(const Core::OrderRequest& order, const Core::OrderStatusReport& report) {
        Core::PositionSide fill_side = order.side == Core::OrderSide::Buy ? Core::PositionSide::Long : Core::PositionSide::Short;
        if (order.reduce_only) {
            position.size -= report.filled_quantity;
            if (position.size <= 1e-12) {
                position = Core::ExchangePosition();
            }
            return;
        }
        position = Core::ExchangePosition(fill_side, report.filled_quantity, report.average_fill_price);
    }
};

class RecordingEventSink : public Core::TradingEventSink {
public:
    std::vector<Core::SignalGeneratedEvent> signals;
    std::vector<Core::OrderSubmittedEvent> submitted;
    std::vector<Core::OrderFailedEvent> failed;
    std::vector<Core::EntryDiscardedEvent> discarded;
    std::vector<Core::StateTransitionEvent> transitions;
    std::vector<Core::DivergenceEvent> divergences;
    std::vector<Core::FatalConditionEvent> fatals;
    std::vector<Core::BarRejectedEvent> rejected_bars;

    void on_signal_generated(const Core::SignalGeneratedEvent& event) override { record(signals, event); }
    void on_order_submitted(const Core::OrderSubmittedEvent& event) override { record(submitted, event); }
    void on_order_failed(const Core::OrderFailedEvent& event) override { record(failed, event); }
    void on_entry_discarded(const Core::EntryDiscardedEvent& event) override { record(discarded, event); }
    void on_state_transition(const Core::StateTransitionEvent& event) override { record(transitions, event); }
    void on_divergence_detected(const Core::DivergenceEvent& event) override { record(divergences, event); }
    void on_fatal_condition(const Core::FatalConditionEvent& event) override { record(fatals, event); }
    void on_bar_rejected(const Core::BarRejectedEvent& event) override { record(rejected_bars, event); }

    size_t transition_count() {
        std::lock_guard<std::mutex> lock(sink_mutex);
        return transitions.size();
    }

private:
    std::mutex sink_mutex;

    template <typename Event>
    void record(std::vector<Event>& events, const Event& event) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        events.push_back(event);
    }
};

} // namespace Testing
} // namespace BybitTrader

#endif // TEST_HELPERS_HPP
