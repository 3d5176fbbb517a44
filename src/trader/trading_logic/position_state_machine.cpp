#include "position_state_machine.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <initializer_list>
#include <thread>

namespace BybitTrader {
namespace Core {

using Logging::TradingLogs;

PositionStateMachine::PositionStateMachine(const PositionStateMachineConstructionParams& construction_params)
    : config(construction_params.system_config),
      gateway(construction_params.gateway_ref),
      risk_sizer(construction_params.risk_sizer_ref),
      event_sink(construction_params.event_sink_ref),
      current_state(PositionState::Flat),
      intent(),
      entries_halted_flag(false),
      protective_orders_deferred(false),
      client_order_sequence(0) {}

// ========================================================================
// PUBLIC OPERATIONS
// ========================================================================

void PositionStateMachine::recover_from_exchange(std::optional<double> atr_at_startup) {
    std::lock_guard<std::mutex> state_lock(state_mutex);

    if (atr_at_startup && *atr_at_startup > 0.0) {
        latest_valid_atr = atr_at_startup;
    }

    ExchangePosition exchange_position = gateway.query_position();
    if (exchange_position.side == PositionSide::Flat || exchange_position.size <= config.risk.size_tolerance) {
        intent = PositionIntent();
        current_state = PositionState::Flat;
        return;
    }

    adopt_exchange_position(exchange_position);
    TradingLogs::log_position_recovered(intent);
    transition_to(PositionState::Open, "recovered from exchange position");
}

void PositionStateMachine::on_bar(const BarDecisionRequest& request) {
    std::lock_guard<std::mutex> state_lock(state_mutex);

    if (request.snapshot.atr_valid && request.snapshot.atr > 0.0) {
        latest_valid_atr = request.snapshot.atr;
    }

    if (current_state == PositionState::Open) {
        apply_deferred_protective_levels();

        std::string trigger_reason;
        if (check_protective_levels(request.bar, trigger_reason)) {
            exit_position(trigger_reason);
            return;
        }

        bool exit_signal_matches_side =
            (request.signal == Signal::ExitLong && intent.side == PositionSide::Long) ||
            (request.signal == Signal::ExitShort && intent.side == PositionSide::Short);
        if (exit_signal_matches_side) {
            exit_position(std::string("signal ") + to_string(request.signal));
        }
        return;
    }

    if (current_state == PositionState::Flat &&
        (request.signal == Signal::EnterLong || request.signal == Signal::EnterShort)) {
        handle_entry_signal(request);
    }
}

void PositionStateMachine::reconcile() {
    std::lock_guard<std::mutex> state_lock(state_mutex);

    ExchangePosition reported = gateway.query_position();
    bool exchange_flat = reported.side == PositionSide::Flat || reported.size <= config.risk.size_tolerance;

    if (exchange_flat && entries_halted_flag) {
        entries_halted_flag = false;
        TradingLogs::log_entries_halted("cleared, exchange reports flat");
    }

    if (current_state == PositionState::Flat) {
        if (exchange_flat) {
            return;
        }
        event_sink.on_divergence_detected(DivergenceEvent{intent, reported, "exchange reports a position while intent is flat"});
        adopt_exchange_position(reported);
        protective_orders_deferred = true;
        transition_to(PositionState::Open, "reconciled to exchange position");
        arm_deferred_protective_orders();
        return;
    }

    if (exchange_flat) {
        event_sink.on_divergence_detected(DivergenceEvent{intent, reported, "exchange reports flat while intent is open"});
        cancel_protective_orders();
        reset_to_flat("reconciled to flat exchange position");
        return;
    }

    if (reported.side != intent.side) {
        event_sink.on_divergence_detected(DivergenceEvent{intent, reported, "exchange side differs from intent"});
        cancel_protective_orders();
        adopt_exchange_position(reported);
        protective_orders_deferred = true;
        transition_to(PositionState::Open, "reconciled to exchange side");
        arm_deferred_protective_orders();
        return;
    }

    if (!sizes_match(intent.size, reported.size)) {
        event_sink.on_divergence_detected(DivergenceEvent{intent, reported, "exchange size differs from intent"});
        intent.size = reported.size;
    }
}

void PositionStateMachine::shutdown(bool close_position) {
    std::lock_guard<std::mutex> state_lock(state_mutex);

    if (current_state != PositionState::Open) {
        return;
    }

    if (!close_position) {
        TradingLogs::log_shutdown_position_left_protected(intent);
        return;
    }

    PositionIntent closing_intent = intent;
    try {
        exit_position("shutdown");
        TradingLogs::log_shutdown_position_closed(closing_intent);
    } catch (const StuckPosition&) {
        TradingLogs::log_shutdown_position_left_protected(intent);
    }
}

PositionStatus PositionStateMachine::status() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return PositionStatus{current_state, intent, entries_halted_flag};
}

PositionState PositionStateMachine::state() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return current_state;
}

PositionSide PositionStateMachine::current_side() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return intent.side;
}

bool PositionStateMachine::entries_halted() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return entries_halted_flag;
}

// ========================================================================
// ENTRY
// ========================================================================

void PositionStateMachine::handle_entry_signal(const BarDecisionRequest& request) {
    Signal entry_signal = request.signal;

    if (entries_halted_flag) {
        event_sink.on_entry_discarded(EntryDiscardedEvent{entry_signal, "entries halted until the exchange reports flat"});
        return;
    }
    if (!request.snapshot.atr_valid) {
        event_sink.on_entry_discarded(EntryDiscardedEvent{entry_signal, "ATR not valid yet"});
        return;
    }

    PositionSide side = entry_signal == Signal::EnterLong ? PositionSide::Long : PositionSide::Short;

    double account_equity = 0.0;
    try {
        account_equity = gateway.query_account_equity();
    } catch (const GatewayError& gateway_error) {
        event_sink.on_entry_discarded(EntryDiscardedEvent{entry_signal, std::string("equity query failed: ") + gateway_error.what()});
        return;
    }

    PositionSizing sizing;
    try {
        sizing = risk_sizer.size(PositionSizingRequest(account_equity, request.bar.close_price, request.snapshot.atr, side));
    } catch (const InsufficientEquity& insufficient_equity_error) {
        event_sink.on_entry_discarded(EntryDiscardedEvent{entry_signal, insufficient_equity_error.what()});
        return;
    }

    enter_position(side, sizing, request.bar.close_price, request.snapshot.atr);
}

void PositionStateMachine::enter_position(PositionSide side, const PositionSizing& sizing, double reference_price, double atr) {
    intent = PositionIntent();
    intent.side = side;
    intent.size = sizing.size;
    intent.entry_price = reference_price;
    intent.stop_loss = sizing.stop_loss;
    intent.take_profit = sizing.take_profit;
    intent.protective_levels_set = true;
    transition_to(PositionState::PendingEntry, "entry order sized");

    OrderRequest entry_order(entry_order_side(side), sizing.size, OrderType::Market);
    entry_order.client_order_id = next_client_order_id("entry");

    std::optional<OrderHandle> entry_handle = submit_and_report(entry_order);
    if (!entry_handle) {
        // A retried create can fail on the duplicate orderLinkId after the first attempt filled.
        if (!adopt_entry_from_exchange(side, reference_price, atr, "entry confirmed by position query after submit failure")) {
            reset_to_flat("entry order not accepted");
        }
        return;
    }

    OrderStatusReport report = await_order_resolution(*entry_handle);

    if (report.state == OrderState::Filled) {
        double fill_price = report.average_fill_price > 0.0 ? report.average_fill_price : reference_price;
        double filled_quantity = report.filled_quantity > 0.0 ? report.filled_quantity : sizing.size;
        ProtectiveLevels levels = risk_sizer.compute_protective_levels(side, fill_price, atr);
        intent.size = filled_quantity;
        intent.entry_price = fill_price;
        intent.stop_loss = levels.stop_loss;
        intent.take_profit = levels.take_profit;
        transition_to(PositionState::Open, "entry filled");
        submit_protective_orders();
        return;
    }

    if (report.state == OrderState::Rejected) {
        event_sink.on_order_failed(OrderFailedEvent{entry_order.side, entry_order.type, entry_order.quantity,
                                                    "entry rejected: " + report.reason});
        reset_to_flat("entry rejected");
        return;
    }

    // Confirmation timed out: the exchange decides what happened.
    try {
        gateway.cancel_order(*entry_handle);
    } catch (const GatewayError& cancel_error) {
        TradingLogs::log_gateway_error("cancel unconfirmed entry", cancel_error.what());
    }

    if (adopt_entry_from_exchange(side, reference_price, atr, "entry confirmed by position query after timeout")) {
        return;
    }

    event_sink.on_order_failed(OrderFailedEvent{entry_order.side, entry_order.type, entry_order.quantity,
                                                "entry not confirmed within " +
                                                std::to_string(config.timing.order_confirmation_timeout_ms) + "ms"});
    reset_to_flat("entry confirmation timeout");
}

bool PositionStateMachine::adopt_entry_from_exchange(PositionSide side, double reference_price, double atr, const std::string& reason) {
    std::optional<ExchangePosition> exchange_position = query_position_after_timeout();
    if (!exchange_position || exchange_position->side != side || exchange_position->size <= config.risk.size_tolerance) {
        return false;
    }

    double fill_price = exchange_position->avg_entry_price > 0.0 ? exchange_position->avg_entry_price : reference_price;
    ProtectiveLevels levels = risk_sizer.compute_protective_levels(side, fill_price, atr);
    intent.size = exchange_position->size;
    intent.entry_price = fill_price;
    intent.stop_loss = levels.stop_loss;
    intent.take_profit = levels.take_profit;
    transition_to(PositionState::Open, reason);
    submit_protective_orders();
    return true;
}

// ========================================================================
// EXIT
// ========================================================================

void PositionStateMachine::exit_position(const std::string& reason) {
    transition_to(PositionState::PendingExit, reason);
    cancel_protective_orders();

    // One immediate retry after the first failure.
    for (int attempt_number = 1; attempt_number <= 2; ++attempt_number) {
        if (attempt_exit_order(attempt_number)) {
            reset_to_flat("exit confirmed");
            return;
        }
    }

    std::string stuck_message = std::string("exit of ") + to_string(intent.side) + " " +
                                TradingLogs::format_quantity(intent.size) + " failed twice; entries halted";
    transition_to(PositionState::Open, "exit failed twice");
    entries_halted_flag = true;
    submit_protective_orders();
    event_sink.on_fatal_condition(FatalConditionEvent{"StuckPosition", stuck_message});
    throw StuckPosition(stuck_message);
}

bool PositionStateMachine::attempt_exit_order(int attempt_number) {
    OrderRequest exit_order(exit_order_side(intent.side), intent.size, OrderType::Market);
    exit_order.reduce_only = true;
    exit_order.client_order_id = next_client_order_id("exit");

    std::optional<OrderHandle> exit_handle = submit_and_report(exit_order);
    if (!exit_handle) {
        // Typically an exchange stop already closed the position and the reduce-only create was refused.
        std::optional<ExchangePosition> exchange_position = query_position_after_timeout();
        if (exchange_position) {
            if (exchange_position->side == PositionSide::Flat || exchange_position->size <= config.risk.size_tolerance) {
                return true;
            }
            intent.size = exchange_position->size;
        }
        return false;
    }

    OrderStatusReport report = await_order_resolution(*exit_handle);
    if (report.state == OrderState::Filled) {
        return true;
    }

    if (report.state == OrderState::Pending) {
        try {
            gateway.cancel_order(*exit_handle);
        } catch (const GatewayError& cancel_error) {
            TradingLogs::log_gateway_error("cancel unconfirmed exit", cancel_error.what());
        }
    }

    // A rejected or unconfirmed exit may still have closed the position (or an exchange stop did).
    std::optional<ExchangePosition> exchange_position = query_position_after_timeout();
    if (exchange_position) {
        if (exchange_position->side == PositionSide::Flat || exchange_position->size <= config.risk.size_tolerance) {
            return true;
        }
        intent.size = exchange_position->size;
    }

    std::string failure_reason = report.state == OrderState::Rejected
        ? "exit rejected: " + report.reason
        : "exit not confirmed within " + std::to_string(config.timing.order_confirmation_timeout_ms) + "ms";
    event_sink.on_order_failed(OrderFailedEvent{exit_order.side, exit_order.type, exit_order.quantity,
                                                failure_reason + " (attempt " + std::to_string(attempt_number) + ")"});
    return false;
}

// ========================================================================
// PROTECTIVE LEVELS
// ========================================================================

bool PositionStateMachine::check_protective_levels(const Bar& bar, std::string& trigger_reason) {
    if (!intent.protective_levels_set) {
        return false;
    }

    bool stop_hit = false;
    bool target_hit = false;
    double stop_extreme = 0.0;
    double target_extreme = 0.0;
    if (intent.side == PositionSide::Long) {
        stop_hit = bar.low_price <= intent.stop_loss;
        target_hit = bar.high_price >= intent.take_profit;
        stop_extreme = bar.low_price;
        target_extreme = bar.high_price;
    } else if (intent.side == PositionSide::Short) {
        stop_hit = bar.high_price >= intent.stop_loss;
        target_hit = bar.low_price <= intent.take_profit;
        stop_extreme = bar.high_price;
        target_extreme = bar.low_price;
    }

    // Stop wins when one bar crosses both.
    if (stop_hit) {
        TradingLogs::log_protective_trigger("STOP_LOSS", intent.stop_loss, stop_extreme);
        trigger_reason = "stop-loss hit";
        return true;
    }
    if (target_hit) {
        TradingLogs::log_protective_trigger("TAKE_PROFIT", intent.take_profit, target_extreme);
        trigger_reason = "take-profit hit";
        return true;
    }
    return false;
}

void PositionStateMachine::apply_deferred_protective_levels() {
    if (intent.protective_levels_set || !latest_valid_atr || intent.entry_price <= 0.0) {
        return;
    }
    ProtectiveLevels levels = risk_sizer.compute_protective_levels(intent.side, intent.entry_price, *latest_valid_atr);
    intent.stop_loss = levels.stop_loss;
    intent.take_profit = levels.take_profit;
    intent.protective_levels_set = true;
    TradingLogs::log_position_recovered(intent);
    arm_deferred_protective_orders();
}

void PositionStateMachine::arm_deferred_protective_orders() {
    if (!protective_orders_deferred || !intent.protective_levels_set) {
        return;
    }
    protective_orders_deferred = false;
    submit_protective_orders();
}

void PositionStateMachine::submit_protective_orders() {
    if (!intent.protective_levels_set || intent.side == PositionSide::Flat) {
        return;
    }

    OrderRequest stop_order(exit_order_side(intent.side), intent.size, OrderType::StopMarket);
    stop_order.trigger_price = intent.stop_loss;
    stop_order.reduce_only = true;
    stop_order.client_order_id = next_client_order_id("sl");

    OrderRequest target_order(exit_order_side(intent.side), intent.size, OrderType::TakeProfitMarket);
    target_order.trigger_price = intent.take_profit;
    target_order.reduce_only = true;
    target_order.client_order_id = next_client_order_id("tp");

    for (const OrderRequest& protective_order : {stop_order, target_order}) {
        std::optional<OrderHandle> protective_handle = submit_and_report(protective_order);
        if (protective_handle) {
            protective_orders.push_back(*protective_handle);
        }
    }
}

void PositionStateMachine::cancel_protective_orders() {
    for (const OrderHandle& protective_handle : protective_orders) {
        try {
            gateway.cancel_order(protective_handle);
        } catch (const GatewayError& cancel_error) {
            TradingLogs::log_gateway_error("cancel protective order " + protective_handle.order_id, cancel_error.what());
        }
    }
    protective_orders.clear();
}

// ========================================================================
// HELPERS
// ========================================================================

void PositionStateMachine::transition_to(PositionState next_state, const std::string& reason) {
    PositionState previous_state = current_state;
    current_state = next_state;
    event_sink.on_state_transition(StateTransitionEvent{previous_state, next_state, intent, reason});
}

void PositionStateMachine::adopt_exchange_position(const ExchangePosition& exchange_position) {
    intent = PositionIntent();
    intent.side = exchange_position.side;
    intent.size = exchange_position.size;
    intent.entry_price = exchange_position.avg_entry_price;

    if (latest_valid_atr && intent.entry_price > 0.0) {
        ProtectiveLevels levels = risk_sizer.compute_protective_levels(intent.side, intent.entry_price, *latest_valid_atr);
        intent.stop_loss = levels.stop_loss;
        intent.take_profit = levels.take_profit;
        intent.protective_levels_set = true;
    } else {
        TradingLogs::log_protective_levels_deferred(latest_valid_atr ? "exchange reported no entry price" : "no valid ATR yet");
    }
}

void PositionStateMachine::reset_to_flat(const std::string& reason) {
    intent = PositionIntent();
    protective_orders.clear();
    protective_orders_deferred = false;
    transition_to(PositionState::Flat, reason);
}

std::optional<OrderHandle> PositionStateMachine::submit_and_report(const OrderRequest& order_request) {
    try {
        OrderHandle handle = gateway.submit_order(order_request);
        event_sink.on_order_submitted(OrderSubmittedEvent{handle, order_request.side, order_request.type, order_request.quantity,
                                                          order_request.trigger_price.value_or(0.0), order_request.reduce_only});
        return handle;
    } catch (const GatewayError& gateway_error) {
        event_sink.on_order_failed(OrderFailedEvent{order_request.side, order_request.type, order_request.quantity, gateway_error.what()});
        return std::nullopt;
    }
}

OrderStatusReport PositionStateMachine::await_order_resolution(const OrderHandle& handle) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.timing.order_confirmation_timeout_ms);
    auto poll_interval = std::chrono::milliseconds(config.timing.order_status_poll_interval_ms);

    while (true) {
        try {
            OrderStatusReport report = gateway.query_order_status(handle);
            if (report.state != OrderState::Pending) {
                return report;
            }
        } catch (const GatewayError& status_error) {
            TradingLogs::log_gateway_error("order status " + handle.order_id, status_error.what());
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(poll_interval, deadline - now));
    }

    OrderStatusReport timed_out_report;
    timed_out_report.state = OrderState::Pending;
    timed_out_report.reason = "confirmation timeout";
    return timed_out_report;
}

std::optional<ExchangePosition> PositionStateMachine::query_position_after_timeout() {
    try {
        return gateway.query_position();
    } catch (const GatewayError& position_error) {
        TradingLogs::log_gateway_error("position query", position_error.what());
        return std::nullopt;
    }
}

std::string PositionStateMachine::next_client_order_id(const char* purpose) {
    unsigned long sequence_number = ++client_order_sequence;
    return std::string("bt-") + purpose + "-" + std::to_string(TimeUtils::get_current_epoch_milliseconds()) +
           "-" + std::to_string(sequence_number);
}

bool PositionStateMachine::sizes_match(double intended_size, double reported_size) const {
    return std::fabs(intended_size - reported_size) <= config.risk.size_tolerance;
}

} // namespace Core
} // namespace BybitTrader
