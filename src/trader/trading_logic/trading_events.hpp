#ifndef TRADING_EVENTS_HPP
#define TRADING_EVENTS_HPP

#include <cstdint>
#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace BybitTrader {
namespace Core {

struct SignalGeneratedEvent {
    std::int64_t bar_timestamp_ms;
    Signal signal;
    PositionSide position_side;
    double close_price;
};

struct OrderSubmittedEvent {
    OrderHandle handle;
    OrderSide side;
    OrderType type;
    double quantity;
    double trigger_price;     // 0 for market orders
    bool reduce_only;
};

struct OrderFailedEvent {
    OrderSide side;
    OrderType type;
    double quantity;
    std::string reason;
};

struct EntryDiscardedEvent {
    Signal signal;
    std::string reason;
};

struct StateTransitionEvent {
    PositionState from_state;
    PositionState to_state;
    PositionIntent intent;
    std::string reason;
};

struct DivergenceEvent {
    PositionIntent intended;
    ExchangePosition reported;
    std::string description;
};

struct FatalConditionEvent {
    std::string condition;
    std::string message;
};

struct BarRejectedEvent {
    std::int64_t bar_timestamp_ms;
    std::int64_t last_timestamp_ms;
    std::string reason;
};

/**
 * Observability sink for the trading core. Implementations must be safe to call
 * from the market data and reconciliation threads.
 */
class TradingEventSink {
public:
    virtual ~TradingEventSink() = default;

    virtual void on_signal_generated(const SignalGeneratedEvent& event) = 0;
    virtual void on_order_submitted(const OrderSubmittedEvent& event) = 0;
    virtual void on_order_failed(const OrderFailedEvent& event) = 0;
    virtual void on_entry_discarded(const EntryDiscardedEvent& event) = 0;
    virtual void on_state_transition(const StateTransitionEvent& event) = 0;
    virtual void on_divergence_detected(const DivergenceEvent& event) = 0;
    virtual void on_fatal_condition(const FatalConditionEvent& event) = 0;
    virtual void on_bar_rejected(const BarRejectedEvent& event) = 0;
};

} // namespace Core
} // namespace BybitTrader

#endif // TRADING_EVENTS_HPP
