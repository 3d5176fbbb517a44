#ifndef LOGGING_EVENT_SINK_HPP
#define LOGGING_EVENT_SINK_HPP

#include "trading_events.hpp"

namespace BybitTrader {
namespace Core {

// Default sink: every event becomes a TradingLogs line.
class LoggingEventSink : public TradingEventSink {
public:
    void on_signal_generated(const SignalGeneratedEvent& event) override;
    void on_order_submitted(const OrderSubmittedEvent& event) override;
    void on_order_failed(const OrderFailedEvent& event) override;
    void on_entry_discarded(const EntryDiscardedEvent& event) override;
    void on_state_transition(const StateTransitionEvent& event) override;
    void on_divergence_detected(const DivergenceEvent& event) override;
    void on_fatal_condition(const FatalConditionEvent& event) override;
    void on_bar_rejected(const BarRejectedEvent& event) override;
};

} // namespace Core
} // namespace BybitTrader

#endif // LOGGING_EVENT_SINK_HPP
