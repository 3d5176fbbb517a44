#include "logging_event_sink.hpp"
#include "logging/logs/trading_logs.hpp"

namespace BybitTrader {
namespace Core {

using Logging::TradingLogs;

void LoggingEventSink::on_signal_generated(const SignalGeneratedEvent& event) {
    TradingLogs::log_signal(event);
}

void LoggingEventSink::on_order_submitted(const OrderSubmittedEvent& event) {
    TradingLogs::log_order_submitted(event);
}

void LoggingEventSink::on_order_failed(const OrderFailedEvent& event) {
    TradingLogs::log_order_failed(event);
}

void LoggingEventSink::on_entry_discarded(const EntryDiscardedEvent& event) {
    TradingLogs::log_entry_discarded(event);
}

void LoggingEventSink::on_state_transition(const StateTransitionEvent& event) {
    TradingLogs::log_state_transition(event);
}

void LoggingEventSink::on_divergence_detected(const DivergenceEvent& event) {
    TradingLogs::log_divergence(event);
}

void LoggingEventSink::on_fatal_condition(const FatalConditionEvent& event) {
    TradingLogs::log_fatal(event);
}

void LoggingEventSink::on_bar_rejected(const BarRejectedEvent& event) {
    TradingLogs::log_bar_rejected(event);
}

} // namespace Core
} // namespace BybitTrader
