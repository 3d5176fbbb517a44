#ifndef TRADING_LOGS_HPP
#define TRADING_LOGS_HPP

#include <string>
#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/trading_logic/trading_events.hpp"

namespace BybitTrader {
namespace Logging {

/**
 * Trading decisions, order flow and position state logging.
 * Every line carries an upper-case category prefix so runs can be grepped.
 */
class TradingLogs {
public:
    static std::string format_price(double price);
    static std::string format_quantity(double quantity);

    // Startup / shutdown
    static void log_startup(const Config::SystemConfig& config, double initial_equity);
    static void log_leverage_configured(const std::string& symbol, double leverage);
    static void log_warmup_complete(int bars_replayed, const Core::IndicatorSnapshot& snapshot);
    static void log_position_recovered(const Core::PositionIntent& intent);
    static void log_protective_levels_deferred(const std::string& reason);
    static void log_shutdown_position_closed(const Core::PositionIntent& intent);
    static void log_shutdown_position_left_protected(const Core::PositionIntent& intent);

    // Per-bar analysis
    static void log_indicator_snapshot(const std::string& symbol, const Core::IndicatorSnapshot& snapshot);
    static void log_signal(const Core::SignalGeneratedEvent& event);
    static void log_protective_trigger(const std::string& trigger_name, double trigger_price, double bar_extreme);
    static void log_entries_halted(const std::string& reason);

    // Orders and state
    static void log_order_submitted(const Core::OrderSubmittedEvent& event);
    static void log_order_failed(const Core::OrderFailedEvent& event);
    static void log_entry_discarded(const Core::EntryDiscardedEvent& event);
    static void log_state_transition(const Core::StateTransitionEvent& event);
    static void log_divergence(const Core::DivergenceEvent& event);
    static void log_fatal(const Core::FatalConditionEvent& event);
    static void log_bar_rejected(const Core::BarRejectedEvent& event);
    static void log_gateway_error(const std::string& operation, const std::string& error_message);
};

} // namespace Logging
} // namespace BybitTrader

#endif // TRADING_LOGS_HPP
