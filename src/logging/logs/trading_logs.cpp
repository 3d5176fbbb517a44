#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace BybitTrader {
namespace Logging {

using Core::to_string;

namespace {
    std::string describe_intent(const Core::PositionIntent& intent) {
        std::ostringstream oss;
        oss << to_string(intent.side) << " size=" << TradingLogs::format_quantity(intent.size)
            << " entry=" << TradingLogs::format_price(intent.entry_price);
        if (intent.protective_levels_set) {
            oss << " stop=" << TradingLogs::format_price(intent.stop_loss)
                << " target=" << TradingLogs::format_price(intent.take_profit);
        } else if (intent.side != Core::PositionSide::Flat) {
            oss << " stop/target=pending";
        }
        return oss.str();
    }

    std::string describe_exchange_position(const Core::ExchangePosition& position) {
        std::ostringstream oss;
        oss << to_string(position.side) << " size=" << TradingLogs::format_quantity(position.size)
            << " avg_entry=" << TradingLogs::format_price(position.avg_entry_price);
        return oss.str();
    }
}

std::string TradingLogs::format_price(double price) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << price;
    return oss.str();
}

std::string TradingLogs::format_quantity(double quantity) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << quantity;
    std::string formatted = oss.str();
    formatted.erase(formatted.find_last_not_of('0') + 1);
    if (!formatted.empty() && formatted.back() == '.') {
        formatted.pop_back();
    }
    return formatted;
}

void TradingLogs::log_startup(const Config::SystemConfig& config, double initial_equity) {
    LOG_THREAD_SECTION_HEADER("TRADER STARTUP");
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Symbol", config.strategy.symbol + " (" + config.api.category + ")");
    TABLE_ROW_48("Mode", config.api.testnet ? "TESTNET (paper)" : "MAINNET (live)");
    TABLE_ROW_48("Interval", config.strategy.kline_interval + " min");
    TABLE_ROW_48("Equity", format_price(initial_equity) + " USDT");
    TABLE_ROW_48("EMA fast/slow", std::to_string(config.strategy.fast_ema) + " / " + std::to_string(config.strategy.slow_ema));
    TABLE_ROW_48("Stochastic", std::to_string(config.strategy.stoch_period) + " / " + std::to_string(config.strategy.stoch_k_period));
    TABLE_ROW_48("Sizing", config.risk.sizing_policy + " leverage x" + format_quantity(config.risk.leverage));
    TABLE_ROW_48("ATR mult / RR", format_quantity(config.risk.atr_multiplier) + " / " + format_quantity(config.risk.risk_reward_ratio));
    TABLE_SEPARATOR_48();
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_leverage_configured(const std::string& symbol, double leverage) {
    log_message("LEVERAGE: " + symbol + " leverage set to x" + format_quantity(leverage), "");
}

void TradingLogs::log_warmup_complete(int bars_replayed, const Core::IndicatorSnapshot& snapshot) {
    std::ostringstream oss;
    oss << "WARMUP: Replayed " << bars_replayed << " closed bars, last bar "
        << TimeUtils::format_epoch_milliseconds_utc(snapshot.timestamp_ms)
        << (snapshot.signal_inputs_valid() ? " (indicators ready)" : " (indicators still warming up)");
    log_message(oss.str(), "");
}

void TradingLogs::log_position_recovered(const Core::PositionIntent& intent) {
    log_message("RECOVERY: Exchange reports open position, resuming as " + describe_intent(intent), "");
}

void TradingLogs::log_protective_levels_deferred(const std::string& reason) {
    log_message("RECOVERY: Stop/target deferred until ATR is valid - " + reason, "");
}

void TradingLogs::log_shutdown_position_closed(const Core::PositionIntent& intent) {
    log_message("SHUTDOWN: Closed position on exit - " + describe_intent(intent), "");
}

void TradingLogs::log_shutdown_position_left_protected(const Core::PositionIntent& intent) {
    log_message("SHUTDOWN: Position left open under exchange stop/target orders - " + describe_intent(intent), "");
}

void TradingLogs::log_indicator_snapshot(const std::string& symbol, const Core::IndicatorSnapshot& snapshot) {
    LOG_THREAD_SIGNAL_ANALYSIS_HEADER(symbol);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "bar=" << TimeUtils::format_epoch_milliseconds_utc(snapshot.timestamp_ms)
        << " close=" << snapshot.close_price
        << " ema_fast=" << snapshot.ema_fast << " ema_slow=" << snapshot.ema_slow;
    LOG_THREAD_CONTENT(oss.str());
    oss.str("");
    oss << "%K=" << snapshot.stoch_k << " %D=" << snapshot.stoch_d
        << " atr=" << snapshot.atr << " vol=" << snapshot.volume
        << " vol_avg=" << snapshot.vol_avg << " vol_std=" << snapshot.vol_std;
    LOG_THREAD_CONTENT(oss.str());
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_signal(const Core::SignalGeneratedEvent& event) {
    log_message(std::string("SIGNAL: ") + to_string(event.signal) + " at close " + format_price(event.close_price) +
                " (position " + to_string(event.position_side) + ", bar " +
                TimeUtils::format_epoch_milliseconds_utc(event.bar_timestamp_ms) + ")", "");
}

void TradingLogs::log_protective_trigger(const std::string& trigger_name, double trigger_price, double bar_extreme) {
    log_message("PROTECTIVE_TRIGGER: " + trigger_name + " " + format_price(trigger_price) +
                " crossed by bar extreme " + format_price(bar_extreme), "");
}

void TradingLogs::log_entries_halted(const std::string& reason) {
    log_message("ENTRIES_HALTED: " + reason, "");
}

void TradingLogs::log_order_submitted(const Core::OrderSubmittedEvent& event) {
    std::ostringstream oss;
    oss << "ORDER_SUBMITTED: " << to_string(event.side) << " " << format_quantity(event.quantity)
        << " " << to_string(event.type);
    if (event.trigger_price > 0.0) {
        oss << " trigger=" << format_price(event.trigger_price);
    }
    if (event.reduce_only) {
        oss << " reduce-only";
    }
    oss << " id=" << event.handle.order_id << " link=" << event.handle.client_order_id;
    log_message(oss.str(), "");
}

void TradingLogs::log_order_failed(const Core::OrderFailedEvent& event) {
    log_message(std::string("ORDER_FAILED: ") + to_string(event.side) + " " + format_quantity(event.quantity) + " " +
                to_string(event.type) + " - " + event.reason, "");
}

void TradingLogs::log_entry_discarded(const Core::EntryDiscardedEvent& event) {
    log_message(std::string("ENTRY_DISCARDED: ") + to_string(event.signal) + " - " + event.reason, "");
}

void TradingLogs::log_state_transition(const Core::StateTransitionEvent& event) {
    log_message(std::string("STATE_TRANSITION: ") + to_string(event.from_state) + " -> " + to_string(event.to_state) +
                " (" + event.reason + ") intent " + describe_intent(event.intent), "");
}

void TradingLogs::log_divergence(const Core::DivergenceEvent& event) {
    log_message("DIVERGENCE: " + event.description + " - intended " + describe_intent(event.intended) +
                ", exchange " + describe_exchange_position(event.reported) + "; state forced to exchange", "");
}

void TradingLogs::log_fatal(const Core::FatalConditionEvent& event) {
    log_message("FATAL: " + event.condition + " - " + event.message, "");
}

void TradingLogs::log_bar_rejected(const Core::BarRejectedEvent& event) {
    log_message("BAR_REJECTED: bar " + std::to_string(event.bar_timestamp_ms) + " not after " +
                std::to_string(event.last_timestamp_ms) + " - " + event.reason, "");
}

void TradingLogs::log_gateway_error(const std::string& operation, const std::string& error_message) {
    log_message("GATEWAY_ERROR: " + operation + " failed - " + error_message, "");
}

} // namespace Logging
} // namespace BybitTrader
