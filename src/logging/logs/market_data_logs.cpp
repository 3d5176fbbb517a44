#include "market_data_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace BybitTrader {
namespace Logging {

void MarketDataLogs::log_market_data_fetch_table(const std::string& symbol, const std::string& interval) {
    log_message("================================================================================", "");
    log_message("                         MARKET DATA FEED - " + symbol + " " + interval + "m klines", "");
    log_message("================================================================================", "");
}

void MarketDataLogs::log_history_loaded(const std::string& symbol, size_t bar_count, int requested_count) {
    log_message("+-- HISTORY " + symbol, "");
    log_message("|   Closed bars loaded: " + std::to_string(bar_count) + " of " + std::to_string(requested_count) + " requested", "");
    log_message("+-- ", "");
}

void MarketDataLogs::log_new_bars(const std::vector<Core::Bar>& bars) {
    for (const Core::Bar& bar : bars) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "BAR: " << TimeUtils::format_epoch_milliseconds_utc(bar.timestamp_ms)
            << " O=" << bar.open_price << " H=" << bar.high_price
            << " L=" << bar.low_price << " C=" << bar.close_price
            << std::setprecision(4) << " V=" << bar.volume;
        log_message(oss.str(), "");
    }
}

void MarketDataLogs::log_no_new_bars(const std::string& symbol) {
    log_message("BAR: No new closed bar for " + symbol, "");
}

void MarketDataLogs::log_forming_bar_skipped(std::int64_t bar_timestamp_ms) {
    log_message("BAR: Skipping forming bar " + TimeUtils::format_epoch_milliseconds_utc(bar_timestamp_ms), "");
}

void MarketDataLogs::log_feed_error(const std::string& error_message) {
    log_message("ERROR: Market data feed error: " + error_message, "");
}

} // namespace Logging
} // namespace BybitTrader
