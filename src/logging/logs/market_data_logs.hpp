#ifndef MARKET_DATA_LOGS_HPP
#define MARKET_DATA_LOGS_HPP

#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace BybitTrader {
namespace Logging {

// Kline feed and bar delivery logging.
class MarketDataLogs {
public:
    static void log_market_data_fetch_table(const std::string& symbol, const std::string& interval);
    static void log_history_loaded(const std::string& symbol, size_t bar_count, int requested_count);
    static void log_new_bars(const std::vector<Core::Bar>& bars);
    static void log_no_new_bars(const std::string& symbol);
    static void log_forming_bar_skipped(std::int64_t bar_timestamp_ms);
    static void log_feed_error(const std::string& error_message);
};

} // namespace Logging
} // namespace BybitTrader

#endif // MARKET_DATA_LOGS_HPP
