#ifndef BYBIT_KLINE_FEED_HPP
#define BYBIT_KLINE_FEED_HPP

#include "api/general/market_data_feed_interface.hpp"
#include "configs/system_config.hpp"
#include "utils/connectivity_manager.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace BybitTrader {
namespace API {

constexpr int BYBIT_KLINE_MAX_LIMIT = 1000;

// Public /v5/market/kline polling. Only closed candles are delivered, each exactly once.
class BybitKlineFeed : public MarketDataFeedInterface {
private:
    const Config::SystemConfig& config;
    Core::ConnectivityManager& connectivity_manager;
    std::int64_t interval_milliseconds;
    std::int64_t last_delivered_timestamp_ms;

    std::vector<Core::Bar> fetch_klines(int limit);

public:
    BybitKlineFeed(const Config::SystemConfig& system_config, Core::ConnectivityManager& connectivity_mgr);

    std::vector<Core::Bar> fetch_history(int bar_count) override;
    std::vector<Core::Bar> poll_new_bars() override;
    std::string get_feed_name() const override;

};

// "1".."720" are minutes, "D", "W" and "M" are day, week and month. Throws std::runtime_error otherwise.
std::int64_t kline_interval_to_milliseconds(const std::string& interval);

// Drops candles whose close time (start + interval) is still in the future. Input and output oldest first.
std::vector<Core::Bar> drop_forming_bars(const std::vector<Core::Bar>& bars, std::int64_t now_ms, std::int64_t interval_ms);

} // namespace API
} // namespace BybitTrader

#endif // BYBIT_KLINE_FEED_HPP
