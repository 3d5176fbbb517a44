#include "bybit_kline_feed.hpp"
#include "bybit_messages.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/market_data_logs.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace BybitTrader {
namespace API {

using BybitMessages::json;
using Logging::MarketDataLogs;

namespace {
    const char* KLINE_ENDPOINT = "/v5/market/kline";
    // Enough overlap to bridge a couple of missed polls.
    constexpr int POLL_KLINE_LIMIT = 5;
}

std::int64_t kline_interval_to_milliseconds(const std::string& interval) {
    if (interval == "D") return 24LL * 60LL * TimeUtils::MILLISECONDS_PER_MINUTE;
    if (interval == "W") return 7LL * 24LL * 60LL * TimeUtils::MILLISECONDS_PER_MINUTE;
    if (interval == "M") return 30LL * 24LL * 60LL * TimeUtils::MILLISECONDS_PER_MINUTE;

    if (interval.empty() || !std::all_of(interval.begin(), interval.end(),
                                         [](unsigned char character) { return std::isdigit(character) != 0; })) {
        throw std::runtime_error("Unsupported kline interval: '" + interval + "'");
    }
    int minutes = std::stoi(interval);
    if (minutes <= 0) {
        throw std::runtime_error("Unsupported kline interval: '" + interval + "'");
    }
    return static_cast<std::int64_t>(minutes) * TimeUtils::MILLISECONDS_PER_MINUTE;
}

std::vector<Core::Bar> drop_forming_bars(const std::vector<Core::Bar>& bars, std::int64_t now_ms, std::int64_t interval_ms) {
    std::vector<Core::Bar> closed_bars;
    closed_bars.reserve(bars.size());
    for (const Core::Bar& bar : bars) {
        if (bar.timestamp_ms + interval_ms <= now_ms) {
            closed_bars.push_back(bar);
        } else {
            MarketDataLogs::log_forming_bar_skipped(bar.timestamp_ms);
        }
    }
    return closed_bars;
}

BybitKlineFeed::BybitKlineFeed(const Config::SystemConfig& system_config, Core::ConnectivityManager& connectivity_mgr)
    : config(system_config),
      connectivity_manager(connectivity_mgr),
      interval_milliseconds(kline_interval_to_milliseconds(system_config.strategy.kline_interval)),
      last_delivered_timestamp_ms(0) {}

std::string BybitKlineFeed::get_feed_name() const {
    return "bybit-kline-" + config.strategy.symbol + "-" + config.strategy.kline_interval;
}

std::vector<Core::Bar> BybitKlineFeed::fetch_klines(int limit) {
    std::string request_url = config.api.active_base_url() + KLINE_ENDPOINT +
                              "?category=" + config.api.category +
                              "&symbol=" + config.strategy.symbol +
                              "&interval=" + config.strategy.kline_interval +
                              "&limit=" + std::to_string(limit);

    Core::HttpRequest http_request(request_url, config.api.retry_count, config.api.timeout_seconds,
                                   config.api.enable_ssl_verification, config.api.rate_limit_delay_ms);
    std::string response_body;
    try {
        response_body = Core::http_get(http_request, connectivity_manager);
    } catch (const std::runtime_error& transport_error) {
        throw Core::GatewayError(std::string("GET ") + KLINE_ENDPOINT + ": " + transport_error.what());
    }

    json response = BybitMessages::parse_response(response_body, "kline");
    std::vector<Core::Bar> bars = BybitMessages::parse_kline_list(BybitMessages::require_success(response, "kline"));
    return drop_forming_bars(bars, TimeUtils::get_current_epoch_milliseconds(), interval_milliseconds);
}

std::vector<Core::Bar> BybitKlineFeed::fetch_history(int bar_count) {
    if (bar_count <= 0) {
        return {};
    }
    MarketDataLogs::log_market_data_fetch_table(config.strategy.symbol, config.strategy.kline_interval);

    // One extra for the forming candle that gets dropped.
    int request_limit = std::min(bar_count + 1, BYBIT_KLINE_MAX_LIMIT);
    std::vector<Core::Bar> closed_bars = fetch_klines(request_limit);

    if (closed_bars.size() > static_cast<size_t>(bar_count)) {
        closed_bars.erase(closed_bars.begin(), closed_bars.end() - bar_count);
    }
    if (!closed_bars.empty()) {
        last_delivered_timestamp_ms = std::max(last_delivered_timestamp_ms, closed_bars.back().timestamp_ms);
    }

    MarketDataLogs::log_history_loaded(config.strategy.symbol, closed_bars.size(), bar_count);
    return closed_bars;
}

std::vector<Core::Bar> BybitKlineFeed::poll_new_bars() {
    std::vector<Core::Bar> closed_bars = fetch_klines(POLL_KLINE_LIMIT);

    std::vector<Core::Bar> new_bars;
    for (const Core::Bar& bar : closed_bars) {
        if (bar.timestamp_ms > last_delivered_timestamp_ms) {
            new_bars.push_back(bar);
        }
    }

    if (new_bars.empty()) {
        MarketDataLogs::log_no_new_bars(config.strategy.symbol);
        return new_bars;
    }

    last_delivered_timestamp_ms = new_bars.back().timestamp_ms;
    MarketDataLogs::log_new_bars(new_bars);
    return new_bars;
}

} // namespace API
} // namespace BybitTrader
