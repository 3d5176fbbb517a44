#ifndef MARKET_DATA_THREAD_HPP
#define MARKET_DATA_THREAD_HPP

#include "configs/timing_config.hpp"
#include "api/general/market_data_feed_interface.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/connectivity_manager.hpp"
#include <atomic>
#include <mutex>
#include <condition_variable>

namespace BybitTrader {
namespace Threads {

// Polls the kline feed and pushes each new closed bar through the trading pipeline.
struct MarketDataThread {
    const Config::TimingConfig& timing;
    API::MarketDataFeedInterface& market_data_feed;
    Core::TradingCoordinator& trading_coordinator;
    Core::ConnectivityManager& connectivity_manager;
    Logging::LoggingContext& logging_context;
    std::mutex& state_mtx;
    std::condition_variable& state_cv;
    std::atomic<bool>& running;
    std::atomic<unsigned long>* iteration_counter {nullptr};

    MarketDataThread(const Config::TimingConfig& timing_config,
                     API::MarketDataFeedInterface& feed,
                     Core::TradingCoordinator& coordinator,
                     Core::ConnectivityManager& connectivity_mgr,
                     Logging::LoggingContext& context,
                     std::mutex& mtx,
                     std::condition_variable& cv,
                     std::atomic<bool>& running_flag)
        : timing(timing_config), market_data_feed(feed), trading_coordinator(coordinator),
          connectivity_manager(connectivity_mgr), logging_context(context),
          state_mtx(mtx), state_cv(cv), running(running_flag) {}

    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }

    // Thread entrypoint
    void operator()();

    // One poll: fetch new bars and process them in order. Never throws.
    void poll_and_process_bars();

private:
    void market_data_loop();
    void wait_for_next_poll();
};

} // namespace Threads
} // namespace BybitTrader

#endif // MARKET_DATA_THREAD_HPP
