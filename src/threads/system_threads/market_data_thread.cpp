/**
 * Market data thread.
 * Polls closed bars and drives indicators, signals and the position state machine.
 */
#include "market_data_thread.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/market_data_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logs/trading_logs.hpp"
#include <chrono>
#include <thread>
#include <vector>

using namespace BybitTrader::Threads;
using namespace BybitTrader::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void MarketDataThread::operator()() {
    set_logging_context(logging_context);
    set_log_thread_tag("MARKET");

    try {
        std::this_thread::sleep_for(std::chrono::milliseconds(timing.thread_startup_sequence_delay_milliseconds));
        SystemLogs::log_thread_started("MARKET_DATA");
        market_data_loop();
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("Market data thread exited: ") + exception_error.what());
        running.store(false);
        state_cv.notify_all();
    }

    SystemLogs::log_thread_stopped("MARKET_DATA", iteration_counter ? iteration_counter->load() : 0UL);
}

void MarketDataThread::market_data_loop() {
    while (running.load()) {
        if (!connectivity_manager.should_attempt_connection()) {
            SystemLogs::log_connectivity_issue(connectivity_manager.get_status_string(),
                                               connectivity_manager.get_seconds_until_retry());
        } else {
            poll_and_process_bars();
        }

        if (iteration_counter) {
            iteration_counter->fetch_add(1);
        }
        wait_for_next_poll();
    }
}

void MarketDataThread::wait_for_next_poll() {
    std::unique_lock<std::mutex> state_lock(state_mtx);
    state_cv.wait_for(state_lock, std::chrono::seconds(timing.thread_market_data_poll_interval_sec),
                      [this] { return !running.load(); });
}

// ========================================================================
// BAR PROCESSING
// ========================================================================

void MarketDataThread::poll_and_process_bars() {
    std::vector<Core::Bar> new_bars;
    try {
        new_bars = market_data_feed.poll_new_bars();
    } catch (const Core::GatewayError& gateway_exception_error) {
        MarketDataLogs::log_feed_error(gateway_exception_error.what());
        return;
    } catch (const std::runtime_error& runtime_exception_error) {
        MarketDataLogs::log_feed_error(runtime_exception_error.what());
        return;
    }

    for (const Core::Bar& bar : new_bars) {
        if (!running.load()) {
            break;
        }
        try {
            trading_coordinator.process_bar(bar);
        } catch (const Core::StuckPosition& stuck_exception_error) {
            // Entries stay halted; reconciliation clears it once the exchange reports flat.
            SystemLogs::log_fatal_error(stuck_exception_error.what());
        } catch (const Core::GatewayError& gateway_exception_error) {
            TradingLogs::log_gateway_error("process_bar", gateway_exception_error.what());
        } catch (const std::runtime_error& runtime_exception_error) {
            SystemLogs::log_fatal_error(std::string("Bar processing failed: ") + runtime_exception_error.what());
        }
    }
}
