/**
 * Reconciliation thread.
 * Queries the exchange position on a fixed interval and lets the state machine resolve divergence.
 */
#include "reconciliation_thread.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logs/trading_logs.hpp"
#include <chrono>
#include <thread>

using namespace BybitTrader::Threads;
using namespace BybitTrader::Logging;

void ReconciliationThread::operator()() {
    set_logging_context(logging_context);
    set_log_thread_tag("RECON");

    try {
        std::this_thread::sleep_for(std::chrono::milliseconds(timing.thread_startup_sequence_delay_milliseconds));
        SystemLogs::log_thread_started("RECONCILIATION");
        reconciliation_loop();
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("Reconciliation thread exited: ") + exception_error.what());
    }

    SystemLogs::log_thread_stopped("RECONCILIATION", iteration_counter ? iteration_counter->load() : 0UL);
}

void ReconciliationThread::reconciliation_loop() {
    // The first cycle waits a full interval; startup recovery already matched the exchange.
    while (wait_for_next_cycle()) {
        if (!connectivity_manager.should_attempt_connection()) {
            SystemLogs::log_connectivity_issue(connectivity_manager.get_status_string(),
                                               connectivity_manager.get_seconds_until_retry());
            continue;
        }

        try {
            position_state_machine.reconcile();
        } catch (const Core::GatewayError& gateway_exception_error) {
            TradingLogs::log_gateway_error("reconcile", gateway_exception_error.what());
        } catch (const std::runtime_error& runtime_exception_error) {
            SystemLogs::log_system_warning(std::string("Reconciliation failed: ") + runtime_exception_error.what());
        }

        if (iteration_counter) {
            iteration_counter->fetch_add(1);
        }
    }
}

bool ReconciliationThread::wait_for_next_cycle() {
    std::unique_lock<std::mutex> state_lock(state_mtx);
    state_cv.wait_for(state_lock, std::chrono::seconds(timing.thread_reconciliation_interval_sec),
                      [this] { return !running.load(); });
    return running.load();
}
