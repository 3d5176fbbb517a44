#ifndef RECONCILIATION_THREAD_HPP
#define RECONCILIATION_THREAD_HPP

#include "configs/timing_config.hpp"
#include "trader/trading_logic/position_state_machine.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/connectivity_manager.hpp"
#include <atomic>
#include <mutex>
#include <condition_variable>

namespace BybitTrader {
namespace Threads {

// Periodically forces the position intent to match the exchange.
struct ReconciliationThread {
    const Config::TimingConfig& timing;
    Core::PositionStateMachine& position_state_machine;
    Core::ConnectivityManager& connectivity_manager;
    Logging::LoggingContext& logging_context;
    std::mutex& state_mtx;
    std::condition_variable& state_cv;
    std::atomic<bool>& running;
    std::atomic<unsigned long>* iteration_counter {nullptr};

    ReconciliationThread(const Config::TimingConfig& timing_config,
                         Core::PositionStateMachine& state_machine,
                         Core::ConnectivityManager& connectivity_mgr,
                         Logging::LoggingContext& context,
                         std::mutex& mtx,
                         std::condition_variable& cv,
                         std::atomic<bool>& running_flag)
        : timing(timing_config), position_state_machine(state_machine), connectivity_manager(connectivity_mgr),
          logging_context(context), state_mtx(mtx), state_cv(cv), running(running_flag) {}

    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }

    void operator()();

private:
    void reconciliation_loop();
    bool wait_for_next_cycle();
};

} // namespace Threads
} // namespace BybitTrader

#endif // RECONCILIATION_THREAD_HPP
