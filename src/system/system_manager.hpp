#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace BybitTrader {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Loads and validates configuration, creates the run log folder and the async logger.
SystemInitializationResult initialize();

// Starts the logging thread, configures leverage, warms up indicators, recovers any open
// position and starts the market data and reconciliation threads.
void startup(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<Logging::AsyncLogger> logger);

// Blocks until running is cleared or a shutdown is requested.
void run(SystemState& system_state);

// Stops and joins the workers, closes or leaves the position, then drains the logger.
void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<Logging::AsyncLogger> logger);

} // namespace System
} // namespace BybitTrader

#endif // SYSTEM_MANAGER_HPP
