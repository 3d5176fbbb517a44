#include "system_manager.hpp"
#include <chrono>
#include <cmath>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>
#include "configs/system_config.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logs/trading_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace BybitTrader::Logging;
using namespace BybitTrader::Threads;

namespace BybitTrader {
namespace System {

namespace {
    constexpr int RUN_LOOP_WAKEUP_MILLISECONDS = 200;
}

SystemInitializationResult initialize() {
    SystemInitializationResult initialization_result;

    // Minimal logging context first - config loading may already log
    auto early_logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*early_logging_context);

    try {
        Config::SystemConfig initial_config;
        int config_load_result = Config::load_system_config(initial_config);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error(std::string("Config load failed with result: ") + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }

        std::string validation_error_message;
        if (!Config::validate_config(initial_config, validation_error_message)) {
            SystemLogs::log_configuration_validated(false);
            SystemLogs::log_fatal_error(validation_error_message);
            throw std::runtime_error("System initialization failed: " + validation_error_message);
        }

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->logging_context = early_logging_context;

        initialization_result.logger = initialize_application_foundation(initialization_result.system_state->config);
        SystemLogs::log_configuration_validated(true);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        throw;
    }

    return initialization_result;
}

// ========================================================================
// MODULE CONSTRUCTION
// ========================================================================

static void create_trading_modules(SystemState& state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger) {
    auto modules = std::make_unique<SystemModules>();
    const Config::SystemConfig& config = state.config;

    modules->execution_gateway = std::make_unique<API::BybitExecutionGateway>(config, state.connectivity_manager);
    modules->market_data_feed = std::make_unique<API::BybitKlineFeed>(config, state.connectivity_manager);

    modules->event_sink = std::make_unique<Core::LoggingEventSink>();
    modules->risk_sizer = std::make_unique<Core::RiskSizer>(config.risk);
    modules->indicator_engine = std::make_unique<Core::IndicatorEngine>(config.strategy);
    modules->signal_generator = std::make_unique<Core::SignalGenerator>(config.strategy);

    Core::PositionStateMachineConstructionParams state_machine_params(config, *modules->execution_gateway,
                                                                      *modules->risk_sizer, *modules->event_sink);
    modules->position_state_machine = std::make_unique<Core::PositionStateMachine>(state_machine_params);

    Core::TradingCoordinatorConstructionParams coordinator_params(config, *modules->indicator_engine, *modules->signal_generator,
                                                                  *modules->position_state_machine, *modules->event_sink);
    modules->trading_coordinator = std::make_unique<Core::TradingCoordinator>(coordinator_params);

    modules->market_data_thread = std::make_unique<MarketDataThread>(config.timing, *modules->market_data_feed,
                                                                     *modules->trading_coordinator, state.connectivity_manager,
                                                                     *state.logging_context, state.mtx, state.cv, state.running);
    modules->market_data_thread->set_iteration_counter(thread_handles.market_iterations);

    modules->reconciliation_thread = std::make_unique<ReconciliationThread>(config.timing, *modules->position_state_machine,
                                                                            state.connectivity_manager, *state.logging_context,
                                                                            state.mtx, state.cv, state.running);
    modules->reconciliation_thread->set_iteration_counter(thread_handles.reconciliation_iterations);

    modules->logging_thread = std::make_unique<LoggingThread>(logger, *state.logging_context, config);
    modules->logging_thread->set_iteration_counter(thread_handles.logger_iterations);

    state.trading_modules = std::move(modules);
}

// ========================================================================
// STARTUP SEQUENCE
// ========================================================================

static void prepare_trading_state(SystemState& state) {
    SystemModules& modules = *state.trading_modules;
    const Config::SystemConfig& config = state.config;

    double initial_equity = modules.execution_gateway->query_account_equity();
    if (!std::isfinite(initial_equity) || initial_equity < 0.0) {
        throw std::runtime_error("Exchange reported an invalid account equity");
    }
    TradingLogs::log_startup(config, initial_equity);

    modules.execution_gateway->configure_leverage(config.risk.leverage);
    TradingLogs::log_leverage_configured(config.strategy.symbol, config.risk.leverage);

    std::vector<Core::Bar> history_bars = modules.market_data_feed->fetch_history(config.strategy.warmup_bars);
    modules.trading_coordinator->warm_up(history_bars);

    modules.position_state_machine->recover_from_exchange(modules.trading_coordinator->latest_valid_atr());
}

void startup(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }

    create_trading_modules(system_state, thread_handles, logger);
    SystemModules& modules = *system_state.trading_modules;

    // Logger first so startup output goes through the queue
    thread_handles.logger_thread = std::thread(std::ref(*modules.logging_thread));

    try {
        prepare_trading_state(system_state);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        throw;
    }

    int expected_thread_count = 3;
    int actual_thread_count = 1;
    try {
        thread_handles.market_thread = std::thread(std::ref(*modules.market_data_thread));
        ++actual_thread_count;
        thread_handles.reconciliation_thread = std::thread(std::ref(*modules.reconciliation_thread));
        ++actual_thread_count;
    } catch (const std::system_error& thread_exception_error) {
        SystemLogs::log_thread_startup_error(thread_exception_error.what());
        throw;
    }

    SystemLogs::log_threads_started(expected_thread_count, actual_thread_count);
    SystemLogs::log_startup_complete();
}

void run(SystemState& system_state) {
    // Timed wait: the signal handler can only set atomics, it cannot notify.
    std::unique_lock<std::mutex> state_lock(system_state.mtx);
    while (system_state.running.load() && !system_state.shutdown_requested.load()) {
        system_state.cv.wait_for(state_lock, std::chrono::milliseconds(RUN_LOOP_WAKEUP_MILLISECONDS));
    }
}

// ========================================================================
// SHUTDOWN SEQUENCE
// ========================================================================

static void join_if_running(std::thread& worker_thread) {
    if (worker_thread.joinable()) {
        worker_thread.join();
    }
}

void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger) {
    if (system_state.shutdown_signal.load() != 0) {
        SystemLogs::log_shutdown_requested(system_state.shutdown_signal.load());
    }

    {
        std::lock_guard<std::mutex> state_lock(system_state.mtx);
        system_state.running.store(false);
    }
    system_state.cv.notify_all();

    join_if_running(thread_handles.market_thread);
    join_if_running(thread_handles.reconciliation_thread);

    if (system_state.trading_modules && system_state.trading_modules->position_state_machine) {
        try {
            system_state.trading_modules->position_state_machine->shutdown(system_state.config.flags.close_position_on_shutdown);
        } catch (const Core::StuckPosition& stuck_exception_error) {
            SystemLogs::log_system_shutdown_error(stuck_exception_error.what());
        } catch (const std::runtime_error& runtime_exception_error) {
            SystemLogs::log_system_shutdown_error(runtime_exception_error.what());
        }
    }

    SystemLogs::log_shutdown_complete();

    if (logger) {
        shutdown_global_logger(*logger);
    }
    join_if_running(thread_handles.logger_thread);
}

} // namespace System
} // namespace BybitTrader
