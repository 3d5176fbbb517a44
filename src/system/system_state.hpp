#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include "system/system_modules.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/connectivity_manager.hpp"

/**
 * @brief Central system state container
 * 
 * Contains configuration, module ownership and thread synchronization primitives.
 */
struct SystemState {
    // =========================================================================
    // THREAD SYNCHRONIZATION
    // =========================================================================
    std::mutex mtx;                    // Guards the sleeps of the worker threads
    std::condition_variable cv;        // Wakes worker threads and run() on shutdown

    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};              // Main system running flag
    std::atomic<bool> shutdown_requested{false};  // Set by the signal handler
    std::atomic<int> shutdown_signal{0};          // Signal that requested the shutdown

    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    BybitTrader::Config::SystemConfig config;                       // Complete system configuration
    std::unique_ptr<SystemModules> trading_modules;                 // All system modules
    BybitTrader::Core::ConnectivityManager connectivity_manager;    // Exchange reachability shared by feed and gateway
    std::shared_ptr<BybitTrader::Logging::LoggingContext> logging_context;  // Shared by every thread

    explicit SystemState(const BybitTrader::Config::SystemConfig& initial)
        : config(initial), connectivity_manager(config.timing) {
        if (config.strategy.symbol.empty()) {
            throw std::runtime_error("Target symbol is required but not configured");
        }
    }
};

#endif // SYSTEM_STATE_HPP
