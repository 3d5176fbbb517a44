#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/bybit/bybit_execution_gateway.hpp"
#include "api/bybit/bybit_kline_feed.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "threads/system_threads/market_data_thread.hpp"
#include "threads/system_threads/reconciliation_thread.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "trader/strategy_analysis/risk_sizer.hpp"
#include "trader/strategy_analysis/signal_generator.hpp"
#include "trader/trading_logic/logging_event_sink.hpp"
#include "trader/trading_logic/position_state_machine.hpp"

/**
 * @brief Runtime module container
 * 
 * Holds active system modules as smart pointers for centralized ownership.
 * Declaration order is construction order; later modules reference earlier ones.
 */
struct SystemModules {
    // =========================================================================
    // EXCHANGE ACCESS
    // =========================================================================
    std::unique_ptr<BybitTrader::API::BybitExecutionGateway> execution_gateway;  // Signed order and account calls
    std::unique_ptr<BybitTrader::API::BybitKlineFeed> market_data_feed;          // Closed kline polling

    // =========================================================================
    // CORE TRADING COMPONENTS
    // =========================================================================
    std::unique_ptr<BybitTrader::Core::LoggingEventSink> event_sink;                     // Trading events -> logs
    std::unique_ptr<BybitTrader::Core::RiskSizer> risk_sizer;                            // Position size and protective levels
    std::unique_ptr<BybitTrader::Core::IndicatorEngine> indicator_engine;                // Streaming indicators
    std::unique_ptr<BybitTrader::Core::SignalGenerator> signal_generator;                // Entry/exit rules
    std::unique_ptr<BybitTrader::Core::PositionStateMachine> position_state_machine;     // Position lifecycle
    std::unique_ptr<BybitTrader::Core::TradingCoordinator> trading_coordinator;          // Bar pipeline

    // =========================================================================
    // THREADING COMPONENTS
    // =========================================================================
    std::unique_ptr<BybitTrader::Threads::MarketDataThread> market_data_thread;          // Bar polling and processing
    std::unique_ptr<BybitTrader::Threads::ReconciliationThread> reconciliation_thread;   // Periodic exchange sync
    std::unique_ptr<BybitTrader::Threads::LoggingThread> logging_thread;                 // Async log writer
};

#endif // SYSTEM_MODULES_HPP
