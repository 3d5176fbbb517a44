#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "api_config.hpp"
#include "strategy_config.hpp"
#include "risk_config.hpp"
#include "timing_config.hpp"
#include "logging_config.hpp"

namespace BybitTrader {
namespace Config {

struct FlagsConfig {
    bool close_position_on_shutdown = false;   // Flatten the open position before exiting
};

/**
 * Main trading system configuration.
 * Loaded once at startup and passed by const reference afterwards.
 */
struct SystemConfig {
    SystemConfig() {}

    ApiConfig api;                 // Exchange credentials, endpoints and HTTP settings
    StrategyConfig strategy;       // Symbol, indicator periods and signal thresholds
    RiskConfig risk;               // Sizing policy, leverage and stop/target parameters
    TimingConfig timing;           // Polling intervals, order confirmation timeouts
    LoggingConfig logging;         // Log file naming
    FlagsConfig flags;             // Behaviour switches
};

} // namespace Config
} // namespace BybitTrader

#endif // SYSTEM_CONFIG_HPP
