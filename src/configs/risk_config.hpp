// RiskConfig.hpp
#ifndef RISK_CONFIG_HPP
#define RISK_CONFIG_HPP

#include <string>

namespace BybitTrader {
namespace Config {

struct RiskConfig {
    double leverage = 1.0;                 // Exchange leverage, also scales equity-fraction sizing
    double position_size = 0.001;          // Base order quantity in contracts (fixed policy)
    bool scale_size_by_leverage = false;   // Fixed policy: multiply position_size by leverage
    double risk_reward_ratio = 2.0;        // Take-profit distance as a multiple of the stop distance
    double atr_multiplier = 1.5;           // Stop distance = ATR * atr_multiplier

    // Sizing policy: "fixed" or "equity_fraction"
    std::string sizing_policy = "fixed";
    double equity_fraction = 0.1;          // Share of equity committed as margin (equity_fraction policy)

    // Exchange instrument constraints
    double qty_step = 0.001;               // Minimum order increment
    double min_order_qty = 0.001;          // Minimum order quantity

    // Reconciliation tolerance between intended and reported size
    double size_tolerance = 0.0000001;
};

} // namespace Config
} // namespace BybitTrader

#endif // RISK_CONFIG_HPP
