#include "risk_sizer.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace BybitTrader {
namespace Core {

namespace {
    // Absorbs representation error so 0.003/0.001 floors to 3, not 2.
    constexpr double STEP_ROUNDING_EPSILON = 1e-9;

    std::string format_quantity(double quantity) {
        std::ostringstream quantity_stream;
        quantity_stream << quantity;
        return quantity_stream.str();
    }
}

FixedSizePolicy::FixedSizePolicy(double position_size, double leverage, bool scale_by_leverage)
    : base_size(position_size), leverage_multiplier(scale_by_leverage ? leverage : 1.0) {}

double FixedSizePolicy::raw_quantity(const PositionSizingRequest& request) const {
    (void)request;
    return base_size * leverage_multiplier;
}

EquityFractionPolicy::EquityFractionPolicy(double equity_fraction, double leverage_value)
    : fraction(equity_fraction), leverage(leverage_value) {}

double EquityFractionPolicy::raw_quantity(const PositionSizingRequest& request) const {
    return request.equity * fraction * leverage / request.entry_price;
}

std::unique_ptr<SizingPolicy> create_sizing_policy(const Config::RiskConfig& risk_config) {
    if (risk_config.sizing_policy == "fixed") {
        return std::make_unique<FixedSizePolicy>(risk_config.position_size, risk_config.leverage, risk_config.scale_size_by_leverage);
    }
    if (risk_config.sizing_policy == "equity_fraction") {
        return std::make_unique<EquityFractionPolicy>(risk_config.equity_fraction, risk_config.leverage);
    }
    throw std::runtime_error("Unknown sizing policy: " + risk_config.sizing_policy);
}

RiskSizer::RiskSizer(const Config::RiskConfig& risk_config)
    : RiskSizer(risk_config, create_sizing_policy(risk_config)) {}

RiskSizer::RiskSizer(const Config::RiskConfig& risk_config, std::unique_ptr<SizingPolicy> policy)
    : config(risk_config), sizing_policy(std::move(policy)) {
    if (!sizing_policy) {
        throw std::runtime_error("RiskSizer requires a sizing policy");
    }
    if (config.qty_step <= 0.0) {
        throw std::runtime_error("qty_step must be greater than 0");
    }
    if (config.leverage < 1.0) {
        throw std::runtime_error("leverage must be >= 1");
    }
}

double RiskSizer::round_down_to_step(double quantity) const {
    double step_count = std::floor(quantity / config.qty_step + STEP_ROUNDING_EPSILON);
    if (step_count <= 0.0) {
        return 0.0;
    }
    return step_count * config.qty_step;
}

ProtectiveLevels RiskSizer::compute_protective_levels(PositionSide side, double entry_price, double atr) const {
    if (side == PositionSide::Flat) {
        throw std::runtime_error("Protective levels requested for a flat position");
    }
    if (!(entry_price > 0.0) || !std::isfinite(entry_price)) {
        throw std::runtime_error("Invalid entry price for protective levels: " + std::to_string(entry_price));
    }
    if (!(atr > 0.0) || !std::isfinite(atr)) {
        throw std::runtime_error("Invalid ATR for protective levels: " + std::to_string(atr));
    }

    double stop_distance = atr * config.atr_multiplier;
    double target_distance = stop_distance * config.risk_reward_ratio;

    ProtectiveLevels levels;
    if (side == PositionSide::Long) {
        levels.stop_loss = entry_price - stop_distance;
        levels.take_profit = entry_price + target_distance;
    } else {
        levels.stop_loss = entry_price + stop_distance;
        levels.take_profit = entry_price - target_distance;
    }
    return levels;
}

PositionSizing RiskSizer::size(const PositionSizingRequest& request) const {
    ProtectiveLevels levels = compute_protective_levels(request.side, request.entry_price, request.atr);

    if (!std::isfinite(request.equity) || request.equity <= 0.0) {
        throw InsufficientEquity("account equity " + std::to_string(request.equity) + " is not positive");
    }

    double quantity = round_down_to_step(sizing_policy->raw_quantity(request));
    if (quantity <= 0.0) {
        throw InsufficientEquity("size rounds to zero at qty_step " + format_quantity(config.qty_step));
    }
    if (quantity + STEP_ROUNDING_EPSILON < config.min_order_qty) {
        throw InsufficientEquity("size " + format_quantity(quantity) + " below minimum order quantity " +
                                 format_quantity(config.min_order_qty));
    }

    double required_margin = quantity * request.entry_price / config.leverage;
    if (required_margin > request.equity) {
        throw InsufficientEquity("size " + format_quantity(quantity) + " needs margin " + std::to_string(required_margin) +
                                 " but equity is " + std::to_string(request.equity));
    }

    PositionSizing sizing;
    sizing.size = quantity;
    sizing.stop_loss = levels.stop_loss;
    sizing.take_profit = levels.take_profit;
    return sizing;
}

} // namespace Core
} // namespace BybitTrader
