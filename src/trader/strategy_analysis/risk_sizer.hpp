#ifndef RISK_SIZER_HPP
#define RISK_SIZER_HPP

#include <memory>
#include <string>
#include "configs/risk_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace BybitTrader {
namespace Core {

// Produces the unrounded order quantity for an entry.
class SizingPolicy {
public:
    virtual ~SizingPolicy() = default;
    virtual double raw_quantity(const PositionSizingRequest& request) const = 0;
    virtual std::string name() const = 0;
};

// position_size contracts, optionally multiplied by leverage.
class FixedSizePolicy : public SizingPolicy {
public:
    FixedSizePolicy(double position_size, double leverage, bool scale_by_leverage);
    double raw_quantity(const PositionSizingRequest& request) const override;
    std::string name() const override { return "fixed"; }

private:
    double base_size;
    double leverage_multiplier;
};

// equity * fraction * leverage / entry_price.
class EquityFractionPolicy : public SizingPolicy {
public:
    EquityFractionPolicy(double equity_fraction, double leverage);
    double raw_quantity(const PositionSizingRequest& request) const override;
    std::string name() const override { return "equity_fraction"; }

private:
    double fraction;
    double leverage;
};

// Throws std::runtime_error for an unknown risk.sizing_policy.
std::unique_ptr<SizingPolicy> create_sizing_policy(const Config::RiskConfig& risk_config);

struct ProtectiveLevels {
    double stop_loss;
    double take_profit;
};

class RiskSizer {
public:
    explicit RiskSizer(const Config::RiskConfig& risk_config);
    RiskSizer(const Config::RiskConfig& risk_config, std::unique_ptr<SizingPolicy> sizing_policy);

    // Throws InsufficientEquity when the quantity floors to zero at qty_step, falls below
    // min_order_qty, or needs more margin than equity. Throws std::runtime_error on invalid input.
    PositionSizing size(const PositionSizingRequest& request) const;

    // stop = entry -/+ atr*atr_multiplier, take-profit = entry +/- stop_distance*risk_reward_ratio.
    ProtectiveLevels compute_protective_levels(PositionSide side, double entry_price, double atr) const;

    // Floors to the exchange increment.
    double round_down_to_step(double quantity) const;

    const SizingPolicy& policy() const { return *sizing_policy; }

private:
    Config::RiskConfig config;
    std::unique_ptr<SizingPolicy> sizing_policy;
};

} // namespace Core
} // namespace BybitTrader

#endif // RISK_SIZER_HPP
