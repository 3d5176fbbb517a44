#ifndef SIGNAL_GENERATOR_HPP
#define SIGNAL_GENERATOR_HPP

#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace BybitTrader {
namespace Core {

/**
 * EMA crossover entries confirmed by the stochastic oscillator and a volume filter,
 * EMA level exits. Stateless apart from the configured thresholds.
 *
 * Precedence (first match wins):
 *   invalid inputs -> None
 *   Flat + cross up + oversold %K turning up + volume   -> EnterLong
 *   Flat + cross down + overbought %K turning down + volume -> EnterShort
 *   Long + fast < slow  -> ExitLong
 *   Short + fast > slow -> ExitShort
 */
class SignalGenerator {
public:
    explicit SignalGenerator(const Config::StrategyConfig& strategy_config);

    Signal evaluate(const IndicatorSnapshot& previous, const IndicatorSnapshot& current, PositionSide position_side) const;

    bool volume_filter_passes(const IndicatorSnapshot& current) const;
    bool bullish_stochastic_confirmation(const IndicatorSnapshot& previous, const IndicatorSnapshot& current) const;
    bool bearish_stochastic_confirmation(const IndicatorSnapshot& previous, const IndicatorSnapshot& current) const;

private:
    double oversold_level;
    double overbought_level;
    double volume_std_multiplier;
};

} // namespace Core
} // namespace BybitTrader

#endif // SIGNAL_GENERATOR_HPP
