#include "signal_generator.hpp"

namespace BybitTrader {
namespace Core {

SignalGenerator::SignalGenerator(const Config::StrategyConfig& strategy_config)
    : oversold_level(strategy_config.stoch_oversold_level),
      overbought_level(strategy_config.stoch_overbought_level),
      volume_std_multiplier(strategy_config.volume_std_multiplier) {}

bool SignalGenerator::volume_filter_passes(const IndicatorSnapshot& current) const {
    return current.volume >= current.vol_avg + volume_std_multiplier * current.vol_std;
}

bool SignalGenerator::bullish_stochastic_confirmation(const IndicatorSnapshot& previous, const IndicatorSnapshot& current) const {
    return previous.stoch_k < oversold_level &&
           current.stoch_k > previous.stoch_k &&
           previous.stoch_k <= previous.stoch_d &&
           current.stoch_k > current.stoch_d;
}

bool SignalGenerator::bearish_stochastic_confirmation(const IndicatorSnapshot& previous, const IndicatorSnapshot& current) const {
    return previous.stoch_k > overbought_level &&
           current.stoch_k < previous.stoch_k &&
           previous.stoch_k >= previous.stoch_d &&
           current.stoch_k < current.stoch_d;
}

Signal SignalGenerator::evaluate(const IndicatorSnapshot& previous, const IndicatorSnapshot& current, PositionSide position_side) const {
    if (!previous.signal_inputs_valid() || !current.signal_inputs_valid()) {
        return Signal::None;
    }

    if (position_side == PositionSide::Flat) {
        bool ema_cross_up = previous.ema_fast <= previous.ema_slow && current.ema_fast > current.ema_slow;
        bool ema_cross_down = previous.ema_fast >= previous.ema_slow && current.ema_fast < current.ema_slow;

        if (ema_cross_up && bullish_stochastic_confirmation(previous, current) && volume_filter_passes(current)) {
            return Signal::EnterLong;
        }
        if (ema_cross_down && bearish_stochastic_confirmation(previous, current) && volume_filter_passes(current)) {
            return Signal::EnterShort;
        }
        return Signal::None;
    }

    if (position_side == PositionSide::Long && current.ema_fast < current.ema_slow) {
        return Signal::ExitLong;
    }
    if (position_side == PositionSide::Short && current.ema_fast > current.ema_slow) {
        return Signal::ExitShort;
    }
    return Signal::None;
}

} // namespace Core
} // namespace BybitTrader
