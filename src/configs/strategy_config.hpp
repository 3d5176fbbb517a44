#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include <string>

namespace BybitTrader {
namespace Config {

struct StrategyConfig {
    // ========================================================================
    // TARGET
    // ========================================================================

    std::string symbol = "BTCUSDT";                  // Perpetual contract traded by the bot
    std::string kline_interval = "15";               // Bar interval in exchange notation (minutes)

    // ========================================================================
    // TREND (EMA CROSSOVER)
    // ========================================================================

    int fast_ema = 8;                                // Fast EMA period
    int slow_ema = 21;                               // Slow EMA period

    // ========================================================================
    // MOMENTUM (STOCHASTIC OSCILLATOR)
    // ========================================================================

    int stoch_period = 14;                           // %K lookback (highest high / lowest low)
    int stoch_k_period = 3;                          // %D smoothing of %K
    double stoch_oversold_level = 20.0;              // %K below this is oversold
    double stoch_overbought_level = 80.0;            // %K above this is overbought

    // ========================================================================
    // VOLATILITY AND VOLUME
    // ========================================================================

    int atr_period = 14;                             // Wilder ATR period
    int volume_ma_period = 20;                       // Volume moving average window
    double volume_std_multiplier = 0.0;              // Entry needs volume >= avg + multiplier * std

    // ========================================================================
    // WARM-UP
    // ========================================================================

    int warmup_bars = 200;                           // Closed bars replayed into the indicators at startup
};

} // namespace Config
} // namespace BybitTrader

#endif // STRATEGY_CONFIG_HPP
