#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <cstdint>
#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "rolling_window.hpp"

namespace BybitTrader {
namespace Core {

// EMA seeded with the SMA of the first `period` closes, then close*k + prev*(1-k), k = 2/(period+1).
class ExponentialMovingAverage {
public:
    explicit ExponentialMovingAverage(int ema_period);

    void update(double close_price);
    bool is_valid() const { return valid; }
    double value() const { return current_value; }

private:
    int period;
    double smoothing_factor;
    int seed_count;
    double seed_sum;
    double current_value;
    bool valid;
};

// %K = 100*(close-LL)/(HH-LL) over stoch_period (flat range -> 50), %D = SMA of %K over stoch_k_period.
class StochasticOscillator {
public:
    StochasticOscillator(int stoch_period, int stoch_k_period);

    void update(const Bar& bar);
    bool k_valid() const { return highs.full(); }
    bool d_valid() const { return k_values.full(); }
    double k_value() const { return current_k; }
    double d_value() const { return current_d; }

private:
    RollingWindow<double> highs;
    RollingWindow<double> lows;
    RollingWindow<double> k_values;
    double current_k;
    double current_d;
};

// Wilder ATR. First true range is high-low, first ATR is the SMA of `period` true ranges.
class AverageTrueRange {
public:
    explicit AverageTrueRange(int atr_period);

    void update(const Bar& bar);
    bool is_valid() const { return valid; }
    double value() const { return current_value; }

private:
    int period;
    bool has_previous_close;
    double previous_close;
    int seed_count;
    double seed_sum;
    double current_value;
    bool valid;
};

// SMA and sample standard deviation of volume over volume_ma_period.
class VolumeAverage {
public:
    explicit VolumeAverage(int volume_ma_period);

    void update(double volume);
    bool is_valid() const { return volumes.full(); }
    double average() const { return current_average; }
    double standard_deviation() const { return current_std; }

private:
    RollingWindow<double> volumes;
    double current_average;
    double current_std;
};

/**
 * Owns every rolling indicator for one symbol. Feed closed bars in strictly increasing
 * timestamp order; each update returns the new snapshot and keeps the previous one.
 */
class IndicatorEngine {
public:
    explicit IndicatorEngine(const Config::StrategyConfig& strategy_config);

    // Throws OutOfOrderBar (no state change) when bar.timestamp_ms <= last processed timestamp.
    IndicatorSnapshot update(const Bar& bar);

    const IndicatorSnapshot& current_snapshot() const { return current; }
    const IndicatorSnapshot& previous_snapshot() const { return previous; }
    bool has_previous_snapshot() const { return bars_processed >= 2; }
    long long processed_bar_count() const { return bars_processed; }
    std::int64_t last_timestamp_ms() const { return last_timestamp; }

private:
    ExponentialMovingAverage ema_fast;
    ExponentialMovingAverage ema_slow;
    StochasticOscillator stochastic;
    AverageTrueRange atr;
    VolumeAverage volume_average;

    IndicatorSnapshot current;
    IndicatorSnapshot previous;
    long long bars_processed;
    std::int64_t last_timestamp;
};

} // namespace Core
} // namespace BybitTrader

#endif // INDICATORS_HPP
