#include "indicators.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace BybitTrader {
namespace Core {

namespace {
    int require_positive_period(int period, const char* name) {
        if (period < 1) {
            throw std::invalid_argument(std::string(name) + " must be >= 1, got " + std::to_string(period));
        }
        return period;
    }
}

ExponentialMovingAverage::ExponentialMovingAverage(int ema_period)
    : period(require_positive_period(ema_period, "EMA period")),
      smoothing_factor(2.0 / (ema_period + 1.0)),
      seed_count(0), seed_sum(0.0), current_value(0.0), valid(false) {}

void ExponentialMovingAverage::update(double close_price) {
    if (valid) {
        current_value = close_price * smoothing_factor + current_value * (1.0 - smoothing_factor);
        return;
    }
    seed_sum += close_price;
    ++seed_count;
    if (seed_count == period) {
        current_value = seed_sum / period;
        valid = true;
    }
}

StochasticOscillator::StochasticOscillator(int stoch_period, int stoch_k_period)
    : highs(require_positive_period(stoch_period, "Stochastic period")),
      lows(stoch_period),
      k_values(require_positive_period(stoch_k_period, "Stochastic %K smoothing period")),
      current_k(0.0), current_d(0.0) {}

void StochasticOscillator::update(const Bar& bar) {
    highs.push(bar.high_price);
    lows.push(bar.low_price);
    if (!highs.full()) {
        return;
    }

    double highest_high = highs[0];
    double lowest_low = lows[0];
    for (std::size_t window_index = 1; window_index < highs.size(); ++window_index) {
        highest_high = std::max(highest_high, highs[window_index]);
        lowest_low = std::min(lowest_low, lows[window_index]);
    }

    double price_range = highest_high - lowest_low;
    if (price_range <= 0.0) {
        current_k = 50.0;
    } else {
        current_k = std::clamp(100.0 * (bar.close_price - lowest_low) / price_range, 0.0, 100.0);
    }

    k_values.push(current_k);
    if (k_values.full()) {
        double k_sum = 0.0;
        for (std::size_t k_index = 0; k_index < k_values.size(); ++k_index) {
            k_sum += k_values[k_index];
        }
        current_d = k_sum / static_cast<double>(k_values.size());
    }
}

AverageTrueRange::AverageTrueRange(int atr_period)
    : period(require_positive_period(atr_period, "ATR period")),
      has_previous_close(false), previous_close(0.0),
      seed_count(0), seed_sum(0.0), current_value(0.0), valid(false) {}

void AverageTrueRange::update(const Bar& bar) {
    double true_range = bar.high_price - bar.low_price;
    if (has_previous_close) {
        true_range = std::max({true_range,
                               std::abs(bar.high_price - previous_close),
                               std::abs(bar.low_price - previous_close)});
    }
    previous_close = bar.close_price;
    has_previous_close = true;

    if (valid) {
        current_value = (current_value * (period - 1) + true_range) / period;
        return;
    }
    seed_sum += true_range;
    ++seed_count;
    if (seed_count == period) {
        current_value = seed_sum / period;
        valid = true;
    }
}

VolumeAverage::VolumeAverage(int volume_ma_period)
    : volumes(require_positive_period(volume_ma_period, "Volume MA period")),
      current_average(0.0), current_std(0.0) {}

void VolumeAverage::update(double volume) {
    volumes.push(volume);
    if (!volumes.full()) {
        return;
    }

    double volume_sum = 0.0;
    for (std::size_t volume_index = 0; volume_index < volumes.size(); ++volume_index) {
        volume_sum += volumes[volume_index];
    }
    current_average = volume_sum / static_cast<double>(volumes.size());

    if (volumes.size() < 2) {
        current_std = 0.0;
        return;
    }
    double squared_deviation_sum = 0.0;
    for (std::size_t volume_index = 0; volume_index < volumes.size(); ++volume_index) {
        double deviation = volumes[volume_index] - current_average;
        squared_deviation_sum += deviation * deviation;
    }
    current_std = std::sqrt(squared_deviation_sum / static_cast<double>(volumes.size() - 1));
}

IndicatorEngine::IndicatorEngine(const Config::StrategyConfig& strategy_config)
    : ema_fast(strategy_config.fast_ema),
      ema_slow(strategy_config.slow_ema),
      stochastic(strategy_config.stoch_period, strategy_config.stoch_k_period),
      atr(strategy_config.atr_period),
      volume_average(strategy_config.volume_ma_period),
      bars_processed(0),
      last_timestamp(0) {}

IndicatorSnapshot IndicatorEngine::update(const Bar& bar) {
    if (bars_processed > 0 && bar.timestamp_ms <= last_timestamp) {
        throw OutOfOrderBar(bar.timestamp_ms, last_timestamp);
    }

    ema_fast.update(bar.close_price);
    ema_slow.update(bar.close_price);
    stochastic.update(bar);
    atr.update(bar);
    volume_average.update(bar.volume);

    IndicatorSnapshot snapshot;
    snapshot.timestamp_ms = bar.timestamp_ms;
    snapshot.close_price = bar.close_price;
    snapshot.volume = bar.volume;

    snapshot.ema_fast_valid = ema_fast.is_valid();
    snapshot.ema_fast = ema_fast.value();
    snapshot.ema_slow_valid = ema_slow.is_valid();
    snapshot.ema_slow = ema_slow.value();
    snapshot.stoch_k_valid = stochastic.k_valid();
    snapshot.stoch_k = stochastic.k_value();
    snapshot.stoch_d_valid = stochastic.d_valid();
    snapshot.stoch_d = stochastic.d_value();
    snapshot.atr_valid = atr.is_valid();
    snapshot.atr = atr.value();
    snapshot.vol_avg_valid = volume_average.is_valid();
    snapshot.vol_avg = volume_average.average();
    snapshot.vol_std = volume_average.standard_deviation();

    previous = current;
    current = snapshot;
    last_timestamp = bar.timestamp_ms;
    ++bars_processed;
    return snapshot;
}

} // namespace Core
} // namespace BybitTrader
