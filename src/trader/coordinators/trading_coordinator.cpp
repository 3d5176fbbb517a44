#include "trading_coordinator.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "logging/logs/trading_logs.hpp"

namespace BybitTrader {
namespace Core {

using Logging::TradingLogs;

TradingCoordinator::TradingCoordinator(const TradingCoordinatorConstructionParams& construction_params)
    : config(construction_params.system_config),
      indicator_engine(construction_params.indicator_engine_ref),
      signal_generator(construction_params.signal_generator_ref),
      position_state_machine(construction_params.position_state_machine_ref),
      event_sink(construction_params.event_sink_ref) {}

int TradingCoordinator::warm_up(const std::vector<Bar>& history_bars) {
    std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex);

    int bars_accepted = 0;
    for (const Bar& history_bar : history_bars) {
        try {
            indicator_engine.update(history_bar);
            ++bars_accepted;
        } catch (const OutOfOrderBar& out_of_order_error) {
            event_sink.on_bar_rejected(BarRejectedEvent{out_of_order_error.bar_timestamp, out_of_order_error.last_timestamp,
                                                        "history bar out of order"});
        }
    }

    if (bars_accepted > 0) {
        TradingLogs::log_warmup_complete(bars_accepted, indicator_engine.current_snapshot());
    }
    return bars_accepted;
}

BarProcessingResult TradingCoordinator::process_bar(const Bar& bar) {
    std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex);

    IndicatorSnapshot snapshot;
    try {
        snapshot = indicator_engine.update(bar);
    } catch (const OutOfOrderBar& out_of_order_error) {
        event_sink.on_bar_rejected(BarRejectedEvent{out_of_order_error.bar_timestamp, out_of_order_error.last_timestamp,
                                                    out_of_order_error.what()});
        return BarProcessingResult{false, Signal::None, position_state_machine.state()};
    }

    TradingLogs::log_indicator_snapshot(config.strategy.symbol, snapshot);

    Signal signal = Signal::None;
    PositionSide position_side = position_state_machine.current_side();
    if (indicator_engine.has_previous_snapshot()) {
        signal = signal_generator.evaluate(indicator_engine.previous_snapshot(), snapshot, position_side);
    }
    if (signal != Signal::None) {
        event_sink.on_signal_generated(SignalGeneratedEvent{bar.timestamp_ms, signal, position_side, bar.close_price});
    }

    position_state_machine.on_bar(BarDecisionRequest(bar, snapshot, signal));
    return BarProcessingResult{true, signal, position_state_machine.state()};
}

std::optional<double> TradingCoordinator::latest_valid_atr() const {
    std::lock_guard<std::mutex> pipeline_lock(pipeline_mutex);
    const IndicatorSnapshot& snapshot = indicator_engine.current_snapshot();
    if (snapshot.atr_valid && snapshot.atr > 0.0) {
        return snapshot.atr;
    }
    return std::nullopt;
}

} // namespace Core
} // namespace BybitTrader
