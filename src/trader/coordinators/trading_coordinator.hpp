#ifndef TRADING_COORDINATOR_HPP
#define TRADING_COORDINATOR_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "trader/strategy_analysis/signal_generator.hpp"
#include "trader/trading_logic/position_state_machine.hpp"
#include "trader/trading_logic/trading_events.hpp"
#include <mutex>
#include <optional>
#include <vector>

namespace BybitTrader {
namespace Core {

struct TradingCoordinatorConstructionParams {
    const Config::SystemConfig& system_config;
    IndicatorEngine& indicator_engine_ref;
    const SignalGenerator& signal_generator_ref;
    PositionStateMachine& position_state_machine_ref;
    TradingEventSink& event_sink_ref;

    TradingCoordinatorConstructionParams(const Config::SystemConfig& config, IndicatorEngine& indicator_engine,
                                         const SignalGenerator& signal_generator, PositionStateMachine& position_state_machine,
                                         TradingEventSink& event_sink)
        : system_config(config), indicator_engine_ref(indicator_engine), signal_generator_ref(signal_generator),
          position_state_machine_ref(position_state_machine), event_sink_ref(event_sink) {}
};

struct BarProcessingResult {
    bool accepted;
    Signal signal;
    PositionState state_after;
};

/**
 * Runs one closed bar through indicators -> signal -> position state machine.
 * Bars are processed one at a time; StuckPosition from the state machine propagates.
 */
class TradingCoordinator {
public:
    explicit TradingCoordinator(const TradingCoordinatorConstructionParams& construction_params);

    // Replays history into the indicators only. Returns the number of bars accepted.
    int warm_up(const std::vector<Bar>& history_bars);

    BarProcessingResult process_bar(const Bar& bar);

    std::optional<double> latest_valid_atr() const;

private:
    const Config::SystemConfig& config;
    IndicatorEngine& indicator_engine;
    const SignalGenerator& signal_generator;
    PositionStateMachine& position_state_machine;
    TradingEventSink& event_sink;
    mutable std::mutex pipeline_mutex;
};

} // namespace Core
} // namespace BybitTrader

#endif // TRADING_COORDINATOR_HPP
