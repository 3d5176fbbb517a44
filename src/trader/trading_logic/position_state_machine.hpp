#ifndef POSITION_STATE_MACHINE_HPP
#define POSITION_STATE_MACHINE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <atomic>
#include "configs/system_config.hpp"
#include "api/general/execution_gateway_interface.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/risk_sizer.hpp"
#include "trading_events.hpp"

namespace BybitTrader {
namespace Core {

struct PositionStateMachineConstructionParams {
    const Config::SystemConfig& system_config;
    API::ExecutionGatewayInterface& gateway_ref;
    const RiskSizer& risk_sizer_ref;
    TradingEventSink& event_sink_ref;

    PositionStateMachineConstructionParams(const Config::SystemConfig& config, API::ExecutionGatewayInterface& gateway,
                                           const RiskSizer& risk_sizer, TradingEventSink& event_sink)
        : system_config(config), gateway_ref(gateway), risk_sizer_ref(risk_sizer), event_sink_ref(event_sink) {}
};

// Request object for one closed bar (to avoid multi-parameter functions).
struct BarDecisionRequest {
    const Bar& bar;
    const IndicatorSnapshot& snapshot;
    Signal signal;

    BarDecisionRequest(const Bar& closed_bar, const IndicatorSnapshot& indicator_snapshot, Signal bar_signal)
        : bar(closed_bar), snapshot(indicator_snapshot), signal(bar_signal) {}
};

struct PositionStatus {
    PositionState state;
    PositionIntent intent;
    bool entries_halted;
};

/**
 * Owns the PositionIntent and drives it through Flat -> PendingEntry -> Open -> PendingExit -> Flat.
 *
 * Every public operation takes the same mutex for its whole duration, including the bounded
 * wait for order confirmation, so bar processing, reconciliation and shutdown never interleave.
 * The exchange is authoritative: timeouts are resolved by querying the position, and
 * reconciliation forces the intent to whatever the exchange reports.
 */
class PositionStateMachine {
public:
    explicit PositionStateMachine(const PositionStateMachineConstructionParams& construction_params);

    // Startup. Non-flat exchange position -> Open with a synthesized intent. Stop/target come
    // from latest_valid_atr, or are deferred to the first bar with a valid ATR.
    // Throws GatewayError if the position cannot be queried.
    void recover_from_exchange(std::optional<double> latest_valid_atr);

    // Protective checks run before the exit signal; stop wins when a bar crosses both levels.
    // Throws StuckPosition when an exit fails twice.
    void on_bar(const BarDecisionRequest& request);

    // Forces the intent to the exchange position when they disagree. Throws GatewayError.
    void reconcile();

    // Waits for any in-flight operation, then closes the position or leaves it to the exchange orders.
    void shutdown(bool close_position);

    PositionStatus status() const;
    PositionState state() const;
    PositionSide current_side() const;
    bool entries_halted() const;

private:
    const Config::SystemConfig& config;
    API::ExecutionGatewayInterface& gateway;
    const RiskSizer& risk_sizer;
    TradingEventSink& event_sink;

    mutable std::mutex state_mutex;
    PositionState current_state;
    PositionIntent intent;
    bool entries_halted_flag;
    std::optional<double> latest_valid_atr;
    std::vector<OrderHandle> protective_orders;
    bool protective_orders_deferred;   // adopted by reconciliation, exchange orders wait for levels
    std::atomic<unsigned long> client_order_sequence;

    // All of the following expect state_mutex to be held.
    void transition_to(PositionState next_state, const std::string& reason);
    void handle_entry_signal(const BarDecisionRequest& request);
    void enter_position(PositionSide side, const PositionSizing& sizing, double reference_price, double atr);
    bool adopt_entry_from_exchange(PositionSide side, double reference_price, double atr, const std::string& reason);
    void exit_position(const std::string& reason);
    bool attempt_exit_order(int attempt_number);
    bool check_protective_levels(const Bar& bar, std::string& trigger_reason);
    void apply_deferred_protective_levels();
    void submit_protective_orders();
    void arm_deferred_protective_orders();
    void cancel_protective_orders();
    void adopt_exchange_position(const ExchangePosition& exchange_position);
    void reset_to_flat(const std::string& reason);

    std::optional<OrderHandle> submit_and_report(const OrderRequest& order_request);
    OrderStatusReport await_order_resolution(const OrderHandle& handle);
    std::optional<ExchangePosition> query_position_after_timeout();
    std::string next_client_order_id(const char* purpose);
    bool sizes_match(double intended_size, double reported_size) const;
};

} // namespace Core
} // namespace BybitTrader

#endif // POSITION_STATE_MACHINE_HPP
