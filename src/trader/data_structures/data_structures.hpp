#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <cstdint>
#include <optional>

namespace BybitTrader {
namespace Core {

// One closed OHLCV candle. timestamp_ms is the bar open time in epoch milliseconds.
struct Bar {
    std::int64_t timestamp_ms;
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;

    Bar() : timestamp_ms(0), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0) {}
    Bar(std::int64_t timestamp, double open, double high, double low, double close, double bar_volume)
        : timestamp_ms(timestamp), open_price(open), high_price(high), low_price(low), close_price(close), volume(bar_volume) {}
};

struct IndicatorSnapshot {
    std::int64_t timestamp_ms;
    double close_price;
    double volume;

    double ema_fast;
    double ema_slow;
    double stoch_k;
    double stoch_d;
    double atr;
    double vol_avg;
    double vol_std;

    bool ema_fast_valid;
    bool ema_slow_valid;
    bool stoch_k_valid;
    bool stoch_d_valid;
    bool atr_valid;
    bool vol_avg_valid;

    IndicatorSnapshot()
        : timestamp_ms(0), close_price(0.0), volume(0.0),
          ema_fast(0.0), ema_slow(0.0), stoch_k(0.0), stoch_d(0.0), atr(0.0), vol_avg(0.0), vol_std(0.0),
          ema_fast_valid(false), ema_slow_valid(false), stoch_k_valid(false), stoch_d_valid(false),
          atr_valid(false), vol_avg_valid(false) {}

    // Everything the signal rules read.
    bool signal_inputs_valid() const {
        return ema_fast_valid && ema_slow_valid && stoch_k_valid && stoch_d_valid && vol_avg_valid;
    }
};

enum class Signal {
    None,           // Hold
    EnterLong,
    EnterShort,
    ExitLong,
    ExitShort
};

enum class PositionSide {
    Flat,
    Long,
    Short
};

enum class PositionState {
    Flat,
    PendingEntry,
    Open,
    PendingExit
};

// The bot's belief about the position that should exist. Owned by PositionStateMachine.
struct PositionIntent {
    PositionSide side;
    double size;
    double entry_price;
    double stop_loss;
    double take_profit;
    bool protective_levels_set;   // false while stop/take-profit wait for a valid ATR

    PositionIntent() : side(PositionSide::Flat), size(0.0), entry_price(0.0), stop_loss(0.0), take_profit(0.0), protective_levels_set(false) {}
};

// Position as last reported by the exchange.
struct ExchangePosition {
    PositionSide side;
    double size;
    double avg_entry_price;

    ExchangePosition() : side(PositionSide::Flat), size(0.0), avg_entry_price(0.0) {}
    ExchangePosition(PositionSide position_side, double position_size, double average_entry)
        : side(position_side), size(position_size), avg_entry_price(average_entry) {}
};

enum class OrderSide {
    Buy,
    Sell
};

enum class OrderType {
    Market,
    Limit,
    StopMarket,         // reduce-only conditional stop-loss
    TakeProfitMarket    // reduce-only conditional take-profit
};

struct OrderRequest {
    OrderSide side;
    double quantity;
    OrderType type;
    std::optional<double> price;           // Limit orders only
    std::optional<double> trigger_price;   // Conditional orders only
    bool reduce_only;
    std::string client_order_id;

    OrderRequest(OrderSide order_side, double order_quantity, OrderType order_type)
        : side(order_side), quantity(order_quantity), type(order_type), reduce_only(false) {}
};

struct OrderHandle {
    std::string order_id;
    std::string client_order_id;

    bool empty() const { return order_id.empty() && client_order_id.empty(); }
};

enum class OrderState {
    Pending,
    Filled,
    Rejected
};

struct OrderStatusReport {
    OrderState state;
    double filled_quantity;
    double average_fill_price;
    std::string reason;

    OrderStatusReport() : state(OrderState::Pending), filled_quantity(0.0), average_fill_price(0.0) {}
};

// Request object for the risk sizer (to avoid multi-parameter functions).
struct PositionSizingRequest {
    double equity;
    double entry_price;
    double atr;
    PositionSide side;

    PositionSizingRequest(double account_equity, double entry, double atr_value, PositionSide position_side)
        : equity(account_equity), entry_price(entry), atr(atr_value), side(position_side) {}
};

struct PositionSizing {
    double size;
    double stop_loss;
    double take_profit;

    PositionSizing() : size(0.0), stop_loss(0.0), take_profit(0.0) {}
};

inline const char* to_string(Signal signal) {
    switch (signal) {
        case Signal::None: return "HOLD";
        case Signal::EnterLong: return "ENTER_LONG";
        case Signal::EnterShort: return "ENTER_SHORT";
        case Signal::ExitLong: return "EXIT_LONG";
        case Signal::ExitShort: return "EXIT_SHORT";
    }
    return "UNKNOWN";
}

inline const char* to_string(PositionSide side) {
    switch (side) {
        case PositionSide::Flat: return "FLAT";
        case PositionSide::Long: return "LONG";
        case PositionSide::Short: return "SHORT";
    }
    return "UNKNOWN";
}

inline const char* to_string(PositionState state) {
    switch (state) {
        case PositionState::Flat: return "FLAT";
        case PositionState::PendingEntry: return "PENDING_ENTRY";
        case PositionState::Open: return "OPEN";
        case PositionState::PendingExit: return "PENDING_EXIT";
    }
    return "UNKNOWN";
}

inline const char* to_string(OrderSide side) {
    return side == OrderSide::Buy ? "Buy" : "Sell";
}

inline const char* to_string(OrderType type) {
    switch (type) {
        case OrderType::Market: return "MARKET";
        case OrderType::Limit: return "LIMIT";
        case OrderType::StopMarket: return "STOP_MARKET";
        case OrderType::TakeProfitMarket: return "TAKE_PROFIT_MARKET";
    }
    return "UNKNOWN";
}

inline const char* to_string(OrderState state) {
    switch (state) {
        case OrderState::Pending: return "PENDING";
        case OrderState::Filled: return "FILLED";
        case OrderState::Rejected: return "REJECTED";
    }
    return "UNKNOWN";
}

inline OrderSide entry_order_side(PositionSide side) {
    return side == PositionSide::Short ? OrderSide::Sell : OrderSide::Buy;
}

inline OrderSide exit_order_side(PositionSide side) {
    return side == PositionSide::Short ? OrderSide::Buy : OrderSide::Sell;
}

} // namespace Core
} // namespace BybitTrader

#endif // DATA_STRUCTURES_HPP
