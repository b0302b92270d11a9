#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <optional>
#include <ctime>
#include "utils/time_utils.hpp"

namespace AryaTrader {
namespace Core {

struct Bar {
    std::string timestamp;
    std::tm timestamp_tm;
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double tick_size;

    Bar() : timestamp(""), timestamp_tm(), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), tick_size(0.0) {}

    TimeUtils::Weekday day_of_week() const { return TimeUtils::weekday_of(timestamp_tm); }
    TimeUtils::TimeOfDay time_of_day() const { return TimeUtils::time_of_day_of(timestamp_tm); }
    long long epoch_seconds() const { return TimeUtils::to_epoch_seconds(timestamp_tm); }
};

// ========================================================================
// ORDER STRUCTURES
// ========================================================================

using OrderId = unsigned long;

enum class OrderSide { Buy, Sell };
enum class OrderType { Market, Stop, Limit };

inline OrderSide opposite_side(OrderSide side) {
    return side == OrderSide::Buy ? OrderSide::Sell : OrderSide::Buy;
}

inline std::string to_string(OrderSide side) {
    return side == OrderSide::Buy ? "buy" : "sell";
}

inline std::string to_string(OrderType type) {
    switch (type) {
        case OrderType::Market: return "market";
        case OrderType::Stop: return "stop";
        case OrderType::Limit: return "limit";
    }
    return "unknown";
}

// An order request as declared to the execution collaborator. linked_order_id names the
// one-cancels-other counterpart by id only; the collaborator enforces the cancellation.
struct Order {
    OrderId order_id;
    OrderSide side;
    OrderType type;
    int quantity;
    std::optional<double> price;
    std::string label;
    std::optional<OrderId> linked_order_id;

    Order() : order_id(0), side(OrderSide::Buy), type(OrderType::Market), quantity(1), price(), label(""), linked_order_id() {}
    Order(OrderId id, OrderSide order_side, OrderType order_type, std::optional<double> order_price, const std::string& order_label)
        : order_id(id), side(order_side), type(order_type), quantity(1), price(order_price), label(order_label), linked_order_id() {}
};

// ========================================================================
// POSITION STRUCTURES
// ========================================================================

enum class PositionSide { Flat, Long, Short };

inline std::string to_string(PositionSide side) {
    switch (side) {
        case PositionSide::Flat: return "FLAT";
        case PositionSide::Long: return "LONG";
        case PositionSide::Short: return "SHORT";
    }
    return "UNKNOWN";
}

// Per-trade trailing stop state. Created fresh at every entry, discarded at exit.
struct TrailingState {
    double acceleration;
    double furthest_close;

    TrailingState() : acceleration(0.0), furthest_close(0.0) {}
    TrailingState(double base_acceleration, double entry_close) : acceleration(base_acceleration), furthest_close(entry_close) {}
};

struct OpenPosition {
    PositionSide side;
    Order stop_order;
    Order target_order;
    TrailingState trailing_state;

    OpenPosition() : side(PositionSide::Long), stop_order(), target_order(), trailing_state() {}
};

// ========================================================================
// INDICATOR STRUCTURES
// ========================================================================

// Last two values of an indicator series; ready once both exist.
struct IndicatorValues {
    double current;
    double previous;
    bool ready;

    IndicatorValues() : current(0.0), previous(0.0), ready(false) {}
    IndicatorValues(double current_value, double previous_value) : current(current_value), previous(previous_value), ready(true) {}
};

struct IndicatorSnapshot {
    IndicatorValues stochastic_d;
    IndicatorValues adx;
    IndicatorValues sma;
};

// ========================================================================
// STRATEGY DECISION STRUCTURES
// ========================================================================

struct FilterResult {
    bool day_pass;
    bool time_pass;
    bool volatility_pass;
    bool position_flat;
    bool indicators_ready;
    bool adx_long_pass;
    bool adx_short_pass;
    bool bullish_trend;
    bool bearish_trend;
    bool long_eligible;
    bool short_eligible;
    double volatility_range;

    FilterResult()
        : day_pass(false), time_pass(false), volatility_pass(false), position_flat(false), indicators_ready(false),
          adx_long_pass(false), adx_short_pass(false), bullish_trend(false), bearish_trend(false),
          long_eligible(false), short_eligible(false), volatility_range(0.0) {}
};

struct SignalDecision {
    bool buy;
    bool sell;
    std::string signal_reason;

    SignalDecision() : buy(false), sell(false), signal_reason("") {}
};

enum class TrailingStopAction { NONE, TRAILED, FLATTENED };

enum class BarAction { NONE, ENTERED_LONG, ENTERED_SHORT, TRAILED_STOP, FLATTENED_TRAILING, FLATTENED_SESSION_CLOSE };

inline std::string to_string(BarAction action) {
    switch (action) {
        case BarAction::NONE: return "NONE";
        case BarAction::ENTERED_LONG: return "ENTERED_LONG";
        case BarAction::ENTERED_SHORT: return "ENTERED_SHORT";
        case BarAction::TRAILED_STOP: return "TRAILED_STOP";
        case BarAction::FLATTENED_TRAILING: return "FLATTENED_TRAILING";
        case BarAction::FLATTENED_SESSION_CLOSE: return "FLATTENED_SESSION_CLOSE";
    }
    return "UNKNOWN";
}

} // namespace Core
} // namespace AryaTrader

#endif // DATA_STRUCTURES_HPP
