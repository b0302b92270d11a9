#include "trailing_stop_controller.hpp"
#include "logging/logs/trading_logs.hpp"
#include <cmath>
#include <stdexcept>

namespace AryaTrader {
namespace Core {
using namespace AryaTrader::Logging;

TrailingStopController::TrailingStopController(PositionManager& position_manager_ref, const Config::OrdersConfig& orders_config_ref)
    : position_manager(position_manager_ref), orders_config(orders_config_ref) {}

TrailingStopAction TrailingStopController::update(double current_close) {
    const std::optional<OpenPosition>& open_position = position_manager.get_open_position();
    if (!open_position) {
        throw std::runtime_error("Trailing stop update requested while flat");
    }
    if (!open_position->stop_order.price) {
        throw std::runtime_error("Open position has a stop order without a price");
    }

    if (open_position->side == PositionSide::Long) {
        return update_long(*open_position, current_close);
    }
    return update_short(*open_position, current_close);
}

TrailingStopAction TrailingStopController::update_long(const OpenPosition& open_position, double current_close) {
    const TrailingState& trailing_state = open_position.trailing_state;
    double current_stop_price = *open_position.stop_order.price;

    if (current_close <= trailing_state.furthest_close) {
        return TrailingStopAction::NONE;
    }

    double new_furthest_close = current_close;
    double new_acceleration = trailing_state.acceleration * (new_furthest_close - current_stop_price);
    double new_stop_price = current_stop_price + new_acceleration;

    if (new_stop_price < current_close) {
        position_manager.modify_stop(new_stop_price, orders_config.trailing_stop_long_label);
        TrailingState& committed_state = position_manager.get_trailing_state();
        committed_state.furthest_close = new_furthest_close;
        committed_state.acceleration = new_acceleration;
        TradingLogs::log_trailing_stop_update(PositionSide::Long, current_close, new_furthest_close, new_acceleration, new_stop_price,
                                              TrailingStopAction::TRAILED, orders_config.price_precision);
        return TrailingStopAction::TRAILED;
    }

    TradingLogs::log_trailing_stop_update(PositionSide::Long, current_close, new_furthest_close, new_acceleration, current_stop_price,
                                          TrailingStopAction::FLATTENED, orders_config.price_precision);
    position_manager.exit(orders_config.exit_long_label);
    return TrailingStopAction::FLATTENED;
}

TrailingStopAction TrailingStopController::update_short(const OpenPosition& open_position, double current_close) {
    const TrailingState& trailing_state = open_position.trailing_state;
    double current_stop_price = *open_position.stop_order.price;

    if (current_close >= trailing_state.furthest_close) {
        return TrailingStopAction::NONE;
    }

    double new_furthest_close = current_close;
    double new_acceleration = trailing_state.acceleration * std::abs(current_stop_price - new_furthest_close);
    double new_stop_price = current_stop_price - new_acceleration;

    if (new_stop_price > current_close) {
        position_manager.modify_stop(new_stop_price, orders_config.trailing_stop_short_label);
        TrailingState& committed_state = position_manager.get_trailing_state();
        committed_state.furthest_close = new_furthest_close;
        committed_state.acceleration = new_acceleration;
        TradingLogs::log_trailing_stop_update(PositionSide::Short, current_close, new_furthest_close, new_acceleration, new_stop_price,
                                              TrailingStopAction::TRAILED, orders_config.price_precision);
        return TrailingStopAction::TRAILED;
    }

    TradingLogs::log_trailing_stop_update(PositionSide::Short, current_close, new_furthest_close, new_acceleration, current_stop_price,
                                          TrailingStopAction::FLATTENED, orders_config.price_precision);
    position_manager.exit(orders_config.exit_short_label);
    return TrailingStopAction::FLATTENED;
}

} // namespace Core
} // namespace AryaTrader
