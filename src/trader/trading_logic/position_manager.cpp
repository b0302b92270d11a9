#include "position_manager.hpp"
#include "logging/logs/trading_logs.hpp"
#include <stdexcept>

namespace AryaTrader {
namespace Core {
using namespace AryaTrader::Logging;

PositionManager::PositionManager(ExecutionServiceInterface& execution_service_ref, const Config::OrdersConfig& orders_config_ref)
    : execution_service(execution_service_ref), orders_config(orders_config_ref), open_position(), next_order_id(1), last_entry_order_id(0) {}

void PositionManager::enter(const EntryRequest& entry_request) {
    if (open_position) {
        throw std::runtime_error("Cannot enter " + to_string(entry_request.side) + " position - position already " +
                                 to_string(open_position->side));
    }
    if (entry_request.tick_size <= 0.0) {
        throw std::runtime_error("Cannot enter position - tick size must be positive, got: " + std::to_string(entry_request.tick_size));
    }

    bool is_long_entry = entry_request.side == OrderSide::Buy;
    OrderSide exit_side = opposite_side(entry_request.side);
    double stop_distance = entry_request.stop_ticks * entry_request.tick_size;
    double target_distance = entry_request.profit_ticks * entry_request.tick_size;
    double stop_price = is_long_entry ? entry_request.current_close - stop_distance : entry_request.current_close + stop_distance;
    double target_price = is_long_entry ? entry_request.current_close + target_distance : entry_request.current_close - target_distance;

    Order entry_order(allocate_order_id(), entry_request.side, OrderType::Market, std::nullopt,
                      is_long_entry ? orders_config.enter_long_label : orders_config.enter_short_label);
    Order stop_order(allocate_order_id(), exit_side, OrderType::Stop, stop_price,
                     is_long_entry ? orders_config.catastrophic_stop_long_label : orders_config.catastrophic_stop_short_label);
    Order target_order(allocate_order_id(), exit_side, OrderType::Limit, target_price,
                       is_long_entry ? orders_config.profit_target_long_label : orders_config.profit_target_short_label);
    stop_order.linked_order_id = target_order.order_id;
    target_order.linked_order_id = stop_order.order_id;

    // Fixed request order: entry, stop, target
    TradingLogs::log_order_request("INSERT", entry_order, orders_config.price_precision);
    execution_service.insert_order(entry_order);
    TradingLogs::log_order_request("INSERT", stop_order, orders_config.price_precision);
    execution_service.insert_order(stop_order);
    TradingLogs::log_order_request("INSERT", target_order, orders_config.price_precision);
    execution_service.insert_order(target_order);

    OpenPosition new_position;
    new_position.side = is_long_entry ? PositionSide::Long : PositionSide::Short;
    new_position.stop_order = stop_order;
    new_position.target_order = target_order;
    new_position.trailing_state = TrailingState(entry_request.base_acceleration, entry_request.current_close);
    open_position = new_position;
    last_entry_order_id = entry_order.order_id;

    TradingLogs::log_position_entered(new_position.side, entry_request.current_close, stop_order, target_order,
                                      entry_request.base_acceleration, orders_config.price_precision);
}

void PositionManager::exit(const std::string& exit_label) {
    OpenPosition& current_position = require_open_position("exit");
    OrderSide closing_side = current_position.side == PositionSide::Long ? OrderSide::Sell : OrderSide::Buy;

    // Protective orders are cancelled before the closing order goes out
    TradingLogs::log_order_request("CANCEL", current_position.stop_order, orders_config.price_precision);
    execution_service.cancel_order(current_position.stop_order.order_id);
    TradingLogs::log_order_request("CANCEL", current_position.target_order, orders_config.price_precision);
    execution_service.cancel_order(current_position.target_order.order_id);

    Order closing_order(allocate_order_id(), closing_side, OrderType::Market, std::nullopt, exit_label);
    TradingLogs::log_order_request("INSERT", closing_order, orders_config.price_precision);
    execution_service.insert_order(closing_order);

    PositionSide closed_side = current_position.side;
    open_position.reset();
    TradingLogs::log_position_exited(closed_side, exit_label);
}

void PositionManager::modify_stop(double new_stop_price, const std::string& new_label) {
    OpenPosition& current_position = require_open_position("modify stop");

    Order modified_stop_order = current_position.stop_order;
    modified_stop_order.price = new_stop_price;
    modified_stop_order.label = new_label;

    TradingLogs::log_order_request("MODIFY", modified_stop_order, orders_config.price_precision);
    execution_service.modify_order(modified_stop_order);

    double previous_stop_price = current_position.stop_order.price.value_or(0.0);
    current_position.stop_order = modified_stop_order;
    TradingLogs::log_stop_modified(previous_stop_price, new_stop_price, new_label, orders_config.price_precision);
}

bool PositionManager::handle_exit_order_filled(OrderId order_id) {
    if (!open_position) {
        TradingLogs::log_unmatched_fill(order_id);
        return false;
    }

    const Order* filled_order_ptr = nullptr;
    if (open_position->stop_order.order_id == order_id) {
        filled_order_ptr = &open_position->stop_order;
    } else if (open_position->target_order.order_id == order_id) {
        filled_order_ptr = &open_position->target_order;
    }
    if (!filled_order_ptr) {
        TradingLogs::log_unmatched_fill(order_id);
        return false;
    }

    TradingLogs::log_exit_order_filled(*filled_order_ptr, open_position->side);
    open_position.reset();
    return true;
}

PositionSide PositionManager::get_position_side() const {
    return open_position ? open_position->side : PositionSide::Flat;
}

TrailingState& PositionManager::get_trailing_state() {
    return require_open_position("read trailing state").trailing_state;
}

OpenPosition& PositionManager::require_open_position(const std::string& operation_name) {
    if (!open_position) {
        throw std::runtime_error("Cannot " + operation_name + " - no open position");
    }
    return *open_position;
}

} // namespace Core
} // namespace AryaTrader
