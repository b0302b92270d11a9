#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace AryaTrader {
namespace Logging {

using AryaTrader::Core::Order;
using AryaTrader::Core::PositionSide;
using AryaTrader::Core::TrailingStopAction;

std::string TradingLogs::format_price(double price, int price_precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(price_precision) << price;
    return oss.str();
}

void TradingLogs::log_order_request(const std::string& request_action, const Order& order, int price_precision) {
    std::ostringstream oss;
    oss << request_action << " #" << order.order_id << " " << AryaTrader::Core::to_string(order.type) << " "
        << AryaTrader::Core::to_string(order.side) << " " << order.quantity;
    if (order.price) {
        oss << " @ " << format_price(*order.price, price_precision);
    }
    oss << " '" << order.label << "'";
    if (order.linked_order_id) {
        oss << " (OCO with #" << *order.linked_order_id << ")";
    }
    LOG_THREAD_CONTENT(oss.str());
}

void TradingLogs::log_position_entered(PositionSide position_side, double entry_close, const Order& stop_order, const Order& target_order,
                                       double base_acceleration, int price_precision) {
    LOG_THREAD_ORDER_EXECUTION_HEADER();
    TABLE_HEADER_30("Position", "Opened " + AryaTrader::Core::to_string(position_side));
    TABLE_ROW_30("Entry Close", format_price(entry_close, price_precision));
    TABLE_ROW_30("Stop", format_price(stop_order.price.value_or(0.0), price_precision) + " #" + std::to_string(stop_order.order_id));
    TABLE_ROW_30("Target", format_price(target_order.price.value_or(0.0), price_precision) + " #" + std::to_string(target_order.order_id));
    TABLE_ROW_30("Acceleration", std::to_string(base_acceleration));
    TABLE_FOOTER_30();
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_position_exited(PositionSide closed_side, const std::string& exit_label) {
    log_message("Position closed: " + AryaTrader::Core::to_string(closed_side) + " - " + exit_label, "");
}

void TradingLogs::log_stop_modified(double previous_stop_price, double new_stop_price, const std::string& new_label, int price_precision) {
    std::ostringstream oss;
    oss << "Stop moved " << format_price(previous_stop_price, price_precision) << " -> " << format_price(new_stop_price, price_precision)
        << " '" << new_label << "'";
    LOG_THREAD_CONTENT(oss.str());
}

void TradingLogs::log_exit_order_filled(const Order& filled_order, PositionSide closed_side) {
    log_message("Exit order #" + std::to_string(filled_order.order_id) + " filled ('" + filled_order.label + "') - " +
                AryaTrader::Core::to_string(closed_side) + " position is now flat", "");
}

void TradingLogs::log_unmatched_fill(AryaTrader::Core::OrderId order_id) {
    log_message("Fill for order #" + std::to_string(order_id) + " does not belong to the open position - ignored", "");
}

void TradingLogs::log_trailing_stop_update(PositionSide position_side, double current_close, double furthest_close, double acceleration,
                                           double current_stop_price, TrailingStopAction action, int price_precision) {
    LOG_THREAD_TRAILING_STOP_HEADER();
    TABLE_HEADER_30("Trailing", AryaTrader::Core::to_string(position_side));
    TABLE_ROW_30("Close", format_price(current_close, price_precision));
    TABLE_ROW_30("Furthest Close", format_price(furthest_close, price_precision));
    TABLE_ROW_30("Acceleration", std::to_string(acceleration));
    TABLE_ROW_30("Stop", format_price(current_stop_price, price_precision));
    std::string action_string = "HOLD";
    if (action == TrailingStopAction::TRAILED) {
        action_string = "TRAILED";
    } else if (action == TrailingStopAction::FLATTENED) {
        action_string = "FLATTENED";
    }
    TABLE_ROW_30("Action", action_string);
    TABLE_FOOTER_30();
    LOG_THREAD_SECTION_FOOTER();
}

void TradingLogs::log_session_close(const std::string& bar_timestamp, PositionSide position_side) {
    log_message("Session close reached at " + bar_timestamp + " - flattening " + AryaTrader::Core::to_string(position_side) + " position", "");
}

void TradingLogs::log_bar_rolled_back(const std::string& bar_timestamp, const std::string& error_message) {
    log_message("Bar " + bar_timestamp + " not applied, request failed: " + error_message, "");
}

} // namespace Logging
} // namespace AryaTrader
