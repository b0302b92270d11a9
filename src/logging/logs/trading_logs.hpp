#ifndef TRADING_LOGS_HPP
#define TRADING_LOGS_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <string>

using AryaTrader::Config::SystemConfig;

namespace AryaTrader {
namespace Logging {

/**
 * Logging for the position and order lifecycle.
 * Every request sent to the execution collaborator goes through log_order_request.
 */
class TradingLogs {
public:
    // Order requests
    static void log_order_request(const std::string& request_action, const AryaTrader::Core::Order& order, int price_precision);

    // Position lifecycle
    static void log_position_entered(AryaTrader::Core::PositionSide position_side, double entry_close, const AryaTrader::Core::Order& stop_order,
                                     const AryaTrader::Core::Order& target_order, double base_acceleration, int price_precision);
    static void log_position_exited(AryaTrader::Core::PositionSide closed_side, const std::string& exit_label);
    static void log_stop_modified(double previous_stop_price, double new_stop_price, const std::string& new_label, int price_precision);
    static void log_exit_order_filled(const AryaTrader::Core::Order& filled_order, AryaTrader::Core::PositionSide closed_side);
    static void log_unmatched_fill(AryaTrader::Core::OrderId order_id);

    // Trailing stop
    static void log_trailing_stop_update(AryaTrader::Core::PositionSide position_side, double current_close, double furthest_close,
                                         double acceleration, double current_stop_price, AryaTrader::Core::TrailingStopAction action,
                                         int price_precision);

    // Session
    static void log_session_close(const std::string& bar_timestamp, AryaTrader::Core::PositionSide position_side);
    static void log_bar_rolled_back(const std::string& bar_timestamp, const std::string& error_message);

    static std::string format_price(double price, int price_precision);
};

} // namespace Logging
} // namespace AryaTrader

#endif // TRADING_LOGS_HPP
