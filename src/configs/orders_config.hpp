// OrdersConfig.hpp
#ifndef ORDERS_CONFIG_HPP
#define ORDERS_CONFIG_HPP

#include <string>

namespace AryaTrader {
namespace Config {

struct OrdersConfig {
    // Exit distances
    int stop_loss_ticks = 24;                        // Entry close to initial catastrophic stop
    int profit_target_ticks = 77;                    // Entry close to profit target limit
    double trailing_stop_acceleration = 0.2;         // Base acceleration, reset at every entry

    // Order labels
    std::string enter_long_label = "Enter long position";
    std::string enter_short_label = "Enter short position";
    std::string catastrophic_stop_long_label = "Catastrophic stop long exit";
    std::string catastrophic_stop_short_label = "Catastrophic stop short exit";
    std::string profit_target_long_label = "Profit stop long exit";
    std::string profit_target_short_label = "Profit stop short exit";
    std::string trailing_stop_long_label = "Trailing stop long exit";
    std::string trailing_stop_short_label = "Trailing stop short exit";
    std::string exit_long_label = "Exit long position";
    std::string exit_short_label = "Exit short position";
    std::string session_close_label = "Session close exit";

    int price_precision = 5;                         // Decimal places for price formatting in logs
};

} // namespace Config
} // namespace AryaTrader

#endif // ORDERS_CONFIG_HPP
