// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace AryaTrader {
namespace Config {

struct LoggingConfig {
    std::string log_file = "arya_trader.log";
    std::string order_journal_file = "orders.jsonl";
    bool log_bar_decisions = true;                   // Per-bar filter/signal tables
    int logging_poll_interval_ms = 100;              // Logging thread queue drain interval
};

} // namespace Config
} // namespace AryaTrader

#endif // LOGGING_CONFIG_HPP
