#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"
#include "trader/trading_logic/trading_logic_structures.hpp"
#include <string>

using AryaTrader::Config::SystemConfig;

namespace AryaTrader {
namespace Logging {

// Backtest summary figures collected by the runner
struct BacktestSummary {
    unsigned long bars_processed;
    unsigned long orders_filled;
    double realized_pnl_price;
    double realized_pnl_ticks;
    unsigned long completed_trades;
    AryaTrader::Core::TradingStatistics trading_statistics;

    BacktestSummary()
        : bars_processed(0), orders_filled(0), realized_pnl_price(0.0), realized_pnl_ticks(0.0), completed_trades(0), trading_statistics() {}
};

/**
 * Logging for application startup and shutdown.
 */
class StartupLogs {
public:
    static void log_application_header();
    static void log_configuration_source(const std::string& config_path);
    static void log_strategy_configuration(const SystemConfig& config);
    static void log_orders_configuration(const SystemConfig& config);
    static void log_backtest_configuration(const SystemConfig& config, const std::string& feed_name, int required_history);
    static void log_backtest_summary(const BacktestSummary& backtest_summary);
    static void log_fatal_error(const std::string& error_message);

private:
    static std::string enabled_disabled(bool enabled);
};

} // namespace Logging
} // namespace AryaTrader

#endif // STARTUP_LOGS_HPP
