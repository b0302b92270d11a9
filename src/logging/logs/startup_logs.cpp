#include "startup_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace AryaTrader {
namespace Logging {

void StartupLogs::log_application_header() {
    log_message("=== ARYA TRADER - INTRADAY BACKTEST ===", "");
    log_message("Build: " + get_build_identifier() + " | Started: " + TimeUtils::get_current_human_readable_time(), "");
    const std::string& run_folder = get_logging_context()->run_folder;
    if (!run_folder.empty()) {
        log_message("Run folder: " + run_folder, "");
    }
}

void StartupLogs::log_configuration_source(const std::string& config_path) {
    log_message("Configuration source: " + config_path, "");
}

void StartupLogs::log_strategy_configuration(const SystemConfig& config) {
    const AryaTrader::Config::StrategyConfig& strategy = config.strategy;

    LOG_STARTUP_SECTION_HEADER("STRATEGY CONFIGURATION");
    TABLE_HEADER_30("Parameter", "Value");
    TABLE_ROW_30("Symbol", config.instrument.symbol);
    TABLE_ROW_30("Monday", enabled_disabled(strategy.monday_trading_enabled));
    TABLE_ROW_30("Tuesday", enabled_disabled(strategy.tuesday_trading_enabled));
    TABLE_ROW_30("Wednesday", enabled_disabled(strategy.wednesday_trading_enabled));
    TABLE_ROW_30("Thursday", enabled_disabled(strategy.thursday_trading_enabled));
    TABLE_ROW_30("Friday", enabled_disabled(strategy.friday_trading_enabled));
    TABLE_ROW_30("Session", TimeUtils::format_time_of_day(strategy.trading_time_start) + " - " +
                            TimeUtils::format_time_of_day(strategy.trading_time_end));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Range Period", std::to_string(strategy.range_calculation_period));
    TABLE_ROW_30("Minimum Range", std::to_string(strategy.minimum_range_filter));
    TABLE_ROW_30("ADX Period", std::to_string(strategy.adx_period));
    TABLE_ROW_30("Min ADX L/S", std::to_string(strategy.min_adx_long_entry) + " / " + std::to_string(strategy.min_adx_short_entry));
    TABLE_ROW_30("SMA Period", std::to_string(strategy.sma_period));
    TABLE_ROW_30("Stochastic", std::to_string(strategy.stochastic_period) + "/" + std::to_string(strategy.stochastic_slowing_period) + "/" +
                               std::to_string(strategy.stochastic_d_period));
    TABLE_ROW_30("Buy / Sell Level", std::to_string(strategy.buy_signal_level) + " / " + std::to_string(strategy.sell_signal_level));
    TABLE_FOOTER_30();
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_orders_configuration(const SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("ORDERS CONFIGURATION");
    TABLE_HEADER_30("Parameter", "Value");
    TABLE_ROW_30("Tick Size", std::to_string(config.instrument.tick_size));
    TABLE_ROW_30("Stop Ticks", std::to_string(config.orders.stop_loss_ticks));
    TABLE_ROW_30("Profit Ticks", std::to_string(config.orders.profit_target_ticks));
    TABLE_ROW_30("Acceleration", std::to_string(config.orders.trailing_stop_acceleration));
    TABLE_ROW_30("Session Close", config.instrument.force_close_at_session_end ?
                                  TimeUtils::format_time_of_day(config.instrument.session_close_time) : std::string("DISABLED"));
    TABLE_FOOTER_30();
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_backtest_configuration(const SystemConfig& config, const std::string& feed_name, int required_history) {
    LOG_STARTUP_SECTION_HEADER("BACKTEST");
    LOG_STARTUP_CONTENT("Bar feed: " + feed_name);
    LOG_STARTUP_CONTENT("History kept: " + std::to_string(config.backtest.max_history_bars) + " bars (warmup " +
                        std::to_string(required_history) + ")");
    LOG_STARTUP_CONTENT("Order journal: " + config.logging.order_journal_file);
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_backtest_summary(const BacktestSummary& backtest_summary) {
    const AryaTrader::Core::TradingStatistics& statistics = backtest_summary.trading_statistics;
    std::ostringstream pnl_stream;
    pnl_stream << std::fixed << std::setprecision(1) << backtest_summary.realized_pnl_ticks << " ticks";

    LOG_STARTUP_SECTION_HEADER("BACKTEST SUMMARY");
    TABLE_HEADER_30("Metric", "Value");
    TABLE_ROW_30("Bars Processed", std::to_string(backtest_summary.bars_processed));
    TABLE_ROW_30("Long Entries", std::to_string(statistics.long_entries));
    TABLE_ROW_30("Short Entries", std::to_string(statistics.short_entries));
    TABLE_ROW_30("Stop Adjustments", std::to_string(statistics.stop_adjustments));
    TABLE_ROW_30("Trailing Exits", std::to_string(statistics.trailing_flattens));
    TABLE_ROW_30("Session Exits", std::to_string(statistics.session_close_flattens));
    TABLE_ROW_30("Stop/Target Fills", std::to_string(statistics.exit_order_fills));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Orders Filled", std::to_string(backtest_summary.orders_filled));
    TABLE_ROW_30("Closed Trades", std::to_string(backtest_summary.completed_trades));
    TABLE_ROW_30("Realized P&L", pnl_stream.str());
    TABLE_FOOTER_30();
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message, "");
}

std::string StartupLogs::enabled_disabled(bool enabled) {
    return enabled ? "ENABLED" : "DISABLED";
}

} // namespace Logging
} // namespace AryaTrader
