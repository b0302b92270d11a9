#include "signal_analysis_logs.hpp"
#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace AryaTrader {
namespace Logging {

using AryaTrader::Core::BarDecisionResult;
using AryaTrader::Core::FilterResult;
using AryaTrader::Core::IndicatorSnapshot;
using AryaTrader::Core::IndicatorValues;
using AryaTrader::Core::SignalDecision;

void SignalAnalysisLogs::log_bar_decision(const BarDecisionResult& decision_result, const SystemConfig& config) {
    LOG_BAR_HEADER(decision_result.bar_number, decision_result.bar_timestamp);
    LOG_THREAD_SIGNAL_ANALYSIS_HEADER(config.instrument.symbol);
    LOG_THREAD_CONTENT("Close: " + TradingLogs::format_price(decision_result.close_price, config.orders.price_precision) +
                       " | Position: " + AryaTrader::Core::to_string(decision_result.position_before));
    log_indicator_table(decision_result.indicator_snapshot);
    log_filters_table(decision_result.filter_result, config);
    log_signal_decision(decision_result.signal_decision);
    LOG_THREAD_SEPARATOR();
    LOG_THREAD_CONTENT("Action: " + AryaTrader::Core::to_string(decision_result.action) + " -> " +
                       AryaTrader::Core::to_string(decision_result.position_after));
    LOG_THREAD_SECTION_FOOTER();
}

void SignalAnalysisLogs::log_indicator_table(const IndicatorSnapshot& indicator_snapshot) {
    TABLE_HEADER_30("Indicator", "Previous -> Current");
    TABLE_ROW_30("Stochastic %D", format_indicator(indicator_snapshot.stochastic_d));
    TABLE_ROW_30("ADX", format_indicator(indicator_snapshot.adx));
    TABLE_ROW_30("SMA", format_indicator(indicator_snapshot.sma));
    TABLE_FOOTER_30();
}

void SignalAnalysisLogs::log_filters_table(const FilterResult& filter_result, const SystemConfig& config) {
    std::ostringstream range_stream;
    range_stream << std::fixed << std::setprecision(config.orders.price_precision) << filter_result.volatility_range << " > "
                 << config.strategy.minimum_range_filter;

    TABLE_HEADER_30("Filter", "Result");
    TABLE_ROW_30("Day", pass_fail(filter_result.day_pass));
    TABLE_ROW_30("Session Time", pass_fail(filter_result.time_pass));
    TABLE_ROW_30("Volatility", pass_fail(filter_result.volatility_pass) + " (" + range_stream.str() + ")");
    TABLE_ROW_30("Position Flat", pass_fail(filter_result.position_flat));
    TABLE_ROW_30("Indicators Ready", pass_fail(filter_result.indicators_ready));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("ADX Long", pass_fail(filter_result.adx_long_pass));
    TABLE_ROW_30("ADX Short", pass_fail(filter_result.adx_short_pass));
    TABLE_ROW_30("SMA Rising", pass_fail(filter_result.bullish_trend));
    TABLE_ROW_30("SMA Falling", pass_fail(filter_result.bearish_trend));
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("Long Eligible", filter_result.long_eligible ? "YES" : "NO");
    TABLE_ROW_30("Short Eligible", filter_result.short_eligible ? "YES" : "NO");
    TABLE_FOOTER_30();
}

void SignalAnalysisLogs::log_signal_decision(const SignalDecision& signal_decision) {
    std::string signal_string = "NONE";
    if (signal_decision.buy) {
        signal_string = "BUY";
    } else if (signal_decision.sell) {
        signal_string = "SELL";
    }
    LOG_THREAD_CONTENT("Signal: " + signal_string);
    if (!signal_decision.signal_reason.empty()) {
        LOG_THREAD_SUBCONTENT(signal_decision.signal_reason);
    }
}

std::string SignalAnalysisLogs::format_indicator(const IndicatorValues& indicator_values) {
    if (!indicator_values.ready) {
        return "warming up";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << indicator_values.previous << " -> " << indicator_values.current;
    return oss.str();
}

std::string SignalAnalysisLogs::pass_fail(bool passed) {
    return passed ? "PASS" : "FAIL";
}

} // namespace Logging
} // namespace AryaTrader
