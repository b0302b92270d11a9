#ifndef SIGNAL_ANALYSIS_LOGS_HPP
#define SIGNAL_ANALYSIS_LOGS_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/trading_logic/trading_logic_structures.hpp"
#include <string>

using AryaTrader::Config::SystemConfig;

namespace AryaTrader {
namespace Logging {

class SignalAnalysisLogs {
public:
    static void log_bar_decision(const AryaTrader::Core::BarDecisionResult& decision_result, const SystemConfig& config);
    static void log_indicator_table(const AryaTrader::Core::IndicatorSnapshot& indicator_snapshot);
    static void log_filters_table(const AryaTrader::Core::FilterResult& filter_result, const SystemConfig& config);
    static void log_signal_decision(const AryaTrader::Core::SignalDecision& signal_decision);

private:
    static std::string format_indicator(const AryaTrader::Core::IndicatorValues& indicator_values);
    static std::string pass_fail(bool passed);
};

} // namespace Logging
} // namespace AryaTrader

#endif // SIGNAL_ANALYSIS_LOGS_HPP
