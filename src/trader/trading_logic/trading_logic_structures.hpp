#ifndef TRADING_LOGIC_STRUCTURES_HPP
#define TRADING_LOGIC_STRUCTURES_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/indicator_provider_interface.hpp"
#include "execution_interface.hpp"
#include <string>

namespace AryaTrader {
namespace Core {

using AryaTrader::Config::SystemConfig;

struct TradingLogicConstructionParams {
    const SystemConfig& system_config;
    ExecutionServiceInterface& execution_service_ref;
    IndicatorProviderInterface& indicator_provider_ref;

    TradingLogicConstructionParams(const SystemConfig& config, ExecutionServiceInterface& execution_service,
                                   IndicatorProviderInterface& indicator_provider)
        : system_config(config), execution_service_ref(execution_service), indicator_provider_ref(indicator_provider) {}
};

// Outcome of one decision pass, returned to the driver and logged per bar.
struct BarDecisionResult {
    unsigned long bar_number;
    std::string bar_timestamp;
    double close_price;
    PositionSide position_before;
    PositionSide position_after;
    IndicatorSnapshot indicator_snapshot;
    FilterResult filter_result;
    SignalDecision signal_decision;
    bool session_close_triggered;
    BarAction action;

    BarDecisionResult()
        : bar_number(0), bar_timestamp(""), close_price(0.0), position_before(PositionSide::Flat), position_after(PositionSide::Flat),
          indicator_snapshot(), filter_result(), signal_decision(), session_close_triggered(false), action(BarAction::NONE) {}
};

struct TradingStatistics {
    unsigned long bars_processed;
    unsigned long long_entries;
    unsigned long short_entries;
    unsigned long stop_adjustments;
    unsigned long trailing_flattens;
    unsigned long session_close_flattens;
    unsigned long exit_order_fills;

    TradingStatistics()
        : bars_processed(0), long_entries(0), short_entries(0), stop_adjustments(0), trailing_flattens(0),
          session_close_flattens(0), exit_order_fills(0) {}
};

} // namespace Core
} // namespace AryaTrader

#endif // TRADING_LOGIC_STRUCTURES_HPP
