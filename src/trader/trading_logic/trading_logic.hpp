#ifndef TRADING_LOGIC_HPP
#define TRADING_LOGIC_HPP

#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/market_data/bar_history.hpp"
#include "trader/strategy_analysis/indicator_provider_interface.hpp"
#include "position_manager.hpp"
#include "trailing_stop_controller.hpp"
#include "trading_logic_structures.hpp"
#include <string>

namespace AryaTrader {
namespace Core {

/**
 * Per-bar decision engine. One process_bar() call per bar, run to completion before the next.
 * Errors propagate to the caller. A bar whose requests fail is not applied: history, indicators,
 * statistics and position state are as they were before the call.
 */
class TradingLogic {
public:
    TradingLogic(const TradingLogicConstructionParams& construction_params);

    BarDecisionResult process_bar(const Bar& bar);

    // Stop or target fill reported by the execution collaborator.
    bool handle_order_filled(OrderId order_id);

    // Flattens an open position with the given label. Returns false when already flat.
    bool force_flatten(const std::string& reason_label);

    PositionSide get_position_side() const { return position_manager.get_position_side(); }
    const PositionManager& get_position_manager() const { return position_manager; }
    const BarHistory& get_bar_history() const { return bar_history; }
    const TradingStatistics& get_statistics() const { return trading_statistics; }

private:
    const SystemConfig& config;
    IndicatorProviderInterface& indicator_provider;
    BarHistory bar_history;
    PositionManager position_manager;
    TrailingStopController trailing_stop_controller;
    TradingStatistics trading_statistics;

    BarDecisionResult decide_bar(const std::optional<Bar>& previous_bar, const Bar& bar);
    void execute_entry_if_signalled(const Bar& bar, BarDecisionResult& decision_result);
    void execute_trailing_stop(const Bar& bar, BarDecisionResult& decision_result);
    bool check_session_close(const std::optional<Bar>& previous_bar, const Bar& bar);
};

} // namespace Core
} // namespace AryaTrader

#endif // TRADING_LOGIC_HPP
