#include "trading_logic.hpp"
#include "trader/strategy_analysis/strategy_logic.hpp"
#include "logging/logs/trading_logs.hpp"
#include "logging/logs/signal_analysis_logs.hpp"
#include <stdexcept>

namespace AryaTrader {
namespace Core {
using namespace AryaTrader::Logging;

namespace {

size_t validated_history_capacity(int max_history_bars) {
    if (max_history_bars <= 0) {
        throw std::runtime_error("backtest.max_history_bars must be positive, got: " + std::to_string(max_history_bars));
    }
    return static_cast<size_t>(max_history_bars);
}

} // anonymous namespace

TradingLogic::TradingLogic(const TradingLogicConstructionParams& construction_params)
    : config(construction_params.system_config),
      indicator_provider(construction_params.indicator_provider_ref),
      bar_history(validated_history_capacity(construction_params.system_config.backtest.max_history_bars)),
      position_manager(construction_params.execution_service_ref, construction_params.system_config.orders),
      trailing_stop_controller(position_manager, construction_params.system_config.orders),
      trading_statistics() {}

BarDecisionResult TradingLogic::process_bar(const Bar& bar) {
    std::optional<Bar> previous_bar = bar_history.history(0);
    bar_history.append(bar);
    indicator_provider.update(bar);
    trading_statistics.bars_processed++;

    try {
        return decide_bar(previous_bar, bar);
    } catch (const std::exception& request_error) {
        // A rejected request leaves the bar unapplied so the caller can feed it again
        trading_statistics.bars_processed--;
        indicator_provider.rollback_last_update();
        bar_history.undo_append();
        TradingLogs::log_bar_rolled_back(bar.timestamp, request_error.what());
        throw;
    }
}

BarDecisionResult TradingLogic::decide_bar(const std::optional<Bar>& previous_bar, const Bar& bar) {
    BarDecisionResult decision_result;
    decision_result.bar_number = trading_statistics.bars_processed;
    decision_result.bar_timestamp = bar.timestamp;
    decision_result.close_price = bar.close_price;
    decision_result.position_before = position_manager.get_position_side();
    decision_result.indicator_snapshot = indicator_provider.snapshot();

    if (check_session_close(previous_bar, bar)) {
        TradingLogs::log_session_close(bar.timestamp, position_manager.get_position_side());
        position_manager.exit(config.orders.session_close_label);
        trading_statistics.session_close_flattens++;
        decision_result.session_close_triggered = true;
        decision_result.action = BarAction::FLATTENED_SESSION_CLOSE;
        // Filters are still reported, but no entry is taken on the bar that closed the session
        decision_result.filter_result = evaluate_trading_filters(bar, bar_history, decision_result.indicator_snapshot,
                                                                 false, config.strategy);
        decision_result.signal_decision.signal_reason = "session close bar - entries suspended";
    } else {
        decision_result.filter_result = evaluate_trading_filters(bar, bar_history, decision_result.indicator_snapshot,
                                                                 position_manager.is_flat(), config.strategy);
        if (position_manager.is_flat()) {
            execute_entry_if_signalled(bar, decision_result);
        } else {
            execute_trailing_stop(bar, decision_result);
        }
    }

    decision_result.position_after = position_manager.get_position_side();
    if (config.logging.log_bar_decisions) {
        SignalAnalysisLogs::log_bar_decision(decision_result, config);
    }
    return decision_result;
}

void TradingLogic::execute_entry_if_signalled(const Bar& bar, BarDecisionResult& decision_result) {
    decision_result.signal_decision = detect_trading_signals(decision_result.filter_result,
                                                             decision_result.indicator_snapshot.stochastic_d, config.strategy);
    if (!decision_result.signal_decision.buy && !decision_result.signal_decision.sell) {
        return;
    }

    OrderSide entry_side = decision_result.signal_decision.buy ? OrderSide::Buy : OrderSide::Sell;
    double tick_size_value = bar.tick_size > 0.0 ? bar.tick_size : config.instrument.tick_size;
    position_manager.enter(EntryRequest(entry_side, bar.close_price, tick_size_value, config.orders.stop_loss_ticks,
                                        config.orders.profit_target_ticks, config.orders.trailing_stop_acceleration));

    if (entry_side == OrderSide::Buy) {
        trading_statistics.long_entries++;
        decision_result.action = BarAction::ENTERED_LONG;
    } else {
        trading_statistics.short_entries++;
        decision_result.action = BarAction::ENTERED_SHORT;
    }
}

void TradingLogic::execute_trailing_stop(const Bar& bar, BarDecisionResult& decision_result) {
    decision_result.signal_decision.signal_reason = "position open - trailing stop managed";

    TrailingStopAction trailing_action = trailing_stop_controller.update(bar.close_price);
    if (trailing_action == TrailingStopAction::TRAILED) {
        trading_statistics.stop_adjustments++;
        decision_result.action = BarAction::TRAILED_STOP;
    } else if (trailing_action == TrailingStopAction::FLATTENED) {
        trading_statistics.trailing_flattens++;
        decision_result.action = BarAction::FLATTENED_TRAILING;
    }
}

bool TradingLogic::check_session_close(const std::optional<Bar>& previous_bar, const Bar& bar) {
    if (!config.instrument.force_close_at_session_end || position_manager.is_flat() || !previous_bar) {
        return false;
    }
    return session_close_reached(*previous_bar, bar, config.instrument.session_close_time);
}

bool TradingLogic::handle_order_filled(OrderId order_id) {
    if (!position_manager.handle_exit_order_filled(order_id)) {
        return false;
    }
    trading_statistics.exit_order_fills++;
    return true;
}

bool TradingLogic::force_flatten(const std::string& reason_label) {
    if (position_manager.is_flat()) {
        return false;
    }
    position_manager.exit(reason_label);
    trading_statistics.session_close_flattens++;
    return true;
}

} // namespace Core
} // namespace AryaTrader
