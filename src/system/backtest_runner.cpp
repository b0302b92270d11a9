#include "backtest_runner.hpp"
#include "api/orders/order_journal.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/trading_logs.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/market_data/csv_bar_feed.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "trader/trading_logic/trading_logic_structures.hpp"
#include <optional>
#include <stdexcept>

using namespace AryaTrader::Logging;

namespace AryaTrader {
namespace System {

using AryaTrader::API::Orders::OrderFill;
using AryaTrader::Core::Bar;
using AryaTrader::Core::OrderType;

BacktestRunner::BacktestRunner(const AryaTrader::Config::SystemConfig& system_config, AryaTrader::Core::BarFeedInterface& bar_feed_ref,
                               AryaTrader::API::Orders::SimulatedOrderClient& order_client_ref,
                               AryaTrader::Core::TradingLogic& trading_logic_ref)
    : config(system_config), bar_feed(bar_feed_ref), order_client(order_client_ref), trading_logic(trading_logic_ref) {
    order_client.set_fill_callback([this](const OrderFill& order_fill) { handle_fill(order_fill); });
}

BacktestSummary BacktestRunner::run() {
    bar_feed.reset();
    std::optional<Bar> last_bar;

    while (std::optional<Bar> next_bar = bar_feed.next_bar()) {
        order_client.process_bar(*next_bar);
        trading_logic.process_bar(*next_bar);
        last_bar = next_bar;
    }

    if (last_bar) {
        flatten_after_last_bar(*last_bar);
    } else {
        log_message("Bar feed " + bar_feed.get_feed_name() + " produced no bars", "");
    }

    BacktestSummary backtest_summary;
    backtest_summary.trading_statistics = trading_logic.get_statistics();
    backtest_summary.bars_processed = backtest_summary.trading_statistics.bars_processed;
    backtest_summary.orders_filled = order_client.get_filled_order_count();
    backtest_summary.realized_pnl_price = order_client.get_realized_pnl();
    backtest_summary.realized_pnl_ticks = order_client.get_realized_pnl_ticks();
    backtest_summary.completed_trades = order_client.get_completed_trades();
    return backtest_summary;
}

void BacktestRunner::handle_fill(const OrderFill& order_fill) {
    // Market fills only confirm requests the engine already accounted for
    if (order_fill.order.type == OrderType::Market) {
        return;
    }
    trading_logic.handle_order_filled(order_fill.order.order_id);
}

void BacktestRunner::flatten_after_last_bar(const Bar& last_bar) {
    AryaTrader::Core::PositionSide open_side = trading_logic.get_position_side();
    if (open_side != AryaTrader::Core::PositionSide::Flat) {
        TradingLogs::log_session_close(last_bar.timestamp, open_side);
        trading_logic.force_flatten(config.orders.session_close_label);
    }
    order_client.settle_market_orders(last_bar.close_price, last_bar.timestamp);
    if (order_client.get_net_position() != 0) {
        throw std::runtime_error("Backtest ended with a non-flat simulated position: " + std::to_string(order_client.get_net_position()));
    }
}

BacktestSummary run_backtest(const AryaTrader::Config::SystemConfig& system_config) {
    AryaTrader::Core::CsvBarFeed csv_bar_feed(system_config.backtest.bars_csv_path, system_config.instrument.tick_size);
    AryaTrader::Core::TechnicalIndicatorProvider indicator_provider(system_config.strategy);
    AryaTrader::API::Orders::OrderJournal order_journal(get_run_file_path(system_config.logging.order_journal_file));
    AryaTrader::API::Orders::SimulatedOrderClient order_client(system_config.instrument.tick_size, &order_journal);

    AryaTrader::Core::TradingLogicConstructionParams trading_logic_params(system_config, order_client, indicator_provider);
    AryaTrader::Core::TradingLogic trading_logic(trading_logic_params);

    StartupLogs::log_backtest_configuration(system_config, csv_bar_feed.get_feed_name(),
                                            AryaTrader::Config::required_history_bars(system_config.strategy));

    BacktestRunner backtest_runner(system_config, csv_bar_feed, order_client, trading_logic);
    BacktestSummary backtest_summary = backtest_runner.run();
    StartupLogs::log_backtest_summary(backtest_summary);
    log_message("Order journal written to " + order_journal.get_file_path() + " (" +
                std::to_string(order_journal.get_entries_written()) + " entries)", "");
    return backtest_summary;
}

} // namespace System
} // namespace AryaTrader
