#ifndef BACKTEST_RUNNER_HPP
#define BACKTEST_RUNNER_HPP

#include "configs/system_config.hpp"
#include "trader/market_data/bar_feed_interface.hpp"
#include "trader/trading_logic/trading_logic.hpp"
#include "api/orders/simulated_order_client.hpp"
#include "logging/logs/startup_logs.hpp"

namespace AryaTrader {
namespace System {

/**
 * Drives one backtest over a bar feed.
 * Each bar is first matched against working orders, so fills reach the engine as input to that
 * bar, then handed to the decision pass. A position still open after the last bar is flattened
 * and settled at the last close.
 */
class BacktestRunner {
public:
    BacktestRunner(const AryaTrader::Config::SystemConfig& system_config, AryaTrader::Core::BarFeedInterface& bar_feed,
                   AryaTrader::API::Orders::SimulatedOrderClient& order_client, AryaTrader::Core::TradingLogic& trading_logic);

    AryaTrader::Logging::BacktestSummary run();

private:
    const AryaTrader::Config::SystemConfig& config;
    AryaTrader::Core::BarFeedInterface& bar_feed;
    AryaTrader::API::Orders::SimulatedOrderClient& order_client;
    AryaTrader::Core::TradingLogic& trading_logic;

    void handle_fill(const AryaTrader::API::Orders::OrderFill& order_fill);
    void flatten_after_last_bar(const AryaTrader::Core::Bar& last_bar);
};

// Builds feed, indicators, simulated venue and engine from the configuration and runs the backtest.
// Throws std::runtime_error on any failure.
AryaTrader::Logging::BacktestSummary run_backtest(const AryaTrader::Config::SystemConfig& system_config);

} // namespace System
} // namespace AryaTrader

#endif // BACKTEST_RUNNER_HPP
