#ifndef STRATEGY_LOGIC_HPP
#define STRATEGY_LOGIC_HPP

#include <optional>
#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/market_data/bar_history.hpp"

namespace AryaTrader {
namespace Core {

// Entry filters. Pure functions, evaluated fresh on every bar.
bool day_allowed(TimeUtils::Weekday day_of_week, const Config::StrategyConfig& strategy_config);
bool time_allowed(const TimeUtils::TimeOfDay& time_of_day, const TimeUtils::TimeOfDay& session_start, const TimeUtils::TimeOfDay& session_end);
std::optional<double> calculate_volatility_range(const BarHistory& bar_history, int lookback_bars);
bool volatility_allowed(const BarHistory& bar_history, int lookback_bars, double minimum_range);
bool trend_strength_allowed(double adx_now, double minimum_adx);
bool trend_direction_bullish(double sma_now, double sma_previous);
bool trend_direction_bearish(double sma_now, double sma_previous);

FilterResult evaluate_trading_filters(const Bar& current_bar, const BarHistory& bar_history, const IndicatorSnapshot& indicator_snapshot,
                                      bool position_flat, const Config::StrategyConfig& strategy_config);

// Band crossing on %D. Long is checked first and wins if both would fire.
SignalDecision detect_trading_signals(const FilterResult& filter_result, const IndicatorValues& stochastic_d,
                                      const Config::StrategyConfig& strategy_config);

// True when the step from previous_bar to current_bar crosses the session close time.
bool session_close_reached(const Bar& previous_bar, const Bar& current_bar, const TimeUtils::TimeOfDay& session_close_time);

} // namespace Core
} // namespace AryaTrader

#endif // STRATEGY_LOGIC_HPP
