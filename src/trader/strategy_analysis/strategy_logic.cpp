#include "strategy_logic.hpp"
#include <sstream>
#include <iomanip>

namespace AryaTrader {
namespace Core {

using TimeUtils::Weekday;
using TimeUtils::TimeOfDay;

bool day_allowed(Weekday day_of_week, const Config::StrategyConfig& strategy_config) {
    switch (day_of_week) {
        case Weekday::Monday: return strategy_config.monday_trading_enabled;
        case Weekday::Tuesday: return strategy_config.tuesday_trading_enabled;
        case Weekday::Wednesday: return strategy_config.wednesday_trading_enabled;
        case Weekday::Thursday: return strategy_config.thursday_trading_enabled;
        case Weekday::Friday: return strategy_config.friday_trading_enabled;
        default: return true;  // No disable flag exists for weekend days
    }
}

bool time_allowed(const TimeOfDay& time_of_day, const TimeOfDay& session_start, const TimeOfDay& session_end) {
    if (session_start <= session_end) {
        return time_of_day >= session_start && time_of_day <= session_end;
    }
    // Window wraps past midnight
    return time_of_day >= session_start || time_of_day <= session_end;
}

std::optional<double> calculate_volatility_range(const BarHistory& bar_history, int lookback_bars) {
    if (lookback_bars <= 0) {
        return std::nullopt;
    }
    std::optional<double> highest_high = bar_history.highest_high(static_cast<size_t>(lookback_bars));
    std::optional<double> lowest_low = bar_history.lowest_low(static_cast<size_t>(lookback_bars));
    if (!highest_high || !lowest_low) {
        return std::nullopt;
    }
    return *highest_high - *lowest_low;
}

bool volatility_allowed(const BarHistory& bar_history, int lookback_bars, double minimum_range) {
    std::optional<double> volatility_range = calculate_volatility_range(bar_history, lookback_bars);
    return volatility_range && *volatility_range > minimum_range;
}

bool trend_strength_allowed(double adx_now, double minimum_adx) {
    return adx_now >= minimum_adx;
}

bool trend_direction_bullish(double sma_now, double sma_previous) {
    return sma_now > sma_previous;
}

bool trend_direction_bearish(double sma_now, double sma_previous) {
    return sma_now < sma_previous;
}

FilterResult evaluate_trading_filters(const Bar& current_bar, const BarHistory& bar_history, const IndicatorSnapshot& indicator_snapshot,
                                      bool position_flat, const Config::StrategyConfig& strategy_config) {
    FilterResult filter_result;
    filter_result.day_pass = day_allowed(current_bar.day_of_week(), strategy_config);
    filter_result.time_pass = time_allowed(current_bar.time_of_day(), strategy_config.trading_time_start, strategy_config.trading_time_end);

    std::optional<double> volatility_range = calculate_volatility_range(bar_history, strategy_config.range_calculation_period);
    filter_result.volatility_range = volatility_range.value_or(0.0);
    filter_result.volatility_pass = volatility_range && *volatility_range > strategy_config.minimum_range_filter;

    filter_result.position_flat = position_flat;

    // A series that has not warmed up fails its gate: insufficient information, not an error
    filter_result.indicators_ready = indicator_snapshot.adx.ready && indicator_snapshot.sma.ready;
    if (indicator_snapshot.adx.ready) {
        filter_result.adx_long_pass = trend_strength_allowed(indicator_snapshot.adx.current, strategy_config.min_adx_long_entry);
        filter_result.adx_short_pass = trend_strength_allowed(indicator_snapshot.adx.current, strategy_config.min_adx_short_entry);
    }
    if (indicator_snapshot.sma.ready) {
        filter_result.bullish_trend = trend_direction_bullish(indicator_snapshot.sma.current, indicator_snapshot.sma.previous);
        filter_result.bearish_trend = trend_direction_bearish(indicator_snapshot.sma.current, indicator_snapshot.sma.previous);
    }

    bool common_gates_pass = filter_result.day_pass && filter_result.time_pass && filter_result.volatility_pass && filter_result.position_flat;
    filter_result.long_eligible = common_gates_pass && filter_result.adx_long_pass && filter_result.bullish_trend;
    filter_result.short_eligible = common_gates_pass && filter_result.adx_short_pass && filter_result.bearish_trend;
    return filter_result;
}

SignalDecision detect_trading_signals(const FilterResult& filter_result, const IndicatorValues& stochastic_d,
                                      const Config::StrategyConfig& strategy_config) {
    SignalDecision signal_decision;
    if (!stochastic_d.ready) {
        signal_decision.signal_reason = "stochastic %D not warmed up";
        return signal_decision;
    }

    std::ostringstream reason_stream;
    reason_stream << std::fixed << std::setprecision(2) << "%D " << stochastic_d.previous << " -> " << stochastic_d.current;

    if (filter_result.long_eligible && stochastic_d.previous <= strategy_config.buy_signal_level && stochastic_d.current > strategy_config.buy_signal_level) {
        signal_decision.buy = true;
        reason_stream << " crossed above " << strategy_config.buy_signal_level;
    } else if (filter_result.short_eligible && stochastic_d.previous >= strategy_config.sell_signal_level && stochastic_d.current < strategy_config.sell_signal_level) {
        signal_decision.sell = true;
        reason_stream << " crossed below " << strategy_config.sell_signal_level;
    } else {
        reason_stream << " no crossing";
    }
    signal_decision.signal_reason = reason_stream.str();
    return signal_decision;
}

bool session_close_reached(const Bar& previous_bar, const Bar& current_bar, const TimeOfDay& session_close_time) {
    TimeOfDay previous_time = previous_bar.time_of_day();
    TimeOfDay current_time = current_bar.time_of_day();
    bool same_calendar_day = previous_bar.timestamp_tm.tm_year == current_bar.timestamp_tm.tm_year &&
                             previous_bar.timestamp_tm.tm_yday == current_bar.timestamp_tm.tm_yday;
    if (same_calendar_day) {
        return previous_time < session_close_time && session_close_time <= current_time;
    }
    return previous_time < session_close_time || session_close_time <= current_time;
}

} // namespace Core
} // namespace AryaTrader
