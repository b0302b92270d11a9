#include <catch2/catch.hpp>
#include "trader/strategy_analysis/strategy_logic.hpp"
#include "trader/market_data/bar_history.hpp"
#include "test_helpers.hpp"

using namespace AryaTrader::Core;
using AryaTrader::Config::StrategyConfig;
using TestHelpers::bar_time;
using TestHelpers::make_bar;
using TestHelpers::make_snapshot;
using TimeUtils::TimeOfDay;
using TimeUtils::Weekday;

namespace {

// Ten bars between low_price and low_price + range, last one at 2024-01-08 20:15 (Monday, inside the session)
BarHistory make_ranged_history(double low_price, double range) {
    BarHistory bar_history(64);
    for (int bar_index = 0; bar_index < 10; ++bar_index) {
        double high_price = bar_index == 3 ? low_price + range : low_price + range / 2.0;
        double bar_low = bar_index == 7 ? low_price : low_price + range / 4.0;
        bar_history.append(make_bar(bar_time("2024-01-08 18:00:00", bar_index), bar_low, high_price, bar_low, bar_low));
    }
    return bar_history;
}

StrategyConfig make_signal_config() {
    StrategyConfig strategy_config;
    strategy_config.buy_signal_level = 51.0;
    strategy_config.sell_signal_level = 49.0;
    return strategy_config;
}

FilterResult eligible(bool long_eligible, bool short_eligible) {
    FilterResult filter_result;
    filter_result.long_eligible = long_eligible;
    filter_result.short_eligible = short_eligible;
    return filter_result;
}

} // anonymous namespace

TEST_CASE("day filter follows the configured flags", "[filters]") {
    StrategyConfig strategy_config;
    REQUIRE(day_allowed(Weekday::Monday, strategy_config));
    REQUIRE(day_allowed(Weekday::Tuesday, strategy_config));
    REQUIRE_FALSE(day_allowed(Weekday::Wednesday, strategy_config));
    REQUIRE_FALSE(day_allowed(Weekday::Thursday, strategy_config));
    REQUIRE(day_allowed(Weekday::Friday, strategy_config));
    // Days without a flag are never disabled
    REQUIRE(day_allowed(Weekday::Saturday, strategy_config));
    REQUIRE(day_allowed(Weekday::Sunday, strategy_config));
}

TEST_CASE("session window wraps past midnight", "[filters]") {
    TimeOfDay session_start(18, 0, 0);
    TimeOfDay session_end(6, 0, 0);
    REQUIRE(time_allowed(TimeOfDay(18, 0, 0), session_start, session_end));
    REQUIRE(time_allowed(TimeOfDay(23, 59, 0), session_start, session_end));
    REQUIRE(time_allowed(TimeOfDay(0, 0, 0), session_start, session_end));
    REQUIRE(time_allowed(TimeOfDay(6, 0, 0), session_start, session_end));
    REQUIRE_FALSE(time_allowed(TimeOfDay(12, 0, 0), session_start, session_end));
    REQUIRE_FALSE(time_allowed(TimeOfDay(6, 0, 1), session_start, session_end));
    REQUIRE_FALSE(time_allowed(TimeOfDay(17, 59, 59), session_start, session_end));
}

TEST_CASE("same-day session window is inclusive on both ends", "[filters]") {
    TimeOfDay session_start(9, 30, 0);
    TimeOfDay session_end(16, 0, 0);
    REQUIRE(time_allowed(TimeOfDay(9, 30, 0), session_start, session_end));
    REQUIRE(time_allowed(TimeOfDay(16, 0, 0), session_start, session_end));
    REQUIRE_FALSE(time_allowed(TimeOfDay(9, 29, 59), session_start, session_end));
    REQUIRE_FALSE(time_allowed(TimeOfDay(20, 0, 0), session_start, session_end));
}

TEST_CASE("volatility filter requires a range strictly above the minimum", "[filters]") {
    // Binary-exact prices so the boundary is hit exactly
    BarHistory exact_history = make_ranged_history(1.0, 0.25);
    REQUIRE(calculate_volatility_range(exact_history, 10).value() == 0.25);
    REQUIRE_FALSE(volatility_allowed(exact_history, 10, 0.25));

    BarHistory wider_history = make_ranged_history(1.0, 0.25 + 0.0078125);
    REQUIRE(volatility_allowed(wider_history, 10, 0.25));

    BarHistory fx_history = make_ranged_history(1.0950, 0.0021);
    REQUIRE(volatility_allowed(fx_history, 10, 0.002));
    BarHistory narrow_fx_history = make_ranged_history(1.0950, 0.0019);
    REQUIRE_FALSE(volatility_allowed(narrow_fx_history, 10, 0.002));
}

TEST_CASE("volatility filter fails without enough history", "[filters]") {
    BarHistory bar_history(64);
    bar_history.append(make_bar("2024-01-08 18:00:00", 1.0, 2.0, 0.5, 1.0));
    REQUIRE_FALSE(calculate_volatility_range(bar_history, 10).has_value());
    REQUIRE_FALSE(volatility_allowed(bar_history, 10, 0.0));
}

TEST_CASE("trend filters compare strength non-strictly and direction strictly", "[filters]") {
    REQUIRE(trend_strength_allowed(12.0, 12.0));
    REQUIRE_FALSE(trend_strength_allowed(11.99, 12.0));
    REQUIRE(trend_direction_bullish(1.1001, 1.1000));
    REQUIRE_FALSE(trend_direction_bullish(1.1000, 1.1000));
    REQUIRE(trend_direction_bearish(1.0999, 1.1000));
    REQUIRE_FALSE(trend_direction_bearish(1.1000, 1.1000));
}

TEST_CASE("long and short eligibility are evaluated independently", "[filters]") {
    StrategyConfig strategy_config;
    strategy_config.min_adx_long_entry = 20.0;
    strategy_config.min_adx_short_entry = 10.0;
    BarHistory bar_history = make_ranged_history(1.0950, 0.0030);
    Bar current_bar = *bar_history.history(0);

    SECTION("rising SMA with strong trend is long eligible only") {
        FilterResult filter_result = evaluate_trading_filters(current_bar, bar_history, make_snapshot(50, 52, 25.0, 1.0950, 1.0951),
                                                              true, strategy_config);
        REQUIRE(filter_result.day_pass);
        REQUIRE(filter_result.time_pass);
        REQUIRE(filter_result.volatility_pass);
        REQUIRE(filter_result.long_eligible);
        REQUIRE_FALSE(filter_result.short_eligible);
    }
    SECTION("ADX between the two thresholds only allows shorts") {
        FilterResult filter_result = evaluate_trading_filters(current_bar, bar_history, make_snapshot(50, 48, 15.0, 1.0951, 1.0950),
                                                              true, strategy_config);
        REQUIRE(filter_result.adx_short_pass);
        REQUIRE_FALSE(filter_result.adx_long_pass);
        REQUIRE(filter_result.short_eligible);
        REQUIRE_FALSE(filter_result.long_eligible);
    }
    SECTION("an open position blocks both sides") {
        FilterResult filter_result = evaluate_trading_filters(current_bar, bar_history, make_snapshot(50, 52, 25.0, 1.0950, 1.0951),
                                                              false, strategy_config);
        REQUIRE_FALSE(filter_result.long_eligible);
        REQUIRE_FALSE(filter_result.short_eligible);
    }
    SECTION("indicators that have not warmed up fail their gates") {
        FilterResult filter_result = evaluate_trading_filters(current_bar, bar_history, IndicatorSnapshot(), true, strategy_config);
        REQUIRE_FALSE(filter_result.indicators_ready);
        REQUIRE_FALSE(filter_result.long_eligible);
        REQUIRE_FALSE(filter_result.short_eligible);
    }
}

TEST_CASE("buy signal needs %D to cross up through the buy level", "[signals]") {
    StrategyConfig strategy_config = make_signal_config();

    REQUIRE(detect_trading_signals(eligible(true, false), IndicatorValues(52.0, 50.0), strategy_config).buy);
    // Previous value sitting on the level counts as not yet crossed
    REQUIRE(detect_trading_signals(eligible(true, false), IndicatorValues(51.5, 51.0), strategy_config).buy);
    // Current value must be strictly above
    REQUIRE_FALSE(detect_trading_signals(eligible(true, false), IndicatorValues(51.0, 50.0), strategy_config).buy);
    // Already above on the previous bar
    REQUIRE_FALSE(detect_trading_signals(eligible(true, false), IndicatorValues(53.0, 51.0001), strategy_config).buy);
    // Not eligible
    REQUIRE_FALSE(detect_trading_signals(eligible(false, false), IndicatorValues(52.0, 50.0), strategy_config).buy);
}

TEST_CASE("sell signal needs %D to cross down through the sell level", "[signals]") {
    StrategyConfig strategy_config = make_signal_config();

    REQUIRE(detect_trading_signals(eligible(false, true), IndicatorValues(48.0, 50.0), strategy_config).sell);
    REQUIRE(detect_trading_signals(eligible(false, true), IndicatorValues(48.5, 49.0), strategy_config).sell);
    REQUIRE_FALSE(detect_trading_signals(eligible(false, true), IndicatorValues(49.0, 50.0), strategy_config).sell);
    REQUIRE_FALSE(detect_trading_signals(eligible(true, false), IndicatorValues(48.0, 50.0), strategy_config).sell);
}

TEST_CASE("with both sides eligible only the crossing direction fires", "[signals]") {
    StrategyConfig strategy_config = make_signal_config();

    SignalDecision up_decision = detect_trading_signals(eligible(true, true), IndicatorValues(52.0, 48.0), strategy_config);
    REQUIRE(up_decision.buy);
    REQUIRE_FALSE(up_decision.sell);

    SignalDecision down_decision = detect_trading_signals(eligible(true, true), IndicatorValues(48.0, 52.0), strategy_config);
    REQUIRE_FALSE(down_decision.buy);
    REQUIRE(down_decision.sell);

    SignalDecision flat_decision = detect_trading_signals(eligible(true, true), IndicatorValues(50.0, 50.0), strategy_config);
    REQUIRE_FALSE(flat_decision.buy);
    REQUIRE_FALSE(flat_decision.sell);
}

TEST_CASE("no signal before the oscillator warms up", "[signals]") {
    SignalDecision signal_decision = detect_trading_signals(eligible(true, true), IndicatorValues(), make_signal_config());
    REQUIRE_FALSE(signal_decision.buy);
    REQUIRE_FALSE(signal_decision.sell);
}

TEST_CASE("session close is detected when bars step across the close time", "[session]") {
    TimeOfDay session_close(16, 0, 0);
    Bar before_close = make_bar("2024-01-08 15:45:00", 1, 1, 1, 1);
    Bar at_close = make_bar("2024-01-08 16:00:00", 1, 1, 1, 1);
    Bar after_close = make_bar("2024-01-08 16:15:00", 1, 1, 1, 1);
    Bar next_morning = make_bar("2024-01-09 09:00:00", 1, 1, 1, 1);

    REQUIRE(session_close_reached(before_close, at_close, session_close));
    REQUIRE_FALSE(session_close_reached(at_close, after_close, session_close));
    REQUIRE(session_close_reached(make_bar("2024-01-08 15:30:00", 1, 1, 1, 1), next_morning, session_close));
    REQUIRE_FALSE(session_close_reached(after_close, make_bar("2024-01-08 23:00:00", 1, 1, 1, 1), session_close));
    // Overnight gap that skips past the next day's close
    REQUIRE(session_close_reached(after_close, make_bar("2024-01-09 17:00:00", 1, 1, 1, 1), session_close));
}
