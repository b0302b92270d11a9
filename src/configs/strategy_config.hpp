// StrategyConfig.hpp
#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include "utils/time_utils.hpp"

namespace AryaTrader {
namespace Config {

struct StrategyConfig {
    // ========================================================================
    // DAY-OF-WEEK FILTER
    // ========================================================================

    bool monday_trading_enabled = true;
    bool tuesday_trading_enabled = true;
    bool wednesday_trading_enabled = false;
    bool thursday_trading_enabled = false;
    bool friday_trading_enabled = true;

    // ========================================================================
    // SESSION TIME FILTER
    // ========================================================================

    // Entries are only placed inside [start, end]; start > end wraps past midnight
    TimeUtils::TimeOfDay trading_time_start{18, 0, 0};
    TimeUtils::TimeOfDay trading_time_end{6, 0, 0};

    // ========================================================================
    // VOLATILITY FILTER
    // ========================================================================

    int range_calculation_period = 10;               // Bars used for max(High) - min(Low)
    double minimum_range_filter = 0.002;             // Range must be strictly above this value

    // ========================================================================
    // TREND FILTERS
    // ========================================================================

    int adx_period = 14;
    int sma_period = 78;
    double min_adx_long_entry = 12.0;
    double min_adx_short_entry = 12.0;

    // ========================================================================
    // STOCHASTIC SIGNAL
    // ========================================================================

    int stochastic_period = 68;                      // %K lookback
    int stochastic_slowing_period = 3;               // Smoothing applied to fast %K
    int stochastic_d_period = 3;                     // Smoothing applied to slow %K to produce %D
    double buy_signal_level = 51.0;                  // %D crossing above this level is a buy signal
    double sell_signal_level = 49.0;                 // %D crossing below this level is a sell signal
};

} // namespace Config
} // namespace AryaTrader

#endif // STRATEGY_CONFIG_HPP
