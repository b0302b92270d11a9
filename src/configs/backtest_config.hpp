// BacktestConfig.hpp
#ifndef BACKTEST_CONFIG_HPP
#define BACKTEST_CONFIG_HPP

#include <string>

namespace AryaTrader {
namespace Config {

struct BacktestConfig {
    std::string bars_csv_path = "data/bars.csv";
    int max_history_bars = 512;                      // Bars retained for look-back queries
};

} // namespace Config
} // namespace AryaTrader

#endif // BACKTEST_CONFIG_HPP
