#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "strategy_config.hpp"
#include "orders_config.hpp"
#include "instrument_config.hpp"
#include "backtest_config.hpp"
#include "logging_config.hpp"

namespace AryaTrader {
namespace Config {

/**
 * Main trading system configuration.
 * Loaded once from CSV and validated before the engine is constructed; read-only afterwards.
 */
struct SystemConfig {
    SystemConfig() {}

    StrategyConfig strategy;           // Entry filters and signal levels
    OrdersConfig orders;               // Stop/target distances, trailing acceleration, labels
    InstrumentConfig instrument;       // Symbol, tick size, session close
    BacktestConfig backtest;           // Bar source and history depth
    LoggingConfig logging;             // Log and journal files
};

} // namespace Config
} // namespace AryaTrader

#endif // SYSTEM_CONFIG_HPP
