#include "config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace AryaTrader {
namespace Config {

using AryaTrader::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char input_char) { return static_cast<char>(std::tolower(input_char)); });
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw std::runtime_error("expected a boolean (1/0, true/false, yes/no)");
    }

    // std::stoi/std::stod accept trailing garbage; configuration values must be consumed entirely
    inline int to_int(const std::string& input_value) {
        size_t parsed_characters = 0;
        int parsed_value = std::stoi(input_value, &parsed_characters);
        if (parsed_characters != input_value.size()) {
            throw std::runtime_error("trailing characters after integer");
        }
        return parsed_value;
    }

    inline double to_double(const std::string& input_value) {
        size_t parsed_characters = 0;
        double parsed_value = std::stod(input_value, &parsed_characters);
        if (parsed_characters != input_value.size()) {
            throw std::runtime_error("trailing characters after number");
        }
        if (!std::isfinite(parsed_value)) {
            throw std::runtime_error("number must be finite");
        }
        return parsed_value;
    }

    inline std::string require_non_empty(const std::string& input_value) {
        if (input_value.empty()) {
            throw std::runtime_error("value is required but not provided");
        }
        return input_value;
    }

    void apply_config_value(SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
        // Strategy - day-of-week filter
        if (config_key_string == "strategy.monday_trading_enabled") cfg.strategy.monday_trading_enabled = to_bool(config_value_string);
        else if (config_key_string == "strategy.tuesday_trading_enabled") cfg.strategy.tuesday_trading_enabled = to_bool(config_value_string);
        else if (config_key_string == "strategy.wednesday_trading_enabled") cfg.strategy.wednesday_trading_enabled = to_bool(config_value_string);
        else if (config_key_string == "strategy.thursday_trading_enabled") cfg.strategy.thursday_trading_enabled = to_bool(config_value_string);
        else if (config_key_string == "strategy.friday_trading_enabled") cfg.strategy.friday_trading_enabled = to_bool(config_value_string);

        // Strategy - session window
        else if (config_key_string == "strategy.trading_time_start") cfg.strategy.trading_time_start = TimeUtils::parse_time_of_day(config_value_string);
        else if (config_key_string == "strategy.trading_time_end") cfg.strategy.trading_time_end = TimeUtils::parse_time_of_day(config_value_string);

        // Strategy - volatility, trend and signal parameters
        else if (config_key_string == "strategy.range_calculation_period") cfg.strategy.range_calculation_period = to_int(config_value_string);
        else if (config_key_string == "strategy.minimum_range_filter") cfg.strategy.minimum_range_filter = to_double(config_value_string);
        else if (config_key_string == "strategy.adx_period") cfg.strategy.adx_period = to_int(config_value_string);
        else if (config_key_string == "strategy.sma_period") cfg.strategy.sma_period = to_int(config_value_string);
        else if (config_key_string == "strategy.min_adx_long_entry") cfg.strategy.min_adx_long_entry = to_double(config_value_string);
        else if (config_key_string == "strategy.min_adx_short_entry") cfg.strategy.min_adx_short_entry = to_double(config_value_string);
        else if (config_key_string == "strategy.stochastic_period") cfg.strategy.stochastic_period = to_int(config_value_string);
        else if (config_key_string == "strategy.stochastic_slowing_period") cfg.strategy.stochastic_slowing_period = to_int(config_value_string);
        else if (config_key_string == "strategy.stochastic_d_period") cfg.strategy.stochastic_d_period = to_int(config_value_string);
        else if (config_key_string == "strategy.buy_signal_level") cfg.strategy.buy_signal_level = to_double(config_value_string);
        else if (config_key_string == "strategy.sell_signal_level") cfg.strategy.sell_signal_level = to_double(config_value_string);

        // Orders
        else if (config_key_string == "orders.stop_loss_ticks") cfg.orders.stop_loss_ticks = to_int(config_value_string);
        else if (config_key_string == "orders.profit_target_ticks") cfg.orders.profit_target_ticks = to_int(config_value_string);
        else if (config_key_string == "orders.trailing_stop_acceleration") cfg.orders.trailing_stop_acceleration = to_double(config_value_string);
        else if (config_key_string == "orders.price_precision") cfg.orders.price_precision = to_int(config_value_string);

        // Instrument
        else if (config_key_string == "instrument.symbol") cfg.instrument.symbol = require_non_empty(config_value_string);
        else if (config_key_string == "instrument.tick_size") cfg.instrument.tick_size = to_double(config_value_string);
        else if (config_key_string == "instrument.force_close_at_session_end") cfg.instrument.force_close_at_session_end = to_bool(config_value_string);
        else if (config_key_string == "instrument.session_close_time") cfg.instrument.session_close_time = TimeUtils::parse_time_of_day(config_value_string);
        else if (config_key_string == "instrument.max_open_position") cfg.instrument.max_open_position = to_int(config_value_string);

        // Backtest
        else if (config_key_string == "backtest.bars_csv_path") cfg.backtest.bars_csv_path = require_non_empty(config_value_string);
        else if (config_key_string == "backtest.max_history_bars") cfg.backtest.max_history_bars = to_int(config_value_string);

        // Logging
        else if (config_key_string == "logging.log_file") cfg.logging.log_file = require_non_empty(config_value_string);
        else if (config_key_string == "logging.order_journal_file") cfg.logging.order_journal_file = require_non_empty(config_value_string);
        else if (config_key_string == "logging.log_bar_decisions") cfg.logging.log_bar_decisions = to_bool(config_value_string);
        else if (config_key_string == "logging.logging_poll_interval_ms") cfg.logging.logging_poll_interval_ms = to_int(config_value_string);
    }
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) config_value_string.clear();
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            apply_config_value(cfg, config_key_string, config_value_string);
        } catch (const std::exception& parse_exception_error) {
            throw std::runtime_error("Failed to parse " + config_key_string + " from value '" + config_value_string +
                                     "' (" + csv_path + ":" + std::to_string(line_number) + "): " + parse_exception_error.what());
        }
    }
    return true;
}

void load_system_config(SystemConfig& config, const std::string& csv_path) {
    if (!load_config_from_csv(config, csv_path)) {
        throw std::runtime_error("Failed to load config CSV from " + csv_path);
    }

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }
    log_message("Configuration loaded from " + csv_path, "");
}

int required_history_bars(const StrategyConfig& strategy_config) {
    // Two consecutive values are needed from every series
    int stochastic_bars = strategy_config.stochastic_period + strategy_config.stochastic_slowing_period +
                          strategy_config.stochastic_d_period - 2 + 1;
    int adx_bars = 2 * strategy_config.adx_period + 1;
    int sma_bars = strategy_config.sma_period + 1;
    return std::max({strategy_config.range_calculation_period, stochastic_bars, adx_bars, sma_bars});
}

bool validate_config(const SystemConfig& config, std::string& errorMessage) {
    const StrategyConfig& strategy_config = config.strategy;
    if (strategy_config.range_calculation_period <= 0) {
        errorMessage = "strategy.range_calculation_period must be > 0";
        return false;
    }
    if (!(strategy_config.minimum_range_filter >= 0.0) || !std::isfinite(strategy_config.minimum_range_filter)) {
        errorMessage = "strategy.minimum_range_filter must be >= 0";
        return false;
    }
    if (strategy_config.adx_period <= 0 || strategy_config.sma_period <= 0 || strategy_config.stochastic_period <= 0) {
        errorMessage = "strategy.adx_period, strategy.sma_period and strategy.stochastic_period must be > 0";
        return false;
    }
    if (strategy_config.stochastic_slowing_period <= 0 || strategy_config.stochastic_d_period <= 0) {
        errorMessage = "strategy.stochastic_slowing_period and strategy.stochastic_d_period must be > 0";
        return false;
    }
    if (!(strategy_config.min_adx_long_entry >= 0.0) || !(strategy_config.min_adx_short_entry >= 0.0)) {
        errorMessage = "strategy.min_adx_long_entry and strategy.min_adx_short_entry must be >= 0";
        return false;
    }
    if (!(strategy_config.buy_signal_level >= 0.0 && strategy_config.buy_signal_level <= 100.0) ||
        !(strategy_config.sell_signal_level >= 0.0 && strategy_config.sell_signal_level <= 100.0)) {
        errorMessage = "strategy.buy_signal_level and strategy.sell_signal_level must be between 0 and 100";
        return false;
    }
    if (strategy_config.buy_signal_level <= strategy_config.sell_signal_level) {
        errorMessage = "strategy.buy_signal_level must be > strategy.sell_signal_level";
        return false;
    }
    if (config.orders.stop_loss_ticks <= 0 || config.orders.profit_target_ticks <= 0) {
        errorMessage = "orders.stop_loss_ticks and orders.profit_target_ticks must be > 0";
        return false;
    }
    if (!(config.orders.trailing_stop_acceleration > 0.0) || !std::isfinite(config.orders.trailing_stop_acceleration)) {
        errorMessage = "orders.trailing_stop_acceleration must be > 0";
        return false;
    }
    if (config.orders.price_precision < 0) {
        errorMessage = "orders.price_precision must be >= 0";
        return false;
    }
    if (config.instrument.symbol.empty()) {
        errorMessage = "instrument.symbol is missing";
        return false;
    }
    if (!(config.instrument.tick_size > 0.0) || !std::isfinite(config.instrument.tick_size)) {
        errorMessage = "instrument.tick_size must be > 0";
        return false;
    }
    if (config.instrument.max_open_position != 1) {
        errorMessage = "instrument.max_open_position must be 1";
        return false;
    }
    if (config.backtest.max_history_bars < required_history_bars(strategy_config)) {
        errorMessage = "backtest.max_history_bars must be >= " + std::to_string(required_history_bars(strategy_config));
        return false;
    }
    if (config.logging.log_file.empty()) {
        errorMessage = "logging.log_file is empty";
        return false;
    }
    if (config.logging.logging_poll_interval_ms <= 0) {
        errorMessage = "logging.logging_poll_interval_ms must be > 0";
        return false;
    }
    return true;
}

} // namespace Config
} // namespace AryaTrader
