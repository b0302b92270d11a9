#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace AryaTrader {
namespace Core {

void IndicatorSeries::push(double value) {
    previous_value = current_value;
    current_value = value;
    if (value_count < 2) {
        ++value_count;
    }
}

IndicatorValues IndicatorSeries::values() const {
    if (value_count < 2) {
        return IndicatorValues();
    }
    return IndicatorValues(current_value, previous_value);
}

double compute_true_range(double high_price, double low_price, double previous_close) {
    return std::max({high_price - low_price, std::abs(high_price - previous_close), std::abs(low_price - previous_close)});
}

double compute_fast_stochastic_k(double close_price, double highest_high, double lowest_low) {
    double price_range = highest_high - lowest_low;
    if (price_range <= 0.0) {
        return 0.0;
    }
    return 100.0 * (close_price - lowest_low) / price_range;
}

// ========================================================================
// SMA
// ========================================================================

SmaIndicator::SmaIndicator(int period) : sma_period(period), window_values() {
    if (sma_period <= 0) {
        throw std::runtime_error("SMA period must be > 0, got: " + std::to_string(period));
    }
}

std::optional<double> SmaIndicator::update(double value) {
    window_values.push_back(value);
    if (static_cast<int>(window_values.size()) > sma_period) {
        window_values.pop_front();
    }
    if (static_cast<int>(window_values.size()) < sma_period) {
        return std::nullopt;
    }
    double window_sum = 0.0;
    for (double window_value : window_values) {
        window_sum += window_value;
    }
    return window_sum / sma_period;
}

void SmaIndicator::reset() {
    window_values.clear();
}

// ========================================================================
// STOCHASTIC
// ========================================================================

StochasticIndicator::StochasticIndicator(int period, int slowing_period, int d_period)
    : stochastic_period(period), window_highs(), window_lows(), slow_k_average(slowing_period), d_average(d_period) {
    if (stochastic_period <= 0) {
        throw std::runtime_error("Stochastic period must be > 0, got: " + std::to_string(period));
    }
}

std::optional<double> StochasticIndicator::update(const Bar& bar) {
    window_highs.push_back(bar.high_price);
    window_lows.push_back(bar.low_price);
    if (static_cast<int>(window_highs.size()) > stochastic_period) {
        window_highs.pop_front();
        window_lows.pop_front();
    }
    if (static_cast<int>(window_highs.size()) < stochastic_period) {
        return std::nullopt;
    }

    double highest_high = *std::max_element(window_highs.begin(), window_highs.end());
    double lowest_low = *std::min_element(window_lows.begin(), window_lows.end());
    double fast_k_value = compute_fast_stochastic_k(bar.close_price, highest_high, lowest_low);

    std::optional<double> slow_k_value = slow_k_average.update(fast_k_value);
    if (!slow_k_value) {
        return std::nullopt;
    }
    return d_average.update(*slow_k_value);
}

void StochasticIndicator::reset() {
    window_highs.clear();
    window_lows.clear();
    slow_k_average.reset();
    d_average.reset();
}

// ========================================================================
// ADX
// ========================================================================

AdxIndicator::AdxIndicator(int period)
    : adx_period(period), has_previous_bar(false), previous_high(0.0), previous_low(0.0), previous_close(0.0),
      directional_samples(0), smoothed_true_range(0.0), smoothed_plus_dm(0.0), smoothed_minus_dm(0.0),
      dx_samples(0), dx_sum(0.0), adx_initialized(false), adx_value(0.0) {
    if (adx_period <= 0) {
        throw std::runtime_error("ADX period must be > 0, got: " + std::to_string(period));
    }
}

std::optional<double> AdxIndicator::update(const Bar& bar) {
    if (!has_previous_bar) {
        previous_high = bar.high_price;
        previous_low = bar.low_price;
        previous_close = bar.close_price;
        has_previous_bar = true;
        return std::nullopt;
    }

    double true_range = compute_true_range(bar.high_price, bar.low_price, previous_close);
    double up_move = bar.high_price - previous_high;
    double down_move = previous_low - bar.low_price;
    double plus_dm = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
    double minus_dm = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;

    previous_high = bar.high_price;
    previous_low = bar.low_price;
    previous_close = bar.close_price;

    ++directional_samples;
    if (directional_samples <= adx_period) {
        // Initial smoothed values are plain sums over the first period
        smoothed_true_range += true_range;
        smoothed_plus_dm += plus_dm;
        smoothed_minus_dm += minus_dm;
        if (directional_samples < adx_period) {
            return std::nullopt;
        }
    } else {
        smoothed_true_range = smoothed_true_range - smoothed_true_range / adx_period + true_range;
        smoothed_plus_dm = smoothed_plus_dm - smoothed_plus_dm / adx_period + plus_dm;
        smoothed_minus_dm = smoothed_minus_dm - smoothed_minus_dm / adx_period + minus_dm;
    }

    double plus_di = smoothed_true_range > 0.0 ? 100.0 * smoothed_plus_dm / smoothed_true_range : 0.0;
    double minus_di = smoothed_true_range > 0.0 ? 100.0 * smoothed_minus_dm / smoothed_true_range : 0.0;
    double di_sum = plus_di + minus_di;
    double dx_value = di_sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;

    if (!adx_initialized) {
        dx_sum += dx_value;
        ++dx_samples;
        if (dx_samples < adx_period) {
            return std::nullopt;
        }
        adx_value = dx_sum / adx_period;
        adx_initialized = true;
        return adx_value;
    }

    adx_value = (adx_value * (adx_period - 1) + dx_value) / adx_period;
    return adx_value;
}

void AdxIndicator::reset() {
    has_previous_bar = false;
    directional_samples = 0;
    smoothed_true_range = 0.0;
    smoothed_plus_dm = 0.0;
    smoothed_minus_dm = 0.0;
    dx_samples = 0;
    dx_sum = 0.0;
    adx_initialized = false;
    adx_value = 0.0;
}

// ========================================================================
// PROVIDER
// ========================================================================

TechnicalIndicatorProvider::IndicatorState::IndicatorState(const Config::StrategyConfig& strategy_config)
    : stochastic_indicator(strategy_config.stochastic_period, strategy_config.stochastic_slowing_period, strategy_config.stochastic_d_period),
      adx_indicator(strategy_config.adx_period),
      sma_indicator(strategy_config.sma_period),
      stochastic_d_series(), adx_series(), sma_series() {}

TechnicalIndicatorProvider::TechnicalIndicatorProvider(const Config::StrategyConfig& strategy_config)
    : state(strategy_config), state_before_update() {}

void TechnicalIndicatorProvider::update(const Bar& bar) {
    state_before_update = state;

    std::optional<double> stochastic_d_value = state.stochastic_indicator.update(bar);
    if (stochastic_d_value) {
        state.stochastic_d_series.push(*stochastic_d_value);
    }
    std::optional<double> adx_result = state.adx_indicator.update(bar);
    if (adx_result) {
        state.adx_series.push(*adx_result);
    }
    std::optional<double> sma_value = state.sma_indicator.update(bar.close_price);
    if (sma_value) {
        state.sma_series.push(*sma_value);
    }
}

void TechnicalIndicatorProvider::rollback_last_update() {
    if (!state_before_update) {
        throw std::runtime_error("No indicator update to roll back");
    }
    state = *state_before_update;
    state_before_update.reset();
}

IndicatorSnapshot TechnicalIndicatorProvider::snapshot() const {
    IndicatorSnapshot indicator_snapshot;
    indicator_snapshot.stochastic_d = state.stochastic_d_series.values();
    indicator_snapshot.adx = state.adx_series.values();
    indicator_snapshot.sma = state.sma_series.values();
    return indicator_snapshot;
}

void TechnicalIndicatorProvider::reset() {
    state.stochastic_indicator.reset();
    state.adx_indicator.reset();
    state.sma_indicator.reset();
    state.stochastic_d_series.reset();
    state.adx_series.reset();
    state.sma_series.reset();
    state_before_update.reset();
}

} // namespace Core
} // namespace AryaTrader
