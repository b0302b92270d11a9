#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <deque>
#include <optional>
#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "indicator_provider_interface.hpp"

namespace AryaTrader {
namespace Core {

// Keeps the two most recent values of a series.
class IndicatorSeries {
public:
    IndicatorSeries() : current_value(0.0), previous_value(0.0), value_count(0) {}

    void push(double value);
    void reset() { value_count = 0; }
    IndicatorValues values() const;

private:
    double current_value;
    double previous_value;
    int value_count;
};

class SmaIndicator {
public:
    explicit SmaIndicator(int period);

    // Returns the average once `period` values have been seen.
    std::optional<double> update(double value);
    void reset();

private:
    int sma_period;
    std::deque<double> window_values;
};

// Slow stochastic: fast %K over `period` bars, smoothed by `slowing`, %D = SMA of slow %K over `d_period`.
class StochasticIndicator {
public:
    StochasticIndicator(int period, int slowing_period, int d_period);

    std::optional<double> update(const Bar& bar);
    void reset();

private:
    int stochastic_period;
    std::deque<double> window_highs;
    std::deque<double> window_lows;
    SmaIndicator slow_k_average;
    SmaIndicator d_average;
};

// Wilder's Average Directional Index.
class AdxIndicator {
public:
    explicit AdxIndicator(int period);

    std::optional<double> update(const Bar& bar);
    void reset();

private:
    int adx_period;
    bool has_previous_bar;
    double previous_high;
    double previous_low;
    double previous_close;
    int directional_samples;
    double smoothed_true_range;
    double smoothed_plus_dm;
    double smoothed_minus_dm;
    int dx_samples;
    double dx_sum;
    bool adx_initialized;
    double adx_value;
};

double compute_true_range(double high_price, double low_price, double previous_close);
double compute_fast_stochastic_k(double close_price, double highest_high, double lowest_low);

class TechnicalIndicatorProvider : public IndicatorProviderInterface {
public:
    explicit TechnicalIndicatorProvider(const Config::StrategyConfig& strategy_config);

    void update(const Bar& bar) override;
    void rollback_last_update() override;
    IndicatorSnapshot snapshot() const override;
    void reset() override;

private:
    struct IndicatorState {
        StochasticIndicator stochastic_indicator;
        AdxIndicator adx_indicator;
        SmaIndicator sma_indicator;
        IndicatorSeries stochastic_d_series;
        IndicatorSeries adx_series;
        IndicatorSeries sma_series;

        explicit IndicatorState(const Config::StrategyConfig& strategy_config);
    };

    IndicatorState state;
    std::optional<IndicatorState> state_before_update;
};

} // namespace Core
} // namespace AryaTrader

#endif // INDICATORS_HPP
