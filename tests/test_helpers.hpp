#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/strategy_analysis/indicator_provider_interface.hpp"
#include "trader/trading_logic/execution_interface.hpp"
#include "utils/time_utils.hpp"

namespace TestHelpers {

using AryaTrader::Core::Bar;
using AryaTrader::Core::IndicatorSnapshot;
using AryaTrader::Core::IndicatorValues;
using AryaTrader::Core::Order;
using AryaTrader::Core::OrderId;

inline Bar make_bar(const std::string& timestamp, double open_price, double high_price, double low_price, double close_price,
                    double tick_size = 0.0001) {
    Bar bar;
    bar.timestamp_tm = TimeUtils::parse_bar_timestamp(timestamp);
    bar.timestamp = TimeUtils::format_bar_timestamp(bar.timestamp_tm);
    bar.open_price = open_price;
    bar.high_price = high_price;
    bar.low_price = low_price;
    bar.close_price = close_price;
    bar.tick_size = tick_size;
    return bar;
}

// Bar whose open, high and low sit around the close
inline Bar make_close_bar(const std::string& timestamp, double close_price, double half_range = 0.0005) {
    return make_bar(timestamp, close_price, close_price + half_range, close_price - half_range, close_price);
}

// 15 minute spacing starting at the given timestamp
inline std::string bar_time(const std::string& start_timestamp, int bar_index) {
    long long start_epoch = TimeUtils::to_epoch_seconds(TimeUtils::parse_bar_timestamp(start_timestamp));
    time_t bar_epoch = static_cast<time_t>(start_epoch + bar_index * 15LL * TimeUtils::SECONDS_PER_MINUTE);
    std::tm bar_tm;
    gmtime_r(&bar_epoch, &bar_tm);
    return TimeUtils::format_bar_timestamp(bar_tm);
}

inline IndicatorSnapshot make_snapshot(double d_previous, double d_current, double adx_current, double sma_previous, double sma_current) {
    IndicatorSnapshot indicator_snapshot;
    indicator_snapshot.stochastic_d = IndicatorValues(d_current, d_previous);
    indicator_snapshot.adx = IndicatorValues(adx_current, adx_current);
    indicator_snapshot.sma = IndicatorValues(sma_current, sma_previous);
    return indicator_snapshot;
}

// Configuration used by the engine tests: every weekday enabled, session open all day
inline AryaTrader::Config::SystemConfig make_test_config() {
    AryaTrader::Config::SystemConfig config;
    config.strategy.monday_trading_enabled = true;
    config.strategy.tuesday_trading_enabled = true;
    config.strategy.wednesday_trading_enabled = true;
    config.strategy.thursday_trading_enabled = true;
    config.strategy.friday_trading_enabled = true;
    config.strategy.trading_time_start = TimeUtils::TimeOfDay(18, 0, 0);
    config.strategy.trading_time_end = TimeUtils::TimeOfDay(6, 0, 0);
    config.logging.log_bar_decisions = false;
    return config;
}

struct RecordedRequest {
    std::string action;
    Order order;
};

// Records every request in arrival order. fail_on_request, when set, throws on that request number (1-based).
class RecordingExecutionService : public AryaTrader::Core::ExecutionServiceInterface {
public:
    std::vector<RecordedRequest> requests;
    int fail_on_request = 0;

    void insert_order(const Order& order) override { record("insert", order); }
    void modify_order(const Order& order) override { record("modify", order); }
    void cancel_order(OrderId order_id) override {
        Order cancelled_order;
        cancelled_order.order_id = order_id;
        record("cancel", cancelled_order);
    }
    std::string get_execution_name() const override { return "RECORDING"; }

    void clear() { requests.clear(); }

private:
    int request_count = 0;

    void record(const std::string& action, const Order& order) {
        ++request_count;
        if (fail_on_request == request_count) {
            throw std::runtime_error("rejected " + action + " #" + std::to_string(order.order_id));
        }
        requests.push_back(RecordedRequest{action, order});
    }
};

// Returns whatever snapshot the test set before the bar
class ScriptedIndicatorProvider : public AryaTrader::Core::IndicatorProviderInterface {
public:
    IndicatorSnapshot current_snapshot;
    int update_count = 0;
    int rollback_count = 0;

    void update(const Bar&) override { ++update_count; }
    void rollback_last_update() override {
        --update_count;
        ++rollback_count;
    }
    IndicatorSnapshot snapshot() const override { return current_snapshot; }
    void reset() override {
        current_snapshot = IndicatorSnapshot();
        update_count = 0;
    }
};

} // namespace TestHelpers

#endif // TEST_HELPERS_HPP
